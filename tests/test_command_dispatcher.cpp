// Repository: cuebridge
// Component: Command dispatcher unit tests

#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "cuebridge/commands/CommandDispatcher.hpp"
#include "cuebridge/transport/TransportClient.hpp"
#include "cuebridge/util/Logger.hpp"
#include "fixtures/FakeHttpChannel.h"
#include "support/Messages.hpp"

namespace cuebridge::commands {
namespace {

using transport::AddTimeDirection;
using transport::Command;
using transport::CommandVerb;
using transport::HttpResponse;
using transport::SendResult;
using transport::TransportError;

// Records every command and answers with a fixed result.
struct RecordingSender {
  std::vector<Command> sent;
  SendResult reply = SendResult::Delivered(HttpResponse{200, "OK", "{}"});

  CommandSender AsSender() {
    return [this](const Command& c) {
      sent.push_back(c);
      return reply;
    };
  }
};

SnapshotReader Holding(model::SnapshotPtr snapshot) {
  return [snapshot] { return snapshot; };
}

TEST(CommandDispatcherTest, PlaybackVerbsAreAccepted) {
  RecordingSender sender;
  CommandDispatcher dispatcher(sender.AsSender(), Holding(tests::LiveSnapshot(1000)));
  EXPECT_TRUE(dispatcher.Start().ok());
  EXPECT_TRUE(dispatcher.Pause().ok());
  EXPECT_TRUE(dispatcher.Stop().ok());
  EXPECT_TRUE(dispatcher.Reload().ok());
  EXPECT_TRUE(dispatcher.Roll().ok());
  ASSERT_EQ(sender.sent.size(), 5u);
  EXPECT_EQ(sender.sent[0].verb, CommandVerb::kStart);
  EXPECT_EQ(sender.sent[4].verb, CommandVerb::kRoll);
}

TEST(CommandDispatcherTest, AddTimeDispatchesNegativeBoth) {
  RecordingSender sender;
  CommandDispatcher dispatcher(sender.AsSender(), Holding(tests::LiveSnapshot(1000)));
  const CommandResult r = dispatcher.AddTime(-30000, "both");
  EXPECT_EQ(r.outcome, CommandOutcome::kAccepted);
  ASSERT_EQ(sender.sent.size(), 1u);
  EXPECT_EQ(sender.sent[0].verb, CommandVerb::kAddTime);
  EXPECT_EQ(sender.sent[0].time_ms, -30000);
  EXPECT_EQ(sender.sent[0].direction, AddTimeDirection::kBoth);
  EXPECT_EQ(transport::EncodeCommandPath(sender.sent[0]), "/addtime/both/-30000");
}

TEST(CommandDispatcherTest, InvalidDirectionNeverReachesTransport) {
  RecordingSender sender;
  CommandDispatcher dispatcher(sender.AsSender(), Holding(tests::LiveSnapshot(1000)));
  const CommandResult r = dispatcher.AddTime(1000, "sideways");
  EXPECT_EQ(r.outcome, CommandOutcome::kValidationFailed);
  EXPECT_TRUE(sender.sent.empty());
}

TEST(CommandDispatcherTest, ArgumentValidation) {
  RecordingSender sender;
  CommandDispatcher dispatcher(sender.AsSender(), Holding(tests::LiveSnapshot(1000)));
  EXPECT_EQ(dispatcher.LoadEventByIndex(-1).outcome, CommandOutcome::kValidationFailed);
  EXPECT_EQ(dispatcher.LoadEventById("").outcome, CommandOutcome::kValidationFailed);
  EXPECT_EQ(dispatcher.StartEvent("").outcome, CommandOutcome::kValidationFailed);
  EXPECT_EQ(dispatcher.LoadEventByCue("").outcome, CommandOutcome::kValidationFailed);
  EXPECT_TRUE(sender.sent.empty());

  EXPECT_TRUE(dispatcher.LoadEventByIndex(0).ok());
  EXPECT_TRUE(dispatcher.LoadEventByCue("A/1").ok());
  ASSERT_EQ(sender.sent.size(), 2u);
  EXPECT_EQ(transport::EncodeCommandPath(sender.sent[0]), "/load/index/0");
  EXPECT_EQ(transport::EncodeCommandPath(sender.sent[1]), "/load/cue/A%2F1");
}

TEST(CommandDispatcherTest, AddTimeWithoutLoadedEventIsStateError) {
  RecordingSender sender;
  CommandDispatcher dispatcher(sender.AsSender(),
                               Holding(tests::LiveSnapshot(std::nullopt, "stop", "")));
  EXPECT_EQ(dispatcher.AddTime(5000, "end").outcome, CommandOutcome::kStateError);

  CommandDispatcher no_snapshot(sender.AsSender(), Holding(nullptr));
  EXPECT_EQ(no_snapshot.AddTime(5000, "end").outcome, CommandOutcome::kStateError);
  EXPECT_TRUE(sender.sent.empty());
}

TEST(CommandDispatcherTest, ServerRejectionCarriesMessage) {
  RecordingSender sender;
  sender.reply = SendResult::Delivered(
      HttpResponse{400, "Bad Request", R"({"message":"Event not found"})"});
  CommandDispatcher dispatcher(sender.AsSender(), Holding(tests::LiveSnapshot(1000)));
  const CommandResult r = dispatcher.LoadEventById("missing");
  EXPECT_EQ(r.outcome, CommandOutcome::kRejected);
  EXPECT_EQ(r.http_status, 400);
  EXPECT_EQ(r.reason, "Event not found");
}

TEST(CommandDispatcherTest, RejectionIsLoggedAsError) {
  std::vector<std::string> lines;
  util::Logger::SetErrorSink([&lines](const std::string& line) { lines.push_back(line); });
  RecordingSender sender;
  sender.reply = SendResult::Delivered(HttpResponse{409, "Conflict", R"({"message":"busy"})"});
  CommandDispatcher dispatcher(sender.AsSender(), Holding(tests::LiveSnapshot(1000)));
  dispatcher.Roll();
  util::Logger::SetErrorSink(nullptr);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("[CommandDispatcher] roll rejected by server: busy"), std::string::npos);
}

TEST(CommandDispatcherTest, RejectionReasonFallbacks) {
  EXPECT_EQ(CommandDispatcher::RejectionReason(
                HttpResponse{404, "Not Found", R"({"payload":"no such cue"})"}),
            "no such cue");
  EXPECT_EQ(CommandDispatcher::RejectionReason(HttpResponse{503, "Service Unavailable", ""}),
            "HTTP 503 Service Unavailable");
  EXPECT_EQ(CommandDispatcher::RejectionReason(HttpResponse{500, "", "<html>"}), "HTTP 500");
}

TEST(CommandDispatcherTest, Accepts202) {
  RecordingSender sender;
  sender.reply = SendResult::Delivered(HttpResponse{202, "Accepted", ""});
  CommandDispatcher dispatcher(sender.AsSender(), Holding(tests::LiveSnapshot(1000)));
  const CommandResult r = dispatcher.Start();
  EXPECT_TRUE(r.ok());
  EXPECT_EQ(r.http_status, 202);
}

TEST(CommandDispatcherTest, TransportFailureIsReported) {
  RecordingSender sender;
  sender.reply = SendResult::Failure(TransportError::kTimeout);
  CommandDispatcher dispatcher(sender.AsSender(), Holding(tests::LiveSnapshot(1000)));
  const CommandResult r = dispatcher.Pause();
  EXPECT_EQ(r.outcome, CommandOutcome::kTransportFailure);
  EXPECT_EQ(r.transport_error, TransportError::kTimeout);
}

// -----------------------------------------------------------------------------
// Against a real client in Backoff: NotConnected without waiting
// -----------------------------------------------------------------------------
TEST(CommandDispatcherTest, BackoffGivesNotConnectedImmediately) {
  transport::TransportOptions options;
  options.backoff_initial_ms = 60000;
  options.backoff_max_ms = 60000;
  auto channel = std::make_shared<tests::fixtures::FakeHttpChannel>();
  transport::TransportClient client(options,
                                    tests::fixtures::FakeHttpChannel::FactoryFor(channel));
  ASSERT_EQ(client.Connect("timer.local", 4001), transport::ConnectionState::kBackoff);

  CommandDispatcher dispatcher([&client](const Command& c) { return client.Send(c); },
                               Holding(tests::LiveSnapshot(1000)));
  const auto began = std::chrono::steady_clock::now();
  const CommandResult r = dispatcher.AddTime(-30000, "both");
  EXPECT_EQ(r.outcome, CommandOutcome::kTransportFailure);
  EXPECT_EQ(r.transport_error, TransportError::kNotConnected);
  EXPECT_LT(std::chrono::steady_clock::now() - began, std::chrono::milliseconds(100));
  EXPECT_TRUE(channel->CommandRequests().empty());
}

}  // namespace
}  // namespace cuebridge::commands
