// Repository: cuebridge
// Component: Transport client unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>
#include <variant>
#include <vector>

#include "cuebridge/transport/TransportClient.hpp"
#include "fixtures/FakeHttpChannel.h"
#include "support/Messages.hpp"

namespace cuebridge::transport {
namespace {

using tests::PollBody;
using tests::fixtures::FakeHttpChannel;
using tests::fixtures::HttpFail;
using tests::fixtures::HttpOk;
using tests::fixtures::HttpStatus;
using Kind = InboundItem::Kind;

TransportOptions FastOptions() {
  TransportOptions o;
  o.poll_interval = std::chrono::milliseconds(5);
  o.request_timeout = std::chrono::milliseconds(100);
  o.backoff_initial_ms = 5;
  o.backoff_max_ms = 20;
  o.stability_threshold_ms = 1000000;
  o.protocol_error_threshold = 3;
  return o;
}

// Compact description of an item for sequence assertions.
enum class Tag { kConnecting, kConnected, kBackoff, kDisconnected, kFull, kResync, kOther, kEnd };

Tag TagOf(const InboundItem& item) {
  switch (item.kind) {
    case Kind::kTerminal:
      return Tag::kEnd;
    case Kind::kConnectionChanged:
      switch (item.status.state) {
        case ConnectionState::kConnecting:
          return Tag::kConnecting;
        case ConnectionState::kConnected:
          return Tag::kConnected;
        case ConnectionState::kBackoff:
          return Tag::kBackoff;
        case ConnectionState::kDisconnected:
          return Tag::kDisconnected;
      }
      return Tag::kOther;
    case Kind::kMessage:
      if (std::holds_alternative<FullState>(*item.message)) return Tag::kFull;
      if (std::holds_alternative<Resync>(*item.message)) return Tag::kResync;
      return Tag::kOther;
  }
  return Tag::kOther;
}

std::vector<Tag> ReceiveTags(TransportClient& client, size_t count,
                             std::vector<InboundItem>* items = nullptr) {
  std::vector<Tag> out;
  for (size_t i = 0; i < count; ++i) {
    InboundItem item = client.Receive();
    out.push_back(TagOf(item));
    if (items) items->push_back(item);
    if (item.kind == Kind::kTerminal) break;
  }
  return out;
}

TEST(TransportClientTest, FirstConnectHasNoResync) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->SetDefaultPoll(HttpOk(PollBody(5000)));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));

  EXPECT_EQ(client.Connect("timer.local", 4001), ConnectionState::kConnected);
  EXPECT_EQ(ReceiveTags(client, 4),
            (std::vector<Tag>{Tag::kConnecting, Tag::kConnected, Tag::kFull, Tag::kFull}));
}

// -----------------------------------------------------------------------------
// Link drop then recovery: Backoff, Connecting, Connected, Resync, full state
// -----------------------------------------------------------------------------
TEST(TransportClientTest, ResyncPrecedesFirstMessageAfterReconnect) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->QueuePoll(HttpOk(PollBody(5000)));
  channel->QueuePoll(HttpFail(TransportError::kConnectionLost));
  channel->SetDefaultPoll(HttpOk(PollBody(4000)));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));

  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kConnected);
  std::vector<InboundItem> items;
  EXPECT_EQ(ReceiveTags(client, 8, &items),
            (std::vector<Tag>{Tag::kConnecting, Tag::kConnected, Tag::kFull, Tag::kBackoff,
                              Tag::kConnecting, Tag::kConnected, Tag::kResync, Tag::kFull}));
  EXPECT_EQ(items[3].status.last_error, TransportError::kConnectionLost);
}

TEST(TransportClientTest, TimeoutEntersBackoff) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->SetDefaultPoll(HttpFail(TransportError::kTimeout));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));

  EXPECT_EQ(client.Connect("timer.local", 4001), ConnectionState::kBackoff);
  EXPECT_EQ(client.status().last_error, TransportError::kTimeout);
  std::vector<InboundItem> items;
  EXPECT_EQ(ReceiveTags(client, 4, &items),
            (std::vector<Tag>{Tag::kConnecting, Tag::kBackoff, Tag::kConnecting, Tag::kBackoff}));
  EXPECT_EQ(items[1].status.last_error, TransportError::kTimeout);
}

TEST(TransportClientTest, SustainedProtocolErrorsBecomeConnectionLost) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->QueuePoll(HttpOk(PollBody(5000)));
  channel->QueuePoll(HttpOk("not json"));
  channel->QueuePoll(HttpStatus(500, "Internal Server Error"));
  channel->QueuePoll(HttpOk("[]"));
  channel->SetDefaultPoll(HttpOk(PollBody(4000)));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));

  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kConnected);
  std::vector<InboundItem> items;
  EXPECT_EQ(ReceiveTags(client, 8, &items),
            (std::vector<Tag>{Tag::kConnecting, Tag::kConnected, Tag::kFull, Tag::kBackoff,
                              Tag::kConnecting, Tag::kConnected, Tag::kResync, Tag::kFull}));
  EXPECT_EQ(items[3].status.last_error, TransportError::kConnectionLost);
}

TEST(TransportClientTest, IsolatedProtocolErrorsAreSkipped) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->QueuePoll(HttpOk(PollBody(5000)));
  channel->QueuePoll(HttpOk("not json"));
  channel->QueuePoll(HttpOk("{broken"));
  channel->QueuePoll(HttpOk(PollBody(4000)));
  channel->QueuePoll(HttpOk("not json"));
  channel->QueuePoll(HttpOk("not json"));
  channel->SetDefaultPoll(HttpOk(PollBody(3000)));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));

  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kConnected);
  EXPECT_EQ(ReceiveTags(client, 5),
            (std::vector<Tag>{Tag::kConnecting, Tag::kConnected, Tag::kFull, Tag::kFull,
                              Tag::kFull}));
  EXPECT_EQ(client.state(), ConnectionState::kConnected);
}

TEST(TransportClientTest, SendFailsFastWhenNotConnected) {
  auto channel = std::make_shared<FakeHttpChannel>();
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));

  Command start;
  start.verb = CommandVerb::kStart;
  EXPECT_EQ(client.Send(start).error, TransportError::kNotConnected);

  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kBackoff);
  const auto began = std::chrono::steady_clock::now();
  const SendResult r = client.Send(start);
  EXPECT_EQ(r.error, TransportError::kNotConnected);
  EXPECT_FALSE(r.delivered());
  EXPECT_LT(std::chrono::steady_clock::now() - began, std::chrono::milliseconds(50));
  EXPECT_TRUE(channel->CommandRequests().empty());
}

TEST(TransportClientTest, SendUsesApiPathWhenConnected) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->SetDefaultPoll(HttpOk(PollBody(5000)));
  channel->SetCommandResult(HttpStatus(202, "Accepted"));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));
  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kConnected);

  Command load;
  load.verb = CommandVerb::kLoadEventById;
  load.event_id = "a b";
  const SendResult r = client.Send(load);
  ASSERT_TRUE(r.delivered());
  EXPECT_EQ(r.ack->status, 202);
  EXPECT_EQ(channel->CommandRequests(), std::vector<std::string>{"/api/load/id/a%20b"});
}

TEST(TransportClientTest, ShutdownInterruptsBackoffPromptly) {
  TransportOptions options = FastOptions();
  options.backoff_initial_ms = 60000;
  options.backoff_max_ms = 60000;
  auto channel = std::make_shared<FakeHttpChannel>();
  TransportClient client(options, FakeHttpChannel::FactoryFor(channel));
  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kBackoff);

  std::vector<Tag> seen;
  std::thread receiver([&] {
    while (true) {
      const Tag tag = TagOf(client.Receive());
      seen.push_back(tag);
      if (tag == Tag::kEnd) break;
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  const auto began = std::chrono::steady_clock::now();
  client.Shutdown();
  receiver.join();
  EXPECT_LT(std::chrono::steady_clock::now() - began, std::chrono::milliseconds(1000));
  ASSERT_FALSE(seen.empty());
  EXPECT_EQ(seen.back(), Tag::kEnd);
  EXPECT_TRUE(channel->cancelled());
  EXPECT_EQ(TagOf(client.Receive()), Tag::kEnd);
}

// -----------------------------------------------------------------------------
// Next event from the rundown when the poll omits it
// -----------------------------------------------------------------------------
constexpr char kRundownBody[] =
    R"({"payload":[)"
    R"({"type":"event","id":"ev-1","title":"Keynote"},)"
    R"({"type":"block","id":"blk","title":"Break"},)"
    R"({"type":"event","id":"ev-2","title":"Hidden","skip":true},)"
    R"({"type":"event","id":"ev-3","title":"Panel","cue":"3"}]})";

const FullState* FirstFullState(const std::vector<InboundItem>& items) {
  for (const auto& item : items) {
    if (item.kind != Kind::kMessage) continue;
    if (const auto* full = std::get_if<FullState>(&*item.message)) return full;
  }
  return nullptr;
}

TEST(TransportClientTest, RundownSuppliesMissingNextEvent) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->SetDefaultPoll(HttpOk(PollBody(5000, "play", "ev-1")));
  channel->SetRundownResult(HttpOk(kRundownBody));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));

  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kConnected);
  std::vector<InboundItem> items;
  ReceiveTags(client, 3, &items);
  const FullState* full = FirstFullState(items);
  ASSERT_NE(full, nullptr);
  ASSERT_TRUE(full->event_next.has_value());
  EXPECT_EQ(full->event_next.value.event_id, "ev-3");
  EXPECT_EQ(full->event_next.value.cue, "3");
  EXPECT_GE(channel->RundownCount(), 1);
}

TEST(TransportClientTest, RundownEndMarksNoNextEvent) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->SetDefaultPoll(HttpOk(PollBody(5000, "play", "ev-3")));
  channel->SetRundownResult(HttpOk(kRundownBody));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));

  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kConnected);
  std::vector<InboundItem> items;
  ReceiveTags(client, 3, &items);
  const FullState* full = FirstFullState(items);
  ASSERT_NE(full, nullptr);
  EXPECT_EQ(full->event_next.kind, Field<model::EventRef>::Kind::kNull);
}

TEST(TransportClientTest, NoRundownLookupWhenPollCarriesNextEvent) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->SetDefaultPoll(HttpOk(
      R"({"payload":{"timer":{"current":5000,"playback":"play"},)"
      R"("eventNow":{"id":"ev-1","title":"Keynote"},"eventNext":{"id":"ev-9","title":"Q&A"}}})"));
  channel->SetRundownResult(HttpOk(kRundownBody));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));

  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kConnected);
  std::vector<InboundItem> items;
  ReceiveTags(client, 4, &items);
  const FullState* full = FirstFullState(items);
  ASSERT_NE(full, nullptr);
  ASSERT_TRUE(full->event_next.has_value());
  EXPECT_EQ(full->event_next.value.event_id, "ev-9");
  EXPECT_EQ(channel->RundownCount(), 0);
}

TEST(TransportClientTest, RundownFailureLeavesPollIntact) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->SetDefaultPoll(HttpOk(PollBody(5000, "play", "ev-1")));
  channel->SetRundownResult(HttpOk("not json"));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));

  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kConnected);
  std::vector<InboundItem> items;
  EXPECT_EQ(ReceiveTags(client, 4, &items),
            (std::vector<Tag>{Tag::kConnecting, Tag::kConnected, Tag::kFull, Tag::kFull}));
  const FullState* full = FirstFullState(items);
  ASSERT_NE(full, nullptr);
  EXPECT_FALSE(full->event_next.present());
  EXPECT_EQ(client.state(), ConnectionState::kConnected);
}

// -----------------------------------------------------------------------------
// Commands from several threads go out one at a time, even while the
// receive loop is parked in a slow poll
// -----------------------------------------------------------------------------
TEST(TransportClientTest, ConcurrentSendsAreSerializedAndNotBlockedByPoll) {
  auto channel = std::make_shared<FakeHttpChannel>();
  channel->SetDefaultPoll(HttpOk(PollBody(5000)));
  channel->SetCommandDelay(std::chrono::milliseconds(20));
  TransportClient client(FastOptions(), FakeHttpChannel::FactoryFor(channel));
  ASSERT_EQ(client.Connect("timer.local", 4001), ConnectionState::kConnected);

  constexpr auto kPollDelay = std::chrono::milliseconds(2000);
  channel->SetPollDelay(kPollDelay);
  std::thread receiver([&] {
    while (client.Receive().kind != Kind::kTerminal) {
    }
  });
  const int polls = channel->PollCount();
  const auto wait_until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (channel->PollCount() == polls && std::chrono::steady_clock::now() < wait_until) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  ASSERT_GT(channel->PollCount(), polls);

  constexpr int kSenders = 4;
  std::vector<SendResult> results(kSenders);
  std::vector<std::thread> senders;
  const auto began = std::chrono::steady_clock::now();
  for (int i = 0; i < kSenders; ++i) {
    senders.emplace_back([&client, &results, i] {
      Command pause;
      pause.verb = CommandVerb::kPause;
      results[i] = client.Send(pause);
    });
  }
  for (auto& t : senders) t.join();
  const auto elapsed = std::chrono::steady_clock::now() - began;

  client.Shutdown();
  receiver.join();

  for (const auto& r : results) EXPECT_TRUE(r.delivered());
  EXPECT_EQ(channel->CommandRequests().size(), static_cast<size_t>(kSenders));
  EXPECT_EQ(channel->MaxCommandsInFlight(), 1);
  EXPECT_LT(elapsed, kPollDelay);
}

}  // namespace
}  // namespace cuebridge::transport
