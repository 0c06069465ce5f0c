// Repository: cuebridge
// Component: Fake HTTP Channel
// Purpose: Scripted IHttpChannel for transport, dispatcher and session tests.
// Copyright (c) 2026 Cuebridge

#ifndef CUEBRIDGE_TESTS_FIXTURES_FAKE_HTTP_CHANNEL_H_
#define CUEBRIDGE_TESTS_FIXTURES_FAKE_HTTP_CHANNEL_H_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "cuebridge/transport/HttpChannel.hpp"
#include "cuebridge/transport/TransportClient.hpp"

namespace cuebridge::tests::fixtures
{

  inline transport::HttpResult HttpOk(const std::string &body, int status = 200)
  {
    transport::HttpResponse r;
    r.status = status;
    r.reason = status == 200 ? "OK" : "";
    r.body = body;
    return transport::HttpResult::Success(std::move(r));
  }

  inline transport::HttpResult HttpStatus(int status, const std::string &reason,
                                          const std::string &body = "")
  {
    transport::HttpResponse r;
    r.status = status;
    r.reason = reason;
    r.body = body;
    return transport::HttpResult::Success(std::move(r));
  }

  inline transport::HttpResult HttpFail(transport::TransportError error)
  {
    return transport::HttpResult::Failure(error, "scripted failure");
  }

  // FakeHttpChannel answers /poll requests from a script (then a default),
  // /data/rundown with a fixed lookup result and every other path with a fixed
  // command result. All requests are recorded. Optional delays hold a request
  // open without holding the fake's lock; Cancel() ends them early.
  class FakeHttpChannel : public transport::IHttpChannel
  {
  public:
    FakeHttpChannel()
        : default_poll_(HttpFail(transport::TransportError::kConnectionLost)),
          rundown_result_(HttpStatus(404, "Not Found")),
          command_result_(HttpOk("{}"))
    {
    }

    transport::HttpResult Get(const std::string &path,
                              std::chrono::milliseconds /*timeout*/) override
    {
      std::unique_lock<std::mutex> lock(mutex_);
      requests_.push_back(path);
      if (cancelled_)
      {
        return Cancelled();
      }
      if (IsPoll(path))
      {
        ++poll_count_;
        transport::HttpResult r = default_poll_;
        if (!polls_.empty())
        {
          r = polls_.front();
          polls_.pop_front();
        }
        if (poll_delay_.count() > 0 && !Hold(lock, poll_delay_))
        {
          return Cancelled();
        }
        return r;
      }
      if (IsRundown(path))
      {
        ++rundown_count_;
        return rundown_result_;
      }

      ++commands_in_flight_;
      max_commands_in_flight_ = std::max(max_commands_in_flight_, commands_in_flight_);
      transport::HttpResult r = command_result_;
      const bool completed = command_delay_.count() <= 0 || Hold(lock, command_delay_);
      --commands_in_flight_;
      return completed ? r : Cancelled();
    }

    void Cancel() override
    {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
      }
      cv_.notify_all();
    }

    void QueuePoll(transport::HttpResult r)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      polls_.push_back(std::move(r));
    }

    void SetDefaultPoll(transport::HttpResult r)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      default_poll_ = std::move(r);
    }

    void SetCommandResult(transport::HttpResult r)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      command_result_ = std::move(r);
    }

    void SetRundownResult(transport::HttpResult r)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      rundown_result_ = std::move(r);
    }

    void SetPollDelay(std::chrono::milliseconds delay)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      poll_delay_ = delay;
    }

    void SetCommandDelay(std::chrono::milliseconds delay)
    {
      std::lock_guard<std::mutex> lock(mutex_);
      command_delay_ = delay;
    }

    std::vector<std::string> CommandRequests() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      std::vector<std::string> out;
      for (const auto &p : requests_)
      {
        if (!IsPoll(p) && !IsRundown(p))
          out.push_back(p);
      }
      return out;
    }

    int PollCount() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return poll_count_;
    }

    int RundownCount() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return rundown_count_;
    }

    // Highest number of command requests that were open at the same time.
    int MaxCommandsInFlight() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return max_commands_in_flight_;
    }

    bool cancelled() const
    {
      std::lock_guard<std::mutex> lock(mutex_);
      return cancelled_;
    }

    // Factory that always hands out this channel.
    static transport::ChannelFactory FactoryFor(std::shared_ptr<FakeHttpChannel> channel)
    {
      return [channel](const std::string & /*host*/, uint16_t /*port*/)
                 -> std::shared_ptr<transport::IHttpChannel>
      { return channel; };
    }

  private:
    static bool EndsWith(const std::string &path, const std::string &suffix)
    {
      return path.size() >= suffix.size() &&
             path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    static bool IsPoll(const std::string &path) { return EndsWith(path, "/poll"); }
    static bool IsRundown(const std::string &path) { return EndsWith(path, "/data/rundown"); }

    static transport::HttpResult Cancelled()
    {
      return transport::HttpResult::Failure(transport::TransportError::kConnectionLost,
                                            "cancelled");
    }

    // Releases the lock for `delay`. False when Cancel() cut the wait short.
    bool Hold(std::unique_lock<std::mutex> &lock, std::chrono::milliseconds delay)
    {
      return !cv_.wait_for(lock, delay, [this]
                           { return cancelled_; });
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<transport::HttpResult> polls_;
    transport::HttpResult default_poll_;
    transport::HttpResult rundown_result_;
    transport::HttpResult command_result_;
    std::vector<std::string> requests_;
    std::chrono::milliseconds poll_delay_{0};
    std::chrono::milliseconds command_delay_{0};
    int poll_count_ = 0;
    int rundown_count_ = 0;
    int commands_in_flight_ = 0;
    int max_commands_in_flight_ = 0;
    bool cancelled_ = false;
  };

} // namespace cuebridge::tests::fixtures

#endif // CUEBRIDGE_TESTS_FIXTURES_FAKE_HTTP_CHANNEL_H_
