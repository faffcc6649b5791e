// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/util/test/Timer.hpp>
#include <deque>
#include <functional>
#include <vector>

namespace lanlight
{
namespace util
{
namespace test
{

// Single threaded stand-in for util::AsioService. Posted handlers run
// when the test advances time; timers fire in deadline order.
struct IoService
{
  using TimePoint = test::Timer::TimePoint;

  // Handle to a timer owned by the service. Destroying the handle
  // cancels the timer, as destroying an asio timer does.
  struct Timer
  {
    using ErrorCode = test::Timer::ErrorCode;
    using TimePoint = test::Timer::TimePoint;

    explicit Timer(util::test::Timer* pTimer)
      : mpTimer(pTimer)
    {
    }

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    Timer(Timer&& rhs)
      : mpTimer(rhs.mpTimer)
    {
      rhs.mpTimer = nullptr;
    }

    Timer& operator=(Timer&& rhs)
    {
      if (this != &rhs)
      {
        if (mpTimer)
        {
          mpTimer->cancel();
        }
        mpTimer = rhs.mpTimer;
        rhs.mpTimer = nullptr;
      }
      return *this;
    }

    ~Timer()
    {
      if (mpTimer)
      {
        mpTimer->cancel();
      }
    }

    void expires_at(const TimePoint t)
    {
      mpTimer->expires_at(t);
    }

    template <typename T, typename Rep>
    void expires_from_now(std::chrono::duration<T, Rep> duration)
    {
      mpTimer->expires_from_now(duration);
    }

    ErrorCode cancel()
    {
      return mpTimer->cancel();
    }

    template <typename Handler>
    void async_wait(Handler handler)
    {
      mpTimer->async_wait(std::move(handler));
    }

    TimePoint now() const
    {
      return mpTimer->now();
    }

    util::test::Timer* mpTimer;
  };

  IoService()
    : mpNow(std::make_shared<TimePoint>(std::chrono::milliseconds{123456789}))
  {
  }

  IoService(const IoService&) = delete;
  IoService& operator=(const IoService&) = delete;

  ~IoService()
  {
    // Destroying a handler may post another one
    while (!mHandlers.empty())
    {
      auto handlers = std::move(mHandlers);
      mHandlers.clear();
      handlers.clear();
    }
  }

  Timer makeTimer()
  {
    mTimers.emplace_back(mpNow);
    return Timer{&mTimers.back()};
  }

  template <typename Handler>
  void post(Handler handler)
  {
    mHandlers.emplace_back(std::move(handler));
  }

  TimePoint now() const
  {
    return *mpNow;
  }

  template <typename T, typename Rep>
  void advance(std::chrono::duration<T, Rep> duration)
  {
    runHandlers();

    const auto target = *mpNow + std::chrono::duration_cast<TimePoint::duration>(duration);
    while (auto pNext = nextDueTimer(target))
    {
      *mpNow = std::max(*mpNow, pNext->fireAt());
      pNext->fireIfDue();
      runHandlers();
    }
    *mpNow = target;
    runHandlers();
  }

  void runHandlers()
  {
    while (!mHandlers.empty())
    {
      auto handlers = std::move(mHandlers);
      mHandlers.clear();
      for (auto& handler : handlers)
      {
        handler();
      }
    }
  }

private:
  util::test::Timer* nextDueTimer(const TimePoint limit)
  {
    util::test::Timer* pNext = nullptr;
    for (auto& timer : mTimers)
    {
      if (timer.pending() && timer.fireAt() <= limit
          && (!pNext || timer.fireAt() < pNext->fireAt()))
      {
        pNext = &timer;
      }
    }
    return pNext;
  }

  std::shared_ptr<TimePoint> mpNow;
  // Timers are declared before the handlers so that they outlive any
  // handler that still refers to them during destruction.
  std::deque<util::test::Timer> mTimers;
  std::vector<std::function<void()>> mHandlers;
};

} // namespace test
} // namespace util
} // namespace lanlight
