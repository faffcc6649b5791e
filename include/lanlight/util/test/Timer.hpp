// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>

namespace lanlight
{
namespace util
{
namespace test
{

// Timer driven by a virtual clock. Timers created by the same
// IoService share one clock so that advancing time is consistent
// across all of them.
struct Timer
{
  using ErrorCode = int;
  using TimePoint = std::chrono::system_clock::time_point;

  // Initialize the clock with an arbitrary large value to simulate the
  // time_since_epoch of a real clock.
  Timer()
    : Timer(std::make_shared<TimePoint>(std::chrono::milliseconds{123456789}))
  {
  }

  explicit Timer(std::shared_ptr<TimePoint> pNow)
    : mpNow(std::move(pNow))
  {
  }

  void expires_at(const TimePoint t)
  {
    cancel();
    mFireAt = t;
  }

  template <typename T, typename Rep>
  void expires_from_now(std::chrono::duration<T, Rep> duration)
  {
    cancel();
    mFireAt = now() + std::chrono::duration_cast<TimePoint::duration>(duration);
  }

  ErrorCode cancel()
  {
    if (mHandler)
    {
      auto handler = std::move(mHandler);
      mHandler = nullptr;
      handler(1); // call existing handler with truthy error code
    }
    return 0;
  }

  template <typename Handler>
  void async_wait(Handler handler)
  {
    mHandler = [handler](ErrorCode ec) mutable { handler(ec); };
  }

  TimePoint now() const
  {
    return *mpNow;
  }

  bool pending() const
  {
    return static_cast<bool>(mHandler);
  }

  TimePoint fireAt() const
  {
    return mFireAt;
  }

  void fireIfDue()
  {
    if (mHandler && mFireAt <= *mpNow)
    {
      auto handler = std::move(mHandler);
      mHandler = nullptr;
      handler(0);
    }
  }

  // Moves the clock forward, firing the handler at its deadline. A
  // handler that re-arms the timer within the advanced span fires
  // again.
  template <typename T, typename Rep>
  void advance(std::chrono::duration<T, Rep> duration)
  {
    const auto target = *mpNow + std::chrono::duration_cast<TimePoint::duration>(duration);
    while (mHandler && mFireAt <= target)
    {
      *mpNow = std::max(*mpNow, mFireAt);
      fireIfDue();
    }
    *mpNow = target;
  }

private:
  std::shared_ptr<TimePoint> mpNow;
  TimePoint mFireAt;
  std::function<void(ErrorCode)> mHandler;
};

} // namespace test
} // namespace util
} // namespace lanlight
