// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/asio/AsioWrapper.hpp>
#include <lanlight/util/SafeAsyncHandler.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace lanlight
{
namespace util
{

// Timer concept backed by an asio system timer. The pending handler
// is never invoked once the timer has been destroyed.
class AsioTimer
{
public:
  using ErrorCode = asio::error_code;
  using TimePoint = std::chrono::system_clock::time_point;

  explicit AsioTimer(asio::io_context& io)
    : mpTimer(new asio::system_timer(io))
    , mpAsyncHandler(std::make_shared<AsyncHandler>())
  {
  }

  ~AsioTimer()
  {
    // The timer may not be valid anymore if this instance was moved from
    if (mpTimer != nullptr)
    {
      cancel();
    }
  }

  AsioTimer(const AsioTimer&) = delete;
  AsioTimer& operator=(const AsioTimer&) = delete;

  AsioTimer(AsioTimer&& rhs)
    : mpTimer(std::move(rhs.mpTimer))
    , mpAsyncHandler(std::move(rhs.mpAsyncHandler))
  {
  }

  AsioTimer& operator=(AsioTimer&& rhs)
  {
    mpTimer = std::move(rhs.mpTimer);
    mpAsyncHandler = std::move(rhs.mpAsyncHandler);
    return *this;
  }

  void expires_at(const TimePoint tp)
  {
    mpTimer->expires_at(tp);
  }

  template <typename T, typename Rep>
  void expires_from_now(std::chrono::duration<T, Rep> duration)
  {
    mpTimer->expires_after(duration);
  }

  ErrorCode cancel()
  {
    try
    {
      mpTimer->cancel();
    }
    catch (const asio::system_error& e)
    {
      return e.code();
    }
    return {};
  }

  template <typename Handler>
  void async_wait(Handler handler)
  {
    mpAsyncHandler->mpHandler = std::move(handler);
    mpTimer->async_wait(util::makeAsyncSafe(mpAsyncHandler));
  }

  TimePoint now() const
  {
    return std::chrono::system_clock::now();
  }

private:
  struct AsyncHandler
  {
    void operator()(const ErrorCode e)
    {
      if (mpHandler)
      {
        mpHandler(e);
      }
    }

    std::function<void(const ErrorCode)> mpHandler;
  };

  std::unique_ptr<asio::system_timer> mpTimer;
  std::shared_ptr<AsyncHandler> mpAsyncHandler;
};

} // namespace util
} // namespace lanlight
