// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/asio/AsioTimer.hpp>
#include <lanlight/asio/AsioWrapper.hpp>
#include <thread>

namespace lanlight
{
namespace util
{

// Runs an asio io_context on a dedicated thread. This thread is the
// single event loop on which all network and timer work happens.
struct AsioService
{
  using Timer = util::AsioTimer;

  AsioService()
    : AsioService(DefaultHandler{})
  {
  }

  // Exceptions of type ExceptionHandler::Exception escaping a handler
  // are passed to exceptHandler and the loop keeps running.
  template <typename ExceptionHandler>
  explicit AsioService(ExceptionHandler exceptHandler)
    : mWork(asio::make_work_guard(mContext))
  {
    mThread = std::thread{[](asio::io_context& context, ExceptionHandler handler) {
                            for (;;)
                            {
                              try
                              {
                                context.run();
                                break;
                              }
                              catch (const typename ExceptionHandler::Exception& exception)
                              {
                                handler(exception);
                              }
                            }
                          },
      std::ref(mContext), std::move(exceptHandler)};
  }

  ~AsioService()
  {
    mWork.reset();
    mThread.join();
  }

  AsioService(const AsioService&) = delete;
  AsioService& operator=(const AsioService&) = delete;

  Timer makeTimer()
  {
    return Timer{mContext};
  }

  template <typename Handler>
  void post(Handler handler)
  {
    asio::post(mContext, std::move(handler));
  }

  asio::io_context mContext;

private:
  // Default handler is hidden and defines a hidden exception type
  // that will never be thrown by other code, so it effectively does
  // not catch.
  struct DefaultHandler
  {
    struct Exception
    {
    };

    void operator()(const Exception&)
    {
    }
  };

  asio::executor_work_guard<asio::io_context::executor_type> mWork;
  std::thread mThread;
};

} // namespace util
} // namespace lanlight
