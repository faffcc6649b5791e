// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <memory>

namespace lanlight
{
namespace util
{

// Handler for async operations that can complete after the object
// that started them has gone away. Asio timers and sockets may invoke
// their handlers after cancellation, so every handler that reaches
// back into a shared_ptr-owned object goes through this wrapper,
// which only forwards the call while the target is still alive.
template <typename Delegate>
struct SafeAsyncHandler
{
  SafeAsyncHandler(const std::shared_ptr<Delegate>& pDelegate)
    : mpDelegate(pDelegate)
  {
  }

  template <typename... T>
  void operator()(T&&... t) const
  {
    if (auto pDelegate = mpDelegate.lock())
    {
      (*pDelegate)(std::forward<T>(t)...);
    }
  }

  std::weak_ptr<Delegate> mpDelegate;
};

template <typename Delegate>
SafeAsyncHandler<Delegate> makeAsyncSafe(const std::shared_ptr<Delegate>& pDelegate)
{
  return {pDelegate};
}

} // namespace util
} // namespace lanlight
