// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/discovery/Interfaces.hpp>
#include <lanlight/util/Injected.hpp>
#include <algorithm>
#include <chrono>
#include <vector>

namespace lanlight
{
namespace discovery
{

// Periodically asks the platform for the eligible local interfaces
// and passes them to the callback. The callback receives a vector of
// IpInterface in the order reported by the platform, without
// duplicates.
template <typename Callback, typename Platform, typename Timer, typename Log>
struct InterfaceScanner
{
  InterfaceScanner(
    const std::chrono::seconds period,
    util::Injected<Callback> callback,
    util::Injected<Platform> platform,
    util::Injected<Timer> timer,
    util::Injected<Log> log)
    : mPeriod(period)
    , mCallback(std::move(callback))
    , mPlatform(std::move(platform))
    , mTimer(std::move(timer))
    , mLog(std::move(log))
  {
  }

  void enable(const bool bEnable)
  {
    if (bEnable)
    {
      scan();
    }
    else
    {
      mTimer->cancel();
    }
  }

  void scan()
  {
    using namespace std;
    debug(*mLog) << "Scanning network interfaces";
    const auto scanned = mPlatform->scanIpIfAddrs();
    vector<IpInterface> ifaces;
    for (const auto& iface : scanned)
    {
      if (find(begin(ifaces), end(ifaces), iface) == end(ifaces))
      {
        ifaces.push_back(iface);
      }
    }
    (*mCallback)(std::move(ifaces));

    mTimer->expires_from_now(mPeriod);
    using ErrorCode = typename util::Injected<Timer>::type::ErrorCode;
    mTimer->async_wait([this](const ErrorCode e) {
      if (!e)
      {
        scan();
      }
    });
  }

private:
  const std::chrono::seconds mPeriod;
  util::Injected<Callback> mCallback;
  util::Injected<Platform> mPlatform;
  util::Injected<Timer> mTimer;
  util::Injected<Log> mLog;
};

template <typename Callback, typename Platform, typename Timer, typename Log>
InterfaceScanner<Callback, Platform, Timer, Log> makeInterfaceScanner(
  const std::chrono::seconds period,
  util::Injected<Callback> callback,
  util::Injected<Platform> platform,
  util::Injected<Timer> timer,
  util::Injected<Log> log)
{
  using namespace std;
  return {period, move(callback), move(platform), move(timer), move(log)};
}

} // namespace discovery
} // namespace lanlight
