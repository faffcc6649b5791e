// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/discovery/Interfaces.hpp>
#include <vector>

namespace lanlight
{
namespace platform
{
namespace test
{

// Reports a scripted sequence of interface scans. Once the script is
// exhausted the last scan repeats.
struct Platform
{
  using Scans = std::vector<std::vector<discovery::IpInterface>>;

  Platform(Scans scans)
    : mScans(std::move(scans))
    , mNextScan(0)
  {
  }

  std::vector<discovery::IpInterface> scanIpIfAddrs()
  {
    if (mScans.empty())
    {
      return {};
    }
    const auto& scan = mScans[mNextScan];
    if (mNextScan + 1 < mScans.size())
    {
      ++mNextScan;
    }
    return scan;
  }

private:
  Scans mScans;
  std::size_t mNextScan;
};

inline discovery::IpInterface makeInterface(const char* address, const char* netmask)
{
  return {asio::ip::make_address_v4(address), asio::ip::make_address_v4(netmask)};
}

} // namespace test
} // namespace platform
} // namespace lanlight
