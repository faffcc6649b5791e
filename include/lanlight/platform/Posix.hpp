// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/discovery/Interfaces.hpp>
#include <vector>

namespace lanlight
{
namespace platform
{

// Platform API declaration

// Type flag for the Posix platform API
struct Posix
{
  // Scan the network interfaces and return the IPv4 interfaces that
  // are up, broadcast capable and not the loopback, in the order the
  // system reports them.
  std::vector<discovery::IpInterface> scanIpIfAddrs();
};

} // namespace platform
} // namespace lanlight
