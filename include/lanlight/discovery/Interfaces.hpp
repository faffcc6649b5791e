// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/asio/AsioWrapper.hpp>
#include <algorithm>
#include <ostream>
#include <tuple>
#include <vector>

namespace lanlight
{
namespace discovery
{

// A local IPv4 interface eligible for discovery: up, broadcast capable
// and not the loopback.
struct IpInterface
{
  asio::ip::address_v4 address;
  asio::ip::address_v4 netmask;

  friend bool operator==(const IpInterface& lhs, const IpInterface& rhs)
  {
    return std::tie(lhs.address, lhs.netmask) == std::tie(rhs.address, rhs.netmask);
  }

  friend bool operator!=(const IpInterface& lhs, const IpInterface& rhs)
  {
    return !(lhs == rhs);
  }

  friend bool operator<(const IpInterface& lhs, const IpInterface& rhs)
  {
    return std::tie(lhs.address, lhs.netmask) < std::tie(rhs.address, rhs.netmask);
  }

  friend std::ostream& operator<<(std::ostream& stream, const IpInterface& iface)
  {
    return stream << iface.address << "/" << iface.netmask;
  }
};

inline asio::ip::address_v4 networkAddress(const IpInterface& iface)
{
  return asio::ip::address_v4{iface.address.to_uint() & iface.netmask.to_uint()};
}

inline asio::ip::address_v4 broadcastAddress(const IpInterface& iface)
{
  return asio::ip::address_v4{iface.address.to_uint() | ~iface.netmask.to_uint()};
}

inline bool sameSubnet(const IpInterface& lhs, const IpInterface& rhs)
{
  return lhs.netmask == rhs.netmask && networkAddress(lhs) == networkAddress(rhs);
}

// Keeps the first interface of each subnet, preserving the order of
// the input range. Two interfaces on one subnet would otherwise
// discover every device twice.
template <typename It>
std::vector<IpInterface> uniqueSubnets(It begin, const It end)
{
  std::vector<IpInterface> result;
  for (; begin != end; ++begin)
  {
    const auto& iface = *begin;
    const auto seen = std::any_of(result.begin(), result.end(),
      [&iface](const IpInterface& other) { return sameSubnet(iface, other); });
    if (!seen)
    {
      result.push_back(iface);
    }
  }
  return result;
}

inline std::vector<IpInterface> uniqueSubnets(const std::vector<IpInterface>& ifaces)
{
  return uniqueSubnets(ifaces.begin(), ifaces.end());
}

} // namespace discovery
} // namespace lanlight
