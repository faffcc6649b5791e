// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/platform/Posix.hpp>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>

namespace
{

asio::ip::address_v4 makeAddress(const struct sockaddr* pSockAddr)
{
  const auto pAddr = reinterpret_cast<const struct sockaddr_in*>(pSockAddr);
  return asio::ip::address_v4{ntohl(pAddr->sin_addr.s_addr)};
}

// RAII type to make [get,free]ifaddrs function pairs exception safe
struct GetIfAddrs
{
  GetIfAddrs()
  {
    if (getifaddrs(&interfaces)) // returns 0 on success
    {
      interfaces = nullptr;
    }
  }

  ~GetIfAddrs()
  {
    if (interfaces)
    {
      freeifaddrs(interfaces);
    }
  }

  // RAII must not copy
  GetIfAddrs(GetIfAddrs&) = delete;
  GetIfAddrs& operator=(GetIfAddrs&) = delete;

  template <typename Function>
  void withIfAddrs(Function f)
  {
    if (interfaces)
    {
      f(*interfaces);
    }
  }

private:
  struct ifaddrs* interfaces = nullptr;
};

} // anonymous namespace

namespace lanlight
{
namespace platform
{

std::vector<discovery::IpInterface> Posix::scanIpIfAddrs()
{
  std::vector<discovery::IpInterface> ifaces;

  GetIfAddrs getIfAddrs;
  getIfAddrs.withIfAddrs([&](const struct ifaddrs& interfaces) {
    for (auto pIface = &interfaces; pIface; pIface = pIface->ifa_next)
    {
      const auto flags = pIface->ifa_flags;
      if (!pIface->ifa_addr || !pIface->ifa_netmask
          || pIface->ifa_addr->sa_family != AF_INET || !(flags & IFF_UP)
          || !(flags & IFF_BROADCAST) || (flags & IFF_LOOPBACK))
      {
        continue;
      }
      ifaces.push_back({makeAddress(pIface->ifa_addr), makeAddress(pIface->ifa_netmask)});
    }
  });

  return ifaces;
}

} // namespace platform
} // namespace lanlight
