// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/discovery/Interfaces.hpp>
#include <lanlight/test/CatchWrapper.hpp>
#include <lanlight/test/Platform.hpp>

namespace lanlight
{
namespace discovery
{
namespace
{

using platform::test::makeInterface;

} // anonymous namespace

TEST_CASE("Interfaces | SubnetAddresses", "[Interfaces]")
{
  const auto iface = makeInterface("192.168.1.23", "255.255.255.0");
  CHECK(asio::ip::make_address_v4("192.168.1.0") == networkAddress(iface));
  CHECK(asio::ip::make_address_v4("192.168.1.255") == broadcastAddress(iface));

  const auto wide = makeInterface("10.1.2.3", "255.0.0.0");
  CHECK(asio::ip::make_address_v4("10.255.255.255") == broadcastAddress(wide));
}

TEST_CASE("Interfaces | SameSubnet", "[Interfaces]")
{
  const auto a = makeInterface("192.168.1.23", "255.255.255.0");
  const auto b = makeInterface("192.168.1.99", "255.255.255.0");
  const auto c = makeInterface("192.168.2.23", "255.255.255.0");
  const auto d = makeInterface("192.168.1.23", "255.255.0.0");

  CHECK(sameSubnet(a, b));
  CHECK(!sameSubnet(a, c));
  CHECK(!sameSubnet(a, d));
}

TEST_CASE("Interfaces | UniqueSubnetsKeepsFirst", "[Interfaces]")
{
  const auto a = makeInterface("192.168.1.23", "255.255.255.0");
  const auto b = makeInterface("10.0.0.5", "255.0.0.0");
  const auto c = makeInterface("192.168.1.99", "255.255.255.0");

  const auto unique = uniqueSubnets(std::vector<IpInterface>{a, b, c});
  REQUIRE(2 == unique.size());
  CHECK(a == unique[0]);
  CHECK(b == unique[1]);

  const auto reversed = uniqueSubnets(std::vector<IpInterface>{c, b, a});
  REQUIRE(2 == reversed.size());
  CHECK(c == reversed[0]);
}

} // namespace discovery
} // namespace lanlight
