// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/fleet/Registry.hpp>
#include <lanlight/test/CatchWrapper.hpp>

namespace lanlight
{
namespace fleet
{
namespace
{

const lan::Serial kSerial = lan::Serial::fromString("d073d5000001");
const auto kGateway = asio::ip::make_address_v4("192.168.1.10");
const asio::ip::udp::endpoint kEndpoint{asio::ip::make_address_v4("192.168.1.50"), 56700};

} // anonymous namespace

TEST_CASE("Registry | NewDevice", "[Registry]")
{
  Registry registry;
  const auto sighting = registry.sawDevice(kSerial, kEndpoint, kGateway, TimePoint{});
  CHECK(sighting.isNew);
  CHECK(!sighting.moved);
  REQUIRE(sighting.device);
  CHECK(kSerial == sighting.device->serial());
  CHECK(Availability::Unknown == sighting.device->state().availability);
  CHECK(1 == registry.size());
}

TEST_CASE("Registry | OneEntryPerSerial", "[Registry]")
{
  Registry registry;
  const auto first = registry.sawDevice(kSerial, kEndpoint, kGateway, TimePoint{});
  const auto second = registry.sawDevice(kSerial, kEndpoint, kGateway, TimePoint{});
  CHECK(!second.isNew);
  CHECK(!second.moved);
  CHECK(first.device == second.device);
  CHECK(1 == registry.size());
}

TEST_CASE("Registry | DeviceMoved", "[Registry]")
{
  Registry registry;
  registry.sawDevice(kSerial, kEndpoint, kGateway, TimePoint{});
  const asio::ip::udp::endpoint newEndpoint{asio::ip::make_address_v4("192.168.1.51"), 56700};
  const auto sighting = registry.sawDevice(kSerial, newEndpoint, kGateway, TimePoint{});
  CHECK(sighting.moved);
  CHECK(newEndpoint == registry.find(kSerial)->state().endpoint);
}

TEST_CASE("Registry | FindAndRemove", "[Registry]")
{
  Registry registry;
  CHECK(!registry.find(kSerial));
  registry.sawDevice(kSerial, kEndpoint, kGateway, TimePoint{});
  const auto pDevice = registry.find(kSerial);
  CHECK(pDevice);
  CHECK(1 == registry.devices().size());

  CHECK(registry.remove(kSerial));
  CHECK(!registry.remove(kSerial));
  CHECK(!registry.find(kSerial));
  CHECK(registry.devices().empty());
  // Holders of the device keep a valid object
  CHECK(kSerial == pDevice->serial());
}

} // namespace fleet
} // namespace lanlight
