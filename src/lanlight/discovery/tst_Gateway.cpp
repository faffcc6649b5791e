// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/discovery/Gateway.hpp>
#include <lanlight/discovery/test/Interface.hpp>
#include <lanlight/test/CatchWrapper.hpp>
#include <lanlight/test/Platform.hpp>
#include <lanlight/util/Log.hpp>
#include <lanlight/util/test/Timer.hpp>

namespace lanlight
{
namespace discovery
{
namespace
{

const std::uint32_t kSource = 0x5eed;
const auto kIpInterface = platform::test::makeInterface("192.168.1.10", "255.255.255.0");
const lan::Serial kSerial = lan::Serial::fromString("d073d5000001");
const asio::ip::udp::endpoint kDeviceEndpoint{asio::ip::make_address_v4("192.168.1.50"), 56700};

struct ObserverRecord
{
  std::vector<DeviceAnnouncement> announcements;
  std::vector<lan::Packet> packets;
  std::vector<asio::ip::address_v4> failures;
};

struct TestObserver
{
  friend void sawDevice(TestObserver& observer, const DeviceAnnouncement& announcement)
  {
    observer.pRecord->announcements.push_back(announcement);
  }

  friend void receivedPacket(
    TestObserver& observer, const asio::ip::udp::endpoint&, const lan::Packet& packet)
  {
    observer.pRecord->packets.push_back(packet);
  }

  friend void gatewayFailed(TestObserver& observer, const asio::ip::address_v4& addr)
  {
    observer.pRecord->failures.push_back(addr);
  }

  ObserverRecord* pRecord;
};

std::vector<std::uint8_t> stateService(const std::uint32_t source, const lan::Serial& target)
{
  lan::Header header;
  header.source = source;
  header.target = target;
  lan::StateService service;
  service.port = 56700;
  return lan::encode(header, service);
}

struct Fixture
{
  Fixture()
    : iface(asio::ip::udp::endpoint{kIpInterface.address, 50000})
    , gateway(makeGateway(util::injectRef(iface), kIpInterface, TestObserver{&record},
        util::injectRef(timer), util::NullLog{}, std::chrono::seconds(60), kSource, 56700))
  {
  }

  ObserverRecord record;
  test::Interface iface;
  util::test::Timer timer;
  Gateway<test::Interface&, TestObserver, util::test::Timer&, util::NullLog> gateway;
};

} // anonymous namespace

TEST_CASE("Gateway | BroadcastsDiscoveryOnStart", "[Gateway]")
{
  Fixture fixture;
  REQUIRE(1 == fixture.iface.sentMessages.size());

  const auto& sent = fixture.iface.sentMessages.front();
  CHECK(asio::ip::udp::endpoint{asio::ip::make_address_v4("192.168.1.255"), 56700}
        == sent.second);

  const auto result = lan::decode(sent.first);
  REQUIRE(std::holds_alternative<lan::Packet>(result));
  const auto& packet = std::get<lan::Packet>(result);
  CHECK(std::holds_alternative<lan::GetService>(packet.message));
  CHECK(packet.header.tagged);
  CHECK(packet.header.target.isZero());
  CHECK(kSource == packet.header.source);
  CHECK(1 == discoveryCycle(fixture.gateway));
}

TEST_CASE("Gateway | RebroadcastsEveryInterval", "[Gateway]")
{
  Fixture fixture;
  fixture.timer.advance(std::chrono::seconds(59));
  CHECK(1 == fixture.iface.sentMessages.size());
  fixture.timer.advance(std::chrono::seconds(1));
  CHECK(2 == fixture.iface.sentMessages.size());
  fixture.timer.advance(std::chrono::seconds(120));
  CHECK(4 == fixture.iface.sentMessages.size());
  CHECK(4 == discoveryCycle(fixture.gateway));
}

TEST_CASE("Gateway | DiscoverNowStartsCycle", "[Gateway]")
{
  Fixture fixture;
  discover(fixture.gateway);
  CHECK(2 == fixture.iface.sentMessages.size());
  CHECK(2 == discoveryCycle(fixture.gateway));
}

TEST_CASE("Gateway | ReportsAnsweringDevice", "[Gateway]")
{
  Fixture fixture;
  fixture.iface.incomingMessage(kDeviceEndpoint, stateService(kSource, kSerial));

  REQUIRE(1 == fixture.record.announcements.size());
  const auto& announcement = fixture.record.announcements.front();
  CHECK(kSerial == announcement.serial);
  CHECK(kDeviceEndpoint == announcement.endpoint);
  CHECK(kIpInterface.address == announcement.gatewayAddr);
  CHECK(1 == announcement.cycle);
  CHECK(1 == fixture.record.packets.size());
}

TEST_CASE("Gateway | IgnoresOtherClients", "[Gateway]")
{
  Fixture fixture;
  fixture.iface.incomingMessage(kDeviceEndpoint, stateService(kSource + 1, kSerial));
  CHECK(fixture.record.announcements.empty());
  CHECK(fixture.record.packets.empty());
}

TEST_CASE("Gateway | KeepsListeningAfterEmptyDatagram", "[Gateway]")
{
  Fixture fixture;
  fixture.iface.incomingMessage(kDeviceEndpoint, std::vector<std::uint8_t>{});
  CHECK(fixture.record.packets.empty());

  fixture.iface.incomingMessage(kDeviceEndpoint, stateService(kSource, kSerial));
  CHECK(1 == fixture.record.announcements.size());
  CHECK(1 == fixture.record.packets.size());
}

TEST_CASE("Gateway | KeepsListeningAfterGarbage", "[Gateway]")
{
  Fixture fixture;
  fixture.iface.incomingMessage(kDeviceEndpoint, std::vector<std::uint8_t>{1, 2, 3});
  CHECK(fixture.record.packets.empty());

  fixture.iface.incomingMessage(kDeviceEndpoint, stateService(kSource, kSerial));
  CHECK(1 == fixture.record.announcements.size());
}

TEST_CASE("Gateway | ForwardsResponses", "[Gateway]")
{
  Fixture fixture;
  lan::Header header;
  header.source = kSource;
  header.target = kSerial;
  header.sequence = 3;
  fixture.iface.incomingMessage(kDeviceEndpoint, lan::encode(header, lan::StatePower{}));

  CHECK(fixture.record.announcements.empty());
  REQUIRE(1 == fixture.record.packets.size());
  CHECK(3 == fixture.record.packets.front().header.sequence);
}

TEST_CASE("Gateway | UnicastThroughInterface", "[Gateway]")
{
  Fixture fixture;
  const std::vector<std::uint8_t> bytes{4, 5, 6};
  sendTo(fixture.gateway, bytes, kDeviceEndpoint);
  REQUIRE(2 == fixture.iface.sentMessages.size());
  CHECK(bytes == fixture.iface.sentMessages.back().first);
  CHECK(kDeviceEndpoint == fixture.iface.sentMessages.back().second);
}

TEST_CASE("Gateway | ReportsFailedBroadcast", "[Gateway]")
{
  Fixture fixture;
  fixture.iface.failSends = true;
  fixture.timer.advance(std::chrono::seconds(60));
  REQUIRE(1 == fixture.record.failures.size());
  CHECK(kIpInterface.address == fixture.record.failures.front());

  // The next cycle is still scheduled
  fixture.iface.failSends = false;
  fixture.timer.advance(std::chrono::seconds(60));
  CHECK(2 == fixture.iface.sentMessages.size());
}

TEST_CASE("Gateway | FirstBroadcastFailureThrows", "[Gateway]")
{
  ObserverRecord record;
  test::Interface iface;
  iface.failSends = true;
  util::test::Timer timer;
  CHECK_THROWS_AS(makeGateway(util::injectRef(iface), kIpInterface, TestObserver{&record},
                    util::injectRef(timer), util::NullLog{}, std::chrono::seconds(60),
                    kSource, 56700),
    UdpSendException);
}

} // namespace discovery
} // namespace lanlight
