// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/discovery/Gateway.hpp>
#include <lanlight/discovery/Gateways.hpp>
#include <lanlight/discovery/test/Interface.hpp>
#include <lanlight/test/CatchWrapper.hpp>
#include <lanlight/test/Platform.hpp>
#include <lanlight/util/Log.hpp>
#include <lanlight/util/test/IoService.hpp>

namespace lanlight
{
namespace discovery
{
namespace
{

using platform::test::makeInterface;

const auto kIface1 = makeInterface("192.168.1.10", "255.255.255.0");
const auto kIface2 = makeInterface("192.168.1.11", "255.255.255.0");
const auto kIface3 = makeInterface("10.0.0.5", "255.0.0.0");

struct NullObserver
{
  friend void sawDevice(NullObserver&, const DeviceAnnouncement&)
  {
  }

  friend void receivedPacket(NullObserver&, const asio::ip::udp::endpoint&, const lan::Packet&)
  {
  }

  friend void gatewayFailed(NullObserver&, const asio::ip::address_v4&)
  {
  }
};

using Created = std::vector<std::pair<IpInterface, std::shared_ptr<test::Interface>>>;

struct TestGatewayFactory
{
  using Gateway = discovery::
    Gateway<std::shared_ptr<test::Interface>, NullObserver, util::test::IoService::Timer,
      util::NullLog>;

  Gateway operator()(util::test::IoService& io, const IpInterface& iface)
  {
    auto pIface =
      std::make_shared<test::Interface>(asio::ip::udp::endpoint{iface.address, 50000});
    pCreated->emplace_back(iface, pIface);
    return makeGateway(util::injectVal(pIface), iface, NullObserver{},
      util::injectVal(io.makeTimer()), util::NullLog{}, std::chrono::seconds(60), 77, 56700);
  }

  std::shared_ptr<Created> pCreated;
};

using TestGateways =
  Gateways<TestGatewayFactory, util::test::IoService&, platform::test::Platform, util::NullLog>;

std::unique_ptr<TestGateways> makeTestGateways(util::test::IoService& io,
  const std::shared_ptr<Created>& pCreated,
  platform::test::Platform::Scans scans)
{
  return makeGateways(std::chrono::seconds(30), TestGatewayFactory{pCreated},
    util::injectRef(io), util::injectVal(platform::test::Platform{std::move(scans)}),
    util::injectVal(util::NullLog{}));
}

std::vector<IpInterface> gatewayInterfaces(util::test::IoService& io, TestGateways& gateways)
{
  io.runHandlers();
  std::vector<IpInterface> result;
  for (const auto& iface : {kIface1, kIface2, kIface3})
  {
    if (gateways.withGateway(iface.address, [](auto&) {}))
    {
      result.push_back(iface);
    }
  }
  return result;
}

} // anonymous namespace

TEST_CASE("Gateways | OneGatewayPerSubnet", "[Gateways]")
{
  util::test::IoService io;
  auto pCreated = std::make_shared<Created>();
  auto pGateways =
    makeTestGateways(io, pCreated, platform::test::Platform::Scans{{kIface1, kIface2, kIface3}});
  pGateways->enable(true);
  io.runHandlers();

  const auto ifaces = gatewayInterfaces(io, *pGateways);
  REQUIRE(2 == ifaces.size());
  REQUIRE(2 == pCreated->size());
  CHECK(kIface1 == (*pCreated)[0].first);
  CHECK(kIface3 == (*pCreated)[1].first);

  // Exactly one discovery broadcast per subnet and cycle
  io.advance(std::chrono::seconds(60));
  CHECK(2 == (*pCreated)[0].second->sentMessages.size());
  CHECK(2 == (*pCreated)[1].second->sentMessages.size());
}

TEST_CASE("Gateways | ExistingGatewayKeepsSubnet", "[Gateways]")
{
  util::test::IoService io;
  auto pCreated = std::make_shared<Created>();
  auto pGateways =
    makeTestGateways(io, pCreated, platform::test::Platform::Scans{{kIface2}, {kIface1, kIface2}});
  pGateways->enable(true);
  io.runHandlers();
  io.advance(std::chrono::seconds(30));

  const auto ifaces = gatewayInterfaces(io, *pGateways);
  REQUIRE(1 == ifaces.size());
  CHECK(kIface2 == ifaces.front());
  CHECK(1 == pCreated->size());
}

TEST_CASE("Gateways | InterfaceGoesAway", "[Gateways]")
{
  util::test::IoService io;
  auto pCreated = std::make_shared<Created>();
  auto pGateways =
    makeTestGateways(io, pCreated, platform::test::Platform::Scans{{kIface1, kIface3}, {kIface3}});
  pGateways->enable(true);
  io.runHandlers();
  CHECK(2 == gatewayInterfaces(io, *pGateways).size());

  io.advance(std::chrono::seconds(30));
  const auto ifaces = gatewayInterfaces(io, *pGateways);
  REQUIRE(1 == ifaces.size());
  CHECK(kIface3 == ifaces.front());
}

TEST_CASE("Gateways | RepairRecreatesGateway", "[Gateways]")
{
  util::test::IoService io;
  auto pCreated = std::make_shared<Created>();
  auto pGateways = makeTestGateways(io, pCreated, platform::test::Platform::Scans{{kIface1}});
  pGateways->enable(true);
  io.runHandlers();
  REQUIRE(1 == pCreated->size());

  pGateways->repairGateway(kIface1.address);
  io.runHandlers();
  CHECK(2 == pCreated->size());
  CHECK(1 == gatewayInterfaces(io, *pGateways).size());
}

TEST_CASE("Gateways | WithGatewayByAddress", "[Gateways]")
{
  util::test::IoService io;
  auto pCreated = std::make_shared<Created>();
  auto pGateways = makeTestGateways(io, pCreated, platform::test::Platform::Scans{{kIface1}});
  pGateways->enable(true);
  io.runHandlers();

  const std::vector<std::uint8_t> bytes{1, 2, 3};
  const asio::ip::udp::endpoint to{asio::ip::make_address_v4("192.168.1.50"), 56700};
  CHECK(pGateways->withGateway(kIface1.address,
    [&](TestGatewayFactory::Gateway& gateway) { sendTo(gateway, bytes, to); }));
  CHECK(bytes == (*pCreated)[0].second->sentMessages.back().first);

  CHECK(!pGateways->withGateway(
    kIface3.address, [](TestGatewayFactory::Gateway&) { FAIL("unexpected gateway"); }));
}

TEST_CASE("Gateways | DisableRemovesGateways", "[Gateways]")
{
  util::test::IoService io;
  auto pCreated = std::make_shared<Created>();
  auto pGateways = makeTestGateways(io, pCreated, platform::test::Platform::Scans{{kIface1}});
  pGateways->enable(true);
  io.runHandlers();
  pGateways->enable(false);
  io.runHandlers();

  CHECK(gatewayInterfaces(io, *pGateways).empty());
  io.advance(std::chrono::seconds(120));
  CHECK(1 == (*pCreated)[0].second->sentMessages.size());
}

} // namespace discovery
} // namespace lanlight
