// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/fleet/Controller.hpp>
#include <lanlight/lan/test/SimulatedNetwork.hpp>
#include <lanlight/test/CatchWrapper.hpp>
#include <lanlight/test/Platform.hpp>
#include <lanlight/util/Log.hpp>
#include <lanlight/util/test/IoService.hpp>
#include <algorithm>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace lanlight
{
namespace fleet
{
namespace
{

using TestController = Controller<platform::test::Platform,
  lan::test::SimulatedNetwork::InterfaceFactory,
  util::NullLog,
  util::test::IoService&>;

using Transitions = std::vector<std::pair<lan::Serial, Availability>>;
using Outcomes = std::vector<Outcome>;

const auto kIface = platform::test::makeInterface("192.168.1.10", "255.255.255.0");
const auto kBroadcast = asio::ip::make_address_v4("192.168.1.255");

const lan::Serial kBulb = lan::Serial::fromString("d073d5000001");
const lan::Serial kStrip = lan::Serial::fromString("d073d5000002");
const lan::Serial kSwitch = lan::Serial::fromString("d073d5000003");

Settings testSettings()
{
  Settings settings;
  settings.pollDevices = false;
  return settings;
}

lan::test::SimulatedDevice simulatedDevice(const lan::Serial& serial,
  const char* address,
  std::string label,
  const std::uint32_t product = 1)
{
  lan::test::SimulatedDevice device;
  device.serial = serial;
  device.address = asio::ip::make_address_v4(address);
  device.label = std::move(label);
  device.group = "Home";
  device.product = product;
  return device;
}

lan::Message setColor(const std::uint16_t hue)
{
  lan::SetColor set;
  set.color.hue = hue;
  set.color.saturation = 65535;
  set.color.brightness = 32768;
  set.color.kelvin = 3500;
  return set;
}

struct Fixture
{
  Fixture(Settings settings = testSettings(),
    platform::test::Platform::Scans scans = {{kIface}})
    : network(io)
    , pTransitions(std::make_shared<Transitions>())
  {
    auto pRecorded = pTransitions;
    controller.reset(new TestController(std::move(settings),
      platform::test::Platform{std::move(scans)}, network.interfaceFactory(), util::NullLog{},
      util::injectRef(io), [pRecorded](const lan::Serial& serial, const Availability state) {
        pRecorded->emplace_back(serial, state);
      }));
  }

  ~Fixture()
  {
    controller.reset();
    io.runHandlers();
  }

  void discover()
  {
    controller->discover();
    io.runHandlers();
  }

  std::shared_ptr<Outcomes> send(const lan::Serial& serial, lan::Message request)
  {
    auto pOutcomes = std::make_shared<Outcomes>();
    send(serial, std::move(request), pOutcomes);
    return pOutcomes;
  }

  void send(const lan::Serial& serial,
    lan::Message request,
    const std::shared_ptr<Outcomes>& pOutcomes)
  {
    controller->send(serial, std::move(request),
      [pOutcomes](const Outcome& outcome) { pOutcomes->push_back(outcome); });
  }

  DeviceState state(const lan::Serial& serial) const
  {
    const auto result = controller->deviceState(serial);
    REQUIRE(result);
    return *result;
  }

  std::size_t transitionsTo(const lan::Serial& serial, const Availability state) const
  {
    return static_cast<std::size_t>(std::count(
      pTransitions->begin(), pTransitions->end(), std::make_pair(serial, state)));
  }

  std::size_t broadcasts() const
  {
    std::size_t n = 0;
    for (const auto& pIface : network.interfaces())
    {
      for (const auto& sent : pIface->sentMessages)
      {
        n += sent.second.address() == asio::ip::address{kBroadcast} ? 1 : 0;
      }
    }
    return n;
  }

  std::vector<lan::Packet> unicastsTo(const asio::ip::address_v4& address) const
  {
    std::vector<lan::Packet> packets;
    for (const auto& pIface : network.interfaces())
    {
      for (const auto& sent : pIface->sentMessages)
      {
        if (sent.second.address() == asio::ip::address{address})
        {
          packets.push_back(std::get<lan::Packet>(lan::decode(sent.first)));
        }
      }
    }
    return packets;
  }

  // Delivers a datagram as if the device had sent it
  void reply(const lan::test::SimulatedDevice& device,
    const lan::Header& requestHeader,
    const lan::Message& message)
  {
    lan::Header header;
    header.source = requestHeader.source;
    header.target = device.serial;
    header.sequence = requestHeader.sequence;
    network.interfaces().front()->incomingMessage(
      {device.address, lan::kDefaultPort}, lan::encode(header, message));
  }

  util::test::IoService io;
  lan::test::SimulatedNetwork network;
  std::shared_ptr<Transitions> pTransitions;
  std::unique_ptr<TestController> controller;
};

} // namespace

TEST_CASE("Controller | RejectsInvalidSettings", "[Controller]")
{
  util::test::IoService io;
  lan::test::SimulatedNetwork network(io);
  auto settings = testSettings();
  settings.retryCount = 0;
  CHECK_THROWS_AS(TestController(settings, platform::test::Platform{{{kIface}}},
                    network.interfaceFactory(), util::NullLog{}, util::injectRef(io)),
    std::invalid_argument);
}

TEST_CASE("Controller | DiscoversAndDescribesDevices", "[Controller]")
{
  Fixture fixture;
  fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  auto strip = simulatedDevice(kStrip, "192.168.1.52", "Shelf", 32);
  strip.zones.resize(16);
  strip.zones[15].hue = 1000;
  fixture.network.addDevice(strip);
  fixture.network.addDevice(simulatedDevice(kSwitch, "192.168.1.53", "Hallway", 70));

  fixture.discover();

  CHECK(3 == fixture.controller->numDevices());

  const auto bulb = fixture.state(kBulb);
  CHECK(bulb.infoComplete);
  CHECK(Availability::Available == bulb.availability);
  CHECK("Kitchen" == bulb.info.label);
  CHECK("Home" == bulb.info.group);
  CHECK("LIFX Original 1000" == productName(bulb.info));
  CHECK("3.70" == firmwareString(bulb.info));
  CHECK(asio::ip::make_address_v4("192.168.1.51") == bulb.endpoint.address());
  CHECK(lan::kDefaultPort == bulb.endpoint.port());

  const auto shelf = fixture.state(kStrip);
  CHECK(shelf.infoComplete);
  REQUIRE(16 == shelf.info.zones.size());
  CHECK(1000 == shelf.info.zones[15].hue);
  CHECK(shelf.info.multizoneEffect);

  // A switch has no light state to query
  const auto hallway = fixture.state(kSwitch);
  CHECK(hallway.infoComplete);
  CHECK(isSwitch(hallway.info));
  const auto& received = fixture.network.device(kSwitch)->received;
  CHECK(received.end()
        == std::find(received.begin(), received.end(), lan::GetColor::kType));

  CHECK(1 == fixture.transitionsTo(kBulb, Availability::Available));
  CHECK(1 == fixture.transitionsTo(kStrip, Availability::Available));
  CHECK(1 == fixture.transitionsTo(kSwitch, Availability::Available));
  CHECK(3 == fixture.pTransitions->size());
}

TEST_CASE("Controller | RefreshesLegacyMultizoneInBlocks", "[Controller]")
{
  Fixture fixture;
  auto strip = simulatedDevice(kStrip, "192.168.1.52", "Shelf", 31);
  strip.zones.resize(12);
  strip.zones[11].kelvin = 2700;
  fixture.network.addDevice(strip);

  fixture.discover();

  const auto shelf = fixture.state(kStrip);
  CHECK(shelf.infoComplete);
  REQUIRE(12 == shelf.info.zones.size());
  CHECK(2700 == shelf.info.zones[11].kelvin);
  const auto& received = fixture.network.device(kStrip)->received;
  CHECK(2 == std::count(received.begin(), received.end(), lan::GetColorZones::kType));
}

TEST_CASE("Controller | DiscoveryIsIdempotent", "[Controller]")
{
  Fixture fixture;
  fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));

  fixture.discover();
  fixture.discover();

  CHECK(1 == fixture.broadcasts());
  CHECK(1 == fixture.controller->numDevices());
  const auto devices = fixture.controller->devices();
  REQUIRE(1 == devices.size());
  CHECK(kBulb == devices[0].serial);
  CHECK("Kitchen" == devices[0].label);
  CHECK(Availability::Available == devices[0].availability);
}

TEST_CASE("Controller | OneBroadcastPerSubnet", "[Controller]")
{
  const auto other = platform::test::makeInterface("192.168.1.11", "255.255.255.0");
  Fixture fixture{testSettings(), {{kIface, other}}};
  fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));

  fixture.discover();

  CHECK(1 == fixture.network.interfaces().size());
  CHECK(1 == fixture.broadcasts());
  CHECK(1 == fixture.controller->numDevices());

  fixture.io.advance(std::chrono::seconds(60));
  CHECK(1 == fixture.network.interfaces().size());
  CHECK(2 == fixture.broadcasts());
  const auto& received = fixture.network.device(kBulb)->received;
  CHECK(2 == std::count(received.begin(), received.end(), lan::GetService::kType));
}

TEST_CASE("Controller | RediscoverStartsCycleNow", "[Controller]")
{
  Fixture fixture;
  fixture.discover();
  CHECK(0 == fixture.controller->numDevices());

  fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.controller->rediscover();
  fixture.io.runHandlers();

  CHECK(2 == fixture.broadcasts());
  CHECK(1 == fixture.controller->numDevices());
}

TEST_CASE("Controller | CommandUpdatesDevice", "[Controller]")
{
  Fixture fixture;
  fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.discover();

  lan::SetPower on;
  on.level = 65535;
  const auto pOutcomes = fixture.send(kBulb, on);
  fixture.io.runHandlers();

  REQUIRE(1 == pOutcomes->size());
  const auto& outcome = pOutcomes->front();
  CHECK(Status::Success == outcome.status);
  CHECK(1 == outcome.attempts);
  REQUIRE(outcome.response);
  CHECK(std::holds_alternative<lan::Acknowledgement>(*outcome.response));
  CHECK(65535 == fixture.network.device(kBulb)->power);
  CHECK(65535 == fixture.state(kBulb).info.power);

  const auto pQueried = fixture.send(kBulb, lan::GetPower{});
  fixture.io.runHandlers();
  REQUIRE(1 == pQueried->size());
  REQUIRE(pQueried->front().response);
  CHECK(65535 == std::get<lan::StatePower>(*pQueried->front().response).level);
}

TEST_CASE("Controller | SendToUnknownDevice", "[Controller]")
{
  Fixture fixture;
  fixture.discover();

  const auto pOutcomes = fixture.send(kBulb, lan::GetPower{});
  fixture.io.runHandlers();

  REQUIRE(1 == pOutcomes->size());
  CHECK(Status::UnknownDevice == pOutcomes->front().status);
  CHECK(0 == pOutcomes->front().attempts);
  CHECK(fixture.pTransitions->empty());
}

TEST_CASE("Controller | SendRejectsStateMessages", "[Controller]")
{
  Fixture fixture;
  CHECK_THROWS_AS(fixture.controller->send(kBulb, lan::StatePower{}, [](const Outcome&) {}),
    std::invalid_argument);
}

TEST_CASE("Controller | ExhaustsAfterRetryCount", "[Controller]")
{
  Fixture fixture;
  auto& bulb = fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.discover();
  const auto sentBefore = fixture.unicastsTo(bulb.address).size();
  bulb.online = false;

  const auto pOutcomes = fixture.send(kBulb, lan::GetColor{});
  fixture.io.advance(std::chrono::milliseconds(7999));
  CHECK(pOutcomes->empty());

  fixture.io.advance(std::chrono::milliseconds(1));
  REQUIRE(1 == pOutcomes->size());
  CHECK(Status::Exhausted == pOutcomes->front().status);
  CHECK(8 == pOutcomes->front().attempts);

  const auto packets = fixture.unicastsTo(bulb.address);
  REQUIRE(sentBefore + 8 == packets.size());
  for (auto it = packets.begin() + static_cast<std::ptrdiff_t>(sentBefore);
       it != packets.end(); ++it)
  {
    CHECK(lan::GetColor::kType == it->header.type);
    CHECK(packets.back().header.sequence == it->header.sequence);
  }
}

TEST_CASE("Controller | FailedCommandDoesNotDemote", "[Controller]")
{
  Fixture fixture;
  auto& bulb = fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.discover();

  bulb.online = false;
  const auto pFailed = fixture.send(kBulb, lan::GetPower{});
  fixture.io.advance(std::chrono::seconds(9));
  REQUIRE(1 == pFailed->size());
  CHECK(Status::Exhausted == pFailed->front().status);

  const auto state = fixture.state(kBulb);
  CHECK(Availability::Available == state.availability);
  CHECK(1 == state.consecutiveFailures);

  bulb.online = true;
  const auto pSucceeded = fixture.send(kBulb, lan::GetPower{});
  fixture.io.runHandlers();
  REQUIRE(1 == pSucceeded->size());
  CHECK(Status::Success == pSucceeded->front().status);
  CHECK(0 == fixture.state(kBulb).consecutiveFailures);
  CHECK(1 == fixture.pTransitions->size());
}

TEST_CASE("Controller | SilentDeviceBecomesUnavailableOnce", "[Controller]")
{
  Fixture fixture;
  auto& bulb = fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.discover();
  bulb.online = false;

  fixture.io.advance(std::chrono::seconds(185));
  CHECK(Availability::Available == fixture.state(kBulb).availability);

  fixture.io.advance(std::chrono::seconds(15));
  CHECK(Availability::Unavailable == fixture.state(kBulb).availability);
  CHECK(1 == fixture.transitionsTo(kBulb, Availability::Unavailable));

  // Further failures and sweeps don't report it again
  const auto pOutcomes = fixture.send(kBulb, lan::GetPower{});
  fixture.io.advance(std::chrono::seconds(300));
  REQUIRE(1 == pOutcomes->size());
  CHECK(1 == fixture.transitionsTo(kBulb, Availability::Unavailable));
}

TEST_CASE("Controller | NeverAnsweringDeviceBecomesUnavailable", "[Controller]")
{
  Fixture fixture;
  fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  // Only the first discovery broadcast gets through
  fixture.network.setLossModel(
    [](const lan::Serial&, const std::size_t packetOnLink) { return packetOnLink > 1; });
  fixture.discover();

  REQUIRE(1 == fixture.controller->numDevices());
  fixture.io.advance(std::chrono::seconds(30));
  CHECK(Availability::Unknown == fixture.state(kBulb).availability);
  CHECK(!fixture.state(kBulb).infoComplete);

  fixture.io.advance(std::chrono::seconds(170));
  CHECK(Availability::Unavailable == fixture.state(kBulb).availability);
  REQUIRE(1 == fixture.pTransitions->size());
  CHECK(std::make_pair(kBulb, Availability::Unavailable) == fixture.pTransitions->front());
}

TEST_CASE("Controller | RecoversOnFirstSuccess", "[Controller]")
{
  Fixture fixture;
  auto& bulb = fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.discover();
  bulb.online = false;
  fixture.io.advance(std::chrono::seconds(200));
  REQUIRE(Availability::Unavailable == fixture.state(kBulb).availability);

  bulb.online = true;
  const auto before = fixture.io.now();
  const auto pOutcomes = fixture.send(kBulb, lan::GetPower{});
  fixture.io.runHandlers();

  REQUIRE(1 == pOutcomes->size());
  CHECK(Status::Success == pOutcomes->front().status);
  CHECK(before == fixture.io.now());
  CHECK(Availability::Available == fixture.state(kBulb).availability);
  CHECK(2 == fixture.transitionsTo(kBulb, Availability::Available));
  CHECK(std::make_pair(kBulb, Availability::Available) == fixture.pTransitions->back());
}

TEST_CASE("Controller | RediscoveryCompletesRefresh", "[Controller]")
{
  Fixture fixture;
  fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  // Every attempt of the first info query is lost
  fixture.network.setLossModel([](const lan::Serial&, const std::size_t packetOnLink) {
    return packetOnLink >= 2 && packetOnLink <= 9;
  });
  fixture.discover();

  fixture.io.advance(std::chrono::seconds(30));
  CHECK(!fixture.state(kBulb).infoComplete);
  CHECK(fixture.state(kBulb).info.label.empty());

  fixture.io.advance(std::chrono::seconds(31));
  const auto state = fixture.state(kBulb);
  CHECK(state.infoComplete);
  CHECK("Kitchen" == state.info.label);
  CHECK(Availability::Available == state.availability);
}

TEST_CASE("Controller | FollowsDeviceToNewAddress", "[Controller]")
{
  Fixture fixture;
  auto& bulb = fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.discover();

  bulb.address = asio::ip::make_address_v4("192.168.1.77");
  fixture.io.advance(std::chrono::seconds(60));
  CHECK(bulb.address == fixture.state(kBulb).endpoint.address());

  const auto pOutcomes = fixture.send(kBulb, lan::GetLabel{});
  fixture.io.runHandlers();
  REQUIRE(1 == pOutcomes->size());
  CHECK(Status::Success == pOutcomes->front().status);

  SECTION("WhileRequestInFlight")
  {
    bulb.address = asio::ip::make_address_v4("192.168.1.78");
    const auto pInFlight = fixture.send(kBulb, lan::GetLabel{});
    fixture.io.runHandlers();
    CHECK(pInFlight->empty());

    fixture.controller->rediscover();
    fixture.io.runHandlers();
    CHECK(bulb.address == fixture.state(kBulb).endpoint.address());
    CHECK(pInFlight->empty());

    // The resend goes to where the device is now
    fixture.io.advance(std::chrono::seconds(1));
    fixture.io.runHandlers();
    REQUIRE(1 == pInFlight->size());
    CHECK(Status::Success == pInFlight->front().status);
    CHECK(2 == pInFlight->front().attempts);
    CHECK(Availability::Available == fixture.state(kBulb).availability);
    CHECK(0 == fixture.transitionsTo(kBulb, Availability::Unavailable));

    const auto packets = fixture.unicastsTo(bulb.address);
    REQUIRE(!packets.empty());
    CHECK(std::holds_alternative<lan::GetLabel>(packets.back().message));
  }
}

TEST_CASE("Controller | InflightCeilingIsNeverExceeded", "[Controller]")
{
  auto settings = testSettings();
  settings.inflightCeiling = 3;
  Fixture fixture{settings};
  auto& bulb = fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.discover();
  bulb.online = false;

  const auto pOutcomes = std::make_shared<Outcomes>();
  std::size_t sent = 0;
  const auto inflight = [&] {
    const auto resolved = static_cast<std::size_t>(
      std::count_if(pOutcomes->begin(), pOutcomes->end(),
        [](const Outcome& outcome) { return outcome.status != Status::Backpressure; }));
    const auto refused = pOutcomes->size() - resolved;
    return sent - refused - resolved;
  };

  SECTION("Burst")
  {
    for (int i = 0; i < 10; ++i)
    {
      fixture.send(kBulb, lan::GetPower{}, pOutcomes);
      ++sent;
    }
    fixture.io.runHandlers();

    CHECK(3 == inflight());
    REQUIRE(7 == pOutcomes->size());
    for (const auto& outcome : *pOutcomes)
    {
      CHECK(Status::Backpressure == outcome.status);
      CHECK(0 == outcome.attempts);
    }
    // Refusals are not failures of the device
    CHECK(0 == fixture.state(kBulb).consecutiveFailures);

    fixture.io.advance(std::chrono::seconds(8));
    CHECK(0 == inflight());
    CHECK(10 == pOutcomes->size());

    // Released permits admit new requests
    fixture.send(kBulb, lan::GetPower{}, pOutcomes);
    ++sent;
    fixture.io.runHandlers();
    CHECK(1 == inflight());
  }

  SECTION("RandomLoad")
  {
    std::mt19937 gen(42);
    std::uniform_int_distribution<int> burst(0, 4);
    std::uniform_int_distribution<int> pause(0, 3000);
    for (int round = 0; round < 50; ++round)
    {
      const auto refusedBefore = static_cast<std::size_t>(
        std::count_if(pOutcomes->begin(), pOutcomes->end(),
          [](const Outcome& outcome) { return outcome.status == Status::Backpressure; }));
      const auto n = burst(gen);
      for (int i = 0; i < n; ++i)
      {
        fixture.send(kBulb, lan::GetPower{}, pOutcomes);
        ++sent;
      }
      fixture.io.runHandlers();
      const auto refused = static_cast<std::size_t>(
        std::count_if(pOutcomes->begin(), pOutcomes->end(),
          [](const Outcome& outcome) { return outcome.status == Status::Backpressure; }));

      CHECK(inflight() <= 3);
      if (refused > refusedBefore)
      {
        CHECK(3 == inflight());
      }

      fixture.io.advance(std::chrono::milliseconds(pause(gen)));
      CHECK(inflight() <= 3);
    }

    fixture.io.advance(std::chrono::seconds(10));
    CHECK(0 == inflight());
    CHECK(sent == pOutcomes->size());
    for (const auto& outcome : *pOutcomes)
    {
      if (outcome.status != Status::Backpressure)
      {
        CHECK(Status::Exhausted == outcome.status);
        CHECK(8 == outcome.attempts);
      }
    }
  }
}

TEST_CASE("Controller | DiscardsLateAndDuplicateResponses", "[Controller]")
{
  Fixture fixture;
  auto& bulb = fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  bulb.power = 65535;
  fixture.discover();

  SECTION("AfterSuccess")
  {
    const auto pOutcomes = fixture.send(kBulb, lan::GetPower{});
    fixture.io.runHandlers();
    REQUIRE(1 == pOutcomes->size());

    const auto request = fixture.unicastsTo(bulb.address).back();
    lan::StatePower duplicate;
    duplicate.level = 0;
    fixture.reply(bulb, request.header, duplicate);
    fixture.io.runHandlers();

    CHECK(1 == pOutcomes->size());
    CHECK(65535 == fixture.state(kBulb).info.power);
  }

  SECTION("AfterExhaustion")
  {
    bulb.online = false;
    const auto pOutcomes = fixture.send(kBulb, lan::GetPower{});
    fixture.io.advance(std::chrono::seconds(8));
    REQUIRE(1 == pOutcomes->size());
    const auto lastSuccess = fixture.state(kBulb).lastSuccess;

    const auto request = fixture.unicastsTo(bulb.address).back();
    CHECK(lan::GetPower::kType == request.header.type);
    fixture.reply(bulb, request.header, lan::StatePower{});
    fixture.io.runHandlers();

    CHECK(1 == pOutcomes->size());
    CHECK(lastSuccess == fixture.state(kBulb).lastSuccess);
    CHECK(1 == fixture.state(kBulb).consecutiveFailures);
  }
}

TEST_CASE("Controller | RemoveDeviceCancelsRequests", "[Controller]")
{
  Fixture fixture;
  auto& bulb = fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.discover();
  bulb.online = false;

  const auto pOutcomes = fixture.send(kBulb, lan::GetPower{});
  fixture.io.runHandlers();
  fixture.controller->removeDevice(kBulb);
  fixture.io.runHandlers();

  REQUIRE(1 == pOutcomes->size());
  CHECK(Status::Cancelled == pOutcomes->front().status);
  CHECK(0 == fixture.controller->numDevices());
  CHECK(!fixture.controller->deviceState(kBulb));

  // Nothing fires for the removed request later on
  fixture.io.advance(std::chrono::seconds(10));
  CHECK(1 == pOutcomes->size());

  bulb.online = true;
  fixture.io.advance(std::chrono::seconds(50));
  CHECK(1 == fixture.controller->numDevices());
  CHECK(fixture.state(kBulb).infoComplete);
}

TEST_CASE("Controller | StopCancelsEverything", "[Controller]")
{
  Fixture fixture;
  auto& bulb = fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.discover();
  bulb.online = false;

  const auto pPending = fixture.send(kBulb, lan::GetPower{});
  fixture.io.runHandlers();
  fixture.controller->stop();
  fixture.io.runHandlers();

  REQUIRE(1 == pPending->size());
  CHECK(Status::Cancelled == pPending->front().status);
  CHECK("fleet stopped" == pPending->front().reason);

  const auto pLater = fixture.send(kBulb, lan::GetPower{});
  fixture.io.runHandlers();
  REQUIRE(1 == pLater->size());
  CHECK(Status::Cancelled == pLater->front().status);

  const auto broadcasts = fixture.broadcasts();
  fixture.io.advance(std::chrono::seconds(120));
  CHECK(broadcasts == fixture.broadcasts());
  CHECK(1 == pPending->size());
}

TEST_CASE("Controller | PollingKeepsIdleDevicesAvailable", "[Controller]")
{
  auto settings = testSettings();
  settings.pollDevices = true;
  Fixture fixture{settings};
  fixture.network.addDevice(simulatedDevice(kBulb, "192.168.1.51", "Kitchen"));
  fixture.network.addDevice(simulatedDevice(kSwitch, "192.168.1.53", "Hallway", 70));
  fixture.discover();

  fixture.io.advance(std::chrono::seconds(400));

  CHECK(Availability::Available == fixture.state(kBulb).availability);
  CHECK(Availability::Available == fixture.state(kSwitch).availability);
  CHECK(2 == fixture.pTransitions->size());

  const auto& bulbReceived = fixture.network.device(kBulb)->received;
  CHECK(30 < std::count(bulbReceived.begin(), bulbReceived.end(), lan::GetColor::kType));
  const auto& switchReceived = fixture.network.device(kSwitch)->received;
  CHECK(30 < std::count(switchReceived.begin(), switchReceived.end(), lan::GetPower::kType));
  CHECK(0 == std::count(switchReceived.begin(), switchReceived.end(), lan::GetColor::kType));
}

TEST_CASE("Controller | LossyNetworkEndToEnd", "[Controller]")
{
  Fixture fixture;
  std::vector<lan::Serial> serials;
  for (int i = 0; i < 5; ++i)
  {
    const auto serial = lan::Serial::fromString("d073d50000a" + std::to_string(i));
    const auto address = "192.168.1." + std::to_string(60 + i);
    fixture.network.addDevice(
      simulatedDevice(serial, address.c_str(), "Light " + std::to_string(i)));
    serials.push_back(serial);
  }
  // Every third packet on each device's link is lost
  fixture.network.setLossModel(
    [](const lan::Serial&, const std::size_t packetOnLink) { return packetOnLink % 3 == 0; });

  fixture.discover();
  fixture.io.advance(std::chrono::seconds(20));
  REQUIRE(5 == fixture.controller->numDevices());
  for (const auto& serial : serials)
  {
    CHECK(fixture.state(serial).infoComplete);
  }

  const auto pOutcomes = std::make_shared<Outcomes>();
  for (std::uint16_t round = 0; round < 20; ++round)
  {
    for (const auto& serial : serials)
    {
      fixture.send(serial, setColor(static_cast<std::uint16_t>(1000 * round)), pOutcomes);
    }
    // One retry after a loss fits well within this
    fixture.io.advance(std::chrono::seconds(3));
    REQUIRE(5u * (round + 1u) == pOutcomes->size());
  }

  std::size_t retried = 0;
  for (const auto& outcome : *pOutcomes)
  {
    CHECK(Status::Success == outcome.status);
    CHECK(outcome.attempts <= 2);
    retried += outcome.attempts > 1 ? 1 : 0;
  }
  CHECK(0 < retried);

  for (const auto& serial : serials)
  {
    const auto state = fixture.state(serial);
    CHECK(Availability::Available == state.availability);
    REQUIRE(state.info.color);
    CHECK(19000 == state.info.color->hue);
    CHECK(19000 == fixture.network.device(serial)->color.hue);
  }
  CHECK(5 == fixture.pTransitions->size());
}

} // namespace fleet
} // namespace lanlight
