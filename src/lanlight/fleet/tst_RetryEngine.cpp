// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/fleet/RetryEngine.hpp>
#include <lanlight/test/CatchWrapper.hpp>
#include <lanlight/util/Log.hpp>
#include <lanlight/util/test/IoService.hpp>

namespace lanlight
{
namespace fleet
{
namespace
{

const std::uint32_t kSource = 0xabcdef;
const lan::Serial kSerial1 = lan::Serial::fromString("d073d5000001");
const lan::Serial kSerial2 = lan::Serial::fromString("d073d5000002");
const asio::ip::udp::endpoint kEndpoint1{asio::ip::make_address_v4("192.168.1.51"), 56700};
const asio::ip::udp::endpoint kEndpoint2{asio::ip::make_address_v4("192.168.1.52"), 56700};
const std::chrono::milliseconds kTimeout{100};

using Engine = RetryEngine<util::test::IoService&, util::NullLog>;

struct Fixture
{
  Fixture(const std::size_t retryCount = 3)
    : tracker(8)
    , engine(util::injectRef(io),
        kSource,
        kTimeout,
        retryCount,
        [this](const lan::Message&, const Outcome& outcome) {
          events.push_back("observed " + std::string{toString(outcome.status)});
        },
        util::NullLog{})
  {
  }

  Engine::Target target(const lan::Serial& serial, const asio::ip::udp::endpoint& endpoint)
  {
    return {serial, endpoint,
      [this](const std::vector<std::uint8_t>& bytes, const asio::ip::udp::endpoint& to) {
        if (failSends)
        {
          throw discovery::UdpSendException{"send failed", asio::ip::make_address_v4("192.168.1.10")};
        }
        sent.emplace_back(bytes, to);
      }};
  }

  void execute(const lan::Serial& serial,
    const asio::ip::udp::endpoint& endpoint,
    lan::Message request)
  {
    engine.execute(target(serial, endpoint), std::move(request), tracker.admit(serial),
      [this](const Outcome& outcome) {
        events.push_back("handled " + std::string{toString(outcome.status)});
        outcomes.push_back(outcome);
      });
  }

  lan::Packet sentPacket(const std::size_t i) const
  {
    const auto result = lan::decode(sent.at(i).first);
    REQUIRE(std::holds_alternative<lan::Packet>(result));
    return std::get<lan::Packet>(result);
  }

  lan::Packet reply(const lan::Packet& request, lan::Message response) const
  {
    lan::Header header;
    header.source = request.header.source;
    header.target = request.header.target;
    header.sequence = request.header.sequence;
    return {header, std::move(response)};
  }

  util::test::IoService io;
  InflightTracker tracker;
  std::vector<std::string> events;
  std::vector<Outcome> outcomes;
  std::vector<std::pair<std::vector<std::uint8_t>, asio::ip::udp::endpoint>> sent;
  bool failSends = false;
  Engine engine;
};

} // anonymous namespace

TEST_CASE("RetryEngine | ResolvesOnResponse", "[RetryEngine]")
{
  Fixture fixture;
  fixture.execute(kSerial1, kEndpoint1, lan::GetColor{});

  REQUIRE(1 == fixture.sent.size());
  CHECK(kEndpoint1 == fixture.sent[0].second);
  const auto request = fixture.sentPacket(0);
  CHECK(kSource == request.header.source);
  CHECK(kSerial1 == request.header.target);
  CHECK(request.header.resRequired);
  CHECK(!request.header.ackRequired);
  CHECK(1 == fixture.tracker.inflight(kSerial1));

  CHECK(fixture.engine.dispatch(kEndpoint1, fixture.reply(request, lan::LightState{})));
  REQUIRE(1 == fixture.outcomes.size());
  const auto& outcome = fixture.outcomes.front();
  CHECK(Status::Success == outcome.status);
  CHECK(1 == outcome.attempts);
  REQUIRE(outcome.response);
  CHECK(std::holds_alternative<lan::LightState>(*outcome.response));
  CHECK(0 == fixture.tracker.inflight(kSerial1));
  CHECK(0 == fixture.engine.pending());
}

TEST_CASE("RetryEngine | CommandsRequestAcknowledgement", "[RetryEngine]")
{
  Fixture fixture;
  fixture.execute(kSerial1, kEndpoint1, lan::SetPower{});
  const auto request = fixture.sentPacket(0);
  CHECK(request.header.ackRequired);
  CHECK(!request.header.resRequired);

  CHECK(fixture.engine.dispatch(kEndpoint1, fixture.reply(request, lan::Acknowledgement{})));
  REQUIRE(1 == fixture.outcomes.size());
  CHECK(fixture.outcomes.front());
}

TEST_CASE("RetryEngine | RetargetMovesResendsAndMatching", "[RetryEngine]")
{
  const asio::ip::udp::endpoint moved{asio::ip::make_address_v4("192.168.1.77"), 56700};
  Fixture fixture;
  fixture.execute(kSerial1, kEndpoint1, lan::GetLabel{});
  fixture.execute(kSerial2, kEndpoint2, lan::GetLabel{});
  const auto request = fixture.sentPacket(0);

  fixture.engine.retarget(kSerial1, moved, fixture.target(kSerial1, moved).send);
  fixture.io.advance(kTimeout);
  REQUIRE(4 == fixture.sent.size());
  CHECK(moved == fixture.sent[2].second);
  CHECK(kEndpoint2 == fixture.sent[3].second);
  CHECK(request.header.sequence == fixture.sentPacket(2).header.sequence);

  // The old address no longer answers for the device
  CHECK(!fixture.engine.dispatch(kEndpoint1, fixture.reply(request, lan::StateLabel{})));
  CHECK(fixture.engine.dispatch(moved, fixture.reply(request, lan::StateLabel{})));
  REQUIRE(1 == fixture.outcomes.size());
  CHECK(Status::Success == fixture.outcomes.front().status);
  CHECK(2 == fixture.outcomes.front().attempts);
  CHECK(1 == fixture.engine.pending());
}

TEST_CASE("RetryEngine | ResendsUntilExhausted", "[RetryEngine]")
{
  Fixture fixture;
  fixture.execute(kSerial1, kEndpoint1, lan::GetLabel{});
  fixture.io.advance(std::chrono::milliseconds(99));
  CHECK(1 == fixture.sent.size());
  fixture.io.advance(std::chrono::milliseconds(1));
  CHECK(2 == fixture.sent.size());
  fixture.io.advance(kTimeout);
  CHECK(3 == fixture.sent.size());
  CHECK(fixture.outcomes.empty());

  fixture.io.advance(kTimeout);
  CHECK(3 == fixture.sent.size());
  REQUIRE(1 == fixture.outcomes.size());
  const auto& outcome = fixture.outcomes.front();
  CHECK(Status::Exhausted == outcome.status);
  CHECK(3 == outcome.attempts);
  CHECK("no response after 3 attempts" == outcome.reason);
  CHECK(0 == fixture.tracker.inflight(kSerial1));

  // Every attempt is the same datagram
  CHECK(fixture.sent[0].first == fixture.sent[2].first);
}

TEST_CASE("RetryEngine | ResponseToLaterAttempt", "[RetryEngine]")
{
  Fixture fixture;
  fixture.execute(kSerial1, kEndpoint1, lan::GetLabel{});
  fixture.io.advance(kTimeout);
  REQUIRE(2 == fixture.sent.size());

  CHECK(fixture.engine.dispatch(
    kEndpoint1, fixture.reply(fixture.sentPacket(1), lan::StateLabel{})));
  REQUIRE(1 == fixture.outcomes.size());
  CHECK(2 == fixture.outcomes.front().attempts);

  // No further attempts once resolved
  fixture.io.advance(kTimeout * 5);
  CHECK(2 == fixture.sent.size());
  CHECK(1 == fixture.outcomes.size());
}

TEST_CASE("RetryEngine | LateAndDuplicateResponsesDropped", "[RetryEngine]")
{
  Fixture fixture;
  fixture.execute(kSerial1, kEndpoint1, lan::GetColor{});
  const auto request = fixture.sentPacket(0);
  const auto response = fixture.reply(request, lan::LightState{});

  CHECK(fixture.engine.dispatch(kEndpoint1, response));
  CHECK(!fixture.engine.dispatch(kEndpoint1, response));
  CHECK(1 == fixture.outcomes.size());

  fixture.execute(kSerial1, kEndpoint1, lan::GetPower{});
  fixture.io.advance(kTimeout * 3);
  REQUIRE(2 == fixture.outcomes.size());
  CHECK(Status::Exhausted == fixture.outcomes.back().status);
  CHECK(!fixture.engine.dispatch(
    kEndpoint1, fixture.reply(fixture.sentPacket(1), lan::StatePower{})));
  CHECK(2 == fixture.outcomes.size());
}

TEST_CASE("RetryEngine | MismatchedResponsesIgnored", "[RetryEngine]")
{
  Fixture fixture;
  fixture.execute(kSerial1, kEndpoint1, lan::GetColor{});
  const auto request = fixture.sentPacket(0);

  // Wrong type
  CHECK(!fixture.engine.dispatch(kEndpoint1, fixture.reply(request, lan::StatePower{})));

  // Another client
  auto foreign = fixture.reply(request, lan::LightState{});
  foreign.header.source = kSource + 1;
  CHECK(!fixture.engine.dispatch(kEndpoint1, foreign));

  // Another device
  CHECK(!fixture.engine.dispatch(kEndpoint2, fixture.reply(request, lan::LightState{})));

  CHECK(fixture.outcomes.empty());
  CHECK(1 == fixture.engine.pending());
}

TEST_CASE("RetryEngine | SequencesScopedToDevice", "[RetryEngine]")
{
  Fixture fixture;
  fixture.execute(kSerial1, kEndpoint1, lan::GetColor{});
  fixture.execute(kSerial1, kEndpoint1, lan::GetLabel{});
  fixture.execute(kSerial2, kEndpoint2, lan::GetColor{});

  const auto first = fixture.sentPacket(0).header.sequence;
  const auto second = fixture.sentPacket(1).header.sequence;
  const auto other = fixture.sentPacket(2).header.sequence;
  CHECK(first != second);
  CHECK(first == other);
  CHECK(2 == fixture.engine.pending(kSerial1));
  CHECK(1 == fixture.engine.pending(kSerial2));

  // Each response resolves only its own request
  CHECK(fixture.engine.dispatch(
    kEndpoint1, fixture.reply(fixture.sentPacket(1), lan::StateLabel{})));
  REQUIRE(1 == fixture.outcomes.size());
  REQUIRE(fixture.outcomes.front().response);
  CHECK(std::holds_alternative<lan::StateLabel>(*fixture.outcomes.front().response));
  CHECK(1 == fixture.engine.pending(kSerial1));
}

TEST_CASE("RetryEngine | SendFailureCountsAsLostAttempt", "[RetryEngine]")
{
  Fixture fixture;
  fixture.failSends = true;
  fixture.execute(kSerial1, kEndpoint1, lan::GetColor{});
  CHECK(fixture.sent.empty());
  CHECK(fixture.outcomes.empty());

  fixture.failSends = false;
  fixture.io.advance(kTimeout);
  REQUIRE(1 == fixture.sent.size());
  CHECK(fixture.engine.dispatch(
    kEndpoint1, fixture.reply(fixture.sentPacket(0), lan::LightState{})));
  REQUIRE(1 == fixture.outcomes.size());
  CHECK(2 == fixture.outcomes.front().attempts);
}

TEST_CASE("RetryEngine | CancelResolvesAsCancelled", "[RetryEngine]")
{
  Fixture fixture;
  fixture.execute(kSerial1, kEndpoint1, lan::GetColor{});
  fixture.execute(kSerial2, kEndpoint2, lan::GetColor{});

  fixture.engine.cancel(kSerial1, "device removed");
  REQUIRE(1 == fixture.outcomes.size());
  CHECK(Status::Cancelled == fixture.outcomes.front().status);
  CHECK("device removed" == fixture.outcomes.front().reason);
  CHECK(0 == fixture.tracker.inflight(kSerial1));
  // Cancellations are not observed
  CHECK(std::vector<std::string>{"handled cancelled"} == fixture.events);

  fixture.engine.cancelAll("stopped");
  CHECK(2 == fixture.outcomes.size());
  CHECK(0 == fixture.engine.pending());

  fixture.io.advance(kTimeout * 10);
  CHECK(2 == fixture.sent.size());
}

TEST_CASE("RetryEngine | ObserverSeesOutcomeFirst", "[RetryEngine]")
{
  Fixture fixture{1};
  fixture.execute(kSerial1, kEndpoint1, lan::GetColor{});
  fixture.io.advance(kTimeout);
  CHECK(std::vector<std::string>{"observed exhausted", "handled exhausted"} == fixture.events);
}

} // namespace fleet
} // namespace lanlight
