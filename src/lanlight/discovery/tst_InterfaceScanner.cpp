// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/discovery/InterfaceScanner.hpp>
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

struct TestCallback
{
  void operator()(std::vector<IpInterface> ifaces)
  {
    scans.push_back(std::move(ifaces));
  }

  std::vector<std::vector<IpInterface>> scans;
};

const auto iface1 = platform::test::makeInterface("123.123.123.1", "255.255.255.0");
const auto iface2 = platform::test::makeInterface("123.123.124.2", "255.255.255.0");

} // anonymous namespace

TEST_CASE("InterfaceScanner | NoInterfacesThenOne", "[InterfaceScanner]")
{
  auto callback = TestCallback{};
  auto timer = util::test::Timer{};
  auto platform = platform::test::Platform{platform::test::Platform::Scans{{}, {iface1}}};
  {
    auto scanner = makeInterfaceScanner(std::chrono::seconds(2), util::injectRef(callback),
      util::injectVal(std::move(platform)), util::injectRef(timer),
      util::injectVal(util::NullLog{}));
    scanner.enable(true);
    CHECK(1 == callback.scans.size());
    timer.advance(std::chrono::seconds(3));
  }
  REQUIRE(2 == callback.scans.size());
  CHECK(callback.scans[0].empty());
  REQUIRE(1 == callback.scans[1].size());
  CHECK(iface1 == callback.scans[1].front());
}

TEST_CASE("InterfaceScanner | InterfaceGoesAway", "[InterfaceScanner]")
{
  auto callback = TestCallback{};
  auto timer = util::test::Timer{};
  auto platform =
    platform::test::Platform{platform::test::Platform::Scans{{iface1, iface2}, {iface2}}};
  {
    auto scanner = makeInterfaceScanner(std::chrono::seconds(2), util::injectRef(callback),
      util::injectVal(std::move(platform)), util::injectRef(timer),
      util::injectVal(util::NullLog{}));
    scanner.enable(true);
    timer.advance(std::chrono::seconds(3));
  }
  REQUIRE(2 == callback.scans.size());
  CHECK(2 == callback.scans[0].size());
  REQUIRE(1 == callback.scans[1].size());
  CHECK(iface2 == callback.scans[1].front());
}

TEST_CASE("InterfaceScanner | DuplicatesRemoved", "[InterfaceScanner]")
{
  auto callback = TestCallback{};
  auto timer = util::test::Timer{};
  auto platform =
    platform::test::Platform{platform::test::Platform::Scans{{iface2, iface1, iface2}}};
  auto scanner = makeInterfaceScanner(std::chrono::seconds(2), util::injectRef(callback),
    util::injectVal(std::move(platform)), util::injectRef(timer),
    util::injectVal(util::NullLog{}));
  scanner.enable(true);

  REQUIRE(1 == callback.scans.size());
  REQUIRE(2 == callback.scans[0].size());
  CHECK(iface2 == callback.scans[0][0]);
  CHECK(iface1 == callback.scans[0][1]);
}

TEST_CASE("InterfaceScanner | DisableStopsScanning", "[InterfaceScanner]")
{
  auto callback = TestCallback{};
  auto timer = util::test::Timer{};
  auto platform = platform::test::Platform{platform::test::Platform::Scans{{iface1}}};
  auto scanner = makeInterfaceScanner(std::chrono::seconds(2), util::injectRef(callback),
    util::injectVal(std::move(platform)), util::injectRef(timer),
    util::injectVal(util::NullLog{}));
  scanner.enable(true);
  scanner.enable(false);
  timer.advance(std::chrono::seconds(5));
  CHECK(1 == callback.scans.size());
}

} // namespace discovery
} // namespace lanlight
