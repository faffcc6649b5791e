// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/fleet/InflightTracker.hpp>
#include <lanlight/test/CatchWrapper.hpp>
#include <vector>

namespace lanlight
{
namespace fleet
{
namespace
{

const lan::Serial kSerial1 = lan::Serial::fromString("d073d5000001");
const lan::Serial kSerial2 = lan::Serial::fromString("d073d5000002");

} // anonymous namespace

TEST_CASE("InflightTracker | AdmitsUpToCeiling", "[InflightTracker]")
{
  InflightTracker tracker{2};
  auto permit1 = tracker.admit(kSerial1);
  auto permit2 = tracker.admit(kSerial1);
  auto permit3 = tracker.admit(kSerial1);

  CHECK(permit1);
  CHECK(permit2);
  CHECK(!permit3);
  CHECK(2 == tracker.inflight(kSerial1));
}

TEST_CASE("InflightTracker | DevicesAreIndependent", "[InflightTracker]")
{
  InflightTracker tracker{1};
  auto permit1 = tracker.admit(kSerial1);
  auto permit2 = tracker.admit(kSerial2);
  CHECK(permit1);
  CHECK(permit2);
  CHECK(1 == tracker.inflight(kSerial2));
}

TEST_CASE("InflightTracker | ReleaseFreesSlot", "[InflightTracker]")
{
  InflightTracker tracker{1};
  auto permit = tracker.admit(kSerial1);
  permit.release();
  CHECK(!permit);
  CHECK(0 == tracker.inflight(kSerial1));

  // Releasing twice has no effect
  permit.release();
  auto next = tracker.admit(kSerial1);
  CHECK(next);
  CHECK(1 == tracker.inflight(kSerial1));
}

TEST_CASE("InflightTracker | DestructionReleases", "[InflightTracker]")
{
  InflightTracker tracker{3};
  {
    std::vector<InflightTracker::Permit> permits;
    permits.push_back(tracker.admit(kSerial1));
    permits.push_back(tracker.admit(kSerial1));
    CHECK(2 == tracker.inflight(kSerial1));
  }
  CHECK(0 == tracker.inflight(kSerial1));
}

TEST_CASE("InflightTracker | MoveTransfersSlot", "[InflightTracker]")
{
  InflightTracker tracker{1};
  auto permit = tracker.admit(kSerial1);
  auto moved = std::move(permit);
  CHECK(1 == tracker.inflight(kSerial1));
  CHECK(kSerial1 == moved.serial());
  moved.release();
  CHECK(0 == tracker.inflight(kSerial1));
}

} // namespace fleet
} // namespace lanlight
