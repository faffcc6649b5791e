// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/fleet/Availability.hpp>
#include <lanlight/test/CatchWrapper.hpp>

namespace lanlight
{
namespace fleet
{
namespace
{

using std::chrono::seconds;

const TimePoint kStart = TimePoint{} + std::chrono::hours(1000);
const seconds kGrace{180};

AvailabilityRecord freshRecord()
{
  AvailabilityRecord record;
  record.enteredAt = kStart;
  return record;
}

} // anonymous namespace

TEST_CASE("Availability | FirstSuccessMakesAvailable", "[Availability]")
{
  auto record = freshRecord();
  const auto transition = recordSuccess(record, kStart + seconds(1));
  REQUIRE(transition);
  CHECK(Availability::Available == *transition);
  CHECK(Availability::Available == record.state);
  CHECK(record.everSucceeded);

  CHECK(!recordSuccess(record, kStart + seconds(2)));
}

TEST_CASE("Availability | FailuresWithinGraceKeepState", "[Availability]")
{
  auto record = freshRecord();
  recordSuccess(record, kStart);
  CHECK(!recordFailure(record, kStart + seconds(60), kGrace));
  CHECK(!recordFailure(record, kStart + seconds(180), kGrace));
  CHECK(Availability::Available == record.state);
  CHECK(2 == record.consecutiveFailures);
}

TEST_CASE("Availability | FailureAfterGraceDemotes", "[Availability]")
{
  auto record = freshRecord();
  recordSuccess(record, kStart);
  const auto transition = recordFailure(record, kStart + seconds(181), kGrace);
  REQUIRE(transition);
  CHECK(Availability::Unavailable == *transition);
  CHECK(!recordFailure(record, kStart + seconds(200), kGrace));
}

TEST_CASE("Availability | SuccessResetsFailures", "[Availability]")
{
  auto record = freshRecord();
  recordSuccess(record, kStart);
  recordFailure(record, kStart + seconds(100), kGrace);
  recordSuccess(record, kStart + seconds(150));
  CHECK(0 == record.consecutiveFailures);
  CHECK(!recordFailure(record, kStart + seconds(300), kGrace));
}

TEST_CASE("Availability | RecoveryFromUnavailable", "[Availability]")
{
  auto record = freshRecord();
  recordSuccess(record, kStart);
  recordFailure(record, kStart + seconds(200), kGrace);
  REQUIRE(Availability::Unavailable == record.state);

  const auto transition = recordSuccess(record, kStart + seconds(210));
  REQUIRE(transition);
  CHECK(Availability::Available == *transition);
  CHECK(kStart + seconds(210) == record.enteredAt);
}

TEST_CASE("Availability | NeverSucceeded", "[Availability]")
{
  auto record = freshRecord();
  CHECK(!recordFailure(record, kStart + seconds(100), kGrace));
  CHECK(Availability::Unknown == record.state);

  const auto transition = sweep(record, kStart + seconds(181), kGrace);
  REQUIRE(transition);
  CHECK(Availability::Unavailable == *transition);
}

TEST_CASE("Availability | SweepDemotesSilentDevice", "[Availability]")
{
  auto record = freshRecord();
  recordSuccess(record, kStart);
  CHECK(!sweep(record, kStart + seconds(180), kGrace));
  const auto transition = sweep(record, kStart + seconds(190), kGrace);
  REQUIRE(transition);
  CHECK(Availability::Unavailable == *transition);
  CHECK(!sweep(record, kStart + seconds(200), kGrace));
}

TEST_CASE("Availability | Names", "[Availability]")
{
  CHECK(std::string{"available"} == toString(Availability::Available));
  CHECK(std::string{"unavailable"} == toString(Availability::Unavailable));
  CHECK(std::string{"unknown"} == toString(Availability::Unknown));
}

} // namespace fleet
} // namespace lanlight
