// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/fleet/Refresher.hpp>
#include <lanlight/test/CatchWrapper.hpp>
#include <map>

namespace lanlight
{
namespace fleet
{
namespace
{

const lan::Serial kSerial1 = lan::Serial::fromString("d073d5000001");
const lan::Serial kSerial2 = lan::Serial::fromString("d073d5000002");
const lan::Serial kSerial3 = lan::Serial::fromString("d073d5000003");

DeviceInfo infoFor(const std::uint32_t product)
{
  DeviceInfo info;
  info.version = ProductVersion{lan::kLifxVendor, product};
  info.hostFirmware = lan::firmwareVersion(3, 70);
  return info;
}

// Drains nextInfoRequest, feeding zone counts back like responses would
std::vector<std::uint16_t> requestTypes(DeviceInfo info, const std::size_t zoneCount = 0)
{
  RefreshProgress progress;
  std::vector<std::uint16_t> types;
  while (const auto request = nextInfoRequest(info, progress))
  {
    types.push_back(lan::messageType(*request));
    if (std::holds_alternative<lan::GetColorZones>(*request))
    {
      info.zones.resize(zoneCount);
    }
    REQUIRE(types.size() < 20);
  }
  return types;
}

struct Issued
{
  lan::Serial serial;
  lan::Message request;
  OutcomeHandler handler;
};

struct Fixture
{
  explicit Fixture(const std::size_t maxConcurrent)
    : refresher(maxConcurrent,
        [this](const lan::Serial& serial, lan::Message request, OutcomeHandler handler) {
          issued.push_back({serial, std::move(request), std::move(handler)});
        },
        [this](const lan::Serial& serial) -> std::optional<DeviceInfo> {
          const auto it = infos.find(serial);
          if (it == infos.end())
          {
            return std::nullopt;
          }
          return it->second;
        },
        [this](const lan::Serial& serial, const bool complete) {
          completions.emplace_back(serial, complete);
        })
  {
    infos[kSerial1] = infoFor(1);
    infos[kSerial2] = infoFor(1);
    infos[kSerial3] = infoFor(1);
  }

  // Resolves the request with the given index
  void resolve(const std::size_t i, const Status status)
  {
    const auto handler = issued.at(i).handler;
    handler(Outcome{status, issued.at(i).serial, std::nullopt, 1, {}});
  }

  std::size_t issuedFor(const lan::Serial& serial) const
  {
    std::size_t count = 0;
    for (const auto& entry : issued)
    {
      count += entry.serial == serial ? 1 : 0;
    }
    return count;
  }

  std::map<lan::Serial, DeviceInfo> infos;
  std::vector<Issued> issued;
  std::vector<std::pair<lan::Serial, bool>> completions;
  Refresher refresher;
};

} // anonymous namespace

TEST_CASE("nextInfoRequest | PlainBulb", "[Refresher]")
{
  const auto types = requestTypes(infoFor(1));
  CHECK(std::vector<std::uint16_t>{lan::GetVersion::kType, lan::GetHostFirmware::kType,
          lan::GetLabel::kType, lan::GetGroup::kType, lan::GetColor::kType}
        == types);
}

TEST_CASE("nextInfoRequest | SwitchHasNoLightState", "[Refresher]")
{
  const auto types = requestTypes(infoFor(70));
  CHECK(std::vector<std::uint16_t>{lan::GetVersion::kType, lan::GetHostFirmware::kType,
          lan::GetLabel::kType, lan::GetGroup::kType}
        == types);
}

TEST_CASE("nextInfoRequest | LegacyMultizoneInBlocks", "[Refresher]")
{
  const auto types = requestTypes(infoFor(31), 16);
  CHECK(std::vector<std::uint16_t>{lan::GetVersion::kType, lan::GetHostFirmware::kType,
          lan::GetLabel::kType, lan::GetGroup::kType, lan::GetColor::kType,
          lan::GetColorZones::kType, lan::GetColorZones::kType, lan::GetMultiZoneEffect::kType}
        == types);
}

TEST_CASE("nextInfoRequest | ZoneBlockRanges", "[Refresher]")
{
  auto info = infoFor(31);
  RefreshProgress progress;
  progress.version = progress.hostFirmware = progress.label = progress.group = true;
  progress.color = true;

  const auto first = nextInfoRequest(info, progress);
  REQUIRE(first);
  const auto& firstBlock = std::get<lan::GetColorZones>(*first);
  CHECK(0 == firstBlock.startIndex);
  CHECK(7 == firstBlock.endIndex);

  info.zones.resize(10);
  const auto second = nextInfoRequest(info, progress);
  REQUIRE(second);
  const auto& secondBlock = std::get<lan::GetColorZones>(*second);
  CHECK(8 == secondBlock.startIndex);
  CHECK(15 == secondBlock.endIndex);

  const auto third = nextInfoRequest(info, progress);
  REQUIRE(third);
  CHECK(std::holds_alternative<lan::GetMultiZoneEffect>(*third));
}

TEST_CASE("nextInfoRequest | ExtendedMultizone", "[Refresher]")
{
  const auto types = requestTypes(infoFor(117));
  CHECK(std::vector<std::uint16_t>{lan::GetVersion::kType, lan::GetHostFirmware::kType,
          lan::GetLabel::kType, lan::GetGroup::kType, lan::GetColor::kType,
          lan::GetExtendedColorZones::kType, lan::GetMultiZoneEffect::kType}
        == types);
}

TEST_CASE("nextInfoRequest | HevAndInfrared", "[Refresher]")
{
  const auto clean = requestTypes(infoFor(90));
  CHECK(lan::GetHevCycle::kType == clean.back());

  const auto nightVision = requestTypes(infoFor(29));
  CHECK(lan::GetInfrared::kType == nightVision.back());
}

TEST_CASE("Refresher | QueriesOneAtATime", "[Refresher]")
{
  Fixture fixture{4};
  CHECK(fixture.refresher.schedule(kSerial1));
  REQUIRE(1 == fixture.issued.size());
  CHECK(std::holds_alternative<lan::GetVersion>(fixture.issued[0].request));

  fixture.resolve(0, Status::Success);
  REQUIRE(2 == fixture.issued.size());
  CHECK(std::holds_alternative<lan::GetHostFirmware>(fixture.issued[1].request));

  for (std::size_t i = 1; i < 5; ++i)
  {
    fixture.resolve(i, Status::Success);
  }
  CHECK(5 == fixture.issued.size());
  REQUIRE(1 == fixture.completions.size());
  CHECK(kSerial1 == fixture.completions[0].first);
  CHECK(fixture.completions[0].second);
  CHECK(0 == fixture.refresher.running());
}

TEST_CASE("Refresher | BoundsConcurrentDevices", "[Refresher]")
{
  Fixture fixture{2};
  fixture.refresher.schedule(kSerial1);
  fixture.refresher.schedule(kSerial2);
  fixture.refresher.schedule(kSerial3);

  CHECK(2 == fixture.refresher.running());
  CHECK(1 == fixture.refresher.queued());
  CHECK(0 == fixture.issuedFor(kSerial3));

  // Finishing one device starts the next in line
  fixture.resolve(0, Status::Exhausted);
  CHECK(2 == fixture.refresher.running());
  CHECK(0 == fixture.refresher.queued());
  CHECK(1 == fixture.issuedFor(kSerial3));
}

TEST_CASE("Refresher | FailureEndsRefresh", "[Refresher]")
{
  Fixture fixture{4};
  fixture.refresher.schedule(kSerial1);
  fixture.resolve(0, Status::Success);
  fixture.resolve(1, Status::Exhausted);

  CHECK(2 == fixture.issued.size());
  REQUIRE(1 == fixture.completions.size());
  CHECK(!fixture.completions[0].second);
  CHECK(!fixture.refresher.isScheduled(kSerial1));

  // Can be scheduled again
  CHECK(fixture.refresher.schedule(kSerial1));
  CHECK(3 == fixture.issued.size());
}

TEST_CASE("Refresher | NoDuplicateScheduling", "[Refresher]")
{
  Fixture fixture{1};
  CHECK(fixture.refresher.schedule(kSerial1));
  CHECK(!fixture.refresher.schedule(kSerial1));
  CHECK(fixture.refresher.schedule(kSerial2));
  CHECK(!fixture.refresher.schedule(kSerial2));
  CHECK(1 == fixture.refresher.queued());
}

TEST_CASE("Refresher | CancelIgnoresLateOutcome", "[Refresher]")
{
  Fixture fixture{1};
  fixture.refresher.schedule(kSerial1);
  fixture.refresher.schedule(kSerial2);
  fixture.refresher.cancel(kSerial1);

  CHECK(1 == fixture.issuedFor(kSerial2));
  fixture.resolve(0, Status::Success);
  CHECK(1 == fixture.issuedFor(kSerial1));
  CHECK(fixture.completions.empty());
}

TEST_CASE("Refresher | UnknownDeviceEndsRefresh", "[Refresher]")
{
  Fixture fixture{1};
  fixture.infos.erase(kSerial1);
  fixture.refresher.schedule(kSerial1);
  CHECK(fixture.issued.empty());
  REQUIRE(1 == fixture.completions.size());
  CHECK(!fixture.completions[0].second);
}

TEST_CASE("Refresher | StopEndsEverything", "[Refresher]")
{
  Fixture fixture{1};
  fixture.refresher.schedule(kSerial1);
  fixture.refresher.schedule(kSerial2);
  fixture.refresher.stop();

  CHECK(0 == fixture.refresher.running());
  CHECK(0 == fixture.refresher.queued());
  CHECK(!fixture.refresher.schedule(kSerial3));

  fixture.resolve(0, Status::Success);
  CHECK(1 == fixture.issued.size());
}

} // namespace fleet
} // namespace lanlight
