// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/fleet/Device.hpp>
#include <lanlight/test/CatchWrapper.hpp>

namespace lanlight
{
namespace fleet
{
namespace
{

lan::StateMultiZone multiZone(const std::uint8_t count, const std::uint8_t index)
{
  lan::StateMultiZone state;
  state.count = count;
  state.index = index;
  for (std::size_t i = 0; i < state.colors.size(); ++i)
  {
    state.colors[i].hue = static_cast<std::uint16_t>(index + i);
  }
  return state;
}

} // anonymous namespace

TEST_CASE("DeviceInfo | AppliesStateResponses", "[DeviceInfo]")
{
  DeviceInfo info;
  lan::LightState light;
  light.color = lan::Hsbk{100, 200, 300, 3500};
  light.power = 65535;
  light.label = lan::toLabel("Desk");
  applyResponse(info, lan::GetColor{}, light);

  REQUIRE(info.color);
  CHECK(lan::Hsbk{100, 200, 300, 3500} == *info.color);
  CHECK(65535 == *info.power);
  CHECK("Desk" == info.label);

  lan::StateGroup group;
  group.label = lan::toLabel("Office");
  applyResponse(info, lan::GetGroup{}, group);
  CHECK("Office" == info.group);
}

TEST_CASE("DeviceInfo | VersionIsSetOnce", "[DeviceInfo]")
{
  DeviceInfo info;
  lan::StateVersion version;
  version.vendor = lan::kLifxVendor;
  version.product = 32;
  applyResponse(info, lan::GetVersion{}, version);
  version.product = 1;
  applyResponse(info, lan::GetVersion{}, version);

  REQUIRE(info.version);
  CHECK(32 == info.version->product);
  CHECK("LIFX Z" == productName(info));
}

TEST_CASE("DeviceInfo | AcknowledgementAppliesCommand", "[DeviceInfo]")
{
  DeviceInfo info;
  lan::SetPower setPower;
  setPower.level = 65535;
  applyResponse(info, setPower, lan::Acknowledgement{});
  CHECK(65535 == *info.power);

  lan::SetLabel setLabel;
  setLabel.label = lan::toLabel("Hall");
  applyResponse(info, setLabel, lan::Acknowledgement{});
  CHECK("Hall" == info.label);
}

TEST_CASE("DeviceInfo | CollectsZones", "[DeviceInfo]")
{
  DeviceInfo info;
  applyResponse(info, lan::GetColorZones{}, multiZone(12, 0));
  applyResponse(info, lan::GetColorZones{}, multiZone(12, 8));

  REQUIRE(12 == info.zones.size());
  CHECK(0 == info.zones[0].hue);
  CHECK(11 == info.zones[11].hue);

  lan::SetColorZones setZones;
  setZones.startIndex = 10;
  setZones.endIndex = 20;
  setZones.color = lan::Hsbk{1, 1, 1, 1};
  applyResponse(info, setZones, lan::Acknowledgement{});
  CHECK(9 == info.zones[9].hue);
  CHECK(lan::Hsbk{1, 1, 1, 1} == info.zones[10]);
  CHECK(lan::Hsbk{1, 1, 1, 1} == info.zones[11]);
}

TEST_CASE("DeviceInfo | ExtendedZones", "[DeviceInfo]")
{
  DeviceInfo info;
  lan::StateExtendedColorZones state;
  state.count = 3;
  state.colorsCount = 3;
  state.colors[2] = lan::Hsbk{2, 2, 2, 2};
  applyResponse(info, lan::GetExtendedColorZones{}, state);

  REQUIRE(3 == info.zones.size());
  CHECK(lan::Hsbk{2, 2, 2, 2} == info.zones[2]);
}

TEST_CASE("DeviceInfo | FirmwareAndSignal", "[DeviceInfo]")
{
  DeviceInfo info;
  CHECK(firmwareString(info).empty());
  CHECK(!rssi(info));

  lan::StateHostFirmware firmware;
  firmware.version = lan::firmwareVersion(3, 70);
  applyResponse(info, lan::GetHostFirmware{}, firmware);
  CHECK("3.70" == firmwareString(info));

  lan::StateWifiInfo wifi;
  wifi.signal = 1e-5f;
  applyResponse(info, lan::GetWifiInfo{}, wifi);
  REQUIRE(rssi(info));
  CHECK(-50 == *rssi(info));
}

TEST_CASE("DeviceInfo | Switches", "[DeviceInfo]")
{
  DeviceInfo info;
  CHECK(!isSwitch(info));
  info.version = ProductVersion{lan::kLifxVendor, 70};
  CHECK(isSwitch(info));
  CHECK("LIFX Switch" == productName(info));
}

TEST_CASE("Device | SnapshotReflectsRecord", "[Device]")
{
  const auto serial = lan::Serial::fromString("d073d5000001");
  const asio::ip::udp::endpoint endpoint{asio::ip::make_address_v4("10.0.0.2"), 56700};
  Device device{serial, endpoint, asio::ip::make_address_v4("10.0.0.1"), TimePoint{}};

  device.withRecord([](DeviceRecord& record) {
    record.info.label = "Porch";
    record.availability.state = Availability::Available;
  });

  const auto state = device.state();
  CHECK(serial == state.serial);
  CHECK(endpoint == state.endpoint);
  CHECK(Availability::Available == state.availability);
  CHECK("Porch" == state.info.label);
  CHECK(!state.infoComplete);

  const auto summary = device.summary();
  CHECK("Porch" == summary.label);
}

} // namespace fleet
} // namespace lanlight
