// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/lan/ByteStream.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <tuple>

namespace lanlight
{
namespace lan
{

// Message payloads of the LAN protocol. Every message exposes its type
// code, its payload fields in wire order, and, for requests, the type
// of the response that completes it. Set* commands are completed by
// an Acknowledgement.

using Label = std::array<std::uint8_t, 32>;

// Label fields are null padded. Everything from the first null on is
// discarded.
inline std::string toString(const Label& label)
{
  std::string str;
  for (const auto c : label)
  {
    if (c == 0)
    {
      break;
    }
    str.push_back(static_cast<char>(c));
  }
  return str;
}

inline Label toLabel(const std::string& str)
{
  Label label{};
  for (std::size_t i = 0; i < str.size() && i < label.size(); ++i)
  {
    label[i] = static_cast<std::uint8_t>(str[i]);
  }
  return label;
}

struct Hsbk
{
  std::uint16_t hue = 0;
  std::uint16_t saturation = 0;
  std::uint16_t brightness = 0;
  std::uint16_t kelvin = 0;

  friend bool operator==(const Hsbk& lhs, const Hsbk& rhs)
  {
    return std::tie(lhs.hue, lhs.saturation, lhs.brightness, lhs.kelvin)
           == std::tie(rhs.hue, rhs.saturation, rhs.brightness, rhs.kelvin);
  }

  friend bool operator!=(const Hsbk& lhs, const Hsbk& rhs)
  {
    return !(lhs == rhs);
  }

  friend std::uint32_t sizeInByteStream(const Hsbk&)
  {
    return 8;
  }

  template <typename It>
  friend It toByteStream(const Hsbk& hsbk, It out)
  {
    out = toByteStream(hsbk.hue, std::move(out));
    out = toByteStream(hsbk.saturation, std::move(out));
    out = toByteStream(hsbk.brightness, std::move(out));
    return toByteStream(hsbk.kelvin, std::move(out));
  }

  template <typename It>
  static std::pair<Hsbk, It> fromByteStream(It begin, It end)
  {
    Hsbk hsbk;
    std::tie(hsbk.hue, begin) = Deserialize<std::uint16_t>::fromByteStream(begin, end);
    std::tie(hsbk.saturation, begin) = Deserialize<std::uint16_t>::fromByteStream(begin, end);
    std::tie(hsbk.brightness, begin) = Deserialize<std::uint16_t>::fromByteStream(begin, end);
    std::tie(hsbk.kelvin, begin) = Deserialize<std::uint16_t>::fromByteStream(begin, end);
    return std::make_pair(hsbk, std::move(begin));
  }
};

// Messages without a payload
#define LANLIGHT_EMPTY_FIELDS                                                            \
  std::tuple<> fields()                                                                  \
  {                                                                                      \
    return {};                                                                           \
  }                                                                                      \
  std::tuple<> fields() const                                                            \
  {                                                                                      \
    return {};                                                                           \
  }

#define LANLIGHT_FIELDS(...)                                                             \
  auto fields()                                                                          \
  {                                                                                      \
    return std::tie(__VA_ARGS__);                                                        \
  }                                                                                      \
  auto fields() const                                                                    \
  {                                                                                      \
    return std::tie(__VA_ARGS__);                                                        \
  }

// Device messages

struct Acknowledgement
{
  static constexpr std::uint16_t kType = 45;
  static constexpr const char* kName = "Acknowledgement";
  LANLIGHT_EMPTY_FIELDS
};

struct StateService
{
  static constexpr std::uint16_t kType = 3;
  static constexpr const char* kName = "StateService";
  static constexpr std::uint8_t kUdp = 1;
  std::uint8_t service = kUdp;
  std::uint32_t port = 0;
  LANLIGHT_FIELDS(service, port)
};

struct GetService
{
  static constexpr std::uint16_t kType = 2;
  static constexpr const char* kName = "GetService";
  using Response = StateService;
  LANLIGHT_EMPTY_FIELDS
};

struct StateHostFirmware
{
  static constexpr std::uint16_t kType = 15;
  static constexpr const char* kName = "StateHostFirmware";
  std::uint64_t build = 0;
  std::array<std::uint8_t, 8> reserved{};
  // Minor version in the low, major version in the high 16 bits
  std::uint32_t version = 0;
  LANLIGHT_FIELDS(build, reserved, version)
};

struct GetHostFirmware
{
  static constexpr std::uint16_t kType = 14;
  static constexpr const char* kName = "GetHostFirmware";
  using Response = StateHostFirmware;
  LANLIGHT_EMPTY_FIELDS
};

struct StateWifiInfo
{
  static constexpr std::uint16_t kType = 17;
  static constexpr const char* kName = "StateWifiInfo";
  float signal = 0.f;
  std::array<std::uint8_t, 10> reserved{};
  LANLIGHT_FIELDS(signal, reserved)
};

struct GetWifiInfo
{
  static constexpr std::uint16_t kType = 16;
  static constexpr const char* kName = "GetWifiInfo";
  using Response = StateWifiInfo;
  LANLIGHT_EMPTY_FIELDS
};

struct StatePower
{
  static constexpr std::uint16_t kType = 22;
  static constexpr const char* kName = "StatePower";
  std::uint16_t level = 0;
  LANLIGHT_FIELDS(level)
};

struct GetPower
{
  static constexpr std::uint16_t kType = 20;
  static constexpr const char* kName = "GetPower";
  using Response = StatePower;
  LANLIGHT_EMPTY_FIELDS
};

struct SetPower
{
  static constexpr std::uint16_t kType = 21;
  static constexpr const char* kName = "SetPower";
  using Response = Acknowledgement;
  std::uint16_t level = 0;
  LANLIGHT_FIELDS(level)
};

struct StateLabel
{
  static constexpr std::uint16_t kType = 25;
  static constexpr const char* kName = "StateLabel";
  Label label{};
  LANLIGHT_FIELDS(label)
};

struct GetLabel
{
  static constexpr std::uint16_t kType = 23;
  static constexpr const char* kName = "GetLabel";
  using Response = StateLabel;
  LANLIGHT_EMPTY_FIELDS
};

struct SetLabel
{
  static constexpr std::uint16_t kType = 24;
  static constexpr const char* kName = "SetLabel";
  using Response = Acknowledgement;
  Label label{};
  LANLIGHT_FIELDS(label)
};

struct StateVersion
{
  static constexpr std::uint16_t kType = 33;
  static constexpr const char* kName = "StateVersion";
  std::uint32_t vendor = 0;
  std::uint32_t product = 0;
  std::uint32_t reserved = 0;
  LANLIGHT_FIELDS(vendor, product, reserved)
};

struct GetVersion
{
  static constexpr std::uint16_t kType = 32;
  static constexpr const char* kName = "GetVersion";
  using Response = StateVersion;
  LANLIGHT_EMPTY_FIELDS
};

struct StateGroup
{
  static constexpr std::uint16_t kType = 53;
  static constexpr const char* kName = "StateGroup";
  std::array<std::uint8_t, 16> group{};
  Label label{};
  std::uint64_t updatedAt = 0;
  LANLIGHT_FIELDS(group, label, updatedAt)
};

struct GetGroup
{
  static constexpr std::uint16_t kType = 51;
  static constexpr const char* kName = "GetGroup";
  using Response = StateGroup;
  LANLIGHT_EMPTY_FIELDS
};

struct EchoResponse
{
  static constexpr std::uint16_t kType = 59;
  static constexpr const char* kName = "EchoResponse";
  std::array<std::uint8_t, 64> echoing{};
  LANLIGHT_FIELDS(echoing)
};

struct EchoRequest
{
  static constexpr std::uint16_t kType = 58;
  static constexpr const char* kName = "EchoRequest";
  using Response = EchoResponse;
  std::array<std::uint8_t, 64> echoing{};
  LANLIGHT_FIELDS(echoing)
};

// Light messages

struct LightState
{
  static constexpr std::uint16_t kType = 107;
  static constexpr const char* kName = "LightState";
  Hsbk color;
  std::int16_t reserved1 = 0;
  std::uint16_t power = 0;
  Label label{};
  std::uint64_t reserved2 = 0;
  LANLIGHT_FIELDS(color, reserved1, power, label, reserved2)
};

struct GetColor
{
  static constexpr std::uint16_t kType = 101;
  static constexpr const char* kName = "GetColor";
  using Response = LightState;
  LANLIGHT_EMPTY_FIELDS
};

struct SetColor
{
  static constexpr std::uint16_t kType = 102;
  static constexpr const char* kName = "SetColor";
  using Response = Acknowledgement;
  std::uint8_t reserved = 0;
  Hsbk color;
  std::uint32_t durationMs = 0;
  LANLIGHT_FIELDS(reserved, color, durationMs)
};

struct StateLightPower
{
  static constexpr std::uint16_t kType = 118;
  static constexpr const char* kName = "StateLightPower";
  std::uint16_t level = 0;
  LANLIGHT_FIELDS(level)
};

struct GetLightPower
{
  static constexpr std::uint16_t kType = 116;
  static constexpr const char* kName = "GetLightPower";
  using Response = StateLightPower;
  LANLIGHT_EMPTY_FIELDS
};

struct SetLightPower
{
  static constexpr std::uint16_t kType = 117;
  static constexpr const char* kName = "SetLightPower";
  using Response = Acknowledgement;
  std::uint16_t level = 0;
  std::uint32_t durationMs = 0;
  LANLIGHT_FIELDS(level, durationMs)
};

struct StateInfrared
{
  static constexpr std::uint16_t kType = 121;
  static constexpr const char* kName = "StateInfrared";
  std::uint16_t brightness = 0;
  LANLIGHT_FIELDS(brightness)
};

struct GetInfrared
{
  static constexpr std::uint16_t kType = 120;
  static constexpr const char* kName = "GetInfrared";
  using Response = StateInfrared;
  LANLIGHT_EMPTY_FIELDS
};

struct SetInfrared
{
  static constexpr std::uint16_t kType = 122;
  static constexpr const char* kName = "SetInfrared";
  using Response = Acknowledgement;
  std::uint16_t brightness = 0;
  LANLIGHT_FIELDS(brightness)
};

struct StateHevCycle
{
  static constexpr std::uint16_t kType = 144;
  static constexpr const char* kName = "StateHevCycle";
  std::uint32_t durationS = 0;
  std::uint32_t remainingS = 0;
  std::uint8_t lastPower = 0;
  LANLIGHT_FIELDS(durationS, remainingS, lastPower)
};

struct GetHevCycle
{
  static constexpr std::uint16_t kType = 142;
  static constexpr const char* kName = "GetHevCycle";
  using Response = StateHevCycle;
  LANLIGHT_EMPTY_FIELDS
};

struct SetHevCycle
{
  static constexpr std::uint16_t kType = 143;
  static constexpr const char* kName = "SetHevCycle";
  using Response = Acknowledgement;
  std::uint8_t enable = 0;
  std::uint32_t durationS = 0;
  LANLIGHT_FIELDS(enable, durationS)
};

// Multizone messages

const std::size_t kZonesPerStateMultiZone = 8;
const std::size_t kZonesPerExtendedMessage = 82;

struct StateZone
{
  static constexpr std::uint16_t kType = 503;
  static constexpr const char* kName = "StateZone";
  std::uint8_t count = 0;
  std::uint8_t index = 0;
  Hsbk color;
  LANLIGHT_FIELDS(count, index, color)
};

struct StateMultiZone
{
  static constexpr std::uint16_t kType = 506;
  static constexpr const char* kName = "StateMultiZone";
  std::uint8_t count = 0;
  std::uint8_t index = 0;
  std::array<Hsbk, kZonesPerStateMultiZone> colors{};
  LANLIGHT_FIELDS(count, index, colors)
};

// Answered by one StateMultiZone per block of eight zones in the range,
// or by a StateZone for a single zone.
struct GetColorZones
{
  static constexpr std::uint16_t kType = 502;
  static constexpr const char* kName = "GetColorZones";
  using Response = StateMultiZone;
  std::uint8_t startIndex = 0;
  std::uint8_t endIndex = 0;
  LANLIGHT_FIELDS(startIndex, endIndex)
};

struct SetColorZones
{
  static constexpr std::uint16_t kType = 501;
  static constexpr const char* kName = "SetColorZones";
  using Response = Acknowledgement;
  std::uint8_t startIndex = 0;
  std::uint8_t endIndex = 0;
  Hsbk color;
  std::uint32_t durationMs = 0;
  std::uint8_t apply = 1;
  LANLIGHT_FIELDS(startIndex, endIndex, color, durationMs, apply)
};

struct StateMultiZoneEffect
{
  static constexpr std::uint16_t kType = 509;
  static constexpr const char* kName = "StateMultiZoneEffect";
  std::uint32_t instanceId = 0;
  // 0 off, 1 move
  std::uint8_t effect = 0;
  std::uint16_t reserved1 = 0;
  std::uint32_t speedMs = 0;
  std::uint64_t durationNs = 0;
  std::array<std::uint8_t, 8> reserved2{};
  std::array<std::uint8_t, 32> parameters{};
  LANLIGHT_FIELDS(instanceId, effect, reserved1, speedMs, durationNs, reserved2, parameters)
};

struct GetMultiZoneEffect
{
  static constexpr std::uint16_t kType = 507;
  static constexpr const char* kName = "GetMultiZoneEffect";
  using Response = StateMultiZoneEffect;
  LANLIGHT_EMPTY_FIELDS
};

struct StateExtendedColorZones
{
  static constexpr std::uint16_t kType = 512;
  static constexpr const char* kName = "StateExtendedColorZones";
  std::uint16_t count = 0;
  std::uint16_t index = 0;
  std::uint8_t colorsCount = 0;
  std::array<Hsbk, kZonesPerExtendedMessage> colors{};
  LANLIGHT_FIELDS(count, index, colorsCount, colors)
};

struct GetExtendedColorZones
{
  static constexpr std::uint16_t kType = 511;
  static constexpr const char* kName = "GetExtendedColorZones";
  using Response = StateExtendedColorZones;
  LANLIGHT_EMPTY_FIELDS
};

struct SetExtendedColorZones
{
  static constexpr std::uint16_t kType = 510;
  static constexpr const char* kName = "SetExtendedColorZones";
  using Response = Acknowledgement;
  std::uint32_t durationMs = 0;
  std::uint8_t apply = 1;
  std::uint16_t index = 0;
  std::uint8_t colorsCount = 0;
  std::array<Hsbk, kZonesPerExtendedMessage> colors{};
  LANLIGHT_FIELDS(durationMs, apply, index, colorsCount, colors)
};

#undef LANLIGHT_FIELDS
#undef LANLIGHT_EMPTY_FIELDS

} // namespace lan
} // namespace lanlight
