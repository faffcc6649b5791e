// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/asio/AsioWrapper.hpp>
#include <lanlight/lan/Codec.hpp>
#include <lanlight/lan/Products.hpp>
#include <lanlight/lan/Serial.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace lanlight
{
namespace fleet
{

using TimePoint = std::chrono::system_clock::time_point;

enum class Availability
{
  Unknown,
  Available,
  Unavailable
};

inline const char* toString(const Availability availability)
{
  switch (availability)
  {
  case Availability::Unknown:
    return "unknown";
  case Availability::Available:
    return "available";
  case Availability::Unavailable:
    return "unavailable";
  }
  return "invalid";
}

inline std::ostream& operator<<(std::ostream& stream, const Availability availability)
{
  return stream << toString(availability);
}

struct AvailabilityRecord
{
  Availability state = Availability::Unknown;
  TimePoint enteredAt{};
  TimePoint lastSuccess{};
  TimePoint lastFailure{};
  bool everSucceeded = false;
  std::size_t consecutiveFailures = 0;
};

struct ProductVersion
{
  std::uint32_t vendor;
  std::uint32_t product;
};

struct HevCycle
{
  std::uint32_t durationS;
  std::uint32_t remainingS;
  bool lastPowerOn;
};

// What is known about a device, filled in from its responses
struct DeviceInfo
{
  // Set from the first StateVersion and never changed afterwards
  std::optional<ProductVersion> version;
  std::optional<std::uint32_t> hostFirmware;
  std::string label;
  std::string group;
  std::optional<std::uint16_t> power;
  std::optional<lan::Hsbk> color;
  std::vector<lan::Hsbk> zones;
  std::optional<std::uint8_t> multizoneEffect;
  std::optional<std::uint16_t> infraredBrightness;
  std::optional<HevCycle> hevCycle;
  std::optional<float> wifiSignal;
};

inline lan::Features features(const DeviceInfo& info)
{
  return info.version
           ? lan::productFeatures(
               info.version->vendor, info.version->product, info.hostFirmware.value_or(0))
           : lan::Features{};
}

inline std::string productName(const DeviceInfo& info)
{
  if (info.version)
  {
    if (const auto pProduct = lan::findProduct(info.version->vendor, info.version->product))
    {
      return pProduct->name;
    }
    return "product " + std::to_string(info.version->product);
  }
  return {};
}

// "major.minor", empty while unknown
inline std::string firmwareString(const DeviceInfo& info)
{
  if (!info.hostFirmware)
  {
    return {};
  }
  return std::to_string(*info.hostFirmware >> 16) + "."
         + std::to_string(*info.hostFirmware & 0xffff);
}

// Signal strength in dBm
inline std::optional<int> rssi(const DeviceInfo& info)
{
  if (!info.wifiSignal || *info.wifiSignal <= 0.f)
  {
    return std::nullopt;
  }
  return static_cast<int>(std::floor(10.0 * std::log10(*info.wifiSignal) + 0.5));
}

// Switches carry relays instead of a light
inline bool isSwitch(const DeviceInfo& info)
{
  return info.version && features(info).relays;
}

namespace detail
{

inline void storeZone(DeviceInfo& info, const std::size_t count, const std::size_t index,
  const lan::Hsbk& color)
{
  if (info.zones.size() != count)
  {
    info.zones.resize(count);
  }
  if (index < count)
  {
    info.zones[index] = color;
  }
}

struct ResponseApplier
{
  void operator()(const lan::StateHostFirmware& msg)
  {
    info.hostFirmware = msg.version;
  }

  void operator()(const lan::StateWifiInfo& msg)
  {
    info.wifiSignal = msg.signal;
  }

  void operator()(const lan::StatePower& msg)
  {
    info.power = msg.level;
  }

  void operator()(const lan::StateLightPower& msg)
  {
    info.power = msg.level;
  }

  void operator()(const lan::StateLabel& msg)
  {
    info.label = lan::toString(msg.label);
  }

  void operator()(const lan::StateVersion& msg)
  {
    if (!info.version)
    {
      info.version = ProductVersion{msg.vendor, msg.product};
    }
  }

  void operator()(const lan::StateGroup& msg)
  {
    info.group = lan::toString(msg.label);
  }

  void operator()(const lan::LightState& msg)
  {
    info.color = msg.color;
    info.power = msg.power;
    info.label = lan::toString(msg.label);
  }

  void operator()(const lan::StateInfrared& msg)
  {
    info.infraredBrightness = msg.brightness;
  }

  void operator()(const lan::StateHevCycle& msg)
  {
    info.hevCycle = HevCycle{msg.durationS, msg.remainingS, msg.lastPower != 0};
  }

  void operator()(const lan::StateZone& msg)
  {
    storeZone(info, msg.count, msg.index, msg.color);
  }

  void operator()(const lan::StateMultiZone& msg)
  {
    for (std::size_t i = 0; i < msg.colors.size(); ++i)
    {
      storeZone(info, msg.count, msg.index + i, msg.colors[i]);
    }
  }

  void operator()(const lan::StateExtendedColorZones& msg)
  {
    const auto n = std::min<std::size_t>(msg.colorsCount, msg.colors.size());
    for (std::size_t i = 0; i < n; ++i)
    {
      storeZone(info, msg.count, msg.index + i, msg.colors[i]);
    }
  }

  void operator()(const lan::StateMultiZoneEffect& msg)
  {
    info.multizoneEffect = msg.effect;
  }

  template <typename Message>
  void operator()(const Message&)
  {
  }

  DeviceInfo& info;
};

// The state a device has after acknowledging a command
struct CommandApplier
{
  void operator()(const lan::SetPower& msg)
  {
    info.power = msg.level;
  }

  void operator()(const lan::SetLightPower& msg)
  {
    info.power = msg.level;
  }

  void operator()(const lan::SetLabel& msg)
  {
    info.label = lan::toString(msg.label);
  }

  void operator()(const lan::SetColor& msg)
  {
    info.color = msg.color;
  }

  void operator()(const lan::SetInfrared& msg)
  {
    info.infraredBrightness = msg.brightness;
  }

  void operator()(const lan::SetColorZones& msg)
  {
    for (std::size_t i = msg.startIndex; i <= msg.endIndex && i < info.zones.size(); ++i)
    {
      info.zones[i] = msg.color;
    }
  }

  template <typename Message>
  void operator()(const Message&)
  {
  }

  DeviceInfo& info;
};

} // namespace detail

// Updates the device info from a successful exchange
inline void applyResponse(DeviceInfo& info, const lan::Message& request,
  const lan::Message& response)
{
  if (std::holds_alternative<lan::Acknowledgement>(response))
  {
    std::visit(detail::CommandApplier{info}, request);
  }
  else
  {
    std::visit(detail::ResponseApplier{info}, response);
  }
}

// Mutable part of a device, guarded by the device's mutex
struct DeviceRecord
{
  asio::ip::udp::endpoint endpoint;
  // Local interface through which the device is reached
  asio::ip::address_v4 gatewayAddr;
  AvailabilityRecord availability;
  DeviceInfo info;
  // Set once all follow-up info requests completed
  bool infoComplete = false;
};

// Snapshot handed out to consumers
struct DeviceState
{
  lan::Serial serial;
  asio::ip::udp::endpoint endpoint;
  Availability availability;
  TimePoint lastSuccess;
  TimePoint lastFailure;
  std::size_t consecutiveFailures;
  DeviceInfo info;
  bool infoComplete;
};

struct DeviceSummary
{
  lan::Serial serial;
  asio::ip::udp::endpoint endpoint;
  std::string label;
  Availability availability;
};

// A device of the fleet. The serial is immutable; everything else is
// accessed through withRecord, under the device's own lock.
class Device
{
public:
  Device(const lan::Serial& serial, asio::ip::udp::endpoint endpoint,
    asio::ip::address_v4 gatewayAddr, const TimePoint now)
    : mSerial(serial)
  {
    mRecord.endpoint = std::move(endpoint);
    mRecord.gatewayAddr = std::move(gatewayAddr);
    mRecord.availability.enteredAt = now;
  }

  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;

  const lan::Serial& serial() const
  {
    return mSerial;
  }

  template <typename Fn>
  auto withRecord(Fn fn) -> decltype(fn(std::declval<DeviceRecord&>()))
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return fn(mRecord);
  }

  template <typename Fn>
  auto withRecord(Fn fn) const -> decltype(fn(std::declval<const DeviceRecord&>()))
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return fn(mRecord);
  }

  DeviceState state() const
  {
    return withRecord([this](const DeviceRecord& record) {
      return DeviceState{mSerial, record.endpoint, record.availability.state,
        record.availability.lastSuccess, record.availability.lastFailure,
        record.availability.consecutiveFailures, record.info, record.infoComplete};
    });
  }

  DeviceSummary summary() const
  {
    return withRecord([this](const DeviceRecord& record) {
      return DeviceSummary{
        mSerial, record.endpoint, record.info.label, record.availability.state};
    });
  }

private:
  const lan::Serial mSerial;
  mutable std::mutex mMutex;
  DeviceRecord mRecord;
};

} // namespace fleet
} // namespace lanlight
