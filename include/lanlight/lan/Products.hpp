// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <cstdint>
#include <ostream>

namespace lanlight
{
namespace lan
{

const std::uint32_t kLifxVendor = 1;

struct Features
{
  bool color = false;
  bool infrared = false;
  bool multizone = false;
  bool extendedMultizone = false;
  bool hev = false;
  bool matrix = false;
  bool relays = false;
  bool buttons = false;
  std::uint16_t minKelvin = 2500;
  std::uint16_t maxKelvin = 9000;
};

struct Product
{
  std::uint32_t vendor;
  std::uint32_t pid;
  const char* name;
  Features features;
  // Host firmware from which the extended zone messages are understood,
  // as (major << 16 | minor). Only meaningful for extended multizone
  // products.
  std::uint32_t extendedMultizoneFirmware;
};

// Combined firmware version as sent in StateHostFirmware
inline std::uint32_t firmwareVersion(const std::uint16_t major, const std::uint16_t minor)
{
  return (static_cast<std::uint32_t>(major) << 16) | minor;
}

// Returns nullptr for products missing from the table
const Product* findProduct(std::uint32_t vendor, std::uint32_t pid);

// Capabilities of the given product running the given host firmware.
// Unknown products are treated like the original LIFX bulb.
Features productFeatures(std::uint32_t vendor, std::uint32_t pid, std::uint32_t firmware);

} // namespace lan
} // namespace lanlight
