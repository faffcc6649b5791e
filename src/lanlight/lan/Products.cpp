// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#include <lanlight/lan/Products.hpp>
#include <algorithm>
#include <iterator>

namespace lanlight
{
namespace lan
{
namespace
{

Features features(
  const bool color,
  const std::uint16_t minKelvin,
  const std::uint16_t maxKelvin)
{
  Features f;
  f.color = color;
  f.minKelvin = minKelvin;
  f.maxKelvin = maxKelvin;
  return f;
}

Features infrared(Features f)
{
  f.infrared = true;
  return f;
}

Features multizone(Features f, const bool extended)
{
  f.multizone = true;
  f.extendedMultizone = extended;
  return f;
}

Features hev(Features f)
{
  f.hev = true;
  return f;
}

Features matrix(Features f)
{
  f.matrix = true;
  return f;
}

Features switchFeatures()
{
  Features f;
  f.relays = true;
  f.buttons = true;
  f.minKelvin = 0;
  f.maxKelvin = 0;
  return f;
}

const std::uint32_t kExtendedFrom277 = (2u << 16) | 77u;

// Sorted by pid
const Product kProducts[] = {
  {kLifxVendor, 1, "LIFX Original 1000", features(true, 2500, 9000), 0},
  {kLifxVendor, 3, "LIFX Color 650", features(true, 2500, 9000), 0},
  {kLifxVendor, 10, "LIFX White 800 (Low Voltage)", features(false, 2700, 6500), 0},
  {kLifxVendor, 11, "LIFX White 800 (High Voltage)", features(false, 2700, 6500), 0},
  {kLifxVendor, 15, "LIFX Color 1000", features(true, 2500, 9000), 0},
  {kLifxVendor, 18, "LIFX White 900 BR30 (Low Voltage)", features(false, 2500, 9000), 0},
  {kLifxVendor, 19, "LIFX White 900 BR30 (High Voltage)", features(false, 2500, 9000), 0},
  {kLifxVendor, 20, "LIFX Color 1000 BR30", features(true, 2500, 9000), 0},
  {kLifxVendor, 22, "LIFX Color 1000", features(true, 2500, 9000), 0},
  {kLifxVendor, 27, "LIFX A19", features(true, 2500, 9000), 0},
  {kLifxVendor, 28, "LIFX BR30", features(true, 2500, 9000), 0},
  {kLifxVendor, 29, "LIFX A19 Night Vision", infrared(features(true, 2500, 9000)), 0},
  {kLifxVendor, 30, "LIFX BR30 Night Vision", infrared(features(true, 2500, 9000)), 0},
  {kLifxVendor, 31, "LIFX Z", multizone(features(true, 2500, 9000), false), 0},
  {kLifxVendor, 32, "LIFX Z", multizone(features(true, 2500, 9000), true), kExtendedFrom277},
  {kLifxVendor, 36, "LIFX Downlight", features(true, 2500, 9000), 0},
  {kLifxVendor, 37, "LIFX Downlight", features(true, 2500, 9000), 0},
  {kLifxVendor, 38, "LIFX Beam", multizone(features(true, 2500, 9000), true), kExtendedFrom277},
  {kLifxVendor, 39, "LIFX Downlight White to Warm", features(false, 1500, 9000), 0},
  {kLifxVendor, 40, "LIFX Downlight", features(true, 2500, 9000), 0},
  {kLifxVendor, 43, "LIFX A19", features(true, 2500, 9000), 0},
  {kLifxVendor, 44, "LIFX BR30", features(true, 2500, 9000), 0},
  {kLifxVendor, 45, "LIFX A19 Night Vision", infrared(features(true, 2500, 9000)), 0},
  {kLifxVendor, 46, "LIFX BR30 Night Vision", infrared(features(true, 2500, 9000)), 0},
  {kLifxVendor, 49, "LIFX Mini Color", features(true, 1500, 9000), 0},
  {kLifxVendor, 50, "LIFX Mini White to Warm", features(false, 1500, 4000), 0},
  {kLifxVendor, 51, "LIFX Mini White", features(false, 2700, 2700), 0},
  {kLifxVendor, 52, "LIFX GU10", features(true, 1500, 9000), 0},
  {kLifxVendor, 53, "LIFX GU10", features(true, 1500, 9000), 0},
  {kLifxVendor, 55, "LIFX Tile", matrix(features(true, 2500, 9000)), 0},
  {kLifxVendor, 57, "LIFX Candle", matrix(features(true, 1500, 9000)), 0},
  {kLifxVendor, 59, "LIFX Mini Color", features(true, 1500, 9000), 0},
  {kLifxVendor, 60, "LIFX Mini White to Warm", features(false, 1500, 4000), 0},
  {kLifxVendor, 61, "LIFX Mini White", features(false, 2700, 2700), 0},
  {kLifxVendor, 62, "LIFX A19", features(true, 1500, 9000), 0},
  {kLifxVendor, 63, "LIFX BR30", features(true, 2500, 9000), 0},
  {kLifxVendor, 64, "LIFX A19 Night Vision", infrared(features(true, 1500, 9000)), 0},
  {kLifxVendor, 65, "LIFX BR30 Night Vision", infrared(features(true, 2500, 9000)), 0},
  {kLifxVendor, 66, "LIFX Mini White", features(false, 2700, 2700), 0},
  {kLifxVendor, 68, "LIFX Candle", matrix(features(true, 1500, 9000)), 0},
  {kLifxVendor, 70, "LIFX Switch", switchFeatures(), 0},
  {kLifxVendor, 71, "LIFX Switch", switchFeatures(), 0},
  {kLifxVendor, 81, "LIFX Candle White to Warm", features(false, 2200, 6500), 0},
  {kLifxVendor, 82, "LIFX Filament Clear", features(false, 2100, 2100), 0},
  {kLifxVendor, 85, "LIFX Filament Amber", features(false, 2000, 2000), 0},
  {kLifxVendor, 87, "LIFX Mini White", features(false, 2700, 2700), 0},
  {kLifxVendor, 88, "LIFX Mini White", features(false, 2700, 2700), 0},
  {kLifxVendor, 89, "LIFX Switch", switchFeatures(), 0},
  {kLifxVendor, 90, "LIFX Clean", hev(features(true, 1500, 9000)), 0},
  {kLifxVendor, 91, "LIFX Color", features(true, 1500, 9000), 0},
  {kLifxVendor, 92, "LIFX Color", features(true, 1500, 9000), 0},
  {kLifxVendor, 94, "LIFX BR30", features(true, 1500, 9000), 0},
  {kLifxVendor, 96, "LIFX Candle White to Warm", features(false, 2200, 6500), 0},
  {kLifxVendor, 97, "LIFX A19", features(true, 1500, 9000), 0},
  {kLifxVendor, 98, "LIFX BR30", features(true, 1500, 9000), 0},
  {kLifxVendor, 99, "LIFX Clean", hev(features(true, 1500, 9000)), 0},
  {kLifxVendor, 100, "LIFX Filament Clear", features(false, 2100, 2100), 0},
  {kLifxVendor, 101, "LIFX Filament Amber", features(false, 2000, 2000), 0},
  {kLifxVendor, 109, "LIFX A19 Night Vision", infrared(features(true, 1500, 9000)), 0},
  {kLifxVendor, 110, "LIFX BR30 Night Vision", infrared(features(true, 1500, 9000)), 0},
  {kLifxVendor, 111, "LIFX A19 Night Vision", infrared(features(true, 1500, 9000)), 0},
  {kLifxVendor, 112, "LIFX BR30 Night Vision", infrared(features(true, 1500, 9000)), 0},
  {kLifxVendor, 113, "LIFX Mini WW", features(false, 1500, 9000), 0},
  {kLifxVendor, 114, "LIFX Mini WW", features(false, 1500, 9000), 0},
  {kLifxVendor, 115, "LIFX Switch", switchFeatures(), 0},
  {kLifxVendor, 116, "LIFX Switch", switchFeatures(), 0},
  {kLifxVendor, 117, "LIFX Z", multizone(features(true, 1500, 9000), true), 0},
  {kLifxVendor, 118, "LIFX Z", multizone(features(true, 1500, 9000), true), 0},
  {kLifxVendor, 119, "LIFX Beam", multizone(features(true, 1500, 9000), true), 0},
  {kLifxVendor, 120, "LIFX Beam", multizone(features(true, 1500, 9000), true), 0},
};

} // anonymous namespace

const Product* findProduct(const std::uint32_t vendor, const std::uint32_t pid)
{
  const auto it = std::find_if(std::begin(kProducts), std::end(kProducts),
    [vendor, pid](const Product& product) {
      return product.vendor == vendor && product.pid == pid;
    });
  return it == std::end(kProducts) ? nullptr : &*it;
}

Features productFeatures(
  const std::uint32_t vendor,
  const std::uint32_t pid,
  const std::uint32_t firmware)
{
  const auto pProduct = findProduct(vendor, pid);
  if (!pProduct)
  {
    return findProduct(kLifxVendor, 1)->features;
  }

  auto result = pProduct->features;
  if (result.extendedMultizone)
  {
    result.extendedMultizone = firmware >= pProduct->extendedMultizoneFirmware;
  }
  return result;
}

} // namespace lan
} // namespace lanlight
