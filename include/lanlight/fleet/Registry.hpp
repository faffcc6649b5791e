// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/fleet/Device.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace lanlight
{
namespace fleet
{

// Owns the devices of the fleet, one entry per serial. The registry
// lock only guards membership; each device has its own lock for its
// record, so a slow or unreachable device never holds up the others.
class Registry
{
public:
  using DevicePtr = std::shared_ptr<Device>;

  struct Sighting
  {
    DevicePtr device;
    // The serial was not known before
    bool isNew;
    // The device answered from a different endpoint or interface
    bool moved;
  };

  // Registers a device that answered discovery, or updates where an
  // already known device is reached.
  Sighting sawDevice(const lan::Serial& serial, const asio::ip::udp::endpoint& endpoint,
    const asio::ip::address_v4& gatewayAddr, const TimePoint now)
  {
    DevicePtr pDevice;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      auto& entry = mDevices[serial];
      if (!entry)
      {
        entry = std::make_shared<Device>(serial, endpoint, gatewayAddr, now);
        return {entry, true, false};
      }
      pDevice = entry;
    }

    const auto moved = pDevice->withRecord([&](DeviceRecord& record) {
      if (record.endpoint == endpoint && record.gatewayAddr == gatewayAddr)
      {
        return false;
      }
      record.endpoint = endpoint;
      record.gatewayAddr = gatewayAddr;
      return true;
    });
    return {pDevice, false, moved};
  }

  DevicePtr find(const lan::Serial& serial) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    const auto it = mDevices.find(serial);
    return it == mDevices.end() ? nullptr : it->second;
  }

  bool remove(const lan::Serial& serial)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mDevices.erase(serial) > 0;
  }

  std::vector<DevicePtr> devices() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<DevicePtr> result;
    result.reserve(mDevices.size());
    for (const auto& entry : mDevices)
    {
      result.push_back(entry.second);
    }
    return result;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mDevices.size();
  }

private:
  mutable std::mutex mMutex;
  std::map<lan::Serial, DevicePtr> mDevices;
};

} // namespace fleet
} // namespace lanlight
