// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/lan/Header.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace lanlight
{
namespace fleet
{

struct Settings
{
  // Period of the GetService broadcast on every interface
  std::chrono::seconds discoveryInterval{60};
  // How long to wait for the response to one attempt
  std::chrono::milliseconds responseTimeout{1000};
  // Attempts per request, including the first one
  std::size_t retryCount{8};
  // Time without a successful response before a device is unavailable
  std::chrono::seconds gracePeriod{180};
  // Maximum requests in flight per device
  std::size_t inflightCeiling{8};
  // Period of the availability sweep and of the keep-alive poll
  std::chrono::seconds sweepInterval{10};
  // Query every device's light state once per sweep
  bool pollDevices{true};
  std::chrono::seconds interfaceRescanPeriod{30};
  // Devices whose info is refreshed at the same time
  std::size_t maxConcurrentRefreshes{4};
  std::uint16_t port{lan::kDefaultPort};
  bool verbose{false};
};

// Throws std::invalid_argument for settings the fleet can't run with
inline void validate(const Settings& settings)
{
  using namespace std::chrono;
  if (settings.discoveryInterval <= seconds{0})
  {
    throw std::invalid_argument("discovery interval must be positive");
  }
  if (settings.responseTimeout <= milliseconds{0})
  {
    throw std::invalid_argument("response timeout must be positive");
  }
  if (settings.retryCount == 0)
  {
    throw std::invalid_argument("retry count must be at least 1");
  }
  if (settings.gracePeriod <= seconds{0})
  {
    throw std::invalid_argument("grace period must be positive");
  }
  // Sequence numbers are a single byte and must be unique among the
  // requests in flight to one device
  if (settings.inflightCeiling == 0 || settings.inflightCeiling > 255)
  {
    throw std::invalid_argument("inflight ceiling must be between 1 and 255");
  }
  if (settings.sweepInterval <= seconds{0})
  {
    throw std::invalid_argument("sweep interval must be positive");
  }
  if (settings.interfaceRescanPeriod <= seconds{0})
  {
    throw std::invalid_argument("interface rescan period must be positive");
  }
  if (settings.maxConcurrentRefreshes == 0)
  {
    throw std::invalid_argument("at least one refresh must be allowed");
  }
}

} // namespace fleet
} // namespace lanlight
