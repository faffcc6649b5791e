// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/lan/Codec.hpp>
#include <lanlight/lan/Serial.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace lanlight
{
namespace fleet
{

enum class Status
{
  Success,
  // No response after every attempt
  Exhausted,
  // Too many requests in flight to the device
  Backpressure,
  // The device was removed or the fleet stopped
  Cancelled,
  // The serial is not in the registry
  UnknownDevice
};

inline const char* toString(const Status status)
{
  switch (status)
  {
  case Status::Success:
    return "success";
  case Status::Exhausted:
    return "exhausted";
  case Status::Backpressure:
    return "backpressure";
  case Status::Cancelled:
    return "cancelled";
  case Status::UnknownDevice:
    return "unknown device";
  }
  return "invalid";
}

inline std::ostream& operator<<(std::ostream& stream, const Status status)
{
  return stream << toString(status);
}

// Result of a request as seen by the consumer
struct Outcome
{
  Status status;
  lan::Serial serial;
  // The message that completed the request, on success
  std::optional<lan::Message> response;
  // Number of times the request was sent
  std::size_t attempts;
  std::string reason;

  explicit operator bool() const
  {
    return status == Status::Success;
  }
};

using OutcomeHandler = std::function<void(const Outcome&)>;

inline Outcome failedOutcome(
  const Status status, const lan::Serial& serial, std::string reason, std::size_t attempts = 0)
{
  return {status, serial, std::nullopt, attempts, std::move(reason)};
}

} // namespace fleet
} // namespace lanlight
