// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/fleet/Device.hpp>
#include <chrono>
#include <optional>

namespace lanlight
{
namespace fleet
{

// Availability state machine. Each function updates the record and
// returns the new state when, and only when, the call caused a
// transition.
//
//   Unknown     -> Available    first successful response
//   Available   -> Available    success, resets the failure count
//   Available   -> Unavailable  no success for longer than the grace
//                               period and the last outcome a failure
//   Unavailable -> Available    first successful response
//   Unknown     -> Unavailable  no success ever, grace period measured
//                               from entering Unknown
//
// Discovery responses are not outcomes; a device is never demoted by
// discovery and never recovered by it.

namespace detail
{

inline void enter(AvailabilityRecord& record, const Availability state, const TimePoint now)
{
  record.state = state;
  record.enteredAt = now;
}

// Demotes the device if it has gone without a success for longer than
// the grace period.
inline std::optional<Availability> checkGracePeriod(
  AvailabilityRecord& record, const TimePoint now, const std::chrono::seconds gracePeriod)
{
  if (record.state == Availability::Unavailable)
  {
    return std::nullopt;
  }

  const auto reference = record.everSucceeded ? record.lastSuccess : record.enteredAt;
  if (now - reference > gracePeriod)
  {
    enter(record, Availability::Unavailable, now);
    return Availability::Unavailable;
  }
  return std::nullopt;
}

} // namespace detail

inline std::optional<Availability> recordSuccess(AvailabilityRecord& record, const TimePoint now)
{
  record.lastSuccess = now;
  record.everSucceeded = true;
  record.consecutiveFailures = 0;
  if (record.state != Availability::Available)
  {
    detail::enter(record, Availability::Available, now);
    return Availability::Available;
  }
  return std::nullopt;
}

inline std::optional<Availability> recordFailure(
  AvailabilityRecord& record, const TimePoint now, const std::chrono::seconds gracePeriod)
{
  record.lastFailure = now;
  ++record.consecutiveFailures;
  return detail::checkGracePeriod(record, now, gracePeriod);
}

// Periodic check that also catches devices that fell silent with no
// request outstanding. A success always moves lastSuccess forward, so
// a device whose last success is older than the grace period has had
// nothing but failures or silence since.
inline std::optional<Availability> sweep(
  AvailabilityRecord& record, const TimePoint now, const std::chrono::seconds gracePeriod)
{
  return detail::checkGracePeriod(record, now, gracePeriod);
}

} // namespace fleet
} // namespace lanlight
