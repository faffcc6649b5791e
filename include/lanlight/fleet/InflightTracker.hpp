// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/lan/Serial.hpp>
#include <cstddef>
#include <map>
#include <memory>

namespace lanlight
{
namespace fleet
{

// Counts the requests in flight per device and refuses admission
// beyond the ceiling. Admission never waits. Used on the io thread
// only.
class InflightTracker
{
  struct Counts
  {
    explicit Counts(const std::size_t ceiling)
      : ceiling(ceiling)
    {
    }

    void release(const lan::Serial& serial)
    {
      const auto it = inflight.find(serial);
      if (it != inflight.end() && --it->second == 0)
      {
        inflight.erase(it);
      }
    }

    const std::size_t ceiling;
    std::map<lan::Serial, std::size_t> inflight;
  };

public:
  // Move-only handle to one admitted request. The slot is released
  // exactly once, by release() or on destruction.
  class Permit
  {
  public:
    Permit() = default;

    Permit(std::shared_ptr<Counts> pCounts, const lan::Serial& serial)
      : mpCounts(std::move(pCounts))
      , mSerial(serial)
    {
    }

    ~Permit()
    {
      release();
    }

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

    Permit(Permit&& rhs)
      : mpCounts(std::move(rhs.mpCounts))
      , mSerial(rhs.mSerial)
    {
    }

    Permit& operator=(Permit&& rhs)
    {
      if (this != &rhs)
      {
        release();
        mpCounts = std::move(rhs.mpCounts);
        mSerial = rhs.mSerial;
      }
      return *this;
    }

    void release()
    {
      if (mpCounts)
      {
        mpCounts->release(mSerial);
        mpCounts.reset();
      }
    }

    explicit operator bool() const
    {
      return static_cast<bool>(mpCounts);
    }

    const lan::Serial& serial() const
    {
      return mSerial;
    }

  private:
    std::shared_ptr<Counts> mpCounts;
    lan::Serial mSerial{};
  };

  explicit InflightTracker(const std::size_t ceiling)
    : mpCounts(std::make_shared<Counts>(ceiling))
  {
  }

  // Returns an empty permit if the device is at its ceiling
  Permit admit(const lan::Serial& serial)
  {
    auto& count = mpCounts->inflight[serial];
    if (count >= mpCounts->ceiling)
    {
      if (count == 0)
      {
        mpCounts->inflight.erase(serial);
      }
      return {};
    }
    ++count;
    return {mpCounts, serial};
  }

  std::size_t inflight(const lan::Serial& serial) const
  {
    const auto it = mpCounts->inflight.find(serial);
    return it == mpCounts->inflight.end() ? 0 : it->second;
  }

  std::size_t ceiling() const
  {
    return mpCounts->ceiling;
  }

private:
  std::shared_ptr<Counts> mpCounts;
};

} // namespace fleet
} // namespace lanlight
