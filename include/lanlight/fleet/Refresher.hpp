// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/fleet/Device.hpp>
#include <lanlight/fleet/Outcome.hpp>
#include <lanlight/lan/Codec.hpp>
#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <optional>

namespace lanlight
{
namespace fleet
{

// Which follow-up queries of a refresh have been issued
struct RefreshProgress
{
  bool version = false;
  bool hostFirmware = false;
  bool label = false;
  bool group = false;
  bool color = false;
  bool zones = false;
  bool multizoneEffect = false;
  bool hevCycle = false;
  bool infrared = false;
  // First zone of the next legacy GetColorZones block
  std::size_t nextZone = 0;
};

// Returns the next query needed to complete the device info, or
// nothing when the info is complete. What is asked after the product
// is known depends on its features; switches have no light state.
inline std::optional<lan::Message> nextInfoRequest(
  const DeviceInfo& info, RefreshProgress& progress)
{
  if (!progress.version)
  {
    progress.version = true;
    return lan::Message{lan::GetVersion{}};
  }
  if (!progress.hostFirmware)
  {
    progress.hostFirmware = true;
    return lan::Message{lan::GetHostFirmware{}};
  }
  if (!progress.label)
  {
    progress.label = true;
    return lan::Message{lan::GetLabel{}};
  }
  if (!progress.group)
  {
    progress.group = true;
    return lan::Message{lan::GetGroup{}};
  }

  if (isSwitch(info))
  {
    return std::nullopt;
  }

  const auto f = features(info);
  if (!progress.color)
  {
    progress.color = true;
    return lan::Message{lan::GetColor{}};
  }

  if (f.multizone && !progress.zones)
  {
    if (f.extendedMultizone)
    {
      progress.zones = true;
      return lan::Message{lan::GetExtendedColorZones{}};
    }
    // The zone count is only known once the first block arrived
    if (progress.nextZone == 0 || progress.nextZone < info.zones.size())
    {
      lan::GetColorZones get;
      get.startIndex = static_cast<std::uint8_t>(progress.nextZone);
      get.endIndex = static_cast<std::uint8_t>(
        std::min<std::size_t>(progress.nextZone + lan::kZonesPerStateMultiZone - 1, 255));
      progress.nextZone += lan::kZonesPerStateMultiZone;
      return lan::Message{get};
    }
    progress.zones = true;
  }
  if (f.multizone && !progress.multizoneEffect)
  {
    progress.multizoneEffect = true;
    return lan::Message{lan::GetMultiZoneEffect{}};
  }
  if (f.hev && !progress.hevCycle)
  {
    progress.hevCycle = true;
    return lan::Message{lan::GetHevCycle{}};
  }
  if (f.infrared && !progress.infrared)
  {
    progress.infrared = true;
    return lan::Message{lan::GetInfrared{}};
  }
  return std::nullopt;
}

// Runs the follow-up queries of newly discovered or recovered devices.
// The queries of one device are issued one after the other; at most
// maxConcurrent devices are refreshed at the same time and the rest
// wait in order of scheduling. A failed query ends the refresh of the
// device, which is retried when it is next rediscovered. Used on the
// io thread only.
class Refresher
{
public:
  using Issue = std::function<void(const lan::Serial&, lan::Message, OutcomeHandler)>;
  using InfoQuery = std::function<std::optional<DeviceInfo>(const lan::Serial&)>;
  using Completion = std::function<void(const lan::Serial&, bool complete)>;

  Refresher(const std::size_t maxConcurrent, Issue issue, InfoQuery query, Completion completion)
    : mMaxConcurrent(maxConcurrent)
    , mIssue(std::move(issue))
    , mQuery(std::move(query))
    , mCompletion(std::move(completion))
  {
  }

  Refresher(const Refresher&) = delete;
  Refresher& operator=(const Refresher&) = delete;

  // Returns false if the device is already being refreshed or waiting
  bool schedule(const lan::Serial& serial)
  {
    if (mStopped || isScheduled(serial))
    {
      return false;
    }
    mQueue.push_back(serial);
    startNext();
    return true;
  }

  // Forgets the device. A query still in flight for it is ignored
  // when it resolves.
  void cancel(const lan::Serial& serial)
  {
    mQueue.erase(std::remove(mQueue.begin(), mQueue.end(), serial), mQueue.end());
    if (mRunning.erase(serial) > 0)
    {
      startNext();
    }
  }

  void stop()
  {
    mStopped = true;
    mQueue.clear();
    mRunning.clear();
  }

  bool isScheduled(const lan::Serial& serial) const
  {
    return mRunning.count(serial) > 0
           || std::find(mQueue.begin(), mQueue.end(), serial) != mQueue.end();
  }

  std::size_t running() const
  {
    return mRunning.size();
  }

  std::size_t queued() const
  {
    return mQueue.size();
  }

private:
  void startNext()
  {
    while (!mStopped && mRunning.size() < mMaxConcurrent && !mQueue.empty())
    {
      const auto serial = mQueue.front();
      mQueue.pop_front();
      mRunning.emplace(serial, RefreshProgress{});
      step(serial);
    }
  }

  void step(const lan::Serial& serial)
  {
    const auto it = mRunning.find(serial);
    if (it == mRunning.end())
    {
      return;
    }

    const auto info = mQuery(serial);
    if (!info)
    {
      finish(serial, false);
      return;
    }

    auto request = nextInfoRequest(*info, it->second);
    if (!request)
    {
      finish(serial, true);
      return;
    }

    mIssue(serial, std::move(*request), [this, serial](const Outcome& outcome) {
      if (mStopped || mRunning.count(serial) == 0)
      {
        return;
      }
      if (outcome)
      {
        step(serial);
      }
      else
      {
        finish(serial, false);
      }
    });
  }

  void finish(const lan::Serial& serial, const bool complete)
  {
    mRunning.erase(serial);
    if (mCompletion)
    {
      mCompletion(serial, complete);
    }
    startNext();
  }

  const std::size_t mMaxConcurrent;
  Issue mIssue;
  InfoQuery mQuery;
  Completion mCompletion;
  std::deque<lan::Serial> mQueue;
  std::map<lan::Serial, RefreshProgress> mRunning;
  bool mStopped = false;
};

} // namespace fleet
} // namespace lanlight
