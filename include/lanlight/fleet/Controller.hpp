// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/discovery/Gateway.hpp>
#include <lanlight/discovery/Gateways.hpp>
#include <lanlight/fleet/Availability.hpp>
#include <lanlight/fleet/InflightTracker.hpp>
#include <lanlight/fleet/Refresher.hpp>
#include <lanlight/fleet/Registry.hpp>
#include <lanlight/fleet/RetryEngine.hpp>
#include <lanlight/fleet/Settings.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace lanlight
{
namespace fleet
{

using AvailabilityCallback = std::function<void(const lan::Serial&, Availability)>;

namespace detail
{

// Identifies this client in every header it sends. Zero is reserved
// for clients that want broadcast responses.
inline std::uint32_t randomSource()
{
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<std::uint32_t> dist(1, 0xffffffff);
  return dist(gen);
}

inline Settings validated(Settings settings)
{
  validate(settings);
  return settings;
}

} // namespace detail

// Manages a fleet of devices on the local networks: discovers them on
// every eligible interface, keeps their info and availability current
// and sends them requests with retries.
//
// All work happens on the io thread. The public methods may be called
// from any thread; request handlers and the availability callback are
// invoked on the io thread and must not block it.
template <typename Platform, typename InterfaceFactory, typename Log, typename IoContext>
class Controller
{
public:
  using IoType = typename util::Injected<IoContext>::type;
  using Timer = typename IoType::Timer;
  using TimerError = typename Timer::ErrorCode;

  Controller(Settings settings,
    Platform platform,
    InterfaceFactory interfaceFactory,
    Log log,
    util::Injected<IoContext> io,
    AvailabilityCallback availabilityCallback = {})
    : mIo(std::move(io))
    , mDiscovering(false)
    , mpImpl(std::make_shared<Impl>(detail::validated(std::move(settings)),
        std::move(platform), std::move(interfaceFactory), std::move(log), *mIo,
        std::move(availabilityCallback)))
  {
  }

  ~Controller()
  {
    // The io thread owns the state; tear it down there
    auto pImpl = std::move(mpImpl);
    mIo->post([pImpl] { pImpl->shutdown(); });
  }

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  Controller(Controller&&) = delete;
  Controller& operator=(Controller&&) = delete;

  // Starts periodic discovery on every eligible interface. Calling it
  // again while discovery runs has no effect.
  void discover()
  {
    if (!mDiscovering.exchange(true))
    {
      auto pImpl = mpImpl;
      mIo->post([pImpl] { pImpl->startDiscovery(); });
    }
  }

  // Starts a discovery cycle on every interface without waiting for
  // the discovery interval
  void rediscover()
  {
    auto pImpl = mpImpl;
    mIo->post([pImpl] { pImpl->discoverNow(); });
  }

  // Ends discovery and resolves every request in flight as cancelled.
  // Requests sent afterwards are cancelled right away.
  void stop()
  {
    mDiscovering = false;
    auto pImpl = mpImpl;
    mIo->post([pImpl] { pImpl->shutdown(); });
  }

  // Sends a request to the device and invokes the handler with its
  // outcome, exactly once, on the io thread. Throws
  // std::invalid_argument if the message is not a request.
  void send(const lan::Serial& serial, lan::Message request, OutcomeHandler handler)
  {
    if (!lan::isRequest(request))
    {
      throw std::invalid_argument(
        std::string{lan::messageName(request)} + " is not a request message");
    }
    auto pImpl = mpImpl;
    // Wrapped in a shared_ptr since posted handlers must be copyable
    auto pRequest = std::make_shared<lan::Message>(std::move(request));
    mIo->post([pImpl, serial, pRequest, handler] {
      pImpl->request(serial, std::move(*pRequest), handler);
    });
  }

  std::optional<DeviceState> deviceState(const lan::Serial& serial) const
  {
    if (const auto pDevice = mpImpl->mRegistry.find(serial))
    {
      return pDevice->state();
    }
    return std::nullopt;
  }

  std::vector<DeviceSummary> devices() const
  {
    std::vector<DeviceSummary> result;
    for (const auto& pDevice : mpImpl->mRegistry.devices())
    {
      result.push_back(pDevice->summary());
    }
    return result;
  }

  std::size_t numDevices() const
  {
    return mpImpl->mRegistry.size();
  }

  // Forgets the device and cancels its requests in flight. It is added
  // again, as a new device, if it answers a later discovery cycle.
  void removeDevice(const lan::Serial& serial)
  {
    auto pImpl = mpImpl;
    mIo->post([pImpl, serial] { pImpl->removeDevice(serial); });
  }

  std::uint32_t source() const
  {
    return mpImpl->mSource;
  }

private:
  struct Impl;

  struct GatewayObserver
  {
    friend void sawDevice(
      GatewayObserver& observer, const discovery::DeviceAnnouncement& announcement)
    {
      if (const auto pImpl = observer.mpImpl.lock())
      {
        pImpl->sawDevice(announcement);
      }
    }

    friend void receivedPacket(GatewayObserver& observer,
      const asio::ip::udp::endpoint& from,
      const lan::Packet& packet)
    {
      if (const auto pImpl = observer.mpImpl.lock())
      {
        pImpl->mEngine.dispatch(from, packet);
      }
    }

    friend void gatewayFailed(GatewayObserver& observer, const asio::ip::address_v4& addr)
    {
      if (const auto pImpl = observer.mpImpl.lock())
      {
        pImpl->repairGateway(addr);
      }
    }

    std::weak_ptr<Impl> mpImpl;
  };

  struct GatewayFactory
  {
    using InterfaceType = typename std::result_of<InterfaceFactory(
      IoType&, const discovery::IpInterface&)>::type;
    using Gateway = discovery::Gateway<InterfaceType, GatewayObserver, Timer, Log>;

    Gateway operator()(IoType& io, const discovery::IpInterface& iface)
    {
      return discovery::makeGateway(util::injectVal(mInterfaceFactory(io, iface)), iface,
        GatewayObserver{mpImpl}, util::injectVal(io.makeTimer()), channel(mLog, "gateway"),
        mSettings.discoveryInterval, mSource, mSettings.port);
    }

    InterfaceFactory mInterfaceFactory;
    std::weak_ptr<Impl> mpImpl;
    Log mLog;
    Settings mSettings;
    std::uint32_t mSource;
  };

  using ControllerGateways =
    discovery::Gateways<GatewayFactory, IoType&, Platform, Log>;
  using Engine = RetryEngine<IoType&, Log>;

  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(Settings settings,
      Platform platform,
      InterfaceFactory interfaceFactory,
      Log log,
      IoType& io,
      AvailabilityCallback availabilityCallback)
      : mSettings(std::move(settings))
      , mLog(std::move(log))
      , mIo(io)
      , mSource(detail::randomSource())
      , mAvailabilityCallback(std::move(availabilityCallback))
      , mInflight(mSettings.inflightCeiling)
      , mRefresher(mSettings.maxConcurrentRefreshes,
          [this](const lan::Serial& serial, lan::Message request, OutcomeHandler handler) {
            this->request(serial, std::move(request), std::move(handler));
          },
          [this](const lan::Serial& serial) -> std::optional<DeviceInfo> {
            if (const auto pDevice = mRegistry.find(serial))
            {
              return pDevice->withRecord([](const DeviceRecord& record) { return record.info; });
            }
            return std::nullopt;
          },
          [this](const lan::Serial& serial, const bool complete) {
            refreshDone(serial, complete);
          })
      , mEngine(util::injectRef(io),
          mSource,
          mSettings.responseTimeout,
          mSettings.retryCount,
          [this](const lan::Message& request, const Outcome& outcome) {
            recordOutcome(request, outcome);
          },
          channel(mLog, "requests"))
      , mSweepTimer(io.makeTimer())
      , mPlatform(std::move(platform))
      , mInterfaceFactory(std::move(interfaceFactory))
    {
    }

    ~Impl()
    {
      shutdown();
    }

    TimePoint now() const
    {
      return mSweepTimer.now();
    }

    void startDiscovery()
    {
      if (mStopped || mpGateways)
      {
        return;
      }

      mpGateways = discovery::makeGateways(mSettings.interfaceRescanPeriod,
        GatewayFactory{std::move(mInterfaceFactory), this->shared_from_this(), mLog, mSettings,
          mSource},
        util::injectRef(mIo), util::injectVal(std::move(mPlatform)),
        util::injectVal(channel(mLog, "interfaces")));
      info(mLog) << "starting discovery, client " << mSource;
      mpGateways->enable(true);
      scheduleSweep();
    }

    void discoverNow()
    {
      if (mpGateways && !mStopped)
      {
        mpGateways->discoverNow();
      }
    }

    void repairGateway(const asio::ip::address_v4& addr)
    {
      if (mpGateways && !mStopped)
      {
        mpGateways->repairGateway(addr);
      }
    }

    void shutdown()
    {
      if (mStopped)
      {
        return;
      }
      mStopped = true;
      mRefresher.stop();
      mSweepTimer.cancel();
      mEngine.cancelAll("fleet stopped");
      mpGateways.reset();
    }

    void sawDevice(const discovery::DeviceAnnouncement& announcement)
    {
      const auto& serial = announcement.serial;
      const auto sighting =
        mRegistry.sawDevice(serial, announcement.endpoint, announcement.gatewayAddr, now());

      if (sighting.isNew)
      {
        info(mLog) << "discovered " << serial << " at " << announcement.endpoint
                   << " in cycle " << announcement.cycle;
        mRefresher.schedule(serial);
        return;
      }

      if (sighting.moved)
      {
        info(mLog) << serial << " is now reached at " << announcement.endpoint << " through "
                   << announcement.gatewayAddr;
        mEngine.retarget(serial, announcement.endpoint, sender(announcement.gatewayAddr));
      }

      const auto needsRefresh = sighting.device->withRecord([](const DeviceRecord& record) {
        return record.availability.state == Availability::Unavailable || !record.infoComplete;
      });
      if (needsRefresh)
      {
        mRefresher.schedule(serial);
      }
    }

    void request(const lan::Serial& serial, lan::Message request, OutcomeHandler handler)
    {
      if (mStopped)
      {
        handler(failedOutcome(Status::Cancelled, serial, "fleet stopped"));
        return;
      }

      const auto pDevice = mRegistry.find(serial);
      if (!pDevice)
      {
        handler(failedOutcome(Status::UnknownDevice, serial, "device not in registry"));
        return;
      }

      auto permit = mInflight.admit(serial);
      if (!permit)
      {
        debug(mLog) << "refusing " << request << " to " << serial << ", "
                    << mInflight.ceiling() << " requests in flight";
        handler(failedOutcome(Status::Backpressure, serial,
          std::to_string(mInflight.ceiling()) + " requests in flight"));
        return;
      }

      auto target = pDevice->withRecord([&](const DeviceRecord& record) {
        return typename Engine::Target{serial, record.endpoint, sender(record.gatewayAddr)};
      });
      mEngine.execute(
        std::move(target), std::move(request), std::move(permit), std::move(handler));
    }

    // Unicasts through the gateway of the device's interface. A gateway
    // that fails to send is rebuilt.
    typename Engine::Sender sender(const asio::ip::address_v4& gatewayAddr)
    {
      using Gateway = typename GatewayFactory::Gateway;
      return [this, gatewayAddr](
               const std::vector<std::uint8_t>& bytes, const asio::ip::udp::endpoint& to) {
        const auto found =
          mpGateways && mpGateways->withGateway(gatewayAddr, [&](Gateway& gateway) {
            try
            {
              sendTo(gateway, bytes, to);
            }
            catch (const discovery::UdpSendException&)
            {
              mpGateways->repairGateway(gatewayAddr);
              throw;
            }
          });
        if (!found)
        {
          throw discovery::UdpSendException{"no gateway on interface", gatewayAddr};
        }
      };
    }

    void recordOutcome(const lan::Message& request, const Outcome& outcome)
    {
      const auto pDevice = mRegistry.find(outcome.serial);
      if (!pDevice)
      {
        return;
      }

      const auto t = now();
      const auto transition = pDevice->withRecord([&](DeviceRecord& record) {
        if (outcome.status == Status::Success)
        {
          if (outcome.response)
          {
            applyResponse(record.info, request, *outcome.response);
          }
          return recordSuccess(record.availability, t);
        }
        return recordFailure(record.availability, t, mSettings.gracePeriod);
      });

      if (transition)
      {
        notifyTransition(outcome.serial, *transition);
      }
    }

    void notifyTransition(const lan::Serial& serial, const Availability state)
    {
      info(mLog) << serial << " is now " << state;

      if (state == Availability::Available)
      {
        const auto pDevice = mRegistry.find(serial);
        if (pDevice
            && !pDevice->withRecord([](const DeviceRecord& record) { return record.infoComplete; }))
        {
          mRefresher.schedule(serial);
        }
      }

      if (mAvailabilityCallback)
      {
        mAvailabilityCallback(serial, state);
      }
    }

    void refreshDone(const lan::Serial& serial, const bool complete)
    {
      const auto pDevice = mRegistry.find(serial);
      if (!pDevice)
      {
        return;
      }

      if (complete)
      {
        const auto summary = pDevice->withRecord([&](DeviceRecord& record) {
          record.infoComplete = true;
          return productName(record.info) + " \"" + record.info.label + "\" firmware "
                 + firmwareString(record.info);
        });
        info(mLog) << serial << " is a " << summary;
      }
      else
      {
        debug(mLog) << "refresh of " << serial << " incomplete";
      }
    }

    void scheduleSweep()
    {
      mSweepTimer.expires_from_now(mSettings.sweepInterval);
      mSweepTimer.async_wait([this](const TimerError e) {
        if (!e)
        {
          sweepDevices();
          scheduleSweep();
        }
      });
    }

    void sweepDevices()
    {
      const auto t = now();
      for (const auto& pDevice : mRegistry.devices())
      {
        const auto transition = pDevice->withRecord([&](DeviceRecord& record) {
          return sweep(record.availability, t, mSettings.gracePeriod);
        });
        if (transition)
        {
          notifyTransition(pDevice->serial(), *transition);
        }
        if (mSettings.pollDevices)
        {
          poll(*pDevice);
        }
      }
    }

    // Keep-alive query; a device is polled again only once its previous
    // poll resolved
    void poll(Device& device)
    {
      const auto serial = device.serial();
      if (mPolling.count(serial) > 0 || mRefresher.isScheduled(serial))
      {
        return;
      }

      const auto switchOnly =
        device.withRecord([](const DeviceRecord& record) { return isSwitch(record.info); });
      mPolling.insert(serial);
      request(serial,
        switchOnly ? lan::Message{lan::GetPower{}} : lan::Message{lan::GetColor{}},
        [this, serial](const Outcome&) { mPolling.erase(serial); });
    }

    void removeDevice(const lan::Serial& serial)
    {
      mRefresher.cancel(serial);
      mEngine.cancel(serial, "device removed");
      mPolling.erase(serial);
      if (mRegistry.remove(serial))
      {
        info(mLog) << "removed " << serial;
      }
    }

    const Settings mSettings;
    Log mLog;
    IoType& mIo;
    const std::uint32_t mSource;
    AvailabilityCallback mAvailabilityCallback;
    bool mStopped = false;
    Registry mRegistry;
    InflightTracker mInflight;
    std::set<lan::Serial> mPolling;
    Refresher mRefresher;
    Engine mEngine;
    Timer mSweepTimer;
    Platform mPlatform;
    InterfaceFactory mInterfaceFactory;
    std::unique_ptr<ControllerGateways> mpGateways;
  };

  util::Injected<IoContext> mIo;
  std::atomic<bool> mDiscovering;
  std::shared_ptr<Impl> mpImpl;
};

} // namespace fleet
} // namespace lanlight
