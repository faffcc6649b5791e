// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/discovery/Interfaces.hpp>
#include <lanlight/discovery/UdpInterface.hpp>
#include <lanlight/lan/Codec.hpp>
#include <lanlight/util/Injected.hpp>
#include <lanlight/util/SafeAsyncHandler.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace lanlight
{
namespace discovery
{

// A device that answered a discovery broadcast
struct DeviceAnnouncement
{
  lan::Serial serial;
  asio::ip::udp::endpoint endpoint;
  // Address of the local interface the announcement arrived on
  asio::ip::address_v4 gatewayAddr;
  // Discovery cycle of the gateway the response is attributed to
  std::uint64_t cycle;
};

// Concept: GatewayObserver
//
//   sawDevice(observer, const DeviceAnnouncement&)
//     A device answered discovery on this gateway's interface.
//
//   receivedPacket(observer, const asio::ip::udp::endpoint& from, const lan::Packet&)
//     Any other message addressed to our client id. Responses to
//     requests in flight are correlated by the observer.
//
//   gatewayFailed(observer, const asio::ip::address_v4& interfaceAddr)
//     A periodic discovery broadcast could not be sent. The observer
//     decides whether to rebuild the gateway.

// Owns the transport of one local interface. Broadcasts GetService to
// the subnet once per discovery interval and dispatches everything
// received on the interface to the observer.
template <typename Interface, typename Observer, typename Timer, typename Log>
class Gateway
{
public:
  using TimerError = typename util::Injected<Timer>::type::ErrorCode;

  Gateway(
    util::Injected<Interface> iface,
    IpInterface ipInterface,
    Observer observer,
    util::Injected<Timer> timer,
    Log log,
    const std::chrono::seconds discoveryInterval,
    const std::uint32_t source,
    const std::uint16_t port)
    : mpImpl(std::make_shared<Impl>(std::move(iface), std::move(ipInterface),
        std::move(observer), std::move(timer), std::move(log), discoveryInterval, source,
        port))
  {
    debug(mpImpl->mLog) << "gateway for " << mpImpl->mIpInterface << " bound to "
                        << endpoint(*mpImpl->mInterface);
    mpImpl->listen();
    mpImpl->startCycle();
  }

  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;

  Gateway(Gateway&& rhs)
    : mpImpl(std::move(rhs.mpImpl))
  {
  }

  Gateway& operator=(Gateway&& rhs)
  {
    mpImpl = std::move(rhs.mpImpl);
    return *this;
  }

  // Begin a new discovery cycle now instead of waiting for the interval
  friend void discover(Gateway& gateway)
  {
    gateway.mpImpl->nextCycle();
  }

  // Unicast through this gateway's interface. Throws UdpSendException.
  friend void sendTo(
    Gateway& gateway,
    const std::vector<std::uint8_t>& bytes,
    const asio::ip::udp::endpoint& to)
  {
    send(*gateway.mpImpl->mInterface, bytes.data(), bytes.size(), to);
  }

  friend std::uint64_t discoveryCycle(const Gateway& gateway)
  {
    return gateway.mpImpl->mCycle;
  }

private:
  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(
      util::Injected<Interface> iface,
      IpInterface ipInterface,
      Observer observer,
      util::Injected<Timer> timer,
      Log log,
      const std::chrono::seconds discoveryInterval,
      const std::uint32_t source,
      const std::uint16_t port)
      : mInterface(std::move(iface))
      , mIpInterface(std::move(ipInterface))
      , mObserver(std::move(observer))
      , mTimer(std::move(timer))
      , mLog(std::move(log))
      , mInterval(discoveryInterval)
      , mSource(source)
      , mPort(port)
      , mCycle(0)
    {
    }

    void listen()
    {
      receive(*mInterface, util::makeAsyncSafe(this->shared_from_this()));
    }

    // Handler for datagrams received on the interface
    template <typename It>
    void operator()(const asio::ip::udp::endpoint& from, const It begin, const It end)
    {
      auto result = lan::decode(begin, end);
      if (const auto pError = std::get_if<lan::DecodeError>(&result))
      {
        debug(mLog) << "ignoring datagram from " << from << ": " << pError->reason;
      }
      else
      {
        onPacket(from, std::get<lan::Packet>(result));
      }
      listen();
    }

    void onPacket(const asio::ip::udp::endpoint& from, const lan::Packet& packet)
    {
      if (packet.header.source != mSource)
      {
        // Traffic of other clients on the network
        return;
      }

      if (const auto pService = std::get_if<lan::StateService>(&packet.message))
      {
        if (pService->service == lan::StateService::kUdp && !packet.header.target.isZero())
        {
          const auto port = static_cast<std::uint16_t>(pService->port);
          sawDevice(mObserver, DeviceAnnouncement{packet.header.target,
                                 {from.address(), port}, mIpInterface.address, mCycle});
        }
      }
      receivedPacket(mObserver, from, packet);
    }

    void startCycle()
    {
      ++mCycle;
      // Schedule before sending so that a failing send does not end
      // the discovery cycle
      mTimer->expires_from_now(mInterval);
      mTimer->async_wait([this](const TimerError e) {
        if (!e)
        {
          nextCycle();
        }
      });
      broadcastDiscovery();
    }

    // Failures of the first cycle propagate to whoever creates the
    // gateway. Later ones are reported to the observer.
    void nextCycle()
    {
      try
      {
        startCycle();
      }
      catch (const UdpSendException& e)
      {
        warning(mLog) << "discovery broadcast on " << mIpInterface << " failed: " << e.what();
        gatewayFailed(mObserver, mIpInterface.address);
      }
    }

    void broadcastDiscovery()
    {
      lan::Header header;
      header.tagged = true;
      header.source = mSource;
      header.resRequired = true;
      header.sequence = static_cast<std::uint8_t>(mCycle);
      const auto bytes = lan::encode(header, lan::GetService{});
      const asio::ip::udp::endpoint to{broadcastAddress(mIpInterface), mPort};

      debug(mLog) << "discovery cycle " << mCycle << " on " << mIpInterface << " to " << to;
      send(*mInterface, bytes.data(), bytes.size(), to);
    }

    util::Injected<Interface> mInterface;
    IpInterface mIpInterface;
    Observer mObserver;
    util::Injected<Timer> mTimer;
    Log mLog;
    std::chrono::seconds mInterval;
    std::uint32_t mSource;
    std::uint16_t mPort;
    std::uint64_t mCycle;
  };

  std::shared_ptr<Impl> mpImpl;
};

template <typename Interface, typename Observer, typename Timer, typename Log>
Gateway<Interface, Observer, Timer, Log> makeGateway(
  util::Injected<Interface> iface,
  IpInterface ipInterface,
  Observer observer,
  util::Injected<Timer> timer,
  Log log,
  const std::chrono::seconds discoveryInterval,
  const std::uint32_t source,
  const std::uint16_t port)
{
  return {std::move(iface), std::move(ipInterface), std::move(observer), std::move(timer),
    std::move(log), discoveryInterval, source, port};
}

} // namespace discovery
} // namespace lanlight
