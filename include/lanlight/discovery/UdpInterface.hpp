// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/asio/AsioService.hpp>
#include <lanlight/discovery/Interfaces.hpp>
#include <lanlight/discovery/Socket.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace lanlight
{
namespace discovery
{

// The largest message of the protocol is StateExtendedColorZones
const std::size_t kMaxMessageSize = 1024;

// Thrown when a datagram can't be handed to the network stack of an
// interface. This is local resource exhaustion, not packet loss.
struct UdpSendException : std::runtime_error
{
  UdpSendException(const std::runtime_error& e, asio::ip::address ifAddr)
    : std::runtime_error(e.what())
    , interfaceAddr(std::move(ifAddr))
  {
  }

  UdpSendException(const std::string& what, asio::ip::address ifAddr)
    : std::runtime_error(what)
    , interfaceAddr(std::move(ifAddr))
  {
  }

  asio::ip::address interfaceAddr;
};

// Transport bound to one local interface. Copies share the socket.
template <std::size_t MaxPacketSize>
struct UdpInterface
{
  UdpInterface(util::AsioService& io, const IpInterface& iface)
    : mpSocket(std::make_shared<Socket<MaxPacketSize>>(io))
    , mInterface(iface)
  {
    configureBroadcastSocket(*mpSocket, iface.address);
  }

  // Best effort; throws UdpSendException on local failure
  friend std::size_t send(
    UdpInterface& iface,
    const uint8_t* const pData,
    const size_t numBytes,
    const asio::ip::udp::endpoint& to)
  {
    try
    {
      return send(iface.mpSocket, pData, numBytes, to);
    }
    catch (const std::runtime_error& err)
    {
      throw UdpSendException{err, iface.mInterface.address};
    }
  }

  // One-shot receive. The handler is invoked with (from, begin, end)
  // for the next datagram and must call receive again to get more.
  template <typename Handler>
  friend void receive(UdpInterface& iface, Handler handler)
  {
    receive(iface.mpSocket, std::move(handler));
  }

  friend asio::ip::udp::endpoint endpoint(UdpInterface& iface)
  {
    return iface.mpSocket->mImpl.local_endpoint();
  }

private:
  // Sockets are neither copyable nor movable and must be owned by a
  // shared_ptr for util::makeAsyncSafe
  std::shared_ptr<Socket<MaxPacketSize>> mpSocket;
  IpInterface mInterface;
};

// Creates the transport for an interface on the real network
struct UdpInterfaceFactory
{
  UdpInterface<kMaxMessageSize> operator()(util::AsioService& io, const IpInterface& iface)
  {
    return {io, iface};
  }
};

} // namespace discovery
} // namespace lanlight
