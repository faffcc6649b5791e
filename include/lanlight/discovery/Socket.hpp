// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/asio/AsioService.hpp>
#include <lanlight/asio/AsioWrapper.hpp>
#include <lanlight/util/SafeAsyncHandler.hpp>
#include <array>
#include <functional>
#include <memory>

namespace lanlight
{
namespace discovery
{

template <std::size_t MaxPacketSize>
struct Socket : std::enable_shared_from_this<Socket<MaxPacketSize>>
{
  Socket(util::AsioService& io)
    : mImpl(io.mContext, asio::ip::udp::v4())
  {
  }

  ~Socket()
  {
    // Ignore error codes in shutdown and close as the socket may
    // have already been forcibly closed
    asio::error_code ec;
    mImpl.shutdown(asio::ip::udp::socket::shutdown_both, ec);
    mImpl.close(ec);
  }

  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  // Throws asio::system_error when the datagram can't be handed to the
  // network stack
  friend std::size_t send(
    const std::shared_ptr<Socket>& socket,
    const uint8_t* const pData,
    const size_t numBytes,
    const asio::ip::udp::endpoint& to)
  {
    return socket->mImpl.send_to(asio::buffer(pData, numBytes), to);
  }

  template <typename Handler>
  friend void receive(const std::shared_ptr<Socket>& socket, Handler handler)
  {
    socket->mHandler = std::move(handler);
    socket->receiveNext();
  }

  // Empty datagrams and receive errors are not passed to the handler.
  // The receive is re-armed for them so that the stream of datagrams
  // only ends when the socket is closed.
  void operator()(const asio::error_code& error, const std::size_t numBytes)
  {
    if (error == asio::error::operation_aborted || !mImpl.is_open())
    {
      return;
    }

    if (!error && numBytes > 0 && numBytes <= MaxPacketSize)
    {
      // The handler usually re-arms the receive, which replaces mHandler
      const auto handler = mHandler;
      const auto bufBegin = std::begin(mReceiveBuffer);
      handler(mSenderEndpoint, bufBegin, bufBegin + static_cast<ptrdiff_t>(numBytes));
    }
    else
    {
      receiveNext();
    }
  }

  void receiveNext()
  {
    mImpl.async_receive_from(asio::buffer(mReceiveBuffer, MaxPacketSize), mSenderEndpoint,
      util::makeAsyncSafe(this->shared_from_this()));
  }

  asio::ip::udp::socket mImpl;
  asio::ip::udp::endpoint mSenderEndpoint;
  using Buffer = std::array<uint8_t, MaxPacketSize>;
  Buffer mReceiveBuffer;
  using ByteIt = typename Buffer::const_iterator;
  std::function<void(const asio::ip::udp::endpoint&, ByteIt, ByteIt)> mHandler;
};

// Configure a socket bound to the given interface address that can
// send subnet broadcasts and receive the unicast replies to them.
// Sends never block; a full send buffer surfaces as an error.
template <std::size_t MaxPacketSize>
void configureBroadcastSocket(Socket<MaxPacketSize>& socket, const asio::ip::address_v4& addr)
{
  socket.mImpl.set_option(asio::ip::udp::socket::reuse_address(true));
  socket.mImpl.set_option(asio::socket_base::broadcast(true));
  socket.mImpl.non_blocking(true);
  socket.mImpl.bind(asio::ip::udp::endpoint{addr, 0});
}

} // namespace discovery
} // namespace lanlight
