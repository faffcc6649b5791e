// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/asio/AsioWrapper.hpp>
#include <lanlight/discovery/UdpInterface.hpp>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace lanlight
{
namespace discovery
{
namespace test
{

// Transport double. Records what is sent, lets the test inject
// received datagrams and optionally forwards sends to a simulated
// network.
struct Interface
{
  using SendHook =
    std::function<void(const std::vector<uint8_t>&, const asio::ip::udp::endpoint&)>;

  Interface() = default;

  explicit Interface(asio::ip::udp::endpoint localEndpoint)
    : mLocalEndpoint(std::move(localEndpoint))
  {
  }

  friend std::size_t send(
    Interface& iface,
    const uint8_t* const bytes,
    const size_t numBytes,
    const asio::ip::udp::endpoint& to)
  {
    if (iface.failSends)
    {
      throw UdpSendException{"no buffer space available", iface.mLocalEndpoint.address()};
    }

    std::vector<uint8_t> datagram{bytes, bytes + numBytes};
    iface.sentMessages.push_back(std::make_pair(datagram, to));
    if (iface.onSend)
    {
      iface.onSend(datagram, to);
    }
    return numBytes;
  }

  template <typename Callback>
  friend void receive(Interface& iface, Callback callback)
  {
    iface.mCallback = [callback](const asio::ip::udp::endpoint& from,
                        const std::vector<uint8_t>& buffer) {
      callback(from, begin(buffer), end(buffer));
    };
  }

  template <typename It>
  void incomingMessage(const asio::ip::udp::endpoint& from, It messageBegin, It messageEnd)
  {
    // Like the socket, empty datagrams never reach the receiver
    if (mCallback && messageBegin != messageEnd)
    {
      // The receiver re-arms from within the callback
      const auto callback = mCallback;
      const std::vector<uint8_t> buffer{messageBegin, messageEnd};
      callback(from, buffer);
    }
  }

  void incomingMessage(const asio::ip::udp::endpoint& from, const std::vector<uint8_t>& bytes)
  {
    incomingMessage(from, bytes.begin(), bytes.end());
  }

  friend asio::ip::udp::endpoint endpoint(Interface& iface)
  {
    return iface.mLocalEndpoint;
  }

  using SentMessage = std::pair<std::vector<uint8_t>, asio::ip::udp::endpoint>;
  std::vector<SentMessage> sentMessages;
  SendHook onSend;
  bool failSends = false;

private:
  using ReceiveCallback =
    std::function<void(const asio::ip::udp::endpoint&, const std::vector<uint8_t>&)>;
  ReceiveCallback mCallback;
  asio::ip::udp::endpoint mLocalEndpoint;
};

} // namespace test
} // namespace discovery
} // namespace lanlight
