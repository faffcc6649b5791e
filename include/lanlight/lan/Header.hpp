// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/lan/ByteStream.hpp>
#include <lanlight/lan/Serial.hpp>
#include <cstdint>
#include <stdexcept>

namespace lanlight
{
namespace lan
{

const std::uint16_t kProtocol = 1024;
const std::uint16_t kHeaderSize = 36;
const std::uint16_t kDefaultPort = 56700;

// The 36 byte header in front of every message: frame, frame address
// and protocol header.
//
//  frame:          size:16, protocol:12 addressable:1 tagged:1 origin:2, source:32
//  frame address:  target:64, reserved:48, res_required:1 ack_required:1 reserved:6,
//                  sequence:8
//  protocol:       reserved:64, type:16, reserved:16
struct Header
{
  // Total size of the message including this header
  std::uint16_t size = kHeaderSize;
  // Set when the target is all zeros, i.e. a broadcast
  bool tagged = false;
  // Client identifier, echoed back by devices in their responses
  std::uint32_t source = 0;
  Serial target{};
  bool resRequired = false;
  bool ackRequired = false;
  // Correlates responses with the request they answer
  std::uint8_t sequence = 0;
  std::uint16_t type = 0;

  friend std::uint32_t sizeInByteStream(const Header&)
  {
    return kHeaderSize;
  }

  template <typename It>
  friend It toByteStream(const Header& header, It out)
  {
    const auto protocolBits = static_cast<std::uint16_t>(
      kProtocol | (1u << 12) | (header.tagged ? (1u << 13) : 0u));
    const auto flags = static_cast<std::uint8_t>(
      (header.resRequired ? 0x01 : 0x00) | (header.ackRequired ? 0x02 : 0x00));

    out = toByteStream(header.size, std::move(out));
    out = toByteStream(protocolBits, std::move(out));
    out = toByteStream(header.source, std::move(out));
    out = toByteStream(header.target, std::move(out));
    out = toByteStream(std::array<std::uint8_t, 6>{}, std::move(out));
    out = toByteStream(flags, std::move(out));
    out = toByteStream(header.sequence, std::move(out));
    out = toByteStream(std::uint64_t{0}, std::move(out));
    out = toByteStream(header.type, std::move(out));
    return toByteStream(std::uint16_t{0}, std::move(out));
  }

  template <typename It>
  static std::pair<Header, It> fromByteStream(It begin, It end)
  {
    Header header;
    std::uint16_t protocolBits = 0;
    std::uint8_t flags = 0;
    std::tie(header.size, begin) = Deserialize<std::uint16_t>::fromByteStream(begin, end);
    std::tie(protocolBits, begin) = Deserialize<std::uint16_t>::fromByteStream(begin, end);
    std::tie(header.source, begin) = Deserialize<std::uint32_t>::fromByteStream(begin, end);
    std::tie(header.target, begin) = Deserialize<Serial>::fromByteStream(begin, end);
    begin = Deserialize<std::array<std::uint8_t, 6>>::fromByteStream(begin, end).second;
    std::tie(flags, begin) = Deserialize<std::uint8_t>::fromByteStream(begin, end);
    std::tie(header.sequence, begin) = Deserialize<std::uint8_t>::fromByteStream(begin, end);
    begin = Deserialize<std::uint64_t>::fromByteStream(begin, end).second;
    std::tie(header.type, begin) = Deserialize<std::uint16_t>::fromByteStream(begin, end);
    begin = Deserialize<std::uint16_t>::fromByteStream(begin, end).second;

    if ((protocolBits & 0x0fff) != kProtocol)
    {
      throw std::runtime_error("unsupported protocol " + std::to_string(protocolBits & 0x0fff));
    }
    if (header.size < kHeaderSize)
    {
      throw std::range_error("declared size smaller than header");
    }

    header.tagged = (protocolBits & (1u << 13)) != 0;
    header.resRequired = (flags & 0x01) != 0;
    header.ackRequired = (flags & 0x02) != 0;
    return std::make_pair(header, std::move(begin));
  }
};

} // namespace lan
} // namespace lanlight
