// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/lan/ByteStream.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace lanlight
{
namespace lan
{

// Hardware identifier of a device, the MAC address of its wifi module.
// On the wire it occupies the eight byte target field, padded with
// zeros.
struct Serial : std::array<std::uint8_t, 6>
{
  // All zeros, the broadcast target
  Serial()
    : std::array<std::uint8_t, 6>{}
  {
  }

  explicit Serial(const std::array<std::uint8_t, 6>& bytes)
    : std::array<std::uint8_t, 6>(bytes)
  {
  }

  // Parses "d073d5001122" or "d0:73:d5:00:11:22"
  static Serial fromString(const std::string& str)
  {
    std::string digits;
    for (const auto c : str)
    {
      if (c != ':')
      {
        digits.push_back(c);
      }
    }
    if (digits.size() != 12
        || !std::all_of(digits.begin(), digits.end(), [](const char c) {
             return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           }))
    {
      throw std::invalid_argument("invalid serial: " + str);
    }

    Serial serial;
    for (std::size_t i = 0; i < serial.size(); ++i)
    {
      serial[i] = static_cast<std::uint8_t>(std::stoul(digits.substr(2 * i, 2), nullptr, 16));
    }
    return serial;
  }

  bool isZero() const
  {
    return std::all_of(begin(), end(), [](const std::uint8_t b) { return b == 0; });
  }

  friend std::ostream& operator<<(std::ostream& stream, const Serial& serial)
  {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < serial.size(); ++i)
    {
      ss << (i == 0 ? "" : ":") << std::setw(2) << static_cast<unsigned>(serial[i]);
    }
    return stream << ss.str();
  }

  friend std::uint32_t sizeInByteStream(const Serial&)
  {
    return 8;
  }

  template <typename It>
  friend It toByteStream(const Serial& serial, It out)
  {
    out = std::copy(serial.begin(), serial.end(), std::move(out));
    return toByteStream(std::array<std::uint8_t, 2>{}, std::move(out));
  }

  template <typename It>
  static std::pair<Serial, It> fromByteStream(It begin, It end)
  {
    auto result = Deserialize<std::array<std::uint8_t, 8>>::fromByteStream(
      std::move(begin), std::move(end));
    Serial serial;
    std::copy(result.first.begin(), result.first.begin() + 6, serial.begin());
    return std::make_pair(serial, std::move(result.second));
  }
};

} // namespace lan
} // namespace lanlight
