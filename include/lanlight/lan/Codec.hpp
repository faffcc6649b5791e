// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <lanlight/lan/ByteStream.hpp>
#include <lanlight/lan/Header.hpp>
#include <lanlight/lan/Messages.hpp>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace lanlight
{
namespace lan
{

// The closed set of messages this codebase speaks
using Message = std::variant<
  GetService,
  StateService,
  GetHostFirmware,
  StateHostFirmware,
  GetWifiInfo,
  StateWifiInfo,
  GetPower,
  SetPower,
  StatePower,
  GetLabel,
  SetLabel,
  StateLabel,
  GetVersion,
  StateVersion,
  Acknowledgement,
  GetGroup,
  StateGroup,
  EchoRequest,
  EchoResponse,
  GetColor,
  SetColor,
  LightState,
  GetLightPower,
  SetLightPower,
  StateLightPower,
  GetInfrared,
  StateInfrared,
  SetInfrared,
  GetHevCycle,
  SetHevCycle,
  StateHevCycle,
  SetColorZones,
  GetColorZones,
  StateZone,
  StateMultiZone,
  GetMultiZoneEffect,
  StateMultiZoneEffect,
  SetExtendedColorZones,
  GetExtendedColorZones,
  StateExtendedColorZones>;

struct Packet
{
  Header header;
  Message message;
};

struct DecodeError
{
  std::string reason;
};

using DecodeResult = std::variant<Packet, DecodeError>;

namespace detail
{

template <typename Payload>
std::uint32_t payloadSize(const Payload& payload)
{
  return std::apply(
    [](const auto&... field) { return (std::uint32_t{0} + ... + sizeInByteStream(field)); },
    payload.fields());
}

template <typename Payload, typename It>
It writePayload(const Payload& payload, It out)
{
  std::apply(
    [&out](const auto&... field) { ((out = toByteStream(field, std::move(out))), ...); },
    payload.fields());
  return out;
}

template <typename Payload, typename It>
std::pair<Payload, It> readPayload(It begin, const It end)
{
  Payload payload;
  std::apply(
    [&begin, &end](auto&... field) {
      ((std::tie(field, begin) =
           Deserialize<std::decay_t<decltype(field)>>::fromByteStream(begin, end)),
        ...);
    },
    payload.fields());
  return std::make_pair(std::move(payload), std::move(begin));
}

template <typename T, typename = void>
struct ResponseOf
{
  static constexpr std::uint16_t kType = 0;
};

template <typename T>
struct ResponseOf<T, std::void_t<typename T::Response>>
{
  static constexpr std::uint16_t kType = T::Response::kType;
};

template <typename Variant>
struct MessageParser;

template <typename... Messages>
struct MessageParser<std::variant<Messages...>>
{
  template <typename It>
  static bool parse(const std::uint16_t type, It begin, It end, Message& out)
  {
    return (parseAs<Messages>(type, begin, end, out) || ...);
  }

  template <typename M, typename It>
  static bool parseAs(const std::uint16_t type, It begin, It end, Message& out)
  {
    if (type != M::kType)
    {
      return false;
    }
    out = readPayload<M>(std::move(begin), std::move(end)).first;
    return true;
  }
};

} // namespace detail

inline std::uint16_t messageType(const Message& message)
{
  return std::visit(
    [](const auto& m) { return std::decay_t<decltype(m)>::kType; }, message);
}

inline const char* messageName(const Message& message)
{
  return std::visit(
    [](const auto& m) { return std::decay_t<decltype(m)>::kName; }, message);
}

// Type code of the response that completes the given request, or 0
// if the message is not a request.
inline std::uint16_t responseType(const Message& message)
{
  return std::visit(
    [](const auto& m) { return detail::ResponseOf<std::decay_t<decltype(m)>>::kType; },
    message);
}

inline bool isRequest(const Message& message)
{
  return responseType(message) != 0;
}

// Commands change device state and are acknowledged rather than
// answered with a state message.
inline bool requiresAck(const Message& message)
{
  return responseType(message) == Acknowledgement::kType;
}

inline bool acceptsResponse(const Message& request, const std::uint16_t type)
{
  if (std::holds_alternative<GetColorZones>(request) && type == StateZone::kType)
  {
    return true;
  }
  const auto expected = responseType(request);
  return expected != 0 && expected == type;
}

inline std::ostream& operator<<(std::ostream& stream, const Message& message)
{
  return stream << messageName(message) << "(" << messageType(message) << ")";
}

// Serializes header and message. The size and type fields of the
// header are derived from the message.
template <typename It>
It encode(Header header, const Message& message, It out)
{
  return std::visit(
    [&header, &out](const auto& m) {
      header.type = m.kType;
      header.size = static_cast<std::uint16_t>(kHeaderSize + detail::payloadSize(m));
      return detail::writePayload(m, toByteStream(header, std::move(out)));
    },
    message);
}

inline std::vector<std::uint8_t> encode(const Header& header, const Message& message)
{
  std::vector<std::uint8_t> bytes;
  encode(header, message, std::back_inserter(bytes));
  return bytes;
}

// Never throws. Malformed input yields a DecodeError.
template <typename It>
DecodeResult decode(It begin, It end)
{
  using ItDiff = typename std::iterator_traits<It>::difference_type;
  try
  {
    auto result = Deserialize<Header>::fromByteStream(begin, end);
    const auto& header = result.first;
    if (std::distance(begin, end) < static_cast<ItDiff>(header.size))
    {
      return DecodeError{"truncated message, declared size " + std::to_string(header.size)};
    }

    Message message;
    const auto payloadEnd = begin + static_cast<ItDiff>(header.size);
    if (!detail::MessageParser<Message>::parse(header.type, result.second, payloadEnd, message))
    {
      return DecodeError{"unknown message type " + std::to_string(header.type)};
    }
    return Packet{header, std::move(message)};
  }
  catch (const std::runtime_error& e)
  {
    return DecodeError{e.what()};
  }
}

inline DecodeResult decode(const std::vector<std::uint8_t>& bytes)
{
  return decode(bytes.begin(), bytes.end());
}

} // namespace lan
} // namespace lanlight
