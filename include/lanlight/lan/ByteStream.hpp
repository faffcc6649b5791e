// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace lanlight
{
namespace lan
{

// Concept: ByteStreamSerializable
//
// A type that can be encoded to and decoded from a stream of bytes in
// the little-endian order used on the wire. The following type is for
// documentation purposes only.

struct ByteStreamSerializable
{
  friend std::uint32_t sizeInByteStream(const ByteStreamSerializable&);

  // The byte stream pointed to by 'out' must have sufficient space to
  // hold this object, as defined by sizeInByteStream.
  template <typename It>
  friend It toByteStream(const ByteStreamSerializable&, It out);
};

// Deserialization aspect of the concept. The default implementation
// defers to a class static method on T. Types that can't provide such
// a method specialize this template.
template <typename T>
struct Deserialize
{
  // Throws std::range_error if the byte range is too short. Returns
  // the parsed value and an iterator to the next byte to parse.
  template <typename It>
  static std::pair<T, It> fromByteStream(It begin, It end)
  {
    return T::fromByteStream(std::move(begin), std::move(end));
  }
};

// Default size implementation. Works for primitive types.
template <typename T>
std::uint32_t sizeInByteStream(T)
{
  return sizeof(T);
}

namespace detail
{

template <typename T, typename It>
It copyLittleEndian(const T value, It out)
{
  for (std::size_t i = 0; i < sizeof(T); ++i)
  {
    *out++ = static_cast<std::uint8_t>((value >> (8 * i)) & 0xff);
  }
  return out;
}

template <typename T, typename It>
std::pair<T, It> readLittleEndian(It begin, const It end)
{
  using ItDiff = typename std::iterator_traits<It>::difference_type;
  if (std::distance(begin, end) < static_cast<ItDiff>(sizeof(T)))
  {
    throw std::range_error("Parsing type from byte stream failed");
  }

  T value = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i)
  {
    value = static_cast<T>(value | (static_cast<T>(static_cast<std::uint8_t>(*begin)) << (8 * i)));
    ++begin;
  }
  return std::make_pair(value, begin);
}

} // namespace detail

// uint8_t
template <typename It>
It toByteStream(const std::uint8_t byte, It out)
{
  *out++ = byte;
  return out;
}

template <>
struct Deserialize<std::uint8_t>
{
  template <typename It>
  static std::pair<std::uint8_t, It> fromByteStream(It begin, It end)
  {
    return detail::readLittleEndian<std::uint8_t>(std::move(begin), std::move(end));
  }
};

// uint16_t
template <typename It>
It toByteStream(const std::uint16_t s, It out)
{
  return detail::copyLittleEndian(s, std::move(out));
}

template <>
struct Deserialize<std::uint16_t>
{
  template <typename It>
  static std::pair<std::uint16_t, It> fromByteStream(It begin, It end)
  {
    return detail::readLittleEndian<std::uint16_t>(std::move(begin), std::move(end));
  }
};

// int16_t in terms of uint16_t
template <typename It>
It toByteStream(const std::int16_t s, It out)
{
  return toByteStream(static_cast<std::uint16_t>(s), std::move(out));
}

template <>
struct Deserialize<std::int16_t>
{
  template <typename It>
  static std::pair<std::int16_t, It> fromByteStream(It begin, It end)
  {
    auto result = Deserialize<std::uint16_t>::fromByteStream(std::move(begin), std::move(end));
    return std::make_pair(static_cast<std::int16_t>(result.first), result.second);
  }
};

// uint32_t
template <typename It>
It toByteStream(const std::uint32_t l, It out)
{
  return detail::copyLittleEndian(l, std::move(out));
}

template <>
struct Deserialize<std::uint32_t>
{
  template <typename It>
  static std::pair<std::uint32_t, It> fromByteStream(It begin, It end)
  {
    return detail::readLittleEndian<std::uint32_t>(std::move(begin), std::move(end));
  }
};

// uint64_t
template <typename It>
It toByteStream(const std::uint64_t ll, It out)
{
  return detail::copyLittleEndian(ll, std::move(out));
}

template <>
struct Deserialize<std::uint64_t>
{
  template <typename It>
  static std::pair<std::uint64_t, It> fromByteStream(It begin, It end)
  {
    return detail::readLittleEndian<std::uint64_t>(std::move(begin), std::move(end));
  }
};

// IEEE 754 single precision, carried as its bit pattern
template <typename It>
It toByteStream(const float f, It out)
{
  std::uint32_t bits = 0;
  std::memcpy(&bits, &f, sizeof(bits));
  return toByteStream(bits, std::move(out));
}

template <>
struct Deserialize<float>
{
  template <typename It>
  static std::pair<float, It> fromByteStream(It begin, It end)
  {
    auto result = Deserialize<std::uint32_t>::fromByteStream(std::move(begin), std::move(end));
    float f = 0;
    std::memcpy(&f, &result.first, sizeof(f));
    return std::make_pair(f, result.second);
  }
};

// Fixed size arrays
template <typename T, std::size_t Size>
std::uint32_t sizeInByteStream(const std::array<T, Size>& arr)
{
  std::uint32_t totalSize = 0;
  for (const auto& val : arr)
  {
    totalSize += sizeInByteStream(val);
  }
  return totalSize;
}

template <typename T, std::size_t Size, typename It>
It toByteStream(const std::array<T, Size>& arr, It out)
{
  for (const auto& val : arr)
  {
    out = toByteStream(val, std::move(out));
  }
  return out;
}

template <typename T, std::size_t Size>
struct Deserialize<std::array<T, Size>>
{
  template <typename It>
  static std::pair<std::array<T, Size>, It> fromByteStream(It begin, It end)
  {
    std::array<T, Size> result{};
    for (auto& val : result)
    {
      std::tie(val, begin) = Deserialize<T>::fromByteStream(std::move(begin), end);
    }
    return std::make_pair(std::move(result), std::move(begin));
  }
};

} // namespace lan
} // namespace lanlight
