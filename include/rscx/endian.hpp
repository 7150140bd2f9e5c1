#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace rscx {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return (static_cast<uint64_t>(byteswap(static_cast<uint32_t>(value))) << 32) |
         byteswap(static_cast<uint32_t>(value >> 32));
}

} // namespace detail

inline constexpr bool is_little_endian() noexcept {
  return std::endian::native == std::endian::little;
}

// Convert between little-endian and host byte order (the conversion is symmetric)
template <typename T> inline constexpr T fromLittleEndian(T value) noexcept {
  if constexpr (is_little_endian()) {
    return value;
  }
  return detail::byteswap(value);
}

template <typename T> inline constexpr T toLittleEndian(T value) noexcept {
  return fromLittleEndian(value);
}

// Decode a little-endian integer from raw bytes
template <typename T> inline T loadLittleEndian(const uint8_t *bytes) noexcept {
  T value;
  std::memcpy(&value, bytes, sizeof(T));
  return fromLittleEndian(value);
}

// Encode a little-endian integer into raw bytes
template <typename T> inline void storeLittleEndian(uint8_t *bytes, T value) noexcept {
  value = toLittleEndian(value);
  std::memcpy(bytes, &value, sizeof(T));
}

} // namespace rscx
