// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace parley {
namespace util {

// Network byte order helpers. The wire protocol is big-endian throughout.

inline uint16_t ByteSwap16(uint16_t x) {
  return static_cast<uint16_t>((x >> 8) | (x << 8));
}

inline uint32_t ByteSwap32(uint32_t x) {
  return ((x >> 24) & 0x000000FF) | ((x >> 8) & 0x0000FF00) |
         ((x << 8) & 0x00FF0000) | ((x << 24) & 0xFF000000);
}

inline uint64_t ByteSwap64(uint64_t x) {
  return (static_cast<uint64_t>(ByteSwap32(static_cast<uint32_t>(x))) << 32) |
         ByteSwap32(static_cast<uint32_t>(x >> 32));
}

inline uint16_t ReadBE16(const uint8_t *ptr) {
  uint16_t result;
  std::memcpy(&result, ptr, sizeof(result));
  if constexpr (std::endian::native == std::endian::little) {
    result = ByteSwap16(result);
  }
  return result;
}

inline uint32_t ReadBE32(const uint8_t *ptr) {
  uint32_t result;
  std::memcpy(&result, ptr, sizeof(result));
  if constexpr (std::endian::native == std::endian::little) {
    result = ByteSwap32(result);
  }
  return result;
}

inline uint64_t ReadBE64(const uint8_t *ptr) {
  uint64_t result;
  std::memcpy(&result, ptr, sizeof(result));
  if constexpr (std::endian::native == std::endian::little) {
    result = ByteSwap64(result);
  }
  return result;
}

inline void WriteBE16(uint8_t *ptr, uint16_t value) {
  if constexpr (std::endian::native == std::endian::little) {
    value = ByteSwap16(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

inline void WriteBE32(uint8_t *ptr, uint32_t value) {
  if constexpr (std::endian::native == std::endian::little) {
    value = ByteSwap32(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

inline void WriteBE64(uint8_t *ptr, uint64_t value) {
  if constexpr (std::endian::native == std::endian::little) {
    value = ByteSwap64(value);
  }
  std::memcpy(ptr, &value, sizeof(value));
}

} // namespace util
} // namespace parley
