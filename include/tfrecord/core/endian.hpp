#pragma once

/** \file endian.hpp
 *  \brief Little-endian load/store helpers independent of host byte order.
 */

#include <cstdint>

namespace tfrecord::core {

constexpr auto load_le32(const std::uint8_t* p) noexcept -> std::uint32_t {
  return static_cast<std::uint32_t>(p[0])
       | (static_cast<std::uint32_t>(p[1]) << 8)
       | (static_cast<std::uint32_t>(p[2]) << 16)
       | (static_cast<std::uint32_t>(p[3]) << 24);
}

constexpr auto load_le64(const std::uint8_t* p) noexcept -> std::uint64_t {
  return static_cast<std::uint64_t>(load_le32(p))
       | (static_cast<std::uint64_t>(load_le32(p + 4)) << 32);
}

constexpr void store_le32(std::uint8_t* p, std::uint32_t v) noexcept {
  p[0] = static_cast<std::uint8_t>(v);
  p[1] = static_cast<std::uint8_t>(v >> 8);
  p[2] = static_cast<std::uint8_t>(v >> 16);
  p[3] = static_cast<std::uint8_t>(v >> 24);
}

constexpr void store_le64(std::uint8_t* p, std::uint64_t v) noexcept {
  store_le32(p, static_cast<std::uint32_t>(v));
  store_le32(p + 4, static_cast<std::uint32_t>(v >> 32));
}

} // namespace tfrecord::core
