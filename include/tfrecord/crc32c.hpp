#pragma once

/** \file crc32c.hpp
 *  \brief CRC32C (Castagnoli) with runtime backend dispatch, plus the record checksum mask.
 *
 * Backends: "scalar" (table-driven, always available) and "sse42" (x86-64 CRC32
 * instruction, used only when the CPU reports SSE4.2). The process-wide backend is
 * chosen once, honoring TFRECORD_CRC32C_BACKEND (scalar | sse42 | auto).
 * Thread-safety: all functions are pure; backend selection is initialized once.
 */

#include <cstdint>
#include <span>
#include <string_view>

namespace tfrecord {

/// Added to the rotated CRC by mask_crc().
constexpr std::uint32_t kMaskDelta = 0xa282ead8u;

struct Crc32cOps {
  std::string_view name;
  /// Continues a finalized CRC over more bytes; extend(0, b) is the CRC of b.
  std::uint32_t (*extend)(std::uint32_t crc, std::span<const std::uint8_t> bytes) noexcept;
};

// Returns a stable reference valid for the process lifetime. Unknown or unsupported
// names fall back to "scalar".
const Crc32cOps& select_crc32c_backend(std::string_view name) noexcept;

/** \brief Backend used by crc32c()/crc32c_extend(): env override first, then CPU detection. */
const Crc32cOps& active_crc32c_backend() noexcept;

inline std::string_view crc32c_backend_name() noexcept { return active_crc32c_backend().name; }

// CRC32C (Castagnoli) over the given bytes
auto crc32c(std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t;

// crc32c_extend(crc32c(a), b) == crc32c(a || b)
auto crc32c_extend(std::uint32_t crc, std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t;

/** \brief Rotate right by 15 and add kMaskDelta (mod 2^32). */
constexpr auto mask_crc(std::uint32_t crc) noexcept -> std::uint32_t {
  return ((crc >> 15) | (crc << 17)) + kMaskDelta;
}

/** \brief Inverse of mask_crc(). */
constexpr auto unmask_crc(std::uint32_t masked) noexcept -> std::uint32_t {
  const std::uint32_t rot = masked - kMaskDelta;
  return (rot >> 17) | (rot << 15);
}

inline auto masked_crc32c(std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t {
  return mask_crc(crc32c(bytes));
}

} // namespace tfrecord
