#pragma once

/** \file record_codec.hpp
 *  \brief Length-delimited record framing with masked CRC32C over length and payload.
 *
 * Wire layout (little-endian on all platforms):
 *   [length u64][masked_crc32c(length) u32][payload: length bytes][masked_crc32c(payload) u32]
 *
 * Thread-safety: RecordCodec reuses header/footer scratch buffers and must not be shared
 * between concurrent callers; the free functions are stateless and thread-safe.
 * Errors: returned via std::expected with tfrecord::core::error.
 */

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

#include "tfrecord/channel.hpp"
#include "tfrecord/error.hpp"

namespace tfrecord {

constexpr std::size_t RECORD_HEADER_SIZE = 8 + 4; // length + masked crc of length
constexpr std::size_t RECORD_FOOTER_SIZE = 4;     // masked crc of payload

/** \brief On-wire size of a record holding payload_size bytes. */
constexpr auto record_length(std::uint64_t payload_size) noexcept -> std::uint64_t {
  return RECORD_HEADER_SIZE + payload_size + RECORD_FOOTER_SIZE;
}

/** \brief Masked CRC32C of the 8-byte little-endian encoding of length. */
auto masked_length_crc(std::uint64_t length) noexcept -> std::uint32_t;

struct DecodeOptions {
  std::uint64_t max_record_bytes{0}; /**< 0 = unlimited; larger lengths fail with resource_exhausted */
  bool verify_data_crc{true};        /**< footer is always read; comparison can be disabled */

  /** Defaults overridden by TFRECORD_MAX_RECORD_BYTES when set to a valid decimal. */
  static auto from_env() -> DecodeOptions;
};

/** \brief One frame parsed out of a contiguous buffer. The payload is not owned. */
struct RecordView {
  std::uint64_t length;                  // payload length
  std::uint32_t length_crc;              // masked, as stored
  std::span<const std::uint8_t> payload; // does not own memory
  std::uint32_t data_crc;                // masked, as stored
  std::size_t frame_size;                // header + payload + footer
};

/** \brief Encode one record into a contiguous byte vector. */
auto encode_record(std::span<const std::uint8_t> payload) -> std::vector<std::uint8_t>;

/** \brief Decode the frame at the front of bytes (trailing bytes are ignored).
 *
 *  Empty input yields io_eof; 1..11 bytes yields malformed_stream; a frame extending past
 *  the end yields truncated_record; checksum failures yield checksum_mismatch.
 */
auto decode_record(std::span<const std::uint8_t> bytes, const DecodeOptions& opts = {})
    -> std::expected<RecordView, core::error>;

class RecordCodec {
public:
  RecordCodec() = default;
  explicit RecordCodec(DecodeOptions opts) : opts_(opts) {}

  static constexpr auto record_length(std::span<const std::uint8_t> payload) noexcept -> std::uint64_t {
    return tfrecord::record_length(payload.size());
  }

  /** \brief Read one record.
   *
   *  Returns std::nullopt when the channel ends before any header byte (clean end-of-stream).
   *  Never returns a partially read or unverified record.
   */
  auto decode(ReadableChannel& in) -> std::expected<std::optional<std::vector<std::uint8_t>>, core::error>;

  /** \brief Write one record. On failure the channel may hold a partial frame. */
  auto encode(WritableChannel& out, std::span<const std::uint8_t> payload) -> std::expected<void, core::error>;

  const DecodeOptions& options() const noexcept { return opts_; }

private:
  DecodeOptions opts_{};
  std::array<std::uint8_t, RECORD_HEADER_SIZE> header_{};
  std::array<std::uint8_t, RECORD_FOOTER_SIZE> footer_{};
};

} // namespace tfrecord
