#include "tfrecord/record_codec.hpp"

#include "tfrecord/core/endian.hpp"
#include "tfrecord/core/platform_utils.hpp"
#include "tfrecord/crc32c.hpp"

#include <cstring>
#include <limits>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

namespace tfrecord {

namespace {

using core::error;
using core::error_code;

constexpr const char* kComponent = "record.codec";

auto checksum_error(const char* field, std::uint32_t stored, std::uint32_t computed) -> error {
  const std::string f{field};
  return error{error_code::checksum_mismatch, "mismatch of " + f + " mask when reading a record", kComponent,
               f, stored, computed};
}

auto truncated_error(std::string message, std::uint64_t expected, std::uint64_t got) -> error {
  return error{error_code::truncated_record, std::move(message), kComponent, {}, expected, got};
}

// Validates the 12 header bytes and returns the payload length.
auto parse_header(const std::uint8_t* hdr, const DecodeOptions& opts) -> std::expected<std::uint64_t, error> {
  const std::uint64_t length = core::load_le64(hdr);
  const std::uint32_t stored = core::load_le32(hdr + 8);
  const std::uint32_t computed = mask_crc(crc32c({hdr, 8}));
  if (stored != computed) {
    return std::unexpected(checksum_error("length", stored, computed));
  }
  if (opts.max_record_bytes != 0 && length > opts.max_record_bytes) {
    return std::unexpected(error{error_code::resource_exhausted,
                                 "record length " + std::to_string(length) + " exceeds limit "
                                     + std::to_string(opts.max_record_bytes),
                                 kComponent});
  }
  if (length > std::numeric_limits<std::size_t>::max() - RECORD_HEADER_SIZE - RECORD_FOOTER_SIZE) {
    return std::unexpected(error{error_code::resource_exhausted, "record length not addressable", kComponent});
  }
  return length;
}

auto verify_data(std::span<const std::uint8_t> payload, std::uint32_t stored, const DecodeOptions& opts)
    -> std::expected<void, error> {
  if (!opts.verify_data_crc) return {};
  const std::uint32_t computed = masked_crc32c(payload);
  if (stored != computed) {
    return std::unexpected(checksum_error("data", stored, computed));
  }
  return {};
}

} // namespace

auto masked_length_crc(std::uint64_t length) noexcept -> std::uint32_t {
  std::array<std::uint8_t, 8> le{};
  core::store_le64(le.data(), length);
  return masked_crc32c(le);
}

auto DecodeOptions::from_env() -> DecodeOptions {
  DecodeOptions o{};
  if (auto v = core::env_u64("TFRECORD_MAX_RECORD_BYTES")) o.max_record_bytes = *v;
  return o;
}

auto encode_record(std::span<const std::uint8_t> payload) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out(static_cast<std::size_t>(record_length(payload.size())));
  std::uint8_t* p = out.data();
  core::store_le64(p, payload.size());
  core::store_le32(p + 8, masked_length_crc(payload.size()));
  p += RECORD_HEADER_SIZE;
  if (!payload.empty()) { std::memcpy(p, payload.data(), payload.size()); p += payload.size(); }
  core::store_le32(p, masked_crc32c(payload));
  return out;
}

auto decode_record(std::span<const std::uint8_t> bytes, const DecodeOptions& opts)
    -> std::expected<RecordView, core::error> {
  if (bytes.empty()) {
    return std::unexpected(error{error_code::io_eof, "no record", kComponent});
  }
  if (bytes.size() < RECORD_HEADER_SIZE) {
    return std::unexpected(error{error_code::malformed_stream, "fewer than 12 bytes for header", kComponent,
                                 {}, RECORD_HEADER_SIZE, bytes.size()});
  }
  auto length = parse_header(bytes.data(), opts);
  if (!length) return std::unexpected(length.error());

  const std::size_t n = static_cast<std::size_t>(*length);
  const std::size_t available = bytes.size() - RECORD_HEADER_SIZE;
  if (available < n) {
    return std::unexpected(truncated_error("EOF while reading record payload", n, available));
  }
  if (available - n < RECORD_FOOTER_SIZE) {
    return std::unexpected(truncated_error("EOF while reading record footer", RECORD_FOOTER_SIZE, available - n));
  }
  const auto payload = bytes.subspan(RECORD_HEADER_SIZE, n);
  const std::uint32_t data_crc = core::load_le32(bytes.data() + RECORD_HEADER_SIZE + n);
  if (auto ok = verify_data(payload, data_crc, opts); !ok) return std::unexpected(ok.error());

  return RecordView{*length, core::load_le32(bytes.data() + 8), payload, data_crc,
                    static_cast<std::size_t>(record_length(n))};
}

auto RecordCodec::decode(ReadableChannel& in) -> std::expected<std::optional<std::vector<std::uint8_t>>, core::error> {
  auto got = read_fully(in, header_);
  if (!got) return std::unexpected(got.error());
  if (*got == 0) return std::optional<std::vector<std::uint8_t>>{};
  if (*got < RECORD_HEADER_SIZE) {
    return std::unexpected(error{error_code::malformed_stream, "fewer than 12 bytes for header", kComponent,
                                 {}, RECORD_HEADER_SIZE, *got});
  }

  auto length = parse_header(header_.data(), opts_);
  if (!length) return std::unexpected(length.error());

  std::vector<std::uint8_t> data;
  try {
    data.resize(static_cast<std::size_t>(*length));
  } catch (const std::bad_alloc&) {
    return std::unexpected(error{error_code::resource_exhausted, "OOM allocating record of length "
                                     + std::to_string(*length), kComponent});
  } catch (const std::length_error&) {
    return std::unexpected(error{error_code::resource_exhausted, "record length exceeds vector capacity", kComponent});
  }

  auto body = read_fully(in, data);
  if (!body) return std::unexpected(body.error());
  if (*body < data.size()) {
    return std::unexpected(truncated_error("EOF while reading record of length " + std::to_string(*length)
                                               + ". Input might be truncated",
                                           *length, *body));
  }

  auto tail = read_fully(in, footer_);
  if (!tail) return std::unexpected(tail.error());
  if (*tail < RECORD_FOOTER_SIZE) {
    return std::unexpected(truncated_error("EOF while reading record footer", RECORD_FOOTER_SIZE, *tail));
  }
  if (auto ok = verify_data(data, core::load_le32(footer_.data()), opts_); !ok) {
    return std::unexpected(ok.error());
  }
  return std::optional<std::vector<std::uint8_t>>{std::move(data)};
}

auto RecordCodec::encode(WritableChannel& out, std::span<const std::uint8_t> payload)
    -> std::expected<void, core::error> {
  const std::uint32_t length_crc = masked_length_crc(payload.size());
  const std::uint32_t data_crc = masked_crc32c(payload);

  core::store_le64(header_.data(), payload.size());
  core::store_le32(header_.data() + 8, length_crc);
  if (auto w = write_fully(out, header_); !w) return w;

  if (auto w = write_fully(out, payload); !w) return w;

  core::store_le32(footer_.data(), data_crc);
  return write_fully(out, footer_);
}

} // namespace tfrecord
