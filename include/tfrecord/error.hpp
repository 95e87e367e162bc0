#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 * - Record-level failures also carry the offending field and the stored and
 *   computed values (checksums, or expected and consumed byte counts).
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tfrecord::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  config_invalid = 2001,
  data_integrity = 3001,
  checksum_mismatch = 3002,
  malformed_stream = 3003,
  truncated_record = 3004,
  precondition_failed = 4001,
  resource_exhausted = 5001,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "record.codec" */
  std::string field{};                     /**< "length" or "data" for checksum failures */
  std::uint64_t stored{0};                 /**< value read from the stream / expected byte count */
  std::uint64_t computed{0};               /**< value recomputed / bytes actually read */
};

/** \brief Stable lower-case name of an error code ("checksum_mismatch", ...). */
auto to_string(error_code ec) noexcept -> std::string_view;

/** \brief One-line rendering: "<code>: <message> [component] (field stored=.. computed=..)". */
auto describe(const error& e) -> std::string;

} // namespace tfrecord::core
