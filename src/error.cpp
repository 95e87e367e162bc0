#include "tfrecord/error.hpp"

#include <sstream>

namespace tfrecord::core {

auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::checksum_mismatch: return "checksum_mismatch";
    case error_code::malformed_stream: return "malformed_stream";
    case error_code::truncated_record: return "truncated_record";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::resource_exhausted: return "resource_exhausted";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "unknown";
}

auto describe(const error& e) -> std::string {
  std::ostringstream oss;
  oss << to_string(e.code) << ": " << e.message;
  if (!e.component.empty()) oss << " [" << e.component << "]";
  switch (e.code) {
    case error_code::checksum_mismatch:
      oss << " (" << (e.field.empty() ? "crc" : e.field) << " stored=0x" << std::hex << e.stored
          << " computed=0x" << e.computed << std::dec << ")";
      break;
    case error_code::truncated_record:
      oss << " (expected " << e.stored << " bytes, read " << e.computed << ")";
      break;
    default:
      break;
  }
  return oss.str();
}

} // namespace tfrecord::core
