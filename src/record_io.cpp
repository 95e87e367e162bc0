#include "tfrecord/record_io.hpp"

#include "tfrecord/core/platform_utils.hpp"

#include <iostream>
#include <string>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#elif defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace tfrecord {

namespace {

using core::error;
using core::error_code;

constexpr const char* kComponent = "record.io";

bool debug_enabled() {
  static const bool dbg = core::env_flag("TFRECORD_DEBUG");
  return dbg;
}

// OS-level sync of an already written file. Errors are propagated via std::expected.
auto fsync_file_path(const std::filesystem::path& p) -> std::expected<void, error> {
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed", kComponent});
  }
  int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return std::unexpected(error{error_code::io_failed, "fsync failed", kComponent});
  }
#elif defined(_WIN32)
  HANDLE h = ::CreateFileW(p.wstring().c_str(), GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                           nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed", kComponent});
  }
  BOOL ok = ::FlushFileBuffers(h);
  ::CloseHandle(h);
  if (!ok) {
    return std::unexpected(error{error_code::io_failed, "FlushFileBuffers failed", kComponent});
  }
#endif
  return {};
}

bool is_torn_tail(const error& e) {
  return e.code == error_code::truncated_record || e.code == error_code::malformed_stream;
}

} // namespace

auto RecordWriter::open(const std::filesystem::path& path, const RecordWriterOptions& opts)
    -> std::expected<RecordWriter, core::error> {
  RecordWriter w;
  w.path_ = path;
  w.fsync_on_flush_ = opts.fsync_on_flush;
  auto ch = FileWriteChannel::open(path, opts.truncate);
  if (!ch) return std::unexpected(ch.error());
  w.out_.emplace(std::move(*ch));
  return w;
}

auto RecordWriter::append(std::span<const std::uint8_t> payload) -> std::expected<void, core::error> {
  if (!out_ || !out_->is_open()) {
    return std::unexpected(error{error_code::io_failed, "writer closed", kComponent});
  }
  if (auto r = codec_.encode(*out_, payload); !r) return r;
  stats_.records++;
  stats_.bytes += record_length(payload.size());
  return {};
}

auto RecordWriter::flush(bool sync) -> std::expected<void, core::error> {
  if (!out_ || !out_->is_open()) {
    return std::unexpected(error{error_code::io_failed, "writer closed", kComponent});
  }
  if (auto r = out_->flush(); !r) return r;
  stats_.flushes++;
  if (sync || fsync_on_flush_) {
    if (auto r = fsync_file_path(path_); !r) return r;
    stats_.syncs++;
  }
  return {};
}

auto RecordWriter::close() -> std::expected<void, core::error> {
  if (!out_ || !out_->is_open()) return {};
  auto r = flush(false);
  out_->close();
  return r;
}

auto RecordReader::open(const std::filesystem::path& path, const DecodeOptions& opts)
    -> std::expected<RecordReader, core::error> {
  RecordReader r;
  r.path_ = path;
  auto ch = FileReadChannel::open(path);
  if (!ch) return std::unexpected(ch.error());
  r.in_.emplace(std::move(*ch));
  r.codec_ = RecordCodec(opts);
  return r;
}

auto RecordReader::next() -> std::expected<std::optional<std::vector<std::uint8_t>>, core::error> {
  if (!in_) {
    return std::unexpected(error{error_code::precondition_failed, "reader not open", kComponent});
  }
  auto rec = codec_.decode(*in_);
  if (!rec) {
    auto e = rec.error();
    e.message += " at offset " + std::to_string(offset_) + " of " + path_.string();
    return std::unexpected(std::move(e));
  }
  if (*rec) {
    offset_ += record_length((*rec)->size());
    records_++;
  }
  return rec;
}

auto scan_records(const std::filesystem::path& path, RecordCallback on_record, const ScanOptions& opts)
    -> std::expected<ScanStats, core::error> {
  return scan_records_accepting(path,
      [&](std::span<const std::uint8_t> payload) -> std::expected<ScanDecision, error> {
        on_record(payload);
        return ScanDecision::DeliverAndContinue;
      },
      opts);
}

auto scan_records_accepting(const std::filesystem::path& path, AcceptingRecordCallback on_record,
                            const ScanOptions& opts)
    -> std::expected<ScanStats, core::error> {
  ScanStats stats{};
  auto reader = RecordReader::open(path, opts.decode);
  if (!reader) return std::unexpected(reader.error());

  while (true) {
    if (opts.max_records > 0 && stats.records >= opts.max_records) break;

    const std::uint64_t at = reader->offset();
    auto rec = reader->next();
    if (!rec) {
      if (opts.tolerate_torn_tail && is_torn_tail(rec.error())) {
        if (debug_enabled()) {
          std::cerr << "[TFRECORD][scan] torn tail at offset " << at << " in " << path.string()
                    << ": " << core::describe(rec.error()) << std::endl;
        }
        stats.torn_tail = true;
        break;
      }
      if (debug_enabled()) {
        std::cerr << "[TFRECORD][scan] " << core::describe(rec.error()) << std::endl;
      }
      return std::unexpected(rec.error());
    }
    if (!*rec) break; // clean end of file

    const auto& payload = **rec;
    if (opts.max_bytes > 0 && stats.payload_bytes + payload.size() > opts.max_bytes) break;
    stats.frame_bytes += record_length(payload.size());

    auto decision = on_record(payload);
    if (!decision) return std::unexpected(decision.error());
    const bool deliver = *decision == ScanDecision::DeliverAndContinue || *decision == ScanDecision::DeliverAndStop;
    if (deliver) {
      stats.records++;
      stats.payload_bytes += payload.size();
      if (stats.records == 1 || payload.size() < stats.min_len) stats.min_len = payload.size();
      if (payload.size() > stats.max_len) stats.max_len = payload.size();
    } else {
      stats.skipped++;
    }
    if (*decision == ScanDecision::DeliverAndStop || *decision == ScanDecision::SkipAndStop) break;
  }

  if (debug_enabled()) {
    std::cerr << "[TFRECORD][scan] " << path.string() << ": records=" << stats.records
              << " skipped=" << stats.skipped << " payload_bytes=" << stats.payload_bytes
              << (stats.torn_tail ? " (torn tail)" : "") << std::endl;
  }
  return stats;
}

} // namespace tfrecord
