#pragma once

/** \file record_io.hpp
 *  \brief Record files: writer, sequential reader and verifying scan.
 *
 * Notes
 * - Writer and reader are not thread-safe; one instance per file.
 * - scan_records is read-only and reentrant for independent paths.
 * - fsync is optional; flush(true) or fsync_on_flush performs an OS-level sync.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "tfrecord/channel.hpp"
#include "tfrecord/error.hpp"
#include "tfrecord/record_codec.hpp"

namespace tfrecord {

struct RecordWriterOptions {
  bool truncate{false};       /**< start a fresh file instead of appending */
  bool fsync_on_flush{false}; /**< every flush() also syncs to stable storage */
};

struct RecordWriterStats {
  std::uint64_t records{};
  std::uint64_t bytes{};   /**< framed bytes written (header + payload + footer) */
  std::uint64_t flushes{};
  std::uint64_t syncs{};
};

class RecordWriter {
public:
  RecordWriter(RecordWriter&&) = default;
  RecordWriter& operator=(RecordWriter&&) = default;
  RecordWriter(const RecordWriter&) = delete;
  RecordWriter& operator=(const RecordWriter&) = delete;

  static auto open(const std::filesystem::path& path, const RecordWriterOptions& opts = {})
      -> std::expected<RecordWriter, core::error>;

  auto append(std::span<const std::uint8_t> payload) -> std::expected<void, core::error>;

  /** Flush buffered data. If sync=true or fsync_on_flush, also syncs the file and increments stats().syncs. */
  auto flush(bool sync = false) -> std::expected<void, core::error>;

  /** Flushes and closes; further appends fail with io_failed. */
  auto close() -> std::expected<void, core::error>;

  const std::filesystem::path& path() const noexcept { return path_; }
  const RecordWriterStats& stats() const noexcept { return stats_; }

private:
  RecordWriter() = default;

  std::filesystem::path path_;
  bool fsync_on_flush_{false};
  std::optional<FileWriteChannel> out_;
  RecordCodec codec_;
  RecordWriterStats stats_{};
};

class RecordReader {
public:
  RecordReader(RecordReader&&) = default;
  RecordReader& operator=(RecordReader&&) = default;
  RecordReader(const RecordReader&) = delete;
  RecordReader& operator=(const RecordReader&) = delete;

  static auto open(const std::filesystem::path& path, const DecodeOptions& opts = DecodeOptions::from_env())
      -> std::expected<RecordReader, core::error>;

  /** Next record, or std::nullopt at a clean end of file. */
  auto next() -> std::expected<std::optional<std::vector<std::uint8_t>>, core::error>;

  /** Byte offset of the next frame. */
  std::uint64_t offset() const noexcept { return offset_; }
  std::uint64_t records_read() const noexcept { return records_; }
  const std::filesystem::path& path() const noexcept { return path_; }

private:
  RecordReader() = default;

  std::filesystem::path path_;
  std::optional<FileReadChannel> in_;
  RecordCodec codec_;
  std::uint64_t offset_{};
  std::uint64_t records_{};
};

/// \brief Delivery decision for accepting-callback scans
/// - DeliverAndContinue: delivered; counted; continue
/// - DeliverAndStop: delivered; counted; stop after this record
/// - Skip: not delivered; not counted; continue
/// - SkipAndStop: not delivered; not counted; stop
enum class ScanDecision : std::uint8_t { DeliverAndContinue, DeliverAndStop, Skip, SkipAndStop };

struct ScanOptions {
  DecodeOptions decode{DecodeOptions::from_env()};
  bool tolerate_torn_tail{false}; /**< a truncated/partial final frame ends the scan without error */
  std::size_t max_records{0};     /**< 0 = unlimited */
  std::size_t max_bytes{0};       /**< 0 = unlimited; gating uses payload bytes only */
};

struct ScanStats {
  std::size_t records{};        /**< delivered records */
  std::size_t skipped{};        /**< records the callback declined */
  std::uint64_t payload_bytes{};/**< payload bytes of delivered records */
  std::uint64_t frame_bytes{};  /**< framed bytes of every verified record, delivered or not */
  std::uint64_t min_len{0};     /**< smallest delivered payload (0 if none) */
  std::uint64_t max_len{0};     /**< largest delivered payload */
  bool torn_tail{false};        /**< scan ended on a truncated tail (tolerate_torn_tail only) */
};

using RecordCallback = std::function<void(std::span<const std::uint8_t>)>;
using AcceptingRecordCallback = std::function<std::expected<ScanDecision, core::error>(std::span<const std::uint8_t>)>;

// Sequentially verifies every record of a file and invokes on_record for each.
// Checksum failures always stop the scan with an error.
[[nodiscard]] auto scan_records(const std::filesystem::path& path, RecordCallback on_record,
                                const ScanOptions& opts = {})
    -> std::expected<ScanStats, core::error>;

/** \brief Accepting-callback variant.
 *  Callback returns expected<ScanDecision,error>:
 *  - DeliverAndContinue / DeliverAndStop: counted in stats
 *  - Skip / SkipAndStop: counted in stats.skipped only
 *  - unexpected(error): stop with that error
 *  @code
 *  std::size_t n = 0;
 *  auto st = scan_records_accepting(path, [&](std::span<const std::uint8_t>) -> std::expected<ScanDecision, core::error> {
 *    return (++n == 5) ? ScanDecision::DeliverAndStop : ScanDecision::DeliverAndContinue;
 *  });
 *  @endcode
 */
[[nodiscard]] auto scan_records_accepting(const std::filesystem::path& path, AcceptingRecordCallback on_record,
                                          const ScanOptions& opts = {})
    -> std::expected<ScanStats, core::error>;

} // namespace tfrecord
