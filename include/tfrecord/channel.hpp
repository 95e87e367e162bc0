#pragma once

/** \file channel.hpp
 *  \brief Blocking byte channels consumed by the record codec.
 *
 * Contract
 * - read(buf): blocks until at least one byte is available or the stream ends.
 *   Returns the number of bytes stored; 0 for a non-empty buf means end-of-stream.
 * - write(buf): returns the number of bytes committed (may be fewer than buf.size()).
 * - Failures are reported as core::error with error_code::io_failed.
 * Channels are not thread-safe. The codec never opens, closes or seeks them.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <span>
#include <utility>
#include <vector>

#include "tfrecord/error.hpp"

namespace tfrecord {

class ReadableChannel {
public:
  virtual ~ReadableChannel() = default;
  virtual auto read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> = 0;
};

class WritableChannel {
public:
  virtual ~WritableChannel() = default;
  virtual auto write(std::span<const std::uint8_t> buf) -> std::expected<std::size_t, core::error> = 0;
};

/** \brief Reads until buf is full or end-of-stream; returns the byte count obtained. */
auto read_fully(ReadableChannel& in, std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error>;

/** \brief Writes all of buf, retrying short writes. A write committing 0 bytes is io_failed. */
auto write_fully(WritableChannel& out, std::span<const std::uint8_t> buf) -> std::expected<void, core::error>;

/** \brief In-memory channel: writes append to an owned buffer, reads consume it from a cursor.
 *
 *  max_chunk (>0) caps the bytes moved per read/write call to exercise short transfers.
 */
class MemoryChannel final : public ReadableChannel, public WritableChannel {
public:
  MemoryChannel() = default;
  explicit MemoryChannel(std::vector<std::uint8_t> bytes, std::size_t max_chunk = 0)
    : bytes_(std::move(bytes)), max_chunk_(max_chunk) {}

  auto read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> override;
  auto write(std::span<const std::uint8_t> buf) -> std::expected<std::size_t, core::error> override;

  const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }
  std::vector<std::uint8_t>& bytes() noexcept { return bytes_; }
  std::size_t position() const noexcept { return pos_; }
  std::size_t remaining() const noexcept { return pos_ < bytes_.size() ? bytes_.size() - pos_ : 0; }
  void rewind() noexcept { pos_ = 0; }
  void set_max_chunk(std::size_t n) noexcept { max_chunk_ = n; }

private:
  std::vector<std::uint8_t> bytes_;
  std::size_t pos_{0};
  std::size_t max_chunk_{0};
};

/** \brief Binary file input channel (std::ifstream). */
class FileReadChannel final : public ReadableChannel {
public:
  static auto open(const std::filesystem::path& path) -> std::expected<FileReadChannel, core::error>;

  FileReadChannel(FileReadChannel&&) = default;
  FileReadChannel& operator=(FileReadChannel&&) = default;
  FileReadChannel(const FileReadChannel&) = delete;
  FileReadChannel& operator=(const FileReadChannel&) = delete;

  auto read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> override;

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  FileReadChannel() = default;
  std::filesystem::path path_;
  std::ifstream in_;
};

/** \brief Binary file output channel (std::ofstream); appends unless truncate is set. */
class FileWriteChannel final : public WritableChannel {
public:
  static auto open(const std::filesystem::path& path, bool truncate = false)
      -> std::expected<FileWriteChannel, core::error>;

  FileWriteChannel(FileWriteChannel&&) = default;
  FileWriteChannel& operator=(FileWriteChannel&&) = default;
  FileWriteChannel(const FileWriteChannel&) = delete;
  FileWriteChannel& operator=(const FileWriteChannel&) = delete;

  auto write(std::span<const std::uint8_t> buf) -> std::expected<std::size_t, core::error> override;
  auto flush() -> std::expected<void, core::error>;
  void close();

  const std::filesystem::path& path() const noexcept { return path_; }
  bool is_open() const noexcept { return out_.is_open(); }

private:
  FileWriteChannel() = default;
  std::filesystem::path path_;
  std::ofstream out_;
};

} // namespace tfrecord
