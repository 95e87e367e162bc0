#include "tfrecord/channel.hpp"

#include <algorithm>
#include <cstring>

namespace tfrecord {

auto read_fully(ReadableChannel& in, std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> {
  std::size_t got = 0;
  while (got < buf.size()) {
    auto r = in.read(buf.subspan(got));
    if (!r) return std::unexpected(r.error());
    if (*r == 0) break; // end-of-stream
    got += *r;
  }
  return got;
}

auto write_fully(WritableChannel& out, std::span<const std::uint8_t> buf) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  std::size_t put = 0;
  while (put < buf.size()) {
    auto w = out.write(buf.subspan(put));
    if (!w) return std::unexpected(w.error());
    if (*w == 0) {
      return std::unexpected(error{error_code::io_failed, "channel committed no bytes", "record.channel"});
    }
    put += *w;
  }
  return {};
}

auto MemoryChannel::read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> {
  std::size_t n = std::min(buf.size(), remaining());
  if (max_chunk_ > 0) n = std::min(n, max_chunk_);
  if (n > 0) {
    std::memcpy(buf.data(), bytes_.data() + pos_, n);
    pos_ += n;
  }
  return n;
}

auto MemoryChannel::write(std::span<const std::uint8_t> buf) -> std::expected<std::size_t, core::error> {
  std::size_t n = buf.size();
  if (max_chunk_ > 0) n = std::min(n, max_chunk_);
  bytes_.insert(bytes_.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
  return n;
}

auto FileReadChannel::open(const std::filesystem::path& path) -> std::expected<FileReadChannel, core::error> {
  using core::error; using core::error_code;
  FileReadChannel ch;
  ch.path_ = path;
  ch.in_.open(path, std::ios::binary);
  if (!ch.in_.good()) {
    std::error_code ec;
    const bool missing = !std::filesystem::exists(path, ec);
    return std::unexpected(error{missing ? error_code::not_found : error_code::io_failed,
                                 "open failed: " + path.string(), "record.channel"});
  }
  return ch;
}

auto FileReadChannel::read(std::span<std::uint8_t> buf) -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  if (buf.empty() || in_.eof()) return std::size_t{0};
  in_.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (in_.bad()) {
    return std::unexpected(error{error_code::io_failed, "read failed: " + path_.string(), "record.channel"});
  }
  return static_cast<std::size_t>(in_.gcount());
}

auto FileWriteChannel::open(const std::filesystem::path& path, bool truncate)
    -> std::expected<FileWriteChannel, core::error> {
  using core::error; using core::error_code;
  FileWriteChannel ch;
  ch.path_ = path;
  const std::ios::openmode mode = std::ios::binary | std::ios::out | (truncate ? std::ios::trunc : std::ios::app);
  ch.out_.open(path, mode);
  if (!ch.out_.good()) {
    return std::unexpected(error{error_code::io_failed, "open failed: " + path.string(), "record.channel"});
  }
  return ch;
}

auto FileWriteChannel::write(std::span<const std::uint8_t> buf) -> std::expected<std::size_t, core::error> {
  using core::error; using core::error_code;
  if (!out_.good()) {
    return std::unexpected(error{error_code::io_failed, "writer closed", "record.channel"});
  }
  out_.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (!out_.good()) {
    return std::unexpected(error{error_code::io_failed, "write failed: " + path_.string(), "record.channel"});
  }
  return buf.size();
}

auto FileWriteChannel::flush() -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!out_.good()) {
    return std::unexpected(error{error_code::io_failed, "writer closed", "record.channel"});
  }
  out_.flush();
  if (!out_.good()) {
    return std::unexpected(error{error_code::io_failed, "flush failed: " + path_.string(), "record.channel"});
  }
  return {};
}

void FileWriteChannel::close() {
  if (out_.is_open()) out_.close();
}

} // namespace tfrecord
