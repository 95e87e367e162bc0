#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <span>
#include <vector>

#include "tfrecord/record_codec.hpp"

// Fuzzer: feeds arbitrary bytes through the streaming and in-place decoders.
// Both must agree on every record they accept and never return an unverified payload.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  using namespace tfrecord;
  const DecodeOptions opts{.max_record_bytes = 1u << 20};
  std::span<const std::uint8_t> bytes{data, size};

  MemoryChannel ch(std::vector<std::uint8_t>(data, data + size), size % 7 + 1);
  RecordCodec codec(opts);
  while (true) {
    auto view = decode_record(bytes, opts);
    auto rec = codec.decode(ch);
    if (!rec || !*rec) {
      if (view) __builtin_trap();
      break;
    }
    if (!view || view->payload.size() != (*rec)->size()) __builtin_trap();
    if (!std::equal(view->payload.begin(), view->payload.end(), (*rec)->begin())) __builtin_trap();
    bytes = bytes.subspan(view->frame_size);
  }
  return 0;
}
