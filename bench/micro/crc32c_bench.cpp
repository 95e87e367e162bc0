#include <benchmark/benchmark.h>
#include <tfrecord/crc32c.hpp>

#include <cstdint>
#include <string>
#include <vector>

static std::vector<std::uint8_t> make_buffer(std::size_t n) {
  std::vector<std::uint8_t> v(n);
  for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<std::uint8_t>(i * 31u + 17u);
  return v;
}

static void BenchCrc32cScalar(benchmark::State& state) {
  const auto buf = make_buffer(static_cast<std::size_t>(state.range(0)));
  const auto& ops = tfrecord::select_crc32c_backend("scalar");
  for (auto _ : state) {
    benchmark::DoNotOptimize(ops.extend(0u, buf));
  }
  state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BenchCrc32cScalar)->Arg(64)->Arg(4096)->Arg(1 << 20);

static void BenchCrc32cSse42(benchmark::State& state) {
  const auto buf = make_buffer(static_cast<std::size_t>(state.range(0)));
  const auto& ops = tfrecord::select_crc32c_backend("sse42");
  state.SetLabel(std::string(ops.name));
  for (auto _ : state) {
    benchmark::DoNotOptimize(ops.extend(0u, buf));
  }
  state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BenchCrc32cSse42)->Arg(64)->Arg(4096)->Arg(1 << 20);

BENCHMARK_MAIN();
