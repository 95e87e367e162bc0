#include <catch2/catch_all.hpp>
#include <tfrecord/crc32c.hpp>

#include <array>
#include <cstdint>
#include <numeric>
#include <string_view>
#include <vector>

namespace {
std::span<const std::uint8_t> as_bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}
}

TEST_CASE("crc32c known-answer (Castagnoli, reflected)", "[crc32c]") {
  using namespace tfrecord;
  REQUIRE(crc32c(as_bytes("123456789")) == 0xE3069283u);
  REQUIRE(crc32c({}) == 0u);

  std::array<std::uint8_t, 32> zeros{};
  REQUIRE(crc32c(zeros) == 0x8A9136AAu);
  std::array<std::uint8_t, 32> ones{};
  ones.fill(0xFF);
  REQUIRE(crc32c(ones) == 0x62A8AB43u);
  std::array<std::uint8_t, 32> ascending{};
  std::iota(ascending.begin(), ascending.end(), std::uint8_t{0});
  REQUIRE(crc32c(ascending) == 0x46DD794Eu);
}

TEST_CASE("mask matches rotate-right-15 plus delta", "[crc32c][mask]") {
  using namespace tfrecord;
  STATIC_REQUIRE(mask_crc(0u) == 0xA282EAD8u);
  STATIC_REQUIRE(mask_crc(0xFFFFFFFFu) == 0xA282EAD7u);
  REQUIRE(mask_crc(0xE3069283u) == 0xC78AB0E5u);
  REQUIRE(masked_crc32c(as_bytes("ab")) == 0xF4F0B01Cu);
  REQUIRE(masked_crc32c({}) == 0xA282EAD8u);
}

TEST_CASE("unmask inverts mask and masking changes the value", "[crc32c][mask]") {
  using namespace tfrecord;
  for (std::uint32_t c : {0u, 1u, 0x8000u, 0xE3069283u, 0x12345678u, 0xFFFFFFFFu}) {
    REQUIRE(unmask_crc(mask_crc(c)) == c);
    REQUIRE(mask_crc(c) != c);
    REQUIRE(mask_crc(mask_crc(c)) != mask_crc(c));
  }
}

TEST_CASE("crc32c_extend composes over split buffers", "[crc32c]") {
  using namespace tfrecord;
  std::vector<std::uint8_t> data(1031);
  for (std::size_t i = 0; i < data.size(); ++i) data[i] = static_cast<std::uint8_t>(i * 131u + 7u);
  const auto whole = crc32c(data);
  for (std::size_t split : {std::size_t{0}, std::size_t{1}, std::size_t{7}, std::size_t{8}, std::size_t{513}, data.size()}) {
    std::span<const std::uint8_t> all{data};
    const auto head = crc32c(all.first(split));
    REQUIRE(crc32c_extend(head, all.subspan(split)) == whole);
  }
}

TEST_CASE("all crc32c backends agree with scalar", "[crc32c][backend]") {
  using namespace tfrecord;
  const auto& scalar = select_crc32c_backend("scalar");
  REQUIRE(scalar.name == "scalar");
  const auto& sse = select_crc32c_backend("SSE42");
  const auto& active = active_crc32c_backend();
  REQUIRE((active.name == "scalar" || active.name == "sse42"));
  REQUIRE(select_crc32c_backend("no-such-backend").name == "scalar");

  std::vector<std::uint8_t> data(4099);
  for (std::size_t i = 0; i < data.size(); ++i) data[i] = static_cast<std::uint8_t>((i * 2654435761u) >> 13);
  std::span<const std::uint8_t> all{data};
  for (std::size_t n : {std::size_t{0}, std::size_t{1}, std::size_t{3}, std::size_t{8}, std::size_t{15}, std::size_t{64}, data.size()}) {
    const auto ref = scalar.extend(0u, all.first(n));
    REQUIRE(sse.extend(0u, all.first(n)) == ref);
    REQUIRE(active.extend(0u, all.first(n)) == ref);
    REQUIRE(crc32c(all.first(n)) == ref);
  }
  REQUIRE(sse.extend(0u, as_bytes("123456789")) == 0xE3069283u);
}
