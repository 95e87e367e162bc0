#include "tfrecord/crc32c.hpp"
#include "tfrecord/core/platform_utils.hpp"

#include <array>
#include <cstring>
#include <string>

#if (defined(__x86_64__) || defined(_M_X64)) && (defined(__GNUC__) || defined(__clang__))
#define TFRECORD_HAVE_SSE42_CRC 1
#include <cpuid.h>
#include <nmmintrin.h>
#else
#define TFRECORD_HAVE_SSE42_CRC 0
#endif

namespace tfrecord {

namespace {

// Reflected CRC-32C (Castagnoli) table using reversed polynomial 0x82F63B78
constexpr std::array<std::uint32_t, 256> CRC32C_TABLE = []{
  std::array<std::uint32_t, 256> t{};
  const std::uint32_t poly = 0x82F63B78u;
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
    }
    t[i] = c;
  }
  return t;
}();

std::uint32_t extend_scalar(std::uint32_t crc, std::span<const std::uint8_t> bytes) noexcept {
  std::uint32_t c = ~crc;
  for (auto b : bytes) {
    c = CRC32C_TABLE[(c ^ b) & 0xFFu] ^ (c >> 8);
  }
  return ~c;
}

#if TFRECORD_HAVE_SSE42_CRC
__attribute__((target("sse4.2")))
std::uint32_t extend_sse42(std::uint32_t crc, std::span<const std::uint8_t> bytes) noexcept {
  const std::uint8_t* p = bytes.data();
  std::size_t n = bytes.size();
  std::uint64_t c = static_cast<std::uint32_t>(~crc);
  // x86 is little-endian, so the native 8-byte load feeds bytes in stream order
  while (n >= 8) {
    std::uint64_t v;
    std::memcpy(&v, p, 8);
    c = _mm_crc32_u64(c, v);
    p += 8;
    n -= 8;
  }
  auto c32 = static_cast<std::uint32_t>(c);
  while (n > 0) {
    c32 = _mm_crc32_u8(c32, *p);
    ++p;
    --n;
  }
  return ~c32;
}

[[gnu::cold]] bool cpu_has_sse42() noexcept {
  unsigned int eax = 0, ebx = 0, ecx = 0, edx = 0;
  if (!__get_cpuid(1, &eax, &ebx, &ecx, &edx)) return false;
  return (ecx & (1u << 20)) != 0; // CPUID.01H:ECX.SSE4_2[bit 20]
}
#endif

const Crc32cOps& scalar_ops() noexcept {
  static const Crc32cOps ops{"scalar", &extend_scalar};
  return ops;
}

bool eq_ci(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    char ca = a[i]; char cb = b[i];
    if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
    if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
    if (ca != cb) return false;
  }
  return true;
}

const Crc32cOps& detect_best() noexcept {
#if TFRECORD_HAVE_SSE42_CRC
  if (cpu_has_sse42()) return select_crc32c_backend("sse42");
#endif
  return scalar_ops();
}

} // namespace

const Crc32cOps& select_crc32c_backend(std::string_view name) noexcept {
  if (eq_ci(name, "scalar")) return scalar_ops();
#if TFRECORD_HAVE_SSE42_CRC
  if (eq_ci(name, "sse42")) {
    static const bool supported = cpu_has_sse42();
    static const Crc32cOps ops{"sse42", &extend_sse42};
    if (supported) return ops;
  }
#endif
  // Unknown or unavailable backend, return scalar
  return scalar_ops();
}

const Crc32cOps& active_crc32c_backend() noexcept {
  static const Crc32cOps& ops = []() -> const Crc32cOps& {
    const auto env = core::safe_getenv("TFRECORD_CRC32C_BACKEND");
    if (env && !env->empty() && !eq_ci(*env, "auto")) {
      return select_crc32c_backend(*env);
    }
    return detect_best();
  }();
  return ops;
}

auto crc32c(std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t {
  return active_crc32c_backend().extend(0u, bytes);
}

auto crc32c_extend(std::uint32_t crc, std::span<const std::uint8_t> bytes) noexcept -> std::uint32_t {
  return active_crc32c_backend().extend(crc, bytes);
}

} // namespace tfrecord
