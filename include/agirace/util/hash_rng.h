#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace agirace::util {

// splitmix64 mixing step. Deterministic, fast, not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits of a 64-bit word as a double in [0,1).
inline double u01_from_u64(std::uint64_t x) {
  return static_cast<double>(x >> 11) * (1.0 / 9007199254740992.0);
}

struct HashRng {
  std::uint64_t s{0};

  explicit HashRng(std::uint64_t seed) : s(seed) {}

  std::uint64_t next_u64() {
    s = splitmix64(s);
    return s;
  }

  double next_u01() { return u01_from_u64(next_u64()); }

  // Index in [0, n). n == 0 returns 0.
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    return static_cast<std::size_t>(next_u01() * static_cast<double>(n)) % n;
  }
};

// Wraps a seeded HashRng as the `double()` callable the turn engine consumes.
// Each call advances the captured generator.
inline std::function<double()> make_u01_source(std::uint64_t seed) {
  return [rng = HashRng(seed)]() mutable { return rng.next_u01(); };
}

} // namespace agirace::util
