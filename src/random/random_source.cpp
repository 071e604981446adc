#include "dedupgen/random/random_source.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace dedupgen {
namespace {

constexpr uint64_t kGolden = 0x9e3779b97f4a7c15ULL;
constexpr uint64_t kStarMul = 0x2545f4914f6cdd1dULL;
constexpr double kUnitScale = 1.0 / 9007199254740992.0;  // 2^-53

uint64_t xorshift64(uint64_t& s) noexcept {
  s ^= s << 13;
  s ^= s >> 7;
  s ^= s << 17;
  return s;
}

}  // namespace

uint64_t mix64(uint64_t v) noexcept {
  v = (v ^ (v >> 30)) * 0xbf58476d1ce4e5b9ULL;
  v = (v ^ (v >> 27)) * 0x94d049bb133111ebULL;
  return v ^ (v >> 31);
}

uint64_t splitmix64(uint64_t& state) noexcept {
  state += kGolden;
  return mix64(state);
}

RandomSource::RandomSource(uint64_t seed) noexcept : state_(0) {
  uint64_t s = seed;
  while (state_ == 0) {
    state_ = splitmix64(s);
  }
}

uint64_t RandomSource::next_u64() noexcept {
  return xorshift64(state_) * kStarMul;
}

double RandomSource::next_unit() noexcept {
  const uint64_t bits = next_u64() >> 11;
  return (static_cast<double>(bits) + 0.5) * kUnitScale;
}

void RandomSource::fill(std::span<std::byte> out) noexcept {
  size_t i = 0;
  for (; i + sizeof(uint64_t) <= out.size(); i += sizeof(uint64_t)) {
    const uint64_t w = next_u64();
    std::memcpy(out.data() + i, &w, sizeof(w));
  }
  if (i < out.size()) {
    const uint64_t w = next_u64();
    std::memcpy(out.data() + i, &w, out.size() - i);
  }
}

uint64_t exponential_length(double u, uint64_t mean, uint64_t max_length) noexcept {
  const uint64_t cap = std::max<uint64_t>(1, max_length);
  if (!(u > 0.0)) {
    return cap;
  }
  if (u >= 1.0) {
    return 1;
  }
  const double draw = std::round(-static_cast<double>(mean) * std::log(u));
  if (draw >= static_cast<double>(cap)) {
    return cap;
  }
  if (draw < 1.0) {
    return 1;
  }
  return static_cast<uint64_t>(draw);
}

uint64_t sample_length(RandomSource& rng, uint64_t mean, uint64_t max_length) noexcept {
  return exponential_length(rng.next_unit(), mean, max_length);
}

}  // namespace dedupgen
