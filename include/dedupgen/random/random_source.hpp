#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace dedupgen {

uint64_t splitmix64(uint64_t& state) noexcept;
uint64_t mix64(uint64_t v) noexcept;

// Seeded xorshift64* stream. Copyable; copies continue the same sequence.
class RandomSource {
 public:
  explicit RandomSource(uint64_t seed) noexcept;

  uint64_t next_u64() noexcept;
  // Uniform draw in the open interval (0, 1).
  double next_unit() noexcept;
  void fill(std::span<std::byte> out) noexcept;

 private:
  uint64_t state_;
};

// round(-mean * ln(u)) clamped to [1, max_length]. u must lie in (0, 1).
uint64_t exponential_length(double u, uint64_t mean, uint64_t max_length) noexcept;

uint64_t sample_length(RandomSource& rng, uint64_t mean, uint64_t max_length) noexcept;

}  // namespace dedupgen
