#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace dedupgen {

enum class SegmentKind : uint8_t { Copy = 0, Insert = 1, Delete = 2 };
enum class SelectorPolicy { Balanced, Cycle };
enum class ExhaustionPolicy { Pad, Stop };

inline constexpr size_t kSegmentKindCount = 3;
inline constexpr uint64_t kDefaultMeanSegmentLength = 512ULL * 1024ULL;
inline constexpr uint64_t kDefaultMaxSegmentFactor = 64;
inline constexpr size_t kDefaultIoBlockSize = 1024ULL * 1024ULL;

constexpr size_t kind_index(SegmentKind kind) noexcept {
  return static_cast<size_t>(kind);
}

const char* segment_kind_name(SegmentKind kind) noexcept;
const char* selector_policy_name(SelectorPolicy policy) noexcept;
const char* exhaustion_policy_name(ExhaustionPolicy policy) noexcept;

struct GeneratorConfig {
  uint64_t baseline_length{0};
  uint64_t mean_segment_length{kDefaultMeanSegmentLength};
  double target_duplication_ratio{0.5};
  double delete_probability{0.02};
  std::optional<uint64_t> target_output_length{};
  uint64_t seed{1};

  // 0 selects kDefaultMaxSegmentFactor times the largest configured mean.
  uint64_t max_segment_length{0};
  SelectorPolicy selector{SelectorPolicy::Balanced};
  // Cycle policy only. Unset falls back to the copy mean / insert mean;
  // an explicit 0 drops that kind from the cycle.
  std::optional<uint64_t> insert_mean_length{};
  std::optional<uint64_t> delete_mean_length{};
  ExhaustionPolicy on_exhaustion{ExhaustionPolicy::Pad};
  size_t io_block_size{kDefaultIoBlockSize};
};

// Mean lengths and cap after defaults are resolved.
struct ResolvedLengths {
  uint64_t copy_mean{};
  uint64_t insert_mean{};
  uint64_t delete_mean{};
  uint64_t max_segment{};
};

struct GeneratorState {
  uint64_t cursor{0};
  uint64_t bytes_emitted{0};
  uint64_t copy_bytes{0};
  uint64_t insert_bytes{0};
  uint64_t delete_bytes{0};
  uint64_t steps{0};
  std::array<uint64_t, kSegmentKindCount> segments{};

  double realized_ratio() const noexcept {
    if (bytes_emitted == 0) {
      return 0.0;
    }
    return static_cast<double>(copy_bytes) / static_cast<double>(bytes_emitted);
  }
};

struct SegmentRecord {
  SegmentKind kind{SegmentKind::Copy};
  uint64_t sampled_length{};
  uint64_t length{};
  uint64_t baseline_offset{};
  uint64_t output_offset{};
  bool padding{false};
  // Length was cut to keep the realized ratio near the target.
  bool ratio_capped{false};
};

struct RunningStats {
  uint64_t count{0};
  uint64_t sum{0};
  uint64_t min{0};
  uint64_t max{0};
  double mean{0.0};
  double m2{0.0};

  void add(uint64_t value) noexcept;
  double stddev() const noexcept;
};

struct GenerationSummary {
  GeneratorState state{};
  std::array<RunningStats, kSegmentKindCount> lengths{};
  bool exhausted{false};
  bool cancelled{false};
};

}  // namespace dedupgen
