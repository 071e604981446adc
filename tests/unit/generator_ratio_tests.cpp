#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iostream>
#include <vector>

#include "dedupgen/generator/edit_generator.hpp"
#include "dedupgen/sink/byte_sink.hpp"
#include "dedupgen/sink/hash_sink.hpp"
#include "dedupgen/source/byte_source.hpp"

namespace {

constexpr uint64_t kBaselineLength = 64ULL * 1024 * 1024;

dedupgen::GenerationSummary run_config(const dedupgen::GeneratorConfig& cfg) {
  auto baseline = dedupgen::make_procedural_source(cfg.baseline_length, cfg.seed + 1);
  dedupgen::HashSink sink(0);
  dedupgen::EditSequenceGenerator gen(cfg, *baseline, sink);
  return gen.run();
}

bool test_balanced_converges_to_target() {
  const std::array<double, 4> targets{0.2, 0.5, 0.75, 0.9};
  for (const double r : targets) {
    dedupgen::GeneratorConfig cfg{};
    cfg.baseline_length = kBaselineLength;
    cfg.mean_segment_length = 64 * 1024;
    cfg.target_duplication_ratio = r;
    cfg.seed = 17;
    const auto s = run_config(cfg);
    const double realized = s.state.realized_ratio();
    if (std::fabs(realized - r) > 0.05) {
      std::cerr << std::format("target {} realized {}\n", r, realized);
      return false;
    }
  }
  return true;
}

bool test_balanced_bound_at_ten_means() {
  constexpr uint64_t kMean = 4096;
  const std::array<double, 3> targets{0.2, 0.5, 0.9};
  for (const double r : targets) {
    for (uint64_t seed = 1; seed <= 200; ++seed) {
      dedupgen::GeneratorConfig cfg{};
      cfg.baseline_length = 10 * kMean;
      cfg.mean_segment_length = kMean;
      cfg.target_duplication_ratio = r;
      cfg.seed = seed;
      const auto s = run_config(cfg);
      const double realized = s.state.realized_ratio();
      if (!s.exhausted || std::fabs(realized - r) > 0.05) {
        std::cerr << std::format("N = 10 x mean, seed {}: target {} realized {}\n", seed, r,
                                 realized);
        return false;
      }
    }
  }
  return true;
}

bool test_delete_share_is_small() {
  dedupgen::GeneratorConfig cfg{};
  cfg.baseline_length = kBaselineLength;
  cfg.mean_segment_length = 64 * 1024;
  cfg.delete_probability = 0.02;
  cfg.seed = 8;
  const auto s = run_config(cfg);

  const auto& seg = s.state.segments;
  const double steps = static_cast<double>(s.state.steps);
  const double delete_share = static_cast<double>(seg[dedupgen::kind_index(dedupgen::SegmentKind::Delete)]) / steps;
  if (delete_share > 0.05 || seg[dedupgen::kind_index(dedupgen::SegmentKind::Delete)] == 0) {
    std::cerr << std::format("delete share {} not in (0, 0.05]\n", delete_share);
    return false;
  }
  if (s.state.delete_bytes == 0 || s.state.delete_bytes > s.state.copy_bytes / 5) {
    std::cerr << std::format("deleted {} bytes against {} copied\n", s.state.delete_bytes,
                             s.state.copy_bytes);
    return false;
  }
  return true;
}

bool test_zero_delete_probability() {
  dedupgen::GeneratorConfig cfg{};
  cfg.baseline_length = 8ULL * 1024 * 1024;
  cfg.mean_segment_length = 32 * 1024;
  cfg.delete_probability = 0.0;
  const auto s = run_config(cfg);
  if (s.state.delete_bytes != 0 || s.state.copy_bytes != cfg.baseline_length) {
    std::cerr << std::format("without deletes every baseline byte should be copied once\n");
    return false;
  }
  return true;
}

bool test_segment_lengths_follow_mean() {
  dedupgen::GeneratorConfig cfg{};
  cfg.baseline_length = kBaselineLength;
  cfg.mean_segment_length = 16 * 1024;
  cfg.seed = 3;
  const auto s = run_config(cfg);
  const auto& insert = s.lengths[dedupgen::kind_index(dedupgen::SegmentKind::Insert)];
  const double mean = static_cast<double>(cfg.mean_segment_length);
  // INSERT segments are never truncated without a target length.
  if (insert.count < 1000 || std::fabs(insert.mean - mean) > 0.1 * mean) {
    std::cerr << std::format("insert mean {} over {} segments, configured {}\n", insert.mean,
                             insert.count, mean);
    return false;
  }
  if (std::fabs(insert.stddev() - mean) > 0.15 * mean) {
    std::cerr << std::format("insert stddev {} not close to exponential {}\n", insert.stddev(),
                             mean);
    return false;
  }
  return true;
}

bool test_cycle_policy_follows_mean_ratio() {
  dedupgen::GeneratorConfig cfg{};
  cfg.baseline_length = kBaselineLength;
  cfg.selector = dedupgen::SelectorPolicy::Cycle;
  cfg.mean_segment_length = 24 * 1024;
  cfg.insert_mean_length = 8 * 1024;
  cfg.delete_mean_length = 4 * 1024;
  cfg.seed = 21;
  const auto s = run_config(cfg);

  const double expected = 24.0 / (24.0 + 8.0);
  const double realized = s.state.realized_ratio();
  if (std::fabs(realized - expected) > 0.05) {
    std::cerr << std::format("cycle policy realized {} expected {}\n", realized, expected);
    return false;
  }
  const auto& seg = s.state.segments;
  const uint64_t copies = seg[dedupgen::kind_index(dedupgen::SegmentKind::Copy)];
  const uint64_t inserts = seg[dedupgen::kind_index(dedupgen::SegmentKind::Insert)];
  if (copies < inserts || copies - inserts > 1) {
    std::cerr << std::format("cycle policy should alternate: {} copies, {} inserts\n", copies,
                             inserts);
    return false;
  }
  return true;
}

class LastRecord final : public dedupgen::ISegmentObserver {
 public:
  void on_segment(const dedupgen::SegmentRecord& rec, const dedupgen::GeneratorState&) override {
    last_ = rec;
  }
  const dedupgen::SegmentRecord& last() const { return last_; }

 private:
  dedupgen::SegmentRecord last_{};
};

bool test_cycle_zero_means_copy_only() {
  dedupgen::GeneratorConfig cfg{};
  cfg.baseline_length = 2ULL * 1024 * 1024;
  cfg.selector = dedupgen::SelectorPolicy::Cycle;
  cfg.mean_segment_length = 16 * 1024;
  cfg.insert_mean_length = 0;
  cfg.delete_mean_length = 0;
  cfg.seed = 4;

  auto baseline = dedupgen::make_procedural_source(cfg.baseline_length, 6);
  dedupgen::MemorySink sink;
  dedupgen::EditSequenceGenerator gen(cfg, *baseline, sink);
  const auto s = gen.run();

  std::vector<std::byte> expected(cfg.baseline_length);
  baseline->read_at(0, expected);
  if (s.state.insert_bytes != 0 || s.state.delete_bytes != 0 || sink.data() != expected) {
    std::cerr << std::format("zero insert/delete means should copy the baseline unchanged: "
                             "insert={} delete={}\n",
                             s.state.insert_bytes, s.state.delete_bytes);
    return false;
  }

  // An explicit zero delete mean keeps inserts but drops deletes.
  cfg.insert_mean_length = 8 * 1024;
  dedupgen::HashSink hashed(0);
  dedupgen::EditSequenceGenerator with_inserts(cfg, *baseline, hashed);
  const auto t = with_inserts.run();
  if (t.state.delete_bytes != 0 || t.state.copy_bytes != cfg.baseline_length ||
      t.state.insert_bytes == 0) {
    std::cerr << std::format("zero delete mean: copy={} insert={} delete={}\n",
                             t.state.copy_bytes, t.state.insert_bytes, t.state.delete_bytes);
    return false;
  }
  return true;
}

bool test_cycle_insert_follows_final_copy() {
  dedupgen::GeneratorConfig cfg{};
  cfg.baseline_length = 1024 * 1024;
  cfg.selector = dedupgen::SelectorPolicy::Cycle;
  cfg.mean_segment_length = 24 * 1024;
  cfg.insert_mean_length = 8 * 1024;
  cfg.delete_mean_length = 0;

  for (uint64_t seed = 1; seed <= 20; ++seed) {
    cfg.seed = seed;
    auto baseline = dedupgen::make_procedural_source(cfg.baseline_length, seed);
    dedupgen::HashSink sink(0);
    LastRecord obs;
    dedupgen::EditSequenceGenerator gen(cfg, *baseline, sink);
    gen.set_observer(&obs);
    const auto s = gen.run();

    const auto& seg = s.state.segments;
    const uint64_t copies = seg[dedupgen::kind_index(dedupgen::SegmentKind::Copy)];
    const uint64_t inserts = seg[dedupgen::kind_index(dedupgen::SegmentKind::Insert)];
    if (copies != inserts || obs.last().kind != dedupgen::SegmentKind::Insert ||
        obs.last().padding || obs.last().baseline_offset != cfg.baseline_length) {
      std::cerr << std::format("seed {}: {} copies, {} inserts, last segment {}\n", seed, copies,
                               inserts, dedupgen::segment_kind_name(obs.last().kind));
      return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  if (!test_balanced_converges_to_target()) {
    return 1;
  }
  if (!test_delete_share_is_small()) {
    return 1;
  }
  if (!test_zero_delete_probability()) {
    return 1;
  }
  if (!test_segment_lengths_follow_mean()) {
    return 1;
  }
  if (!test_cycle_policy_follows_mean_ratio()) {
    return 1;
  }
  if (!test_balanced_bound_at_ten_means()) {
    return 1;
  }
  if (!test_cycle_zero_means_copy_only()) {
    return 1;
  }
  if (!test_cycle_insert_follows_final_copy()) {
    return 1;
  }
  return 0;
}
