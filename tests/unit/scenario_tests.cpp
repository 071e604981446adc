#include <cstddef>
#include <cstdint>
#include <format>
#include <iostream>
#include <span>
#include <vector>

#include "dedupgen/generator/edit_generator.hpp"
#include "dedupgen/sink/byte_sink.hpp"
#include "dedupgen/source/byte_source.hpp"

namespace {

// Holds the bytes of the segment in flight and checks each COPY against the
// baseline once the generator reports it.
class VerifyingSink final : public dedupgen::IByteSink, public dedupgen::ISegmentObserver {
 public:
  explicit VerifyingSink(dedupgen::IByteSource& baseline) : baseline_(baseline) {}

  void append(std::span<const std::byte> bytes) override {
    pending_.insert(pending_.end(), bytes.begin(), bytes.end());
    written_ += bytes.size();
  }
  void sync() override {}
  void close() override {}
  uint64_t bytes_written() const noexcept override { return written_; }

  void on_segment(const dedupgen::SegmentRecord& rec, const dedupgen::GeneratorState&) override {
    if (rec.kind == dedupgen::SegmentKind::Copy) {
      if (pending_.size() != rec.length) {
        mismatches_++;
      } else {
        expected_.resize(rec.length);
        baseline_.read_at(rec.baseline_offset, expected_);
        if (expected_ != pending_) {
          mismatches_++;
        }
      }
      ++copies_checked_;
    }
    pending_.clear();
  }

  uint64_t mismatches() const { return mismatches_; }
  uint64_t copies_checked() const { return copies_checked_; }

 private:
  dedupgen::IByteSource& baseline_;
  std::vector<std::byte> pending_;
  std::vector<std::byte> expected_;
  uint64_t written_{0};
  uint64_t mismatches_{0};
  uint64_t copies_checked_{0};
};

bool test_one_gib_half_duplication() {
  dedupgen::GeneratorConfig cfg{};
  cfg.baseline_length = 1'073'741'824ULL;
  cfg.mean_segment_length = 524'288;
  cfg.target_duplication_ratio = 0.5;
  cfg.seed = 42;

  auto baseline = dedupgen::make_procedural_source(cfg.baseline_length, 42);
  VerifyingSink sink(*baseline);
  dedupgen::EditSequenceGenerator gen(cfg, *baseline, sink);
  gen.set_observer(&sink);
  const auto summary = gen.run();

  const double ratio = summary.state.realized_ratio();
  if (!summary.exhausted || summary.cancelled) {
    std::cerr << std::format("run did not end at the end of the baseline\n");
    return false;
  }
  if (ratio < 0.45 || ratio > 0.55) {
    std::cerr << std::format("realized duplication ratio {} outside [0.45, 0.55]\n", ratio);
    return false;
  }
  if (sink.copies_checked() == 0 || sink.mismatches() != 0) {
    std::cerr << std::format("{} of {} COPY segments did not match the baseline\n",
                             sink.mismatches(), sink.copies_checked());
    return false;
  }
  if (sink.bytes_written() != summary.state.bytes_emitted) {
    std::cerr << std::format("sink saw {} bytes, state reports {}\n", sink.bytes_written(),
                             summary.state.bytes_emitted);
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_one_gib_half_duplication()) {
    return 1;
  }
  return 0;
}
