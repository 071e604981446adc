#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "dedupgen/core/error.hpp"
#include "dedupgen/core/types.hpp"
#include "dedupgen/random/random_source.hpp"
#include "dedupgen/sink/byte_sink.hpp"
#include "dedupgen/source/byte_source.hpp"

namespace dedupgen {

// Throws Error{InvalidConfig} describing the first invalid field.
void validate(const GeneratorConfig& cfg);

ResolvedLengths resolve_lengths(const GeneratorConfig& cfg) noexcept;

class ISegmentObserver {
 public:
  virtual ~ISegmentObserver() = default;

  // Called once per completed step, after the state has been committed.
  virtual void on_segment(const SegmentRecord& rec, const GeneratorState& state) = 0;
};

// Streams a derivative of `baseline` into `sink` as a sequence of COPY,
// INSERT and DELETE segments with exponentially distributed lengths.
//
// The generator keeps a monotonic cursor into the baseline and never holds
// more than one io block of data. Both referenced objects must outlive it.
class EditSequenceGenerator {
 public:
  EditSequenceGenerator(GeneratorConfig cfg, IByteSource& baseline, IByteSink& sink);

  EditSequenceGenerator(const EditSequenceGenerator&) = delete;
  EditSequenceGenerator& operator=(const EditSequenceGenerator&) = delete;

  // Plans and applies one segment. Returns false, applying nothing, when the
  // run is already terminal.
  bool step();

  // Steps until terminal or until `stop` becomes true between steps.
  GenerationSummary run(const std::atomic<bool>* stop = nullptr);

  // Applies one segment of `kind` with requested `length` and returns the
  // number of bytes it emitted (COPY/INSERT) or skipped (DELETE). COPY and
  // DELETE are no-ops at the end of the baseline; COPY and INSERT are limited
  // by the remaining target output length.
  uint64_t apply(SegmentKind kind, uint64_t length);

  bool finished() const noexcept;

  void set_observer(ISegmentObserver* observer) noexcept { observer_ = observer; }

  const GeneratorConfig& config() const noexcept { return cfg_; }
  const GeneratorState& state() const noexcept { return state_; }
  GenerationSummary summary() const;

  // Copy of `cause` with the bytes emitted and the cursor appended. Used for
  // failures outside a segment, such as a final sync or close of the sink.
  Error annotate(const Error& cause) const;

 private:
  struct Plan {
    SegmentKind kind{SegmentKind::Insert};
    uint64_t length{};
    uint64_t sampled{};
    bool padding{false};
    bool ratio_capped{false};
  };

  Plan plan_next();
  uint64_t cycle_mean(SegmentKind kind) const noexcept;
  uint64_t ratio_bound(SegmentKind kind) const noexcept;
  uint64_t remaining_baseline() const noexcept;
  uint64_t remaining_target() const noexcept;
  bool baseline_exhausted() const noexcept;

  void emit_copy(uint64_t n);
  void emit_insert(uint64_t n);
  uint64_t apply_segment(const Plan& plan);

  [[noreturn]] void fail(const Error& cause, SegmentKind kind, uint64_t partial) const;

  GeneratorConfig cfg_;
  ResolvedLengths lengths_;
  IByteSource& baseline_;
  IByteSink& sink_;
  ISegmentObserver* observer_{nullptr};

  RandomSource edit_rng_;
  RandomSource data_rng_;
  std::vector<std::byte> buffer_;

  GeneratorState state_{};
  std::array<RunningStats, kSegmentKindCount> length_stats_{};
  size_t cycle_phase_{0};
  // Cycle policy: the INSERT of the current cycle still follows its COPY,
  // even when that COPY reached the end of the baseline.
  bool cycle_insert_pending_{false};
};

}  // namespace dedupgen
