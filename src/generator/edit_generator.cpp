#include "dedupgen/generator/edit_generator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <limits>
#include <span>
#include <string>
#include <utility>

namespace dedupgen {
namespace {

constexpr uint64_t kNoLimit = std::numeric_limits<uint64_t>::max();
constexpr uint64_t kPayloadStreamSalt = 0x243f6a8885a308d3ULL;

// Balanced policy: after every COPY or INSERT, |copy_bytes - r * bytes_emitted|
// stays within kRatioSlack * max(bytes_emitted, copy mean).
constexpr double kRatioSlack = 0.04;

constexpr std::array<SegmentKind, kSegmentKindCount> kCycleOrder{
    SegmentKind::Copy, SegmentKind::Insert, SegmentKind::Delete};

uint64_t saturating_mul(uint64_t a, uint64_t b) noexcept {
  if (a != 0 && b > kNoLimit / a) {
    return kNoLimit;
  }
  return a * b;
}

Error config_error(std::string message) {
  return Error{ErrorCode::InvalidConfig, std::move(message)};
}

}  // namespace

ResolvedLengths resolve_lengths(const GeneratorConfig& cfg) noexcept {
  ResolvedLengths out{};
  out.copy_mean = cfg.mean_segment_length;
  if (cfg.selector == SelectorPolicy::Cycle) {
    out.insert_mean = cfg.insert_mean_length.value_or(out.copy_mean);
    out.delete_mean = cfg.delete_mean_length.value_or(out.insert_mean);
  } else {
    out.insert_mean = out.copy_mean;
    out.delete_mean = out.copy_mean;
  }
  const uint64_t largest = std::max({out.copy_mean, out.insert_mean, out.delete_mean});
  out.max_segment = cfg.max_segment_length != 0
                        ? cfg.max_segment_length
                        : saturating_mul(largest, kDefaultMaxSegmentFactor);
  return out;
}

void validate(const GeneratorConfig& cfg) {
  if (cfg.mean_segment_length == 0) {
    throw config_error("mean_segment_length must be > 0");
  }
  const double r = cfg.target_duplication_ratio;
  if (!(r > 0.0 && r < 1.0)) {
    throw config_error(
        std::format("target_duplication_ratio must lie in (0, 1), got {}", r));
  }
  const double p = cfg.delete_probability;
  if (!(p >= 0.0 && p < 1.0)) {
    throw config_error(std::format("delete_probability must lie in [0, 1), got {}", p));
  }
  if (cfg.target_output_length.has_value() && *cfg.target_output_length == 0) {
    throw config_error("target_output_length must be at least one byte");
  }
  if (cfg.io_block_size == 0) {
    throw config_error("io_block_size must be > 0");
  }
  const auto lengths = resolve_lengths(cfg);
  const uint64_t largest = std::max({lengths.copy_mean, lengths.insert_mean, lengths.delete_mean});
  if (lengths.max_segment < largest) {
    throw config_error(std::format(
        "max_segment_length {} is below the mean segment length {}", lengths.max_segment, largest));
  }
}

EditSequenceGenerator::EditSequenceGenerator(GeneratorConfig cfg,
                                             IByteSource& baseline,
                                             IByteSink& sink)
    : cfg_(std::move(cfg)),
      lengths_(resolve_lengths(cfg_)),
      baseline_(baseline),
      sink_(sink),
      edit_rng_(cfg_.seed),
      data_rng_(mix64(cfg_.seed ^ kPayloadStreamSalt)) {
  validate(cfg_);
  if (baseline_.length() != cfg_.baseline_length) {
    throw config_error(std::format("baseline_length {} does not match source length {}",
                                   cfg_.baseline_length, baseline_.length()));
  }
  // Whole 64-bit words per block keep INSERT payload independent of the
  // block size.
  size_t block = cfg_.io_block_size;
  if (block >= sizeof(uint64_t)) {
    block -= block % sizeof(uint64_t);
  }
  if (cfg_.target_output_length.has_value()) {
    block = static_cast<size_t>(std::min<uint64_t>(block, *cfg_.target_output_length));
  }
  buffer_.resize(block);
}

uint64_t EditSequenceGenerator::remaining_baseline() const noexcept {
  return cfg_.baseline_length - state_.cursor;
}

uint64_t EditSequenceGenerator::remaining_target() const noexcept {
  if (!cfg_.target_output_length.has_value()) {
    return kNoLimit;
  }
  const uint64_t target = *cfg_.target_output_length;
  return state_.bytes_emitted >= target ? 0 : target - state_.bytes_emitted;
}

bool EditSequenceGenerator::baseline_exhausted() const noexcept {
  return state_.cursor >= cfg_.baseline_length;
}

bool EditSequenceGenerator::finished() const noexcept {
  if (cfg_.target_output_length.has_value() && remaining_target() == 0) {
    return true;
  }
  if (baseline_exhausted()) {
    if (cycle_insert_pending_) {
      return false;
    }
    return !(cfg_.target_output_length.has_value() &&
             cfg_.on_exhaustion == ExhaustionPolicy::Pad);
  }
  return false;
}

uint64_t EditSequenceGenerator::cycle_mean(SegmentKind kind) const noexcept {
  switch (kind) {
    case SegmentKind::Copy:
      return lengths_.copy_mean;
    case SegmentKind::Insert:
      return lengths_.insert_mean;
    case SegmentKind::Delete:
      return lengths_.delete_mean;
  }
  return lengths_.copy_mean;
}

uint64_t EditSequenceGenerator::ratio_bound(SegmentKind kind) const noexcept {
  const double r = cfg_.target_duplication_ratio;
  const double s = kRatioSlack;
  const double e = static_cast<double>(state_.bytes_emitted);
  const double w = static_cast<double>(lengths_.copy_mean);
  // Signed distance of the copied bytes from the target share.
  const double d = static_cast<double>(state_.copy_bytes) - r * e;

  // Below the window the allowed distance is s * w; above it, s * emitted.
  double limit = std::numeric_limits<double>::infinity();
  if (kind == SegmentKind::Insert) {
    if (e < w) {
      const double inside = (d + s * w) / r;
      if (e + inside < w) {
        limit = inside;
      }
    }
    if (std::isinf(limit) && r > s) {
      limit = (d + s * e) / (r - s);
    }
  } else if (kind == SegmentKind::Copy) {
    if (e < w) {
      const double inside = (s * w - d) / (1.0 - r);
      if (e + inside < w) {
        limit = inside;
      }
    }
    if (std::isinf(limit) && r + s < 1.0) {
      limit = (s * e - d) / (1.0 - r - s);
    }
  }

  if (std::isinf(limit) || limit >= static_cast<double>(lengths_.max_segment)) {
    return kNoLimit;
  }
  if (limit < 1.0) {
    return 1;
  }
  return static_cast<uint64_t>(limit);
}

EditSequenceGenerator::Plan EditSequenceGenerator::plan_next() {
  if (baseline_exhausted() && !cycle_insert_pending_) {
    // Only reachable with a target under ExhaustionPolicy::Pad.
    Plan pad{};
    pad.kind = SegmentKind::Insert;
    pad.length = remaining_target();
    pad.sampled = pad.length;
    pad.padding = true;
    return pad;
  }

  Plan plan{};
  uint64_t mean = lengths_.copy_mean;
  if (cfg_.selector == SelectorPolicy::Cycle) {
    // Kinds with a zero mean are left out of the cycle. The copy mean is
    // never zero, so this ends.
    do {
      plan.kind = kCycleOrder[cycle_phase_];
      cycle_phase_ = (cycle_phase_ + 1) % kCycleOrder.size();
      mean = cycle_mean(plan.kind);
    } while (mean == 0);
    if (plan.kind == SegmentKind::Copy) {
      cycle_insert_pending_ = lengths_.insert_mean != 0;
    } else if (plan.kind == SegmentKind::Insert) {
      cycle_insert_pending_ = false;
    }
  } else {
    // The delete draw is taken on every step so the stream does not depend
    // on which branch was chosen previously.
    const double u = edit_rng_.next_unit();
    if (u < cfg_.delete_probability) {
      plan.kind = SegmentKind::Delete;
    } else if (state_.realized_ratio() < cfg_.target_duplication_ratio) {
      plan.kind = SegmentKind::Copy;
    } else {
      plan.kind = SegmentKind::Insert;
    }
  }
  plan.sampled = sample_length(edit_rng_, mean, lengths_.max_segment);
  plan.length = plan.sampled;
  if (cfg_.selector == SelectorPolicy::Balanced) {
    const uint64_t bound = ratio_bound(plan.kind);
    if (plan.length > bound) {
      plan.length = bound;
      plan.ratio_capped = true;
    }
  }
  return plan;
}

bool EditSequenceGenerator::step() {
  if (finished()) {
    return false;
  }
  apply_segment(plan_next());
  return true;
}

GenerationSummary EditSequenceGenerator::run(const std::atomic<bool>* stop) {
  bool cancelled = false;
  while (!finished()) {
    if (stop != nullptr && stop->load(std::memory_order_relaxed)) {
      cancelled = true;
      break;
    }
    step();
  }
  auto out = summary();
  out.cancelled = cancelled;
  return out;
}

uint64_t EditSequenceGenerator::apply(SegmentKind kind, uint64_t length) {
  Plan plan{};
  plan.kind = kind;
  plan.length = length;
  plan.sampled = length;
  return apply_segment(plan);
}

GenerationSummary EditSequenceGenerator::summary() const {
  GenerationSummary out{};
  out.state = state_;
  out.lengths = length_stats_;
  out.exhausted = baseline_exhausted();
  return out;
}

Error EditSequenceGenerator::annotate(const Error& cause) const {
  return Error{cause.code(), std::format("{} (after {} bytes emitted, cursor {})", cause.what(),
                                         state_.bytes_emitted, state_.cursor)};
}

void EditSequenceGenerator::fail(const Error& cause, SegmentKind kind, uint64_t partial) const {
  throw Error{cause.code(),
              std::format("{} segment failed after {} bytes emitted "
                          "(cursor {}, {} bytes into segment): {}",
                          segment_kind_name(kind), state_.bytes_emitted, state_.cursor,
                          partial, cause.what())};
}

void EditSequenceGenerator::emit_copy(uint64_t n) {
  uint64_t done = 0;
  try {
    while (done < n) {
      const auto chunk = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), n - done));
      const std::span<std::byte> block(buffer_.data(), chunk);
      baseline_.read_at(state_.cursor + done, block);
      sink_.append(block);
      done += chunk;
    }
  } catch (const Error& e) {
    fail(e, SegmentKind::Copy, done);
  }
}

void EditSequenceGenerator::emit_insert(uint64_t n) {
  uint64_t done = 0;
  try {
    while (done < n) {
      const auto chunk = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), n - done));
      const std::span<std::byte> block(buffer_.data(), chunk);
      data_rng_.fill(block);
      sink_.append(block);
      done += chunk;
    }
  } catch (const Error& e) {
    fail(e, SegmentKind::Insert, done);
  }
}

uint64_t EditSequenceGenerator::apply_segment(const Plan& plan) {
  const SegmentKind kind = plan.kind;
  const uint64_t length = plan.length;

  SegmentRecord rec{};
  rec.kind = kind;
  rec.sampled_length = plan.sampled;
  rec.baseline_offset = state_.cursor;
  rec.output_offset = state_.bytes_emitted;
  rec.padding = plan.padding;
  rec.ratio_capped = plan.ratio_capped;

  uint64_t n = 0;
  switch (kind) {
    case SegmentKind::Copy:
      n = std::min({length, remaining_baseline(), remaining_target()});
      emit_copy(n);
      state_.cursor += n;
      state_.bytes_emitted += n;
      state_.copy_bytes += n;
      break;
    case SegmentKind::Insert:
      n = std::min(length, remaining_target());
      emit_insert(n);
      state_.bytes_emitted += n;
      state_.insert_bytes += n;
      break;
    case SegmentKind::Delete:
      n = std::min(length, remaining_baseline());
      state_.cursor += n;
      state_.delete_bytes += n;
      break;
  }
  if (n == 0) {
    return 0;
  }

  const size_t k = kind_index(kind);
  ++state_.steps;
  ++state_.segments[k];
  length_stats_[k].add(n);

  rec.length = n;
  if (observer_ != nullptr) {
    try {
      observer_->on_segment(rec, state_);
    } catch (const Error& e) {
      throw annotate(e);
    }
  }
  return n;
}

}  // namespace dedupgen
