#include "dedupgen/core/types.hpp"

#include <algorithm>
#include <cmath>

namespace dedupgen {

const char* segment_kind_name(SegmentKind kind) noexcept {
  switch (kind) {
    case SegmentKind::Copy:
      return "copy";
    case SegmentKind::Insert:
      return "insert";
    case SegmentKind::Delete:
      return "delete";
  }
  return "unknown";
}

const char* selector_policy_name(SelectorPolicy policy) noexcept {
  switch (policy) {
    case SelectorPolicy::Balanced:
      return "balanced";
    case SelectorPolicy::Cycle:
      return "cycle";
  }
  return "unknown";
}

const char* exhaustion_policy_name(ExhaustionPolicy policy) noexcept {
  switch (policy) {
    case ExhaustionPolicy::Pad:
      return "pad";
    case ExhaustionPolicy::Stop:
      return "stop";
  }
  return "unknown";
}

void RunningStats::add(uint64_t value) noexcept {
  if (count == 0) {
    min = value;
    max = value;
  } else {
    min = std::min(min, value);
    max = std::max(max, value);
  }
  ++count;
  sum += value;
  const double x = static_cast<double>(value);
  const double delta = x - mean;
  mean += delta / static_cast<double>(count);
  m2 += delta * (x - mean);
}

double RunningStats::stddev() const noexcept {
  if (count < 2) {
    return 0.0;
  }
  return std::sqrt(m2 / static_cast<double>(count - 1));
}

}  // namespace dedupgen
