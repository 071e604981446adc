#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include "dedupgen/core/types.hpp"
#include "dedupgen/generator/edit_generator.hpp"

namespace dedupgen {

struct RunInfo {
  double wall_sec{0.0};
  std::optional<uint64_t> output_digest{};
};

double to_mibps(uint64_t bytes, double sec);

// 16 lowercase hex digits.
std::string format_digest(uint64_t digest);

// One line: "derive emitted=... copy=... insert=... delete=... dup_ratio=...".
std::string format_summary_line(const GenerationSummary& s, const RunInfo& info);

// One line per segment kind: count, mean, stddev, min, max of applied lengths.
std::string format_length_stats(const GenerationSummary& s);

std::string summary_json(const GeneratorConfig& cfg,
                         const GenerationSummary& s,
                         const RunInfo& info);

// Throws Error{SinkWrite} if the file cannot be written.
void write_summary_json(const std::filesystem::path& path,
                        const GeneratorConfig& cfg,
                        const GenerationSummary& s,
                        const RunInfo& info);

// Streams one CSV line per applied segment:
//   kind,output_offset,baseline_offset,length,padding,capped
class ManifestWriter final : public ISegmentObserver {
 public:
  explicit ManifestWriter(const std::filesystem::path& path);

  void on_segment(const SegmentRecord& rec, const GeneratorState& state) override;

  // Flushes and closes; throws Error{SinkWrite} if any line failed to write.
  void close();

 private:
  std::filesystem::path path_;
  std::ofstream out_;
};

}  // namespace dedupgen
