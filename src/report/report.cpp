#include "dedupgen/report/report.hpp"

#include <format>
#include <iomanip>
#include <sstream>

#include "dedupgen/core/error.hpp"

namespace dedupgen {
namespace {

std::string stats_json(const RunningStats& s) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(3) << "{\"count\":" << s.count << ",\"sum\":" << s.sum
     << ",\"mean\":" << s.mean << ",\"stddev\":" << s.stddev() << ",\"min\":" << s.min
     << ",\"max\":" << s.max << "}";
  return os.str();
}

}  // namespace

std::string format_digest(uint64_t digest) {
  return std::format("{:016x}", digest);
}

double to_mibps(uint64_t bytes, double sec) {
  if (sec <= 0.0) {
    return 0.0;
  }
  return static_cast<double>(bytes) / sec / (1024.0 * 1024.0);
}

std::string format_summary_line(const GenerationSummary& s, const RunInfo& info) {
  const auto& st = s.state;
  std::ostringstream os;
  os << "derive emitted=" << st.bytes_emitted << " copy=" << st.copy_bytes
     << " insert=" << st.insert_bytes << " delete=" << st.delete_bytes
     << " baseline_read=" << st.cursor << " dup_ratio=" << std::fixed << std::setprecision(4)
     << st.realized_ratio() << " segments=" << st.steps << " wall_sec=" << std::setprecision(3)
     << info.wall_sec << " MiBps=" << to_mibps(st.bytes_emitted, info.wall_sec);
  if (info.output_digest.has_value()) {
    os << " xxh64=" << format_digest(*info.output_digest);
  }
  if (s.cancelled) {
    os << " cancelled=1";
  }
  return os.str();
}

std::string format_length_stats(const GenerationSummary& s) {
  std::string out;
  for (const auto kind : {SegmentKind::Copy, SegmentKind::Insert, SegmentKind::Delete}) {
    const auto& ls = s.lengths[kind_index(kind)];
    out += std::format("  {:<6} n={} mean={:.1f} stddev={:.1f} min={} max={}\n",
                       segment_kind_name(kind), ls.count, ls.mean, ls.stddev(), ls.min, ls.max);
  }
  return out;
}

std::string summary_json(const GeneratorConfig& cfg,
                         const GenerationSummary& s,
                         const RunInfo& info) {
  const auto& st = s.state;
  const auto lengths = resolve_lengths(cfg);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);
  out << "{\n";
  out << "  \"config\": {\"baseline_length\": " << cfg.baseline_length
      << ", \"mean_segment_length\": " << cfg.mean_segment_length
      << ", \"insert_mean_length\": " << lengths.insert_mean
      << ", \"delete_mean_length\": " << lengths.delete_mean
      << ", \"max_segment_length\": " << lengths.max_segment
      << ", \"target_duplication_ratio\": " << cfg.target_duplication_ratio
      << ", \"delete_probability\": " << cfg.delete_probability << ", \"target_output_length\": ";
  if (cfg.target_output_length.has_value()) {
    out << *cfg.target_output_length;
  } else {
    out << "null";
  }
  out << ", \"seed\": " << cfg.seed << ", \"selector\": \"" << selector_policy_name(cfg.selector)
      << "\", \"on_exhaustion\": \"" << exhaustion_policy_name(cfg.on_exhaustion) << "\"},\n";
  out << "  \"result\": {\n";
  out << "    \"bytes_emitted\": " << st.bytes_emitted << ",\n";
  out << "    \"copy_bytes\": " << st.copy_bytes << ",\n";
  out << "    \"insert_bytes\": " << st.insert_bytes << ",\n";
  out << "    \"delete_bytes\": " << st.delete_bytes << ",\n";
  out << "    \"baseline_read\": " << st.cursor << ",\n";
  out << "    \"duplication_ratio\": " << st.realized_ratio() << ",\n";
  out << "    \"segments\": {\"copy\": " << st.segments[kind_index(SegmentKind::Copy)]
      << ", \"insert\": " << st.segments[kind_index(SegmentKind::Insert)]
      << ", \"delete\": " << st.segments[kind_index(SegmentKind::Delete)] << "},\n";
  out << "    \"lengths\": {\"copy\": " << stats_json(s.lengths[kind_index(SegmentKind::Copy)])
      << ", \"insert\": " << stats_json(s.lengths[kind_index(SegmentKind::Insert)])
      << ", \"delete\": " << stats_json(s.lengths[kind_index(SegmentKind::Delete)]) << "},\n";
  out << "    \"baseline_exhausted\": " << (s.exhausted ? "true" : "false") << ",\n";
  out << "    \"cancelled\": " << (s.cancelled ? "true" : "false") << ",\n";
  out << "    \"wall_sec\": " << info.wall_sec << ",\n";
  out << "    \"output_xxh64\": ";
  if (info.output_digest.has_value()) {
    out << "\"" << format_digest(*info.output_digest) << "\"";
  } else {
    out << "null";
  }
  out << "\n  }\n";
  out << "}\n";
  return out.str();
}

void write_summary_json(const std::filesystem::path& path,
                        const GeneratorConfig& cfg,
                        const GenerationSummary& s,
                        const RunInfo& info) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw Error{ErrorCode::SinkWrite,
                std::format("failed to open JSON output path: {}", path.string())};
  }
  out << summary_json(cfg, s, info);
  out.close();
  if (!out) {
    throw Error{ErrorCode::SinkWrite,
                std::format("failed to write JSON summary: {}", path.string())};
  }
}

ManifestWriter::ManifestWriter(const std::filesystem::path& path)
    : path_(path), out_(path, std::ios::trunc) {
  if (!out_.is_open()) {
    throw Error{ErrorCode::SinkWrite,
                std::format("failed to open manifest path: {}", path.string())};
  }
  out_ << "kind,output_offset,baseline_offset,length,padding,capped\n";
}

void ManifestWriter::on_segment(const SegmentRecord& rec, const GeneratorState&) {
  out_ << segment_kind_name(rec.kind) << ',' << rec.output_offset << ',' << rec.baseline_offset
       << ',' << rec.length << ',' << (rec.padding ? 1 : 0) << ',' << (rec.ratio_capped ? 1 : 0)
       << '\n';
  if (!out_) {
    throw Error{ErrorCode::SinkWrite,
                std::format("failed to write manifest: {}", path_.string())};
  }
}

void ManifestWriter::close() {
  if (!out_.is_open()) {
    return;
  }
  out_.close();
  if (!out_) {
    throw Error{ErrorCode::SinkWrite,
                std::format("failed to close manifest: {}", path_.string())};
  }
}

}  // namespace dedupgen
