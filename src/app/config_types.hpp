#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "dedupgen/codec/codec.hpp"
#include "dedupgen/core/types.hpp"

namespace dedupgen::app {

enum class Mode { Baseline, Derive };

struct Config {
  Mode mode{Mode::Derive};

  std::filesystem::path input{};
  std::filesystem::path output{};
  std::optional<std::filesystem::path> manifest{};
  std::optional<std::filesystem::path> json_output{};

  // Required for baseline mode; checked against the input size in derive mode.
  std::optional<uint64_t> baseline_length{};
  GeneratorConfig generator{};

  CodecId probe{CodecId::None};
  bool probe_enabled{false};
  int zstd_level{1};
  uint64_t probe_bytes{64ULL * 1024ULL * 1024ULL};

  bool sync{false};
  bool quiet{false};
};

}  // namespace dedupgen::app
