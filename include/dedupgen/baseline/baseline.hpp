#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "dedupgen/core/types.hpp"
#include "dedupgen/sink/byte_sink.hpp"
#include "dedupgen/source/byte_source.hpp"

namespace dedupgen {

struct BaselineConfig {
  uint64_t length{0};
  uint64_t seed{1};
  size_t io_block_size{kDefaultIoBlockSize};
};

struct BaselineResult {
  uint64_t bytes_written{0};
  bool cancelled{false};
};

// Streams `source` into `sink` block by block, checking `stop` between blocks.
BaselineResult stream_source(IByteSource& source,
                             IByteSink& sink,
                             size_t io_block_size,
                             const std::atomic<bool>* stop = nullptr);

// Writes cfg.length seeded random bytes, identical to what
// make_procedural_source(cfg.length, cfg.seed) exposes.
BaselineResult write_baseline(const BaselineConfig& cfg,
                              IByteSink& sink,
                              const std::atomic<bool>* stop = nullptr);

}  // namespace dedupgen
