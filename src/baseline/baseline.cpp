#include "dedupgen/baseline/baseline.hpp"

#include <algorithm>
#include <format>
#include <span>
#include <vector>

#include "dedupgen/core/error.hpp"

namespace dedupgen {

BaselineResult stream_source(IByteSource& source,
                             IByteSink& sink,
                             size_t io_block_size,
                             const std::atomic<bool>* stop) {
  if (io_block_size == 0) {
    throw Error{ErrorCode::InvalidConfig, "io_block_size must be > 0"};
  }
  const uint64_t total = source.length();
  std::vector<std::byte> buffer(static_cast<size_t>(std::min<uint64_t>(io_block_size, total)));

  BaselineResult out{};
  while (out.bytes_written < total) {
    if (stop != nullptr && stop->load(std::memory_order_relaxed)) {
      out.cancelled = true;
      break;
    }
    const auto chunk =
        static_cast<size_t>(std::min<uint64_t>(buffer.size(), total - out.bytes_written));
    const std::span<std::byte> block(buffer.data(), chunk);
    try {
      source.read_at(out.bytes_written, block);
      sink.append(block);
    } catch (const Error& e) {
      throw Error{e.code(), std::format("baseline write failed after {} of {} bytes: {}",
                                        out.bytes_written, total, e.what())};
    }
    out.bytes_written += chunk;
  }
  return out;
}

BaselineResult write_baseline(const BaselineConfig& cfg,
                              IByteSink& sink,
                              const std::atomic<bool>* stop) {
  auto source = make_procedural_source(cfg.length, cfg.seed);
  return stream_source(*source, sink, cfg.io_block_size, stop);
}

}  // namespace dedupgen
