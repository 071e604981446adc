#include <cstddef>
#include <cstdint>
#include <format>
#include <iostream>
#include <vector>

#include "dedupgen/codec/codec.hpp"
#include "dedupgen/core/error.hpp"
#include "dedupgen/probe/compressibility.hpp"
#include "dedupgen/source/byte_source.hpp"

namespace {

constexpr uint64_t kSourceLength = 8ULL * 1024 * 1024;
constexpr size_t kBlock = 128 * 1024;

bool test_random_baseline_is_incompressible() {
  auto source = dedupgen::make_procedural_source(kSourceLength, 11);
  for (const auto id : {dedupgen::CodecId::Lz4, dedupgen::CodecId::Zstd}) {
    dedupgen::CodecParams params{};
    params.id = id;
    params.level = 3;
    const auto report = dedupgen::probe_compressibility(*source, params, 2ULL << 20, kBlock);
    if (report.blocks != 16 || report.raw_bytes != 2ULL << 20) {
      std::cerr << std::format("{} probe sampled {} blocks, {} bytes\n",
                               dedupgen::codec_name(id), report.blocks, report.raw_bytes);
      return false;
    }
    if (report.ratio() > 1.01) {
      std::cerr << std::format("{} compressed random data by {:.3f}x\n",
                               dedupgen::codec_name(id), report.ratio());
      return false;
    }
  }
  return true;
}

bool test_zeros_compress_well() {
  auto source = dedupgen::make_memory_source(std::vector<std::byte>(1 << 20));
  for (const auto id : {dedupgen::CodecId::Lz4, dedupgen::CodecId::Zstd}) {
    dedupgen::CodecParams params{};
    params.id = id;
    const auto report = dedupgen::probe_compressibility(*source, params, 1 << 20, 64 * 1024);
    if (report.ratio() < 10.0) {
      std::cerr << std::format("{} ratio on zeros only {:.3f}\n", dedupgen::codec_name(id),
                               report.ratio());
      return false;
    }
  }
  return true;
}

bool test_none_codec_and_empty_source() {
  auto source = dedupgen::make_procedural_source(1 << 20, 2);
  const auto report = dedupgen::probe_compressibility(*source, dedupgen::CodecParams{}, 1 << 20,
                                                      kBlock);
  if (report.raw_bytes != report.compressed_bytes || report.ratio() != 1.0) {
    std::cerr << std::format("none codec should report ratio 1, got {:.3f}\n", report.ratio());
    return false;
  }

  auto empty = dedupgen::make_memory_source({});
  const auto none = dedupgen::probe_compressibility(*empty, dedupgen::CodecParams{}, 1 << 20,
                                                    kBlock);
  if (none.blocks != 0 || none.ratio() != 0.0) {
    std::cerr << std::format("empty source should sample nothing\n");
    return false;
  }

  bool rejected = false;
  try {
    static_cast<void>(
        dedupgen::probe_compressibility(*source, dedupgen::CodecParams{}, 1 << 20, 0));
  } catch (const dedupgen::Error &e) {
    rejected = (e.code() == dedupgen::ErrorCode::InvalidConfig);
  }
  if (!rejected) {
    std::cerr << std::format("zero probe block size should be rejected\n");
    return false;
  }
  return true;
}

bool test_codec_small_buffer_error() {
  auto codec = dedupgen::make_codec(dedupgen::CodecParams{});
  std::vector<std::byte> raw(16);
  std::vector<std::byte> out(4);
  bool failed = false;
  try {
    static_cast<void>(codec->compress(raw, out));
  } catch (const dedupgen::Error &e) {
    failed = (e.code() == dedupgen::ErrorCode::CodecError);
  }
  if (!failed) {
    std::cerr << std::format("expected CodecError for too-small output buffer\n");
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_random_baseline_is_incompressible()) {
    return 1;
  }
  if (!test_zeros_compress_well()) {
    return 1;
  }
  if (!test_none_codec_and_empty_source()) {
    return 1;
  }
  if (!test_codec_small_buffer_error()) {
    return 1;
  }
  return 0;
}
