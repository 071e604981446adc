#include "dedupgen/probe/compressibility.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include "dedupgen/core/error.hpp"

namespace dedupgen {

ProbeReport probe_compressibility(IByteSource& source,
                                  const CodecParams& params,
                                  uint64_t sample_bytes,
                                  size_t block_size) {
  if (block_size == 0) {
    throw Error{ErrorCode::InvalidConfig, "probe block size must be > 0"};
  }

  ProbeReport out{};
  out.codec = params.id;

  const uint64_t total = source.length();
  const uint64_t wanted = std::min(sample_bytes, total);
  if (wanted == 0) {
    return out;
  }

  auto codec = make_codec(params);
  const auto block = static_cast<size_t>(std::min<uint64_t>(block_size, wanted));
  const uint64_t blocks = (wanted + block - 1) / block;
  const uint64_t total_blocks = total / block;
  // Distance between sampled block starts, in whole blocks.
  const uint64_t stride = total_blocks > blocks ? total_blocks / blocks : 1;

  std::vector<std::byte> raw(block);
  std::vector<std::byte> comp(codec->max_compressed_size(block));

  for (uint64_t i = 0; i < blocks; ++i) {
    const uint64_t offset = i * stride * block;
    if (offset >= total) {
      break;
    }
    const auto n = static_cast<size_t>(std::min<uint64_t>(block, total - offset));
    const std::span<std::byte> view(raw.data(), n);
    source.read_at(offset, view);
    out.compressed_bytes += codec->compress(view, comp);
    out.raw_bytes += n;
    ++out.blocks;
  }
  return out;
}

}  // namespace dedupgen
