#pragma once

#include <cstddef>
#include <cstdint>

#include "dedupgen/codec/codec.hpp"
#include "dedupgen/source/byte_source.hpp"

namespace dedupgen {

struct ProbeReport {
  CodecId codec{CodecId::None};
  uint64_t blocks{0};
  uint64_t raw_bytes{0};
  uint64_t compressed_bytes{0};

  // raw / compressed; 0 when nothing was sampled.
  double ratio() const noexcept {
    return compressed_bytes == 0
               ? 0.0
               : static_cast<double>(raw_bytes) / static_cast<double>(compressed_bytes);
  }
};

// Compresses up to `sample_bytes` of `source`, taken as evenly spaced blocks of
// `block_size` bytes, each block compressed independently.
ProbeReport probe_compressibility(IByteSource& source,
                                  const CodecParams& params,
                                  uint64_t sample_bytes,
                                  size_t block_size);

}  // namespace dedupgen
