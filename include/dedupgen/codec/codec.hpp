#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace dedupgen {

enum class CodecId : uint8_t { None = 0, Lz4 = 1, Zstd = 2 };

const char* codec_name(CodecId id) noexcept;

struct CodecParams {
  CodecId id{CodecId::None};
  int level{1};
};

class ICodec {
 public:
  virtual ~ICodec() = default;

  virtual CodecId id() const noexcept = 0;
  virtual const char* name() const noexcept = 0;

  virtual size_t max_compressed_size(size_t raw_size) const = 0;

  // Returns the compressed size. Throws Error{CodecError} on failure.
  virtual size_t compress(std::span<const std::byte> raw, std::span<std::byte> out) = 0;
};

std::unique_ptr<ICodec> make_codec(const CodecParams& params);

}  // namespace dedupgen
