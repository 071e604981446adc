#include "dedupgen/codec/codec.hpp"

#include <cstring>
#include <limits>
#include <new>
#include <string>

#include <lz4.h>
#include <zstd.h>

#include "dedupgen/core/error.hpp"

namespace dedupgen {

const char* codec_name(CodecId id) noexcept {
  switch (id) {
    case CodecId::None:
      return "none";
    case CodecId::Lz4:
      return "lz4";
    case CodecId::Zstd:
      return "zstd";
  }
  return "unknown";
}

namespace {

constexpr size_t kLz4MaxInputSize = static_cast<size_t>(LZ4_MAX_INPUT_SIZE);

class RuntimeCodec final : public ICodec {
 public:
  explicit RuntimeCodec(CodecParams params) : id_(params.id), zstd_level_(params.level) {
    if (id_ == CodecId::Zstd) {
      zstd_cctx_ = ZSTD_createCCtx();
      if (zstd_cctx_ == nullptr) {
        throw std::bad_alloc();
      }
    }
  }

  ~RuntimeCodec() override {
    if (zstd_cctx_ != nullptr) {
      ZSTD_freeCCtx(zstd_cctx_);
    }
  }

  RuntimeCodec(const RuntimeCodec&) = delete;
  RuntimeCodec& operator=(const RuntimeCodec&) = delete;

  CodecId id() const noexcept override { return id_; }
  const char* name() const noexcept override { return codec_name(id_); }

  size_t max_compressed_size(size_t raw_size) const override {
    switch (id_) {
      case CodecId::None:
        return raw_size;
      case CodecId::Lz4:
        if (raw_size > kLz4MaxInputSize) {
          throw Error{ErrorCode::CodecError, "lz4 raw_size exceeds LZ4_MAX_INPUT_SIZE"};
        }
        return static_cast<size_t>(LZ4_compressBound(static_cast<int>(raw_size)));
      case CodecId::Zstd:
        return ZSTD_compressBound(raw_size);
    }
    throw Error{ErrorCode::Unsupported, "unknown codec"};
  }

  size_t compress(std::span<const std::byte> raw, std::span<std::byte> out) override {
    switch (id_) {
      case CodecId::None:
        if (out.size() < raw.size()) {
          throw Error{ErrorCode::CodecError, "output buffer too small"};
        }
        std::memcpy(out.data(), raw.data(), raw.size());
        return raw.size();
      case CodecId::Lz4: {
        if (raw.size() > kLz4MaxInputSize ||
            out.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
          throw Error{ErrorCode::CodecError, "lz4 input/output buffer too large"};
        }
        const int n = LZ4_compress_default(reinterpret_cast<const char*>(raw.data()),
                                           reinterpret_cast<char*>(out.data()),
                                           static_cast<int>(raw.size()),
                                           static_cast<int>(out.size()));
        if (n <= 0) {
          throw Error{ErrorCode::CodecError, "lz4 compress failed"};
        }
        return static_cast<size_t>(n);
      }
      case CodecId::Zstd: {
        const size_t n = ZSTD_compressCCtx(zstd_cctx_, out.data(), out.size(), raw.data(),
                                           raw.size(), zstd_level_);
        if (ZSTD_isError(n)) {
          throw Error{ErrorCode::CodecError,
                      std::string("zstd compress failed: ") + ZSTD_getErrorName(n)};
        }
        return n;
      }
    }
    throw Error{ErrorCode::Unsupported, "unknown codec"};
  }

 private:
  CodecId id_;
  int zstd_level_;
  ZSTD_CCtx* zstd_cctx_{nullptr};
};

}  // namespace

std::unique_ptr<ICodec> make_codec(const CodecParams& params) {
  if (params.id != CodecId::None && params.id != CodecId::Lz4 && params.id != CodecId::Zstd) {
    throw Error{ErrorCode::Unsupported, "invalid codec id"};
  }
  return std::make_unique<RuntimeCodec>(params);
}

}  // namespace dedupgen
