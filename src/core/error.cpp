#include "dedupgen/core/error.hpp"

namespace dedupgen {

const char *error_code_name(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::InvalidConfig:
    return "invalid_config";
  case ErrorCode::SourceError:
    return "source_error";
  case ErrorCode::SinkWrite:
    return "sink_write";
  case ErrorCode::CodecError:
    return "codec_error";
  case ErrorCode::Unsupported:
    return "unsupported";
  case ErrorCode::Internal:
    return "internal";
  }
  return "unknown";
}

} // namespace dedupgen
