#include "app/parse_utils.hpp"

#include <charconv>
#include <format>
#include <limits>
#include <string>

namespace dedupgen::app {

Expected<uint64_t> parse_size(std::string_view text) {
  if (text.empty()) {
    return std::unexpected(Error{ErrorCode::InvalidConfig, "empty size"});
  }
  uint64_t scale = 1;
  std::string_view digits = text;
  switch (text.back()) {
    case 'k':
    case 'K':
      scale = 1024ULL;
      break;
    case 'm':
    case 'M':
      scale = 1024ULL * 1024ULL;
      break;
    case 'g':
    case 'G':
      scale = 1024ULL * 1024ULL * 1024ULL;
      break;
    default:
      break;
  }
  if (scale != 1) {
    digits.remove_suffix(1);
  }

  uint64_t value = 0;
  const auto* first = digits.data();
  const auto* last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (digits.empty() || ec != std::errc{} || ptr != last) {
    return std::unexpected(Error{ErrorCode::InvalidConfig,
                            std::format("invalid size '{}'", std::string(text))});
  }
  if (value > std::numeric_limits<uint64_t>::max() / scale) {
    return std::unexpected(Error{ErrorCode::InvalidConfig,
                            std::format("size '{}' overflows 64 bits", std::string(text))});
  }
  return value * scale;
}

}  // namespace dedupgen::app
