#pragma once

#include <cstdint>
#include <string_view>

#include "dedupgen/core/expected.hpp"

namespace dedupgen::app {

// Parses a byte count with an optional k/m/g suffix (powers of 1024).
Expected<uint64_t> parse_size(std::string_view text);

}  // namespace dedupgen::app
