#pragma once

#include <expected>

#include "dedupgen/core/error.hpp"

namespace dedupgen {

template <class T>
using Expected = std::expected<T, Error>;

}  // namespace dedupgen
