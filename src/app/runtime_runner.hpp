#pragma once

#include "app/config_types.hpp"
#include "dedupgen/core/expected.hpp"

int run_cli_impl(int argc, char** argv);

namespace dedupgen::app {

Expected<Config> parse_args(int argc, char** argv);

}  // namespace dedupgen::app
