#pragma once

#include "sr/options.hpp"

namespace sr {

void print_usage(const char *prog);

enum class ParseStatus { Ok, Help, Error };

// Fills opt from argv. Problems are reported with std::println.
ParseStatus parse_args(int argc, char **argv, Options &opt);

} // namespace sr
