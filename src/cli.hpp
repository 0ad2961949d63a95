#pragma once

#include "renderer.hpp"

#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <string>

// Largest image the command line accepts (width * height).
static constexpr std::size_t MAX_PIXELS = std::size_t{1} << 28;

struct CliArgs {
    std::string  out_path;
    RenderParams params;
    int          threads   = 0;      // 0 = one per logical CPU
    bool         verbose   = false;
    bool         bench     = false;
    bool         show_help = false;
};

// Raised for malformed invocations. usage_error is set when the shape of the
// command line is wrong (as opposed to a value that failed to parse), in
// which case the caller should print the usage text too.
class CliError : public std::runtime_error {
public:
    CliError(const std::string& msg, bool usage_error)
        : std::runtime_error(msg), usage_error(usage_error) {}

    bool usage_error;
};

// Throws CliError.
CliArgs parse_args(int argc, const char* const* argv);

void print_usage(std::FILE* out, const char* argv0);
