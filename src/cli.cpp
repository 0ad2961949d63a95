#include "cli.hpp"
#include "parse.hpp"

#include <climits>
#include <cmath>
#include <cstdio>
#include <string_view>
#include <vector>

void print_usage(std::FILE* out, const char* argv0)
{
    std::fprintf(out,
        "Usage: %s [--threads N] [--verbose] <image file> <WIDTHxHEIGHT> <UPPER_LEFT> <LOWER_RIGHT>\n"
        "       %s --bench\n"
        "Example: %s mandel.png 800x600 -1.20,0.35 -1,0.20\n"
        "\n"
        "  <image file>    output path; a .jxl extension selects JPEG XL, anything else PNG\n"
        "  <UPPER_LEFT>    RE,IM of the top-left corner\n"
        "  <LOWER_RIGHT>   RE,IM of the bottom-right corner (IM not above UPPER_LEFT's)\n"
        "  --threads N     worker threads, 0 = one per logical CPU (default)\n"
        "  --verbose       report render time on stderr\n"
        "  --bench         time a fixed 1920x1080 render and exit\n",
        argv0, argv0, argv0);
}

static ImageBounds parse_bounds(std::string_view s)
{
    const auto dims = parse_pair<std::size_t>(s, 'x');
    if (!dims)
        throw CliError("failed to parse image size '" + std::string(s)
                       + "', expected WIDTHxHEIGHT", false);

    const auto [w, h] = *dims;
    if (w == 0 || h == 0)
        throw CliError("image width and height must be at least 1", false);
    if (w > static_cast<std::size_t>(INT_MAX) || h > static_cast<std::size_t>(INT_MAX)
        || w > MAX_PIXELS / h)
        throw CliError("image size " + std::string(s) + " is too large", false);
    return ImageBounds{w, h};
}

static Complex parse_corner(std::string_view s, const char* which)
{
    const auto c = parse_complex(s);
    if (!c)
        throw CliError(std::string("failed to parse ") + which + " '"
                       + std::string(s) + "', expected RE,IM", false);
    if (!std::isfinite(c->re) || !std::isfinite(c->im))
        throw CliError(std::string(which) + " must be finite", false);
    return *c;
}

CliArgs parse_args(int argc, const char* const* argv)
{
    CliArgs a;
    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string_view cur = argv[i];

        if (cur == "--help" || cur == "-h") {
            a.show_help = true;
            return a;
        }
        if (cur == "--bench") {
            a.bench = true;
            continue;
        }
        if (cur == "--verbose" || cur == "-v") {
            a.verbose = true;
            continue;
        }
        if (cur == "--threads") {
            if (i + 1 >= argc)
                throw CliError("--threads needs a value", true);
            const auto n = parse_number<int>(argv[++i]);
            if (!n || *n < 0)
                throw CliError("--threads must be a non-negative integer", false);
            a.threads = *n;
            continue;
        }
        // Negative real parts ("-1,0.2") are positionals, not options.
        if (cur.size() > 1 && cur[0] == '-' && cur[1] == '-')
            throw CliError("unknown option: " + std::string(cur), true);
        positional.push_back(cur);
    }

    if (a.bench) {
        if (!positional.empty())
            throw CliError("--bench takes no positional arguments", true);
        return a;
    }

    if (positional.size() != 4)
        throw CliError("expected 4 arguments, got " + std::to_string(positional.size()), true);

    a.out_path                = std::string(positional[0]);
    a.params.bounds           = parse_bounds(positional[1]);
    a.params.rect.upper_left  = parse_corner(positional[2], "upper left");
    a.params.rect.lower_right = parse_corner(positional[3], "lower right");

    if (a.out_path.empty())
        throw CliError("output path is empty", false);
    if (a.params.rect.upper_left.im < a.params.rect.lower_right.im)
        throw CliError("upper left imaginary part must not be below lower right's", false);
    return a;
}
