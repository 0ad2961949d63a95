#include "cli.hpp"
#include "cli_benchmark.hpp"
#include "cpu_renderer.hpp"
#include "export.hpp"
#include "renderer.hpp"

#include <cstdio>
#include <exception>
#include <string>

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    const char* argv0 = argc > 0 ? argv[0] : "mandelpng";

    CliArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const CliError& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        if (e.usage_error)
            print_usage(stderr, argv0);
        return 1;
    }

    if (args.show_help) {
        print_usage(stdout, argv0);
        return 0;
    }

    try {
        if (args.bench)
            return run_cli_benchmark();

        const RenderParams& p = args.params;
        PixelBuffer pbuf;
        pbuf.resize(static_cast<int>(p.bounds.width), static_cast<int>(p.bounds.height));

        CpuRenderer renderer(args.threads);
        renderer.render(p, pbuf);
        if (args.verbose)
            fprintf(stderr, "Rendered %dx%d in %.1f ms on %d thread(s)\n",
                    pbuf.width, pbuf.height, renderer.last_render_ms,
                    renderer.thread_count);

        const std::string err = export_image(args.out_path, pbuf);
        if (!err.empty()) {
            fprintf(stderr, "Error: %s\n", err.c_str());
            return 1;
        }
        if (args.verbose)
            fprintf(stderr, "Wrote %s\n", args.out_path.c_str());
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
