#pragma once

#include "cpu_renderer.hpp"
#include <cstdio>
#include <algorithm>
#include <vector>

inline int run_cli_benchmark()
{
    CpuRenderer renderer;

    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;
    PixelBuffer buf;
    buf.resize(W, H);

    RenderParams p;
    p.bounds           = ImageBounds{W, H};
    p.rect.upper_left  = Complex{-2.5,  1.25};
    p.rect.lower_right = Complex{ 1.0, -1.25};

    struct TestCase {
        const char* label;
        int         threads;   // 0 = all hardware threads
    };

    const TestCase tests[] = {
        {"Mandelbrot, 1 thread",     1},
        {"Mandelbrot, all threads",  0},
    };

    printf("mandelpng CLI Benchmark\n");
    printf("%dx%d, %d iter, %d runs (avg best %d)\n", W, H, p.max_iter, RUNS, BEST_N);
    printf("Hardware threads: %d\n\n", renderer.hw_concurrency);
    printf("%-30s %-10s %s\n", "Label", "Threads", "Mpix/s");
    printf("------------------------------------------------\n");

    for (const auto& t : tests) {
        renderer.set_thread_count(t.threads);

        // Warm-up
        renderer.render(p, buf);

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r) {
            renderer.render(p, buf);
            times[r] = renderer.last_render_ms;
        }
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms /= BEST_N;
        double mpixs = (W * H) / (avg_ms * 1000.0);

        printf("%-30s %-10d %6.2f\n", t.label, renderer.thread_count, mpixs);
    }
    return 0;
}
