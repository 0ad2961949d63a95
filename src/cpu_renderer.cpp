#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include "palette.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

static int detect_hw_concurrency()
{
    int n = static_cast<int>(std::thread::hardware_concurrency());
    return n < 1 ? 4 : n;
}

// -----------------------------------------------------------------------
// Constructors: build thread pool
// -----------------------------------------------------------------------
CpuRenderer::CpuRenderer()
    : CpuRenderer(0)
{
}

CpuRenderer::CpuRenderer(int n_threads)
{
    hw_concurrency = detect_hw_concurrency();
    set_thread_count(n_threads);
}

void CpuRenderer::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    pool = std::make_unique<ThreadPool>(n);
    thread_count = n;
}

// -----------------------------------------------------------------------
// Tile renderer: called from thread pool workers. Tiles never overlap, so
// each pixel is written by exactly one task.
// -----------------------------------------------------------------------
void CpuRenderer::render_tile(const RenderParams& p, PixelBuffer& buf,
                               int tx, int ty, int tw, int th) const
{
    const int W = buf.width;
    const int H = buf.height;

    for (int py = ty; py < ty + th && py < H; ++py) {
        Rgb8*     row = buf.pixels.data() + static_cast<size_t>(py) * W;
        const int end = std::min(tx + tw, W);
        for (int px = tx; px < end; ++px) {
            const Complex c = pixel_to_point(p.bounds, px, py, p.rect);
            row[px] = band_color(mandelbrot_iter(c, p.max_iter), p.max_iter);
        }
    }
}

// -----------------------------------------------------------------------
// Top-level render: splits image into tiles and dispatches to thread pool
// -----------------------------------------------------------------------
void CpuRenderer::render(const RenderParams& p, PixelBuffer& buf)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    const size_t expected = p.bounds.width * p.bounds.height;
    if (buf.pixels.size() != expected
        || static_cast<size_t>(buf.width)  != p.bounds.width
        || static_cast<size_t>(buf.height) != p.bounds.height) {
        throw std::logic_error(
            "pixel buffer holds " + std::to_string(buf.pixels.size())
            + " pixels, render needs " + std::to_string(p.bounds.width)
            + "x" + std::to_string(p.bounds.height));
    }

    const int W = buf.width, H = buf.height;
    if (W <= 0 || H <= 0) return;

    constexpr int TILE_W = 64;
    constexpr int TILE_H = 64;

    for (int ty = 0; ty < H; ty += TILE_H) {
        for (int tx = 0; tx < W; tx += TILE_W) {
            const int tw = std::min(TILE_W, W - tx);
            const int th = std::min(TILE_H, H - ty);
            pool->submit([this, &p, &buf, tx, ty, tw, th] {
                render_tile(p, buf, tx, ty, tw, th);
            });
        }
    }
    pool->wait();

    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
}
