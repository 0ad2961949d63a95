#pragma once

#include "renderer.hpp"
#include "thread_pool.hpp"

#include <memory>

class CpuRenderer : public IFractalRenderer {
public:
    CpuRenderer();
    explicit CpuRenderer(int n_threads);

    // Throws std::logic_error if buf does not hold exactly
    // params.bounds.width * params.bounds.height pixels.
    void render(const RenderParams& params, PixelBuffer& buf) override;

    double last_render_ms = 0.0;
    int    thread_count   = 0;
    int    hw_concurrency = 0;       // logical CPU count detected at startup

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

private:
    void render_tile(const RenderParams& params, PixelBuffer& buf,
                     int tx, int ty, int tw, int th) const;

    std::unique_ptr<ThreadPool> pool;
};
