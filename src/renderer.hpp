#pragma once

#include "fractal.hpp"
#include "palette.hpp"
#include "plane.hpp"

#include <cstdint>
#include <vector>

// Pixel buffer: width * height Rgb8 values, row-major, no row padding.
struct PixelBuffer {
    std::vector<Rgb8> pixels;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h), Rgb8{});
    }

    Rgb8& at(int x, int y) { return pixels[static_cast<size_t>(y) * width + x]; }
    const Rgb8& at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }

    // Serialize row y as r,g,b bytes into out (3 * width bytes).
    void row_bytes(int y, uint8_t* out) const
    {
        const Rgb8* row = pixels.data() + static_cast<size_t>(y) * width;
        for (int x = 0; x < width; ++x) {
            *out++ = row[x].r;
            *out++ = row[x].g;
            *out++ = row[x].b;
        }
    }

    // Whole image as one contiguous RGB8 byte sequence.
    std::vector<uint8_t> to_bytes() const
    {
        std::vector<uint8_t> bytes(pixels.size() * 3);
        for (int y = 0; y < height; ++y)
            row_bytes(y, bytes.data() + static_cast<size_t>(y) * width * 3);
        return bytes;
    }
};

struct RenderParams {
    ImageBounds bounds;
    PlaneRect   rect;
    int         max_iter = MAX_ITER;
};

class IFractalRenderer {
public:
    virtual ~IFractalRenderer() = default;
    virtual void render(const RenderParams& params, PixelBuffer& buf) = 0;
};
