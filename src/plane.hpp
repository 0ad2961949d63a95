#pragma once

#include <cstddef>

struct Complex {
    double re = 0.0;
    double im = 0.0;
};

struct ImageBounds {
    std::size_t width  = 0;
    std::size_t height = 0;
};

// Region of the complex plane mapped onto the image.
// upper_left.im >= lower_right.im (the command line rejects the opposite).
struct PlaneRect {
    Complex upper_left;
    Complex lower_right;
};

// Map pixel (x, y) to its point on the plane. The mapping is half-open:
// (0,0) lands exactly on upper_left, (w-1,h-1) one pixel short of
// lower_right. Image y grows downward while im decreases.
inline Complex pixel_to_point(const ImageBounds& bounds,
                              std::size_t x, std::size_t y,
                              const PlaneRect& rect)
{
    const double span_re = rect.lower_right.re - rect.upper_left.re;
    const double span_im = rect.upper_left.im - rect.lower_right.im;
    return Complex{
        rect.upper_left.re + static_cast<double>(x) * span_re / static_cast<double>(bounds.width),
        rect.upper_left.im - static_cast<double>(y) * span_im / static_cast<double>(bounds.height),
    };
}
