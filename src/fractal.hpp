#pragma once

#include "plane.hpp"

// Iteration limit used by the renderer. The band colors in palette.hpp
// assume it stays at or below 255.
static constexpr int    MAX_ITER         = 255;
static constexpr double ESCAPE_RADIUS_SQ = 4.0;
static_assert(MAX_ITER <= 255, "band colors are defined for escape counts up to 255");

// Returns the iteration at which |z|^2 first exceeds ESCAPE_RADIUS_SQ,
// in [0, max_iter), or max_iter for points that never escape.
inline int mandelbrot_iter(double re, double im, int max_iter)
{
    double zr = 0.0, zi = 0.0;
    for (int i = 0; i < max_iter; ++i) {
        const double zr2 = zr*zr, zi2 = zi*zi;
        const double new_zr = zr2 - zi2 + re;
        const double new_zi = 2.0*zr*zi + im;
        zr = new_zr;
        zi = new_zi;
        if (zr*zr + zi*zi > ESCAPE_RADIUS_SQ)
            return i;
    }
    return max_iter;
}

inline int mandelbrot_iter(const Complex& c, int max_iter)
{
    return mandelbrot_iter(c.re, c.im, max_iter);
}

inline bool escaped(int iter, int max_iter)
{
    return iter < max_iter;
}
