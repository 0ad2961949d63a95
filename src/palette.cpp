#include "palette.hpp"

#include <algorithm>

// ---------------------------------------------------------------------------
// Band boundaries (inclusive upper bounds)
// ---------------------------------------------------------------------------
static constexpr int LOW_MAX  = 30;
static constexpr int MID_MAX  = 90;
static constexpr int HIGH_MAX = 200;

static uint8_t inverted(int value)
{
    return static_cast<uint8_t>(255 - std::min(value, 255));
}

Band band_of(int iter, int max_iter)
{
    if (iter >= max_iter)  return Band::Interior;
    if (iter <= LOW_MAX)   return Band::Low;
    if (iter <= MID_MAX)   return Band::Mid;
    if (iter <= HIGH_MAX)  return Band::High;
    return Band::Top;
}

Rgb8 band_color(int iter, int max_iter)
{
    const int     value = std::max(iter, 0);
    const uint8_t inv   = inverted(value);

    switch (band_of(value, max_iter)) {
        case Band::Interior: return Rgb8{  0,   0,   0};
        case Band::Low:      return Rgb8{ 50,  60,  50};
        case Band::Mid:      return Rgb8{inv, inv,  20};
        case Band::High:     return Rgb8{ 40, inv, inv};
        case Band::Top:      return Rgb8{ 10,  20, inv};
    }
    return Rgb8{};
}
