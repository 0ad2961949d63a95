#pragma once

#include <cstdint>

// One output pixel: 8-bit RGB, no alpha, no padding.
struct Rgb8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};
static_assert(sizeof(Rgb8) == 3, "Rgb8 must be exactly three bytes");

inline bool operator==(const Rgb8& a, const Rgb8& b)
{
    return a.r == b.r && a.g == b.g && a.b == b.b;
}
inline bool operator!=(const Rgb8& a, const Rgb8& b) { return !(a == b); }

enum class Band {
    Interior = 0,  // never escaped
    Low      = 1,  // escape count <= 30
    Mid      = 2,  // 30 < count <= 90
    High     = 3,  // 90 < count <= 200
    Top      = 4,  // count > 200
};

// Which band an iteration result falls into. iter >= max_iter is interior.
Band band_of(int iter, int max_iter);

// Map an iteration result to its band color.
// "255 - count" saturates at 0 for counts above 255; negative counts are
// treated as 0.
Rgb8 band_color(int iter, int max_iter);
