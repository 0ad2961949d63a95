#pragma once

#include "renderer.hpp"

#include <string>

// All exporters return an empty string on success, or an error message on
// failure. Output is written to a uniquely named "<path>.XXXXXX" beside the
// destination and renamed onto path only once encoding finished, so a failed
// export leaves no file behind.

std::string export_png(const char* path, const PixelBuffer& buf);

#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf);
#endif

// Picks the encoder from the file extension: ".jxl" selects JPEG XL,
// anything else PNG.
std::string export_image(const std::string& path, const PixelBuffer& buf);

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}
