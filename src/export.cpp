#include "export.hpp"

#include <png.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <memory>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#endif

namespace {

struct FileCloser {
    void operator()(FILE* fp) const { if (fp) std::fclose(fp); }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

// Creates a fresh "<path>.XXXXXX" beside the destination, so an existing
// file of any name other than path itself is never touched. tmp receives
// the generated name. Returns null on failure.
FilePtr open_temp(const char* path, std::string& tmp)
{
    std::string name = std::string(path) + ".XXXXXX";
    const int fd = ::mkstemp(&name[0]);
    if (fd < 0)
        return nullptr;
    // mkstemp creates the file 0600; give the image ordinary permissions.
    FilePtr fp(::fchmod(fd, 0644) == 0 ? ::fdopen(fd, "wb") : nullptr);
    if (!fp) {
        ::close(fd);
        std::remove(name.c_str());
        return nullptr;
    }
    tmp = std::move(name);
    return fp;
}

// Closes the stream (checking for deferred write errors) and renames the
// temporary onto its final name. Removes the temporary on failure.
std::string commit_file(FilePtr fp, const std::string& tmp, const char* path)
{
    const bool flush_failed = std::fflush(fp.get()) != 0 || std::ferror(fp.get());
    const bool close_failed = std::fclose(fp.release()) != 0;
    if (flush_failed || close_failed) {
        std::remove(tmp.c_str());
        return std::string("Write error: ") + path;
    }
    if (std::rename(tmp.c_str(), path) != 0) {
        std::remove(tmp.c_str());
        return std::string("Cannot rename temporary file onto ") + path;
    }
    return {};
}

std::string fail_and_discard(FilePtr fp, const std::string& tmp, std::string msg)
{
    fp.reset();
    std::remove(tmp.c_str());
    return msg;
}

bool has_extension(const std::string& path, const char* ext)
{
    const size_t n = std::strlen(ext);
    if (path.size() < n) return false;
    return std::equal(path.end() - static_cast<std::ptrdiff_t>(n), path.end(), ext,
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) == b;
                      });
}

}  // namespace

// ---------------------------------------------------------------------------
// PNG export
//
// 8-bit RGB, no alpha, no interlace. Rows are serialized one at a time with
// PixelBuffer::row_bytes.
// ---------------------------------------------------------------------------
std::string export_png(const char* path, const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "Cannot export an empty image";

    std::string tmp;
    FilePtr fp = open_temp(path, tmp);
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png)
        return fail_and_discard(std::move(fp), tmp, "png_create_write_struct failed");
    // Lift libpng's default 1,000,000 pixel cap per side up to the format's
    // own limit; the command line already bounds the total pixel count.
    png_set_user_limits(png, PNG_UINT_31_MAX, PNG_UINT_31_MAX);

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        return fail_and_discard(std::move(fp), tmp, "png_create_info_struct failed");
    }

    // Declared before setjmp so its storage outlives a longjmp back here.
    std::vector<uint8_t> row(static_cast<size_t>(buf.width) * 3);

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        return fail_and_discard(std::move(fp), tmp, "PNG write error (libpng longjmp)");
    }

    png_init_io(png, fp.get());
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGB,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y) {
        buf.row_bytes(y, row.data());
        png_write_row(png, row.data());
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    return commit_file(std::move(fp), tmp, path);
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless RGB, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string export_jxl(const char* path, const PixelBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "Cannot export an empty image";

    std::unique_ptr<JxlEncoder, void (*)(JxlEncoder*)> enc(
        JxlEncoderCreate(nullptr), &JxlEncoderDestroy);
    if (!enc) return "JxlEncoderCreate failed";

    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                     = static_cast<uint32_t>(buf.width);
    bi.ysize                     = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample           = 8;
    bi.exponent_bits_per_sample  = 0;
    bi.alpha_bits                = 0;
    bi.num_color_channels        = 3;
    bi.num_extra_channels        = 0;
    bi.uses_original_profile     = JXL_TRUE;

    // Level 5 stops at 2^18 pixels per side.
    if ((bi.xsize > (1u << 18) || bi.ysize > (1u << 18))
        && JxlEncoderSetCodestreamLevel(enc.get(), 10) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetCodestreamLevel failed";

    if (JxlEncoderSetBasicInfo(enc.get(), &bi) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetBasicInfo failed";

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, /*is_gray=*/JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc.get(), &color) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetColorEncoding failed";

    JxlEncoderFrameSettings* opts = JxlEncoderFrameSettingsCreate(enc.get(), nullptr);
    if (JxlEncoderSetFrameLossless(opts, JXL_TRUE) != JXL_ENC_SUCCESS)
        return "JxlEncoderSetFrameLossless failed";

    const std::vector<uint8_t> bytes = buf.to_bytes();
    JxlPixelFormat fmt = {3, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    if (JxlEncoderAddImageFrame(opts, &fmt, bytes.data(), bytes.size())
            != JXL_ENC_SUCCESS)
        return "JxlEncoderAddImageFrame failed";
    JxlEncoderCloseInput(enc.get());

    std::vector<uint8_t> output(65536);
    uint8_t* next_out  = output.data();
    size_t   avail_out = output.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc.get(), &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = next_out - output.data();
        output.resize(output.size() * 2);
        next_out  = output.data() + used;
        avail_out = output.size() - used;
    }
    if (status != JXL_ENC_SUCCESS)
        return "JxlEncoderProcessOutput failed";

    output.resize(static_cast<size_t>(next_out - output.data()));

    std::string tmp;
    FilePtr fp = open_temp(path, tmp);
    if (!fp) return std::string("Cannot open file for writing: ") + path;
    if (std::fwrite(output.data(), 1, output.size(), fp.get()) != output.size())
        return fail_and_discard(std::move(fp), tmp, std::string("Write error: ") + path);
    return commit_file(std::move(fp), tmp, path);
}
#endif  // HAVE_JXL

std::string export_image(const std::string& path, const PixelBuffer& buf)
{
    if (has_extension(path, ".jxl")) {
#ifdef HAVE_JXL
        return export_jxl(path.c_str(), buf);
#else
        return "JPEG XL output requested but this build has no libjxl support";
#endif
    }
    return export_png(path.c_str(), buf);
}
