#include "encode/png_encoder.hpp"

#include "encode/packing.hpp"

#include <png.h>

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace thermlabel {
namespace {

struct PngSink {
    std::vector<uint8_t>* bytes = nullptr;
    char error[256] = {};
};

void png_write_to_sink(png_structp png_ptr, png_bytep data, png_size_t size) {
    PngSink* sink = static_cast<PngSink*>(png_get_io_ptr(png_ptr));
    sink->bytes->insert(sink->bytes->end(), data, data + size);
}

void png_flush_sink(png_structp) {}

void png_error_to_sink(png_structp png_ptr, png_const_charp message) {
    PngSink* sink = static_cast<PngSink*>(png_get_error_ptr(png_ptr));
    std::snprintf(sink->error, sizeof(sink->error), "%s", message ? message : "unknown libpng error");
    png_longjmp(png_ptr, 1);
}

void png_warning_ignore(png_structp, png_const_charp) {}

// libpng reports failures by longjmp; nothing with a destructor may live
// in this frame between setjmp and the jump.
bool write_png_rows(PngSink& sink, int width, int height, int bit_depth, int dpi, png_bytepp rows) {
    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, &sink, png_error_to_sink, png_warning_ignore);
    if (png_ptr == nullptr) {
        std::snprintf(sink.error, sizeof(sink.error), "png_create_write_struct failed");
        return false;
    }
    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (info_ptr == nullptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        std::snprintf(sink.error, sizeof(sink.error), "png_create_info_struct failed");
        return false;
    }
    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        return false;
    }

    png_set_write_fn(png_ptr, &sink, png_write_to_sink, png_flush_sink);
    png_set_IHDR(png_ptr, info_ptr, static_cast<png_uint_32>(width), static_cast<png_uint_32>(height),
                 bit_depth, PNG_COLOR_TYPE_GRAY, PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    if (dpi > 0) {
        // pHYs is pixels per meter
        const png_uint_32 ppm = static_cast<png_uint_32>(std::lround(dpi / 0.0254));
        png_set_pHYs(png_ptr, info_ptr, ppm, ppm, PNG_RESOLUTION_METER);
    }
    png_write_info(png_ptr, info_ptr);
    png_write_image(png_ptr, rows);
    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);
    return true;
}

} // namespace

std::vector<uint8_t> encode_png(const PixelBuffer& buf, int dpi) {
    validate(buf, "encode_png");

    // rows are prepared up front so the libpng frame owns nothing
    std::vector<uint8_t> raster;
    size_t stride = 0;
    int bit_depth = 8;
    if (buf.depth == SampleDepth::Mono1) {
        raster = pack_mono_rows(buf, BitPolarity::WhiteIsOne);
        stride = static_cast<size_t>(packed_stride(buf.width));
        bit_depth = 1;
    } else {
        raster = buf.pixels;
        stride = static_cast<size_t>(buf.width);
    }

    std::vector<png_bytep> rows(static_cast<size_t>(buf.height));
    for (int y = 0; y < buf.height; ++y) {
        rows[static_cast<size_t>(y)] = raster.data() + static_cast<size_t>(y) * stride;
    }

    std::vector<uint8_t> bytes;
    PngSink sink;
    sink.bytes = &bytes;
    if (!write_png_rows(sink, buf.width, buf.height, bit_depth, dpi, rows.data())) {
        throw std::runtime_error(std::string("encode_png: ") + sink.error);
    }
    return bytes;
}

} // namespace thermlabel
