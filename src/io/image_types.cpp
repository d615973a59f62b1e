#include "io/image_types.hpp"

#include "core/errors.hpp"

namespace thermlabel {

PixelBuffer make_buffer(int width, int height, SampleDepth depth, uint8_t fill) {
    if (width <= 0 || height <= 0) {
        throw BufferSizeMismatch("make_buffer: invalid size " + std::to_string(width) + "x" + std::to_string(height));
    }
    PixelBuffer buf;
    buf.width = width;
    buf.height = height;
    buf.depth = depth;
    buf.pixels.assign(static_cast<size_t>(width) * height, fill);
    return buf;
}

void validate(const PixelBuffer& buf, const std::string& where) {
    if (buf.width <= 0 || buf.height <= 0) {
        throw BufferSizeMismatch(where + ": invalid buffer size " +
                                 std::to_string(buf.width) + "x" + std::to_string(buf.height));
    }
    const size_t expected = static_cast<size_t>(buf.width) * static_cast<size_t>(buf.height);
    if (buf.pixels.size() != expected) {
        throw BufferSizeMismatch(where + ": pixel buffer mismatch (have " + std::to_string(buf.pixels.size()) +
                                 ", expected " + std::to_string(expected) + ")");
    }
}

void validate(const PixelBuffer& buf, SampleDepth depth, const std::string& where) {
    validate(buf, where);
    if (buf.depth != depth) {
        throw BufferSizeMismatch(where + (depth == SampleDepth::Gray8 ? ": expected 8-bit grayscale buffer"
                                                                      : ": expected 1-bit monochrome buffer"));
    }
}

} // namespace thermlabel
