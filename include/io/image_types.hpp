#pragma once

#include <cstdint>
#include <vector>
#include <string>

namespace thermlabel {

enum class SampleDepth : uint8_t {
    Gray8 = 8,  // 0..255, 255 = white
    Mono1 = 1,  // 0/1, 1 = white (no dot), 0 = black (dot)
};

struct PixelBuffer {
    int width = 0;
    int height = 0;
    SampleDepth depth = SampleDepth::Gray8;
    std::vector<uint8_t> pixels; // row-major

    size_t size() const { return pixels.size(); }
    bool empty() const { return pixels.empty(); }

    uint8_t at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
    uint8_t& at(int x, int y) { return pixels[static_cast<size_t>(y) * width + x]; }
};

// Allocate a width x height buffer filled with `fill`.
PixelBuffer make_buffer(int width, int height, SampleDepth depth, uint8_t fill = 0);

// Throws BufferSizeMismatch when the dimensions are non-positive or
// pixels.size() != width * height. `where` prefixes the message.
void validate(const PixelBuffer& buf, const std::string& where);

// Same as validate(), and additionally requires the given depth.
void validate(const PixelBuffer& buf, SampleDepth depth, const std::string& where);

} // namespace thermlabel
