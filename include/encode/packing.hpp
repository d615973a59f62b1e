#pragma once

#include <cstdint>
#include <vector>

#include "io/image_types.hpp"

namespace thermlabel {

// Which monochrome sample sets a bit in the packed raster.
enum class BitPolarity : uint8_t {
    WhiteIsOne, // PNG 1-bit grayscale
    BlackIsOne, // thermal head: a set bit heats a dot
};

// Bytes per packed row: ceil(width / 8).
int packed_stride(int width);

// Pack a Mono1 buffer MSB-first, one row per packed_stride(width) bytes.
// Trailing bits of each row are zero.
std::vector<uint8_t> pack_mono_rows(const PixelBuffer& mono, BitPolarity polarity);

} // namespace thermlabel
