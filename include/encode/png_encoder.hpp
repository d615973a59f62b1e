#pragma once

#include <cstdint>
#include <vector>

#include "io/image_types.hpp"

namespace thermlabel {

// Lossless PNG of a buffer: Gray8 as 8-bit grayscale, Mono1 as 1-bit
// grayscale (1 = white). dpi > 0 adds a pHYs chunk so viewers and print
// drivers keep the label's native density.
std::vector<uint8_t> encode_png(const PixelBuffer& buf, int dpi = 0);

} // namespace thermlabel
