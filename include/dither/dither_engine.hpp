#pragma once

#include "dither/dither_config.hpp"
#include "io/image_types.hpp"

namespace thermlabel {

// Reduce an 8-bit grayscale buffer to a 1-bit buffer of the same size
// (1 = white, 0 = black) with the configured algorithm. Throws
// UnsupportedAlgorithm for an unknown tag or out-of-range parameter and
// BufferSizeMismatch for a malformed input; never falls back to another
// algorithm.
PixelBuffer dither(const PixelBuffer& gray, const DitherConfig& cfg);

// Fraction of white (1) samples in a monochrome buffer.
double white_fraction(const PixelBuffer& mono);

} // namespace thermlabel
