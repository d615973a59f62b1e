#pragma once

#include <string>
#include <vector>

#include "dither/dither_config.hpp"
#include "io/image_types.hpp"

namespace thermlabel {

// One neighbor receiving weight / divisor of the quantization error.
// dy == 0 taps point right (dx > 0); dy > 0 taps may point either way.
struct DiffusionTap {
    int dx;
    int dy;
    int weight;
};

struct DiffusionKernel {
    std::string name;
    int divisor = 1;
    std::vector<DiffusionTap> taps;

    // Sum of all tap weights; never exceeds divisor.
    int total_weight() const;
};

// Kernel table for an error-diffusion algorithm. Throws
// UnsupportedAlgorithm for any other family.
const DiffusionKernel& error_diffusion_kernel(DitherAlgorithm a);

// Raster-order error diffusion with a per-pixel pending-error accumulator.
// q = 255 if (v + pending) >= 128 else 0; the error (v + pending - q) is
// spread over the kernel taps; taps outside the buffer are dropped.
PixelBuffer error_diffuse(const PixelBuffer& gray, const DiffusionKernel& kernel);

} // namespace thermlabel
