#pragma once

#include "io/image_types.hpp"

namespace thermlabel {

// Factors are positive reals, 1.0 = identity. They are not clamped;
// out-of-range results clamp per sample.
struct EnhancementSettings {
    double brightness = 1.2;
    double contrast = 1.0;
};

// Contrast around mid-gray: s' = clamp(round((s - 128) * contrast + 128), 0, 255)
PixelBuffer adjust_contrast(const PixelBuffer& in, double contrast);

// Brightness scale: s' = clamp(round(s * brightness), 0, 255)
PixelBuffer adjust_brightness(const PixelBuffer& in, double brightness);

// Contrast first, then brightness. Each stage rounds to an 8-bit sample.
PixelBuffer enhance(const PixelBuffer& in, const EnhancementSettings& settings);

} // namespace thermlabel
