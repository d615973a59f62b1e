#include "preprocess/enhancer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

// ------------------------------------------------------------
// Helper
// ------------------------------------------------------------
static inline uint8_t clamp_u8(double v) {
    const long r = std::lround(v);
    return static_cast<uint8_t>(std::min<long>(std::max<long>(r, 0), 255));
}


namespace thermlabel {

// ------------------------------------------------------------
// Contrast
// ------------------------------------------------------------
// Rule:
//   s' = clamp(round((s - 128) * c + 128), 0, 255)
//
// The pivot is fixed at mid-gray (not the image mean), so the
// transform is the same for every buffer.
//
PixelBuffer adjust_contrast(const PixelBuffer& in, double contrast) {
    validate(in, SampleDepth::Gray8, "adjust_contrast");

    PixelBuffer out = in;
    if (contrast == 1.0) return out;

    // 256-entry table: every sample maps independently
    uint8_t lut[256];
    for (int s = 0; s < 256; ++s) {
        lut[s] = clamp_u8((static_cast<double>(s) - 128.0) * contrast + 128.0);
    }
    for (auto& v : out.pixels) {
        v = lut[v];
    }
    return out;
}

// ------------------------------------------------------------
// Brightness
// ------------------------------------------------------------
// Rule:
//   s' = clamp(round(s * b), 0, 255)
//
PixelBuffer adjust_brightness(const PixelBuffer& in, double brightness) {
    validate(in, SampleDepth::Gray8, "adjust_brightness");

    PixelBuffer out = in;
    if (brightness == 1.0) return out;

    uint8_t lut[256];
    for (int s = 0; s < 256; ++s) {
        lut[s] = clamp_u8(static_cast<double>(s) * brightness);
    }
    for (auto& v : out.pixels) {
        v = lut[v];
    }
    return out;
}

PixelBuffer enhance(const PixelBuffer& in, const EnhancementSettings& settings) {
    PixelBuffer contrasted = adjust_contrast(in, settings.contrast);
    return adjust_brightness(contrasted, settings.brightness);
}

#ifndef NDEBUG
namespace {
// Debug self-test: unit factors must leave every sample untouched.
struct EnhancerSelfTest {
    EnhancerSelfTest() {
        PixelBuffer img;
        img.width = 2;
        img.height = 2;
        img.depth = SampleDepth::Gray8;
        img.pixels = {0, 10, 200, 255};

        EnhancementSettings unit;
        unit.brightness = 1.0;
        unit.contrast = 1.0;
        PixelBuffer out = enhance(img, unit);
        if (out.pixels != img.pixels) throw std::runtime_error("enhancer self-test: identity mismatch");
    }
};
static EnhancerSelfTest _enhancer_self_test{};
} // namespace
#endif

} // namespace thermlabel
