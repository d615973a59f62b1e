#include "encode/packing.hpp"

namespace thermlabel {

int packed_stride(int width) {
    return (width + 7) / 8;
}

std::vector<uint8_t> pack_mono_rows(const PixelBuffer& mono, BitPolarity polarity) {
    validate(mono, SampleDepth::Mono1, "pack_mono_rows");

    const int stride = packed_stride(mono.width);
    const uint8_t set_on = (polarity == BitPolarity::WhiteIsOne) ? 1 : 0;
    std::vector<uint8_t> packed(static_cast<size_t>(stride) * mono.height, 0);
    for (int y = 0; y < mono.height; ++y) {
        uint8_t* row = packed.data() + static_cast<size_t>(y) * stride;
        for (int x = 0; x < mono.width; ++x) {
            if (mono.at(x, y) == set_on) {
                row[x / 8] |= static_cast<uint8_t>(0x80 >> (x % 8));
            }
        }
    }
    return packed;
}

} // namespace thermlabel
