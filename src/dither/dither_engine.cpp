#include "dither/dither_engine.hpp"

#include "core/errors.hpp"
#include "dither/error_diffusion.hpp"
#include "dither/ordered.hpp"
#include "dither/riemersma.hpp"

#include <cstdio>
#include <string>

namespace thermlabel {

PixelBuffer dither(const PixelBuffer& gray, const DitherConfig& cfg) {
    validate(cfg);
    validate(gray, SampleDepth::Gray8, "dither");

#ifndef NDEBUG
    std::fprintf(stderr, "dither: %s on %dx%d\n", dither_algorithm_name(cfg.algorithm).c_str(),
                 gray.width, gray.height);
#endif

    switch (cfg.algorithm) {
        case DitherAlgorithm::Threshold:
            return threshold_dither(gray);

        case DitherAlgorithm::Bayer:
            return ordered_dither(gray, bayer_matrix());
        case DitherAlgorithm::ClusterDot:
            return ordered_dither(gray, cluster_dot_matrix());
        case DitherAlgorithm::Yliluoma:
            return yliluoma_dither(gray);

        case DitherAlgorithm::FloydSteinberg:
        case DitherAlgorithm::Atkinson:
        case DitherAlgorithm::JarvisJudiceNinke:
        case DitherAlgorithm::Stucki:
        case DitherAlgorithm::Burkes:
        case DitherAlgorithm::Sierra3:
        case DitherAlgorithm::Sierra2:
        case DitherAlgorithm::SierraLite:
            return error_diffuse(gray, error_diffusion_kernel(cfg.algorithm));

        case DitherAlgorithm::Riemersma:
            return riemersma_dither(gray, cfg.history, cfg.ratio);
    }
    throw UnsupportedAlgorithm("dither: unsupported algorithm tag " + std::to_string(static_cast<int>(cfg.algorithm)));
}

double white_fraction(const PixelBuffer& mono) {
    validate(mono, SampleDepth::Mono1, "white_fraction");
    size_t white = 0;
    for (uint8_t v : mono.pixels) white += (v != 0) ? 1 : 0;
    return static_cast<double>(white) / static_cast<double>(mono.pixels.size());
}

} // namespace thermlabel
