#include "dither/dither_config.hpp"

#include "core/errors.hpp"

#include <cctype>

namespace thermlabel {
namespace {

struct NamedAlgorithm {
    const char* name;
    DitherAlgorithm algorithm;
};

// First entry per algorithm is its canonical name.
const NamedAlgorithm kNames[] = {
    {"threshold", DitherAlgorithm::Threshold},
    {"none", DitherAlgorithm::Threshold},
    {"bayer", DitherAlgorithm::Bayer},
    {"cluster", DitherAlgorithm::ClusterDot},
    {"yliluoma", DitherAlgorithm::Yliluoma},
    {"floyd-steinberg", DitherAlgorithm::FloydSteinberg},
    {"floyd", DitherAlgorithm::FloydSteinberg},
    {"atkinson", DitherAlgorithm::Atkinson},
    {"jarvis-judice-ninke", DitherAlgorithm::JarvisJudiceNinke},
    {"stucki", DitherAlgorithm::Stucki},
    {"burkes", DitherAlgorithm::Burkes},
    {"sierra3", DitherAlgorithm::Sierra3},
    {"sierra2", DitherAlgorithm::Sierra2},
    {"sierra-2-4a", DitherAlgorithm::SierraLite},
    {"riemersma", DitherAlgorithm::Riemersma},
};

std::string lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

} // namespace

DitherAlgorithm parse_dither_algorithm(const std::string& name) {
    const std::string key = lower(name);
    for (const auto& n : kNames) {
        if (key == n.name) return n.algorithm;
    }
    throw UnsupportedAlgorithm("Unsupported dithering algorithm: " + name);
}

std::string dither_algorithm_name(DitherAlgorithm a) {
    for (const auto& n : kNames) {
        if (n.algorithm == a) return n.name;
    }
    throw UnsupportedAlgorithm("Unsupported dithering algorithm tag: " + std::to_string(static_cast<int>(a)));
}

const std::vector<DitherAlgorithm>& all_dither_algorithms() {
    static const std::vector<DitherAlgorithm> kAll = {
        DitherAlgorithm::Threshold,
        DitherAlgorithm::Bayer,
        DitherAlgorithm::ClusterDot,
        DitherAlgorithm::Yliluoma,
        DitherAlgorithm::FloydSteinberg,
        DitherAlgorithm::Atkinson,
        DitherAlgorithm::JarvisJudiceNinke,
        DitherAlgorithm::Stucki,
        DitherAlgorithm::Burkes,
        DitherAlgorithm::Sierra3,
        DitherAlgorithm::Sierra2,
        DitherAlgorithm::SierraLite,
        DitherAlgorithm::Riemersma,
    };
    return kAll;
}

bool is_error_diffusion(DitherAlgorithm a) {
    switch (a) {
        case DitherAlgorithm::FloydSteinberg:
        case DitherAlgorithm::Atkinson:
        case DitherAlgorithm::JarvisJudiceNinke:
        case DitherAlgorithm::Stucki:
        case DitherAlgorithm::Burkes:
        case DitherAlgorithm::Sierra3:
        case DitherAlgorithm::Sierra2:
        case DitherAlgorithm::SierraLite:
            return true;
        default:
            return false;
    }
}

bool is_ordered(DitherAlgorithm a) {
    return a == DitherAlgorithm::Bayer || a == DitherAlgorithm::ClusterDot || a == DitherAlgorithm::Yliluoma;
}

void validate(const DitherConfig& cfg) {
    // rejects tags outside the enum
    (void)dither_algorithm_name(cfg.algorithm);

    if (cfg.algorithm != DitherAlgorithm::Riemersma) return;
    if (cfg.history < kMinRiemersmaHistory || cfg.history > kMaxRiemersmaHistory) {
        throw UnsupportedAlgorithm("riemersma: history must be in [" + std::to_string(kMinRiemersmaHistory) + ", " +
                                   std::to_string(kMaxRiemersmaHistory) + "], got " + std::to_string(cfg.history));
    }
    if (!(cfg.ratio > 0.0) || !(cfg.ratio < 1.0)) {
        throw UnsupportedAlgorithm("riemersma: ratio must be in (0, 1), got " + std::to_string(cfg.ratio));
    }
}

} // namespace thermlabel
