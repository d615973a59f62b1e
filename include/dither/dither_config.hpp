#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace thermlabel {

enum class DitherAlgorithm : uint8_t {
    Threshold = 0,
    // ordered / matrix
    Bayer,
    ClusterDot,
    Yliluoma,
    // error diffusion
    FloydSteinberg,
    Atkinson,
    JarvisJudiceNinke,
    Stucki,
    Burkes,
    Sierra3,
    Sierra2,
    SierraLite,
    // space-filling curve
    Riemersma,
};

inline constexpr int kMinRiemersmaHistory = 2;
inline constexpr int kMaxRiemersmaHistory = 32;

struct DitherConfig {
    DitherAlgorithm algorithm = DitherAlgorithm::FloydSteinberg;
    int history = 16;    // Riemersma only, [2, 32]
    double ratio = 0.1;  // Riemersma only, (0, 1)
};

// Accepts the user-facing names ("floyd", "bayer", "sierra-2-4a", ...).
// Throws UnsupportedAlgorithm for anything else.
DitherAlgorithm parse_dither_algorithm(const std::string& name);

// Canonical name of an algorithm; throws UnsupportedAlgorithm for a value
// outside the enum.
std::string dither_algorithm_name(DitherAlgorithm a);

// Every algorithm, in enum order.
const std::vector<DitherAlgorithm>& all_dither_algorithms();

bool is_error_diffusion(DitherAlgorithm a);
bool is_ordered(DitherAlgorithm a);

// Throws UnsupportedAlgorithm for an unknown tag or out-of-range parameter.
void validate(const DitherConfig& cfg);

} // namespace thermlabel
