#include "dither/ordered.hpp"

#include <stdexcept>

namespace thermlabel {
namespace {

RankMatrix build_bayer() {
    // M(2n) = [4M + 0, 4M + 2; 4M + 3, 4M + 1]
    RankMatrix m{};
    m[0][0] = 0;
    for (int n = 1; n < kOrderedMatrixSize; n *= 2) {
        for (int y = 0; y < n; ++y) {
            for (int x = 0; x < n; ++x) {
                const uint8_t v = static_cast<uint8_t>(4 * m[y][x]);
                m[y][x] = v;
                m[y][x + n] = static_cast<uint8_t>(v + 2);
                m[y + n][x] = static_cast<uint8_t>(v + 3);
                m[y + n][x + n] = static_cast<uint8_t>(v + 1);
            }
        }
    }
    return m;
}

constexpr int kPlanLevels = kOrderedMatrixSize * kOrderedMatrixSize;

// Yliluoma's plan search: the white-cell count whose mix is closest to the
// target. Black and white are the only candidate pair, so only the mix
// error is scored.
std::array<uint8_t, 256> build_plans() {
    std::array<uint8_t, 256> plans{};
    for (int v = 0; v < 256; ++v) {
        double best = 0.0;
        int best_r = 0;
        for (int r = 0; r <= kPlanLevels; ++r) {
            const double mix = 255.0 * static_cast<double>(r) / kPlanLevels;
            const double penalty = (v - mix) * (v - mix);
            if (r == 0 || penalty < best) {
                best = penalty;
                best_r = r;
            }
        }
        plans[static_cast<size_t>(v)] = static_cast<uint8_t>(best_r);
    }
    return plans;
}

} // namespace

const RankMatrix& bayer_matrix() {
    static const RankMatrix kBayer = build_bayer();
    return kBayer;
}

const RankMatrix& cluster_dot_matrix() {
    static const RankMatrix kCluster = {{
        {{24, 10, 12, 26, 35, 47, 49, 37}},
        {{ 8,  0,  2, 14, 45, 59, 61, 51}},
        {{22,  6,  4, 16, 43, 57, 63, 53}},
        {{30, 20, 18, 28, 33, 41, 55, 39}},
        {{34, 46, 48, 36, 25, 11, 13, 27}},
        {{44, 58, 60, 50,  9,  1,  3, 15}},
        {{42, 56, 62, 52, 23,  7,  5, 17}},
        {{32, 40, 54, 38, 31, 21, 19, 29}},
    }};
    return kCluster;
}

int rank_threshold(int rank) {
    return (2 * rank + 1) * 256 / (2 * kPlanLevels);
}

PixelBuffer threshold_dither(const PixelBuffer& gray) {
    validate(gray, SampleDepth::Gray8, "threshold_dither");

    PixelBuffer out = gray;
    out.depth = SampleDepth::Mono1;
    for (auto& v : out.pixels) {
        v = (v >= 128) ? 1 : 0;
    }
    return out;
}

PixelBuffer ordered_dither(const PixelBuffer& gray, const RankMatrix& m) {
    validate(gray, SampleDepth::Gray8, "ordered_dither");

    int thresholds[kOrderedMatrixSize][kOrderedMatrixSize];
    for (int y = 0; y < kOrderedMatrixSize; ++y) {
        for (int x = 0; x < kOrderedMatrixSize; ++x) {
            thresholds[y][x] = rank_threshold(m[y][x]);
        }
    }

    PixelBuffer out = make_buffer(gray.width, gray.height, SampleDepth::Mono1);
    for (int y = 0; y < gray.height; ++y) {
        const int* row = thresholds[y % kOrderedMatrixSize];
        for (int x = 0; x < gray.width; ++x) {
            out.at(x, y) = (gray.at(x, y) >= row[x % kOrderedMatrixSize]) ? 1 : 0;
        }
    }
    return out;
}

int yliluoma_plan(uint8_t v) {
    static const std::array<uint8_t, 256> kPlans = build_plans();
    return kPlans[v];
}

PixelBuffer yliluoma_dither(const PixelBuffer& gray) {
    validate(gray, SampleDepth::Gray8, "yliluoma_dither");

    const RankMatrix& m = bayer_matrix();
    PixelBuffer out = make_buffer(gray.width, gray.height, SampleDepth::Mono1);
    for (int y = 0; y < gray.height; ++y) {
        for (int x = 0; x < gray.width; ++x) {
            const int rank = m[y % kOrderedMatrixSize][x % kOrderedMatrixSize];
            out.at(x, y) = (rank < yliluoma_plan(gray.at(x, y))) ? 1 : 0;
        }
    }
    return out;
}

#ifndef NDEBUG
namespace {
// Debug self-test: both screens must be permutations of 0..63.
struct OrderedSelfTest {
    OrderedSelfTest() {
        for (const RankMatrix* m : {&bayer_matrix(), &cluster_dot_matrix()}) {
            bool seen[kPlanLevels] = {};
            for (const auto& row : *m) {
                for (uint8_t v : row) {
                    if (v >= kPlanLevels || seen[v]) throw std::runtime_error("ordered self-test: rank matrix is not a permutation");
                    seen[v] = true;
                }
            }
        }
        if (yliluoma_plan(0) != 0 || yliluoma_plan(255) != kPlanLevels) {
            throw std::runtime_error("ordered self-test: yliluoma plan must keep pure colors pure");
        }
    }
};
static OrderedSelfTest _ordered_self_test{};
} // namespace
#endif

} // namespace thermlabel
