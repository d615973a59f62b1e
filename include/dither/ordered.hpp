#pragma once

#include <array>
#include <cstdint>

#include "io/image_types.hpp"

namespace thermlabel {

inline constexpr int kOrderedMatrixSize = 8;

// Rank matrix: every value 0..63 appears once, indexed [y % 8][x % 8].
using RankMatrix = std::array<std::array<uint8_t, kOrderedMatrixSize>, kOrderedMatrixSize>;

// Recursive Bayer index matrix.
const RankMatrix& bayer_matrix();

// Classic 45-degree clustered-dot screen (two dot centers per tile).
const RankMatrix& cluster_dot_matrix();

// Rank k maps to threshold (2k + 1) * 256 / 128, i.e. 2..254 in steps of 4.
int rank_threshold(int rank);

// 1 if v >= 128 else 0.
PixelBuffer threshold_dither(const PixelBuffer& gray);

// 1 if v >= rank_threshold(m[y % 8][x % 8]) else 0.
PixelBuffer ordered_dither(const PixelBuffer& gray, const RankMatrix& m);

// Yliluoma algorithm 1 mixing plan for the black/white palette: number of
// white cells (0..64) out of the 8x8 tile whose mix is nearest to level v,
// i.e. round(v * 64 / 255).
int yliluoma_plan(uint8_t v);

// Pixel is white when its Bayer rank is below yliluoma_plan(v).
PixelBuffer yliluoma_dither(const PixelBuffer& gray);

} // namespace thermlabel
