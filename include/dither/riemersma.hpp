#pragma once

#include <vector>

#include "io/image_types.hpp"

namespace thermlabel {

struct CurvePoint {
    int x;
    int y;
};

// Generalized Hilbert curve over an arbitrary width x height rectangle.
// Starts at (0, 0), visits every cell exactly once, and each step moves to
// an 8-connected neighbor.
std::vector<CurvePoint> gilbert_curve(int width, int height);

// Error weights for the last `history` errors, oldest first:
// w[i] = ratio ^ ((history - 1 - i) / (history - 1)), so the newest error
// weighs 1 and the oldest `ratio`. history == 1 yields {1}.
std::vector<double> riemersma_weights(int history, double ratio);

// Riemersma dithering along gilbert_curve(). Each pixel is compared to 128
// after adding sum(w[i] * e[i]) over the previous `history` errors. The
// weights are not normalized to sum to 1: an average of same-signed errors
// never exceeds one error, so faint tones would never flip. The error
// pushed is the uncorrected sample minus its quantized value.
// history >= 1 here; DitherConfig narrows it to [2, 32].
PixelBuffer riemersma_dither(const PixelBuffer& gray, int history, double ratio);

} // namespace thermlabel
