#include "dither/riemersma.hpp"

#include "core/errors.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

namespace thermlabel {
namespace {

int sgn(int v) { return (v > 0) - (v < 0); }

// (x, y) is the start corner, (ax, ay) the major axis and (bx, by) the
// orthogonal axis of the current sub-rectangle.
void gilbert_fill(int x, int y, int ax, int ay, int bx, int by, std::vector<CurvePoint>& out) {
    const int w = std::abs(ax + ay);
    const int h = std::abs(bx + by);
    const int dax = sgn(ax), day = sgn(ay);
    const int dbx = sgn(bx), dby = sgn(by);

    if (h == 1) {
        for (int i = 0; i < w; ++i) {
            out.push_back({x, y});
            x += dax;
            y += day;
        }
        return;
    }
    if (w == 1) {
        for (int i = 0; i < h; ++i) {
            out.push_back({x, y});
            x += dbx;
            y += dby;
        }
        return;
    }

    int ax2 = ax / 2, ay2 = ay / 2;
    int bx2 = bx / 2, by2 = by / 2;
    const int w2 = std::abs(ax2 + ay2);
    const int h2 = std::abs(bx2 + by2);

    if (2 * w > 3 * h) {
        // long case: split along the major axis only
        if ((w2 % 2) && (w > 2)) {
            ax2 += dax;
            ay2 += day;
        }
        gilbert_fill(x, y, ax2, ay2, bx, by, out);
        gilbert_fill(x + ax2, y + ay2, ax - ax2, ay - ay2, bx, by, out);
    } else {
        // standard case: one step up, one long horizontal step, one step down
        if ((h2 % 2) && (h > 2)) {
            bx2 += dbx;
            by2 += dby;
        }
        gilbert_fill(x, y, bx2, by2, ax2, ay2, out);
        gilbert_fill(x + bx2, y + by2, ax, ay, bx - bx2, by - by2, out);
        gilbert_fill(x + (ax - dax) + (bx2 - dbx), y + (ay - day) + (by2 - dby),
                     -bx2, -by2, -(ax - ax2), -(ay - ay2), out);
    }
}

} // namespace

std::vector<CurvePoint> gilbert_curve(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw BufferSizeMismatch("gilbert_curve: invalid size " + std::to_string(width) + "x" + std::to_string(height));
    }
    std::vector<CurvePoint> out;
    out.reserve(static_cast<size_t>(width) * height);
    if (width >= height) {
        gilbert_fill(0, 0, width, 0, 0, height, out);
    } else {
        gilbert_fill(0, 0, 0, height, width, 0, out);
    }
    return out;
}

std::vector<double> riemersma_weights(int history, double ratio) {
    if (history < 1) throw UnsupportedAlgorithm("riemersma: history must be >= 1");
    if (!(ratio > 0.0) || !(ratio < 1.0)) throw UnsupportedAlgorithm("riemersma: ratio must be in (0, 1)");

    std::vector<double> w(static_cast<size_t>(history), 1.0);
    if (history == 1) return w;
    for (int i = 0; i < history; ++i) {
        const double age = static_cast<double>(history - 1 - i) / static_cast<double>(history - 1);
        w[static_cast<size_t>(i)] = std::pow(ratio, age);
    }
    return w;
}

PixelBuffer riemersma_dither(const PixelBuffer& gray, int history, double ratio) {
    validate(gray, SampleDepth::Gray8, "riemersma_dither");

    const std::vector<double> weights = riemersma_weights(history, ratio);

    // ring buffer of the last `history` errors; head is the oldest slot
    std::vector<double> errors(weights.size(), 0.0);
    size_t head = 0;

    PixelBuffer out = make_buffer(gray.width, gray.height, SampleDepth::Mono1);
    for (const CurvePoint& p : gilbert_curve(gray.width, gray.height)) {
        double correction = 0.0;
        for (size_t i = 0; i < weights.size(); ++i) {
            correction += weights[i] * errors[(head + i) % errors.size()];
        }

        const int v = gray.at(p.x, p.y);
        const bool white = (static_cast<double>(v) + correction) >= 128.0;
        out.at(p.x, p.y) = white ? 1 : 0;

        // overwrite the oldest; it becomes the newest
        errors[head] = static_cast<double>(v - (white ? 255 : 0));
        head = (head + 1) % errors.size();
    }
    return out;
}

} // namespace thermlabel
