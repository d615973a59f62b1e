#include "fit/label_fitter.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace thermlabel {
namespace {

// Contributions of source samples to one output sample along an axis.
struct Taps {
    int first = 0;
    std::vector<double> weights; // normalized, sums to 1
};

double triangle(double x) {
    x = std::fabs(x);
    return x < 1.0 ? 1.0 - x : 0.0;
}

std::vector<Taps> make_taps(int in_size, int out_size) {
    const double scale = static_cast<double>(in_size) / static_cast<double>(out_size);
    const double filterscale = std::max(scale, 1.0);
    const double support = filterscale; // triangle radius is 1

    std::vector<Taps> taps(static_cast<size_t>(out_size));
    for (int o = 0; o < out_size; ++o) {
        const double center = (o + 0.5) * scale;
        const int lo = std::max(static_cast<int>(std::floor(center - support + 0.5)), 0);
        const int hi = std::min(static_cast<int>(std::floor(center + support + 0.5)), in_size);

        Taps& t = taps[static_cast<size_t>(o)];
        t.first = lo;
        double total = 0.0;
        for (int i = lo; i < hi; ++i) {
            const double w = triangle((i - center + 0.5) / filterscale);
            t.weights.push_back(w);
            total += w;
        }
        if (total > 0.0) {
            for (auto& w : t.weights) w /= total;
        } else {
            // center sits exactly between samples on a degenerate axis
            t.weights.assign(t.weights.size(), 1.0 / static_cast<double>(t.weights.size()));
        }
    }
    return taps;
}

uint8_t to_sample(double v) {
    const long r = std::lround(v);
    return static_cast<uint8_t>(std::min<long>(std::max<long>(r, 0), 255));
}

bool is_landscape(int w, int h) { return w > h; }
bool is_portrait(int w, int h) { return h > w; }

} // namespace

PixelBuffer rotate90_ccw(const PixelBuffer& in) {
    validate(in, "rotate90_ccw");

    PixelBuffer out;
    out.width = in.height;
    out.height = in.width;
    out.depth = in.depth;
    out.pixels.resize(in.pixels.size());
    for (int y = 0; y < out.height; ++y) {
        for (int x = 0; x < out.width; ++x) {
            out.at(x, y) = in.at(in.width - 1 - y, x);
        }
    }
    return out;
}

PixelBuffer resample(const PixelBuffer& in, int out_w, int out_h) {
    validate(in, SampleDepth::Gray8, "resample");
    if (out_w <= 0 || out_h <= 0) throw InvalidGeometry("resample: invalid output size");

    if (out_w == in.width && out_h == in.height) return in;

    const std::vector<Taps> tx = make_taps(in.width, out_w);
    const std::vector<Taps> ty = make_taps(in.height, out_h);

    // horizontal pass: in.height rows of out_w
    std::vector<double> rows(static_cast<size_t>(out_w) * in.height, 0.0);
    for (int y = 0; y < in.height; ++y) {
        const uint8_t* src = in.pixels.data() + static_cast<size_t>(y) * in.width;
        double* dst = rows.data() + static_cast<size_t>(y) * out_w;
        for (int x = 0; x < out_w; ++x) {
            const Taps& t = tx[static_cast<size_t>(x)];
            double acc = 0.0;
            for (size_t k = 0; k < t.weights.size(); ++k) {
                acc += t.weights[k] * src[t.first + static_cast<int>(k)];
            }
            dst[x] = acc;
        }
    }

    // vertical pass
    PixelBuffer out;
    out.width = out_w;
    out.height = out_h;
    out.depth = SampleDepth::Gray8;
    out.pixels.resize(static_cast<size_t>(out_w) * out_h);
    for (int y = 0; y < out_h; ++y) {
        const Taps& t = ty[static_cast<size_t>(y)];
        for (int x = 0; x < out_w; ++x) {
            double acc = 0.0;
            for (size_t k = 0; k < t.weights.size(); ++k) {
                acc += t.weights[k] * rows[static_cast<size_t>(t.first + static_cast<int>(k)) * out_w + x];
            }
            out.at(x, y) = to_sample(acc);
        }
    }
    return out;
}

bool should_rotate(int src_w, int src_h, int dst_w, int dst_h) {
    return (is_landscape(src_w, src_h) && is_portrait(dst_w, dst_h)) ||
           (is_portrait(src_w, src_h) && is_landscape(dst_w, dst_h));
}

PixelBuffer fit_to_size(const PixelBuffer& in, int target_w, int target_h) {
    if (target_w < 1 || target_h < 1) {
        throw InvalidGeometry("fit: target resolves to " + std::to_string(target_w) + "x" +
                              std::to_string(target_h) + " pixels");
    }
    validate(in, SampleDepth::Gray8, "fit");

    //===Orientation===//
    const bool rotate = should_rotate(in.width, in.height, target_w, target_h);
    PixelBuffer oriented = rotate ? rotate90_ccw(in) : in;

    //===Uniform scale (fit within)===//
    const double scale = std::min(static_cast<double>(target_w) / oriented.width,
                                  static_cast<double>(target_h) / oriented.height);
    const int scaled_w = std::min(std::max(static_cast<int>(std::lround(oriented.width * scale)), 1), target_w);
    const int scaled_h = std::min(std::max(static_cast<int>(std::lround(oriented.height * scale)), 1), target_h);

#ifndef NDEBUG
    std::fprintf(stderr, "fit: %dx%d -> %dx%d (rotate=%d, scale=%.4f) on %dx%d\n",
                 in.width, in.height, scaled_w, scaled_h, rotate ? 1 : 0, scale, target_w, target_h);
#endif

    PixelBuffer scaled = resample(oriented, scaled_w, scaled_h);

    //===Pad to label===//
    PixelBuffer out = make_buffer(target_w, target_h, SampleDepth::Gray8, 255);
    const int off_x = (target_w - scaled_w) / 2;
    const int off_y = (target_h - scaled_h) / 2;
    for (int y = 0; y < scaled_h; ++y) {
        std::copy(scaled.pixels.begin() + static_cast<std::ptrdiff_t>(y) * scaled_w,
                  scaled.pixels.begin() + static_cast<std::ptrdiff_t>(y + 1) * scaled_w,
                  out.pixels.begin() + static_cast<std::ptrdiff_t>(y + off_y) * target_w + off_x);
    }
    return out;
}

PixelBuffer fit_to_label(const PixelBuffer& in, const LabelGeometry& label) {
    return fit_to_size(in, label.width_px(), label.height_px());
}

} // namespace thermlabel
