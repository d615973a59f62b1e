#include "dither/error_diffusion.hpp"

#include "core/errors.hpp"

#include <stdexcept>

namespace thermlabel {
namespace {

// Weights as published; the divisor follows each table.
const DiffusionKernel kFloydSteinberg{
    "floyd-steinberg", 16,
    {{1, 0, 7},
     {-1, 1, 3}, {0, 1, 5}, {1, 1, 1}}};

// Atkinson keeps 2/8 of the error on purpose (lighter midtones).
const DiffusionKernel kAtkinson{
    "atkinson", 8,
    {{1, 0, 1}, {2, 0, 1},
     {-1, 1, 1}, {0, 1, 1}, {1, 1, 1},
     {0, 2, 1}}};

const DiffusionKernel kJarvisJudiceNinke{
    "jarvis-judice-ninke", 48,
    {{1, 0, 7}, {2, 0, 5},
     {-2, 1, 3}, {-1, 1, 5}, {0, 1, 7}, {1, 1, 5}, {2, 1, 3},
     {-2, 2, 1}, {-1, 2, 3}, {0, 2, 5}, {1, 2, 3}, {2, 2, 1}}};

const DiffusionKernel kStucki{
    "stucki", 42,
    {{1, 0, 8}, {2, 0, 4},
     {-2, 1, 2}, {-1, 1, 4}, {0, 1, 8}, {1, 1, 4}, {2, 1, 2},
     {-2, 2, 1}, {-1, 2, 2}, {0, 2, 4}, {1, 2, 2}, {2, 2, 1}}};

const DiffusionKernel kBurkes{
    "burkes", 32,
    {{1, 0, 8}, {2, 0, 4},
     {-2, 1, 2}, {-1, 1, 4}, {0, 1, 8}, {1, 1, 4}, {2, 1, 2}}};

const DiffusionKernel kSierra3{
    "sierra3", 32,
    {{1, 0, 5}, {2, 0, 3},
     {-2, 1, 2}, {-1, 1, 4}, {0, 1, 5}, {1, 1, 4}, {2, 1, 2},
     {-1, 2, 2}, {0, 2, 3}, {1, 2, 2}}};

const DiffusionKernel kSierra2{
    "sierra2", 16,
    {{1, 0, 4}, {2, 0, 3},
     {-2, 1, 1}, {-1, 1, 2}, {0, 1, 3}, {1, 1, 2}, {2, 1, 1}}};

const DiffusionKernel kSierraLite{
    "sierra-2-4a", 4,
    {{1, 0, 2},
     {-1, 1, 1}, {0, 1, 1}}};

} // namespace

int DiffusionKernel::total_weight() const {
    int sum = 0;
    for (const auto& t : taps) sum += t.weight;
    return sum;
}

const DiffusionKernel& error_diffusion_kernel(DitherAlgorithm a) {
    switch (a) {
        case DitherAlgorithm::FloydSteinberg:    return kFloydSteinberg;
        case DitherAlgorithm::Atkinson:          return kAtkinson;
        case DitherAlgorithm::JarvisJudiceNinke: return kJarvisJudiceNinke;
        case DitherAlgorithm::Stucki:            return kStucki;
        case DitherAlgorithm::Burkes:            return kBurkes;
        case DitherAlgorithm::Sierra3:           return kSierra3;
        case DitherAlgorithm::Sierra2:           return kSierra2;
        case DitherAlgorithm::SierraLite:        return kSierraLite;
        default:
            break;
    }
    throw UnsupportedAlgorithm("error_diffusion_kernel: not an error-diffusion algorithm (tag " +
                               std::to_string(static_cast<int>(a)) + ")");
}

PixelBuffer error_diffuse(const PixelBuffer& gray, const DiffusionKernel& kernel) {
    validate(gray, SampleDepth::Gray8, "error_diffuse");
    if (kernel.divisor <= 0 || kernel.total_weight() > kernel.divisor) {
        throw UnsupportedAlgorithm("error_diffuse: kernel " + kernel.name + " would amplify error");
    }

    const int W = gray.width;
    const int H = gray.height;
    std::vector<double> pending(gray.pixels.size(), 0.0);

    // pre-divided weights
    std::vector<double> weights;
    weights.reserve(kernel.taps.size());
    for (const auto& t : kernel.taps) {
        weights.push_back(static_cast<double>(t.weight) / static_cast<double>(kernel.divisor));
    }

    PixelBuffer out = make_buffer(W, H, SampleDepth::Mono1);
    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            const size_t idx = static_cast<size_t>(y) * W + x;
            const double v = static_cast<double>(gray.pixels[idx]) + pending[idx];
            const double q = (v >= 128.0) ? 255.0 : 0.0;
            out.pixels[idx] = (q > 0.0) ? 1 : 0;

            const double err = v - q;
            if (err == 0.0) continue;
            for (size_t k = 0; k < kernel.taps.size(); ++k) {
                const int nx = x + kernel.taps[k].dx;
                const int ny = y + kernel.taps[k].dy;
                if (nx < 0 || nx >= W || ny >= H) continue; // dropped, never wrapped
                pending[static_cast<size_t>(ny) * W + nx] += err * weights[k];
            }
        }
    }
    return out;
}

#ifndef NDEBUG
namespace {
// Debug self-test: no kernel may redistribute more error than it removes,
// and no tap may point at an already visited pixel.
struct DiffusionSelfTest {
    DiffusionSelfTest() {
        for (const DiffusionKernel* k : {&kFloydSteinberg, &kAtkinson, &kJarvisJudiceNinke, &kStucki,
                                         &kBurkes, &kSierra3, &kSierra2, &kSierraLite}) {
            if (k->total_weight() > k->divisor) throw std::runtime_error("diffusion self-test: energy gain in " + k->name);
            for (const auto& t : k->taps) {
                if (t.dy < 0 || (t.dy == 0 && t.dx <= 0)) {
                    throw std::runtime_error("diffusion self-test: backward tap in " + k->name);
                }
            }
        }
    }
};
static DiffusionSelfTest _diffusion_self_test{};
} // namespace
#endif

} // namespace thermlabel
