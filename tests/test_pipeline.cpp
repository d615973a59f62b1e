#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "dither/dither_engine.hpp"
#include "fit/label_fitter.hpp"
#include "label/label_catalog.hpp"
#include "pipeline/job.hpp"
#include "preprocess/enhancer.hpp"
#include "test_util.hpp"

using namespace thermlabel;

TEST(Job, DefaultsProduceLabelSizedRaster) {
    JobSettings job(find_label("4x6"));
    JobResult r = run_job(test::ramp(120, 80), job);

    EXPECT_EQ(r.enhanced.width, 120);
    EXPECT_EQ(r.fitted.width, 812);
    EXPECT_EQ(r.fitted.height, 1218);
    EXPECT_EQ(r.mono.width, 812);
    EXPECT_EQ(r.mono.height, 1218);
    EXPECT_EQ(r.mono.depth, SampleDepth::Mono1);
}

TEST(Job, StagesRunInOrder) {
    JobSettings job(LabelGeometry::from_pixels(40, 60));
    job.enhancement.contrast = 1.5;
    job.enhancement.brightness = 0.9;
    job.dither.algorithm = DitherAlgorithm::Bayer;

    PixelBuffer source = test::ramp(30, 20);
    JobResult r = run_job(source, job);

    const PixelBuffer enhanced = enhance(source, job.enhancement);
    EXPECT_EQ(r.enhanced.pixels, enhanced.pixels);
    const PixelBuffer fitted = fit_to_label(enhanced, job.label);
    EXPECT_EQ(r.fitted.pixels, fitted.pixels);
    EXPECT_EQ(r.mono.pixels, dither(fitted, job.dither).pixels);
    EXPECT_EQ(prepare_label(source, job).pixels, r.mono.pixels);
}

TEST(Job, WhitePageStaysBlank) {
    JobSettings job(find_label("30336"));
    job.dither.algorithm = DitherAlgorithm::Riemersma;
    PixelBuffer mono = prepare_label(test::gray(50, 50, 255), job);
    EXPECT_DOUBLE_EQ(white_fraction(mono), 1.0);
}

TEST(Job, UnsupportedAlgorithmFailsBeforeProcessing) {
    JobSettings job(find_label("4x6"));
    job.dither.algorithm = static_cast<DitherAlgorithm>(77);
    EXPECT_THROW(run_job(test::gray(10, 10, 128), job), UnsupportedAlgorithm);
}

TEST(Job, RejectsMonoSource) {
    JobSettings job(find_label("2x1"));
    EXPECT_THROW(run_job(make_buffer(10, 10, SampleDepth::Mono1), job), BufferSizeMismatch);
}

TEST(Job, SettingsAreIndependentCopies) {
    JobSettings a(find_label("4x6"));
    JobSettings b = a;
    b.dither.algorithm = DitherAlgorithm::Atkinson;
    b.print_options = "Darkness=10";
    EXPECT_EQ(a.dither.algorithm, DitherAlgorithm::FloydSteinberg);
    EXPECT_TRUE(a.print_options.empty());
}
