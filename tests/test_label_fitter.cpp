#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "fit/label_fitter.hpp"
#include "test_util.hpp"

#include <algorithm>

using namespace thermlabel;

namespace {

bool all_equal(const std::vector<uint8_t>& v, uint8_t value) {
    return std::all_of(v.begin(), v.end(), [value](uint8_t s) { return s == value; });
}

bool contains(const std::vector<uint8_t>& v, uint8_t value) {
    return std::find(v.begin(), v.end(), value) != v.end();
}

} // namespace

TEST(Rotate, CounterClockwise) {
    // 3x2:
    //   1 2 3
    //   4 5 6
    PixelBuffer in = test::gray(3, 2, {1, 2, 3, 4, 5, 6});
    PixelBuffer out = rotate90_ccw(in);
    EXPECT_EQ(out.width, 2);
    EXPECT_EQ(out.height, 3);
    EXPECT_EQ(out.pixels, (std::vector<uint8_t>{3, 6, 2, 5, 1, 4}));
}

TEST(Resample, SameSizeIsCopy) {
    PixelBuffer in = test::ramp(7, 5);
    EXPECT_EQ(resample(in, 7, 5).pixels, in.pixels);
}

TEST(Resample, UniformStaysUniform) {
    PixelBuffer in = test::gray(17, 9, 77);
    for (auto dims : {std::make_pair(5, 3), std::make_pair(40, 31), std::make_pair(1, 1)}) {
        PixelBuffer out = resample(in, dims.first, dims.second);
        EXPECT_EQ(out.width, dims.first);
        EXPECT_EQ(out.height, dims.second);
        EXPECT_TRUE(all_equal(out.pixels, 77));
    }
}

TEST(Resample, UpscaleInterpolatesInsteadOfReplicating) {
    PixelBuffer out = resample(test::gray(2, 1, {0, 255}), 4, 1);
    EXPECT_EQ(out.pixels, (std::vector<uint8_t>{0, 64, 191, 255}));
}

TEST(Resample, DownscaleKeepsRampMonotonic) {
    PixelBuffer out = resample(test::ramp(256, 4), 32, 2);
    for (int x = 1; x < out.width; ++x) EXPECT_LE(out.at(x - 1, 0), out.at(x, 0));
    EXPECT_LT(out.at(0, 0), 16);
    EXPECT_GT(out.at(31, 0), 239);
}

TEST(Fit, ShouldRotateOnlyOnShapeMismatch) {
    EXPECT_TRUE(should_rotate(60, 20, 20, 60));
    EXPECT_TRUE(should_rotate(20, 60, 60, 20));
    EXPECT_FALSE(should_rotate(60, 20, 80, 30));
    EXPECT_FALSE(should_rotate(20, 20, 20, 60)); // square source
    EXPECT_FALSE(should_rotate(60, 20, 50, 50)); // square target
}

TEST(Fit, OutputAlwaysMatchesTargetSize) {
    const std::pair<int, int> sources[] = {{1, 1}, {4, 6}, {6, 4}, {100, 3}, {3, 100}, {37, 37}};
    const std::pair<int, int> targets[] = {{1, 1}, {812, 1218}, {203, 203}, {50, 7}, {7, 50}};
    for (const auto& s : sources) {
        for (const auto& t : targets) {
            PixelBuffer out = fit_to_size(test::ramp(s.first, s.second), t.first, t.second);
            EXPECT_EQ(out.width, t.first);
            EXPECT_EQ(out.height, t.second);
            EXPECT_EQ(out.size(), static_cast<size_t>(t.first) * t.second);
        }
    }
}

TEST(Fit, LandscapeSourceRotatesIntoPortraitLabel) {
    // left half black, right half white
    PixelBuffer in = test::gray(60, 20, 255);
    for (int y = 0; y < 20; ++y) {
        for (int x = 0; x < 30; ++x) in.at(x, y) = 0;
    }
    PixelBuffer out = fit_to_label(in, LabelGeometry::from_pixels(20, 60));
    ASSERT_EQ(out.width, 20);
    ASSERT_EQ(out.height, 60);
    // counter-clockwise: the source's right edge ends up on top, left on the bottom
    EXPECT_TRUE(all_equal(test::row_of(out, 0), 255));
    EXPECT_TRUE(all_equal(test::row_of(out, 59), 0));
    const std::vector<uint8_t> left = test::column_of(out, 0);
    EXPECT_TRUE(contains(left, 0));
    EXPECT_TRUE(contains(left, 255));
}

TEST(Fit, PortraitSourceInSquareLabelIsPaddedLeftAndRight) {
    // 4 wide x 6 tall, fitted to a 1" x 1" label at 203 dpi
    PixelBuffer in = test::gray(4, 6, 0);
    PixelBuffer out = fit_to_label(in, LabelGeometry(1.0, 1.0, 203));
    ASSERT_EQ(out.width, 203);
    ASSERT_EQ(out.height, 203);

    // 4 * 203 / 6 = 135.33 -> 135 columns of content, 34 white on each side
    for (int x = 0; x < 34; ++x) EXPECT_TRUE(all_equal(test::column_of(out, x), 255)) << "column " << x;
    for (int x = 169; x < 203; ++x) EXPECT_TRUE(all_equal(test::column_of(out, x), 255)) << "column " << x;
    for (int x = 34; x < 169; ++x) EXPECT_TRUE(all_equal(test::column_of(out, x), 0)) << "column " << x;

    // the other two edges carry content
    EXPECT_TRUE(contains(test::row_of(out, 0), 0));
    EXPECT_TRUE(contains(test::row_of(out, 202), 0));
}

TEST(Fit, ZeroTargetIsInvalidGeometry) {
    EXPECT_THROW(fit_to_size(test::gray(4, 4, 0), 0, 10), InvalidGeometry);
    EXPECT_THROW(fit_to_size(test::gray(4, 4, 0), 10, -3), InvalidGeometry);
}

TEST(Fit, RejectsMalformedInput) {
    PixelBuffer bad = test::gray(4, 4, 0);
    bad.height = 5;
    EXPECT_THROW(fit_to_size(bad, 10, 10), BufferSizeMismatch);
}
