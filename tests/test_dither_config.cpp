#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "dither/dither_config.hpp"

using namespace thermlabel;

TEST(DitherConfig, DefaultsAreFloydSteinberg) {
    DitherConfig cfg;
    EXPECT_EQ(cfg.algorithm, DitherAlgorithm::FloydSteinberg);
    EXPECT_EQ(cfg.history, 16);
    EXPECT_DOUBLE_EQ(cfg.ratio, 0.1);
    EXPECT_NO_THROW(validate(cfg));
}

TEST(DitherConfig, ParsesUserFacingNames) {
    EXPECT_EQ(parse_dither_algorithm("floyd"), DitherAlgorithm::FloydSteinberg);
    EXPECT_EQ(parse_dither_algorithm("Floyd-Steinberg"), DitherAlgorithm::FloydSteinberg);
    EXPECT_EQ(parse_dither_algorithm("none"), DitherAlgorithm::Threshold);
    EXPECT_EQ(parse_dither_algorithm("BAYER"), DitherAlgorithm::Bayer);
    EXPECT_EQ(parse_dither_algorithm("cluster"), DitherAlgorithm::ClusterDot);
    EXPECT_EQ(parse_dither_algorithm("sierra-2-4a"), DitherAlgorithm::SierraLite);
    EXPECT_EQ(parse_dither_algorithm("riemersma"), DitherAlgorithm::Riemersma);
}

TEST(DitherConfig, UnknownNamesAreRejected) {
    EXPECT_THROW(parse_dither_algorithm("unknown-xyz"), UnsupportedAlgorithm);
    EXPECT_THROW(parse_dither_algorithm("ascii"), UnsupportedAlgorithm);
    EXPECT_THROW(parse_dither_algorithm(""), UnsupportedAlgorithm);
}

TEST(DitherConfig, CanonicalNamesParseBack) {
    for (DitherAlgorithm a : all_dither_algorithms()) {
        EXPECT_EQ(parse_dither_algorithm(dither_algorithm_name(a)), a);
    }
    EXPECT_EQ(all_dither_algorithms().size(), 13u);
    EXPECT_EQ(dither_algorithm_name(DitherAlgorithm::FloydSteinberg), "floyd-steinberg");
}

TEST(DitherConfig, FamiliesAreDisjoint) {
    int diffusion = 0, ordered = 0;
    for (DitherAlgorithm a : all_dither_algorithms()) {
        EXPECT_FALSE(is_error_diffusion(a) && is_ordered(a));
        diffusion += is_error_diffusion(a) ? 1 : 0;
        ordered += is_ordered(a) ? 1 : 0;
    }
    EXPECT_EQ(diffusion, 8);
    EXPECT_EQ(ordered, 3);
    EXPECT_FALSE(is_error_diffusion(DitherAlgorithm::Riemersma));
    EXPECT_FALSE(is_ordered(DitherAlgorithm::Threshold));
}

TEST(DitherConfig, RiemersmaBounds) {
    DitherConfig cfg;
    cfg.algorithm = DitherAlgorithm::Riemersma;

    cfg.history = kMinRiemersmaHistory;
    EXPECT_NO_THROW(validate(cfg));
    cfg.history = kMaxRiemersmaHistory;
    EXPECT_NO_THROW(validate(cfg));
    cfg.history = 1;
    EXPECT_THROW(validate(cfg), UnsupportedAlgorithm);
    cfg.history = 33;
    EXPECT_THROW(validate(cfg), UnsupportedAlgorithm);

    cfg.history = 16;
    cfg.ratio = 0.0;
    EXPECT_THROW(validate(cfg), UnsupportedAlgorithm);
    cfg.ratio = 1.0;
    EXPECT_THROW(validate(cfg), UnsupportedAlgorithm);
    cfg.ratio = 0.999;
    EXPECT_NO_THROW(validate(cfg));
}

TEST(DitherConfig, RiemersmaParametersIgnoredElsewhere) {
    DitherConfig cfg;
    cfg.algorithm = DitherAlgorithm::Bayer;
    cfg.history = 0;
    cfg.ratio = 5.0;
    EXPECT_NO_THROW(validate(cfg));
}

TEST(DitherConfig, TagOutsideEnumIsRejected) {
    DitherConfig cfg;
    cfg.algorithm = static_cast<DitherAlgorithm>(200);
    EXPECT_THROW(validate(cfg), UnsupportedAlgorithm);
    EXPECT_THROW(dither_algorithm_name(cfg.algorithm), UnsupportedAlgorithm);
}
