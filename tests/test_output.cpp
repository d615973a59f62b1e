#include <gtest/gtest.h>

#include "encode/packing.hpp"
#include "encode/png_encoder.hpp"
#include "encode/spool.hpp"
#include "io/image_loader.hpp"
#include "io/image_saver.hpp"
#include "test_util.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>

using namespace thermlabel;

namespace fs = std::filesystem;

namespace {

PixelBuffer mono(int w, int h, std::vector<uint8_t> bits) {
    PixelBuffer b = test::gray(w, h, std::move(bits));
    b.depth = SampleDepth::Mono1;
    return b;
}

uint32_t be32(const std::vector<uint8_t>& b, size_t at) {
    return (uint32_t(b[at]) << 24) | (uint32_t(b[at + 1]) << 16) | (uint32_t(b[at + 2]) << 8) | uint32_t(b[at + 3]);
}

// Offset of a chunk's data, or 0 if absent.
size_t find_chunk(const std::vector<uint8_t>& png, const std::string& type) {
    size_t at = 8;
    while (at + 8 <= png.size()) {
        const uint32_t len = be32(png, at);
        if (std::string(png.begin() + at + 4, png.begin() + at + 8) == type) return at + 8;
        at += 12 + len;
    }
    return 0;
}

std::string temp_path(const std::string& name) {
    return (fs::temp_directory_path() / ("thermlabel_test_" + name)).string();
}

} // namespace

TEST(Packing, StrideRoundsUp) {
    EXPECT_EQ(packed_stride(1), 1);
    EXPECT_EQ(packed_stride(8), 1);
    EXPECT_EQ(packed_stride(9), 2);
    EXPECT_EQ(packed_stride(812), 102);
}

TEST(Packing, MsbFirstWithPolarity) {
    // 10 wide: one full byte plus two bits
    PixelBuffer m = mono(10, 1, {1, 0, 0, 0, 0, 0, 0, 1, 0, 1});
    EXPECT_EQ(pack_mono_rows(m, BitPolarity::WhiteIsOne), (std::vector<uint8_t>{0x81, 0x40}));
    // trailing bits stay clear even when black
    EXPECT_EQ(pack_mono_rows(m, BitPolarity::BlackIsOne), (std::vector<uint8_t>{0x7E, 0x80}));
}

TEST(Png, SignatureAndHeader) {
    const std::vector<uint8_t> png = encode_png(mono(10, 3, std::vector<uint8_t>(30, 1)), 203);
    ASSERT_GT(png.size(), 33u);
    const uint8_t sig[8] = {137, 80, 78, 71, 13, 10, 26, 10};
    for (int i = 0; i < 8; ++i) EXPECT_EQ(png[i], sig[i]);

    const size_t ihdr = find_chunk(png, "IHDR");
    ASSERT_EQ(ihdr, 16u);
    EXPECT_EQ(be32(png, ihdr), 10u);
    EXPECT_EQ(be32(png, ihdr + 4), 3u);
    EXPECT_EQ(png[ihdr + 8], 1); // bit depth
    EXPECT_EQ(png[ihdr + 9], 0); // grayscale
}

TEST(Png, GrayIsEightBit) {
    const std::vector<uint8_t> png = encode_png(test::ramp(5, 5));
    const size_t ihdr = find_chunk(png, "IHDR");
    ASSERT_NE(ihdr, 0u);
    EXPECT_EQ(png[ihdr + 8], 8);
    EXPECT_EQ(find_chunk(png, "pHYs"), 0u);
}

TEST(Png, DensityIsRecorded) {
    const std::vector<uint8_t> png = encode_png(test::gray(2, 2, 0), 203);
    const size_t phys = find_chunk(png, "pHYs");
    ASSERT_NE(phys, 0u);
    EXPECT_EQ(be32(png, phys), 7992u);     // 203 / 0.0254
    EXPECT_EQ(be32(png, phys + 4), 7992u);
    EXPECT_EQ(png[phys + 8], 1);           // meters
}

TEST(Png, MonoDecodesToBlackAndWhite) {
    const std::string path = temp_path("mono.png");
    PixelBuffer m = mono(3, 2, {1, 0, 1, 0, 0, 1});
    write_all(path, encode_png(m, 300));

    PixelBuffer back = load_grayscale(path);
    EXPECT_EQ(back.width, 3);
    EXPECT_EQ(back.height, 2);
    EXPECT_EQ(back.pixels, (std::vector<uint8_t>{255, 0, 255, 0, 0, 255}));
    fs::remove(path);
}

TEST(Png, GrayDecodesBack) {
    const std::string path = temp_path("gray.png");
    PixelBuffer in = test::ramp(16, 4);
    write_all(path, encode_png(in));

    PixelBuffer back = load_grayscale(path);
    ASSERT_EQ(back.size(), in.size());
    for (size_t i = 0; i < in.size(); ++i) EXPECT_NEAR(back.pixels[i], in.pixels[i], 1);
    fs::remove(path);
}

TEST(Pgm, SaveAndLoad) {
    const std::string path = temp_path("label.pgm");
    save_pgm(path, mono(2, 2, {1, 0, 0, 1}));
    PixelBuffer back = load_grayscale(path);
    EXPECT_EQ(back.pixels, (std::vector<uint8_t>{255, 0, 0, 255}));
    fs::remove(path);
}

TEST(Loader, MissingFileThrows) {
    EXPECT_THROW(load_grayscale(temp_path("does_not_exist.png")), std::runtime_error);
    EXPECT_THROW(load_grayscale(temp_path("does_not_exist.dcm")), std::runtime_error);
}

TEST(Spool, PayloadCarriesRasterAndOptions) {
    PixelBuffer m = mono(9, 2, {1, 1, 1, 1, 1, 1, 1, 1, 0,
                                0, 1, 1, 1, 1, 1, 1, 1, 1});
    SpoolPayload p = to_spool_format(m, "Darkness=10", 203);
    EXPECT_EQ(p.stride, 2);
    EXPECT_EQ(p.dpi, 203);
    EXPECT_EQ(p.options, "Darkness=10");
    EXPECT_EQ(p.raster.pixels, m.pixels);
    EXPECT_EQ(p.packed_rows, (std::vector<uint8_t>{0x00, 0x80, 0x80, 0x00}));
}

TEST(Spool, RejectsGrayRaster) {
    EXPECT_ANY_THROW(to_spool_format(test::gray(4, 4, 0)));
}

TEST(Spool, SplitOptions) {
    EXPECT_EQ(split_print_options("  DymoPrintDensity=Medium   DymoPrintQuality=Graphics "),
              (std::vector<std::string>{"DymoPrintDensity=Medium", "DymoPrintQuality=Graphics"}));
    EXPECT_TRUE(split_print_options("").empty());
}

TEST(Spool, LpCommandForDymoLabel) {
    // 30256 at 300 dpi: 694 x 1200 px
    SpoolPayload p = to_spool_format(make_buffer(694, 1200, SampleDepth::Mono1, 1),
                                     "DymoPrintDensity=Medium DymoPrintQuality=Graphics", 300);
    const std::vector<std::string> expected = {
        "lp", "-d", "DYMO_LabelWriter_450",
        "-o", "PageSize=w167h288",
        "-o", "scaling=100",
        "-o", "ppi=300",
        "-o", "DymoPrintDensity=Medium",
        "-o", "DymoPrintQuality=Graphics",
        "/tmp/label.png"};
    EXPECT_EQ(lp_command("DYMO_LabelWriter_450", "/tmp/label.png", p), expected);
}

TEST(Spool, LpCommandWithoutDensity) {
    SpoolPayload p = to_spool_format(make_buffer(8, 8, SampleDepth::Mono1, 1));
    EXPECT_EQ(lp_command("rollo", "x.png", p),
              (std::vector<std::string>{"lp", "-d", "rollo", "-o", "scaling=100", "x.png"}));
}

TEST(Spool, DryRunWritesFileAndLogsCommand) {
    const std::string path = temp_path("spool.png");
    std::ostringstream log;
    LpDryRunSpooler spooler("rollo", path, log);
    spooler.submit(to_spool_format(make_buffer(16, 8, SampleDepth::Mono1, 1), "Darkness=10", 203));

    EXPECT_TRUE(fs::exists(path));
    const std::vector<uint8_t> written = test::file_bytes(path);
    ASSERT_FALSE(written.empty());
    EXPECT_EQ(written.front(), 137);
    ASSERT_FALSE(spooler.last_command().empty());
    EXPECT_EQ(spooler.last_command().back(), path);
    EXPECT_NE(log.str().find("lp -d rollo"), std::string::npos);
    EXPECT_NE(log.str().find("-o Darkness=10"), std::string::npos);
    fs::remove(path);
}
