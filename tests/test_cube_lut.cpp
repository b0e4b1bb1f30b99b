// SPDX-License-Identifier: MIT
#include "lut/CubeLut.h"

#include <gtest/gtest.h>

#include <fmt/format.h>

#include <string>

namespace {

// Identity cube of size n in .cube order (red fastest).
std::string identityCube(int n, const std::string& header = {})
{
    std::string text = header + fmt::format("LUT_3D_SIZE {}\n", n);
    for (int b = 0; b < n; ++b)
        for (int g = 0; g < n; ++g)
            for (int r = 0; r < n; ++r)
                text += fmt::format("{} {} {}\n", r / float(n - 1), g / float(n - 1), b / float(n - 1));
    return text;
}

}

TEST(CubeLut, ParsesIdentityIntoStripLayout)
{
    const LutData lut = parseCubeLut(identityCube(3, "# generated\nTITLE \"Identity\"\n\n"));
    EXPECT_EQ(lut.size, 3);
    EXPECT_EQ(lut.title, "Identity");
    EXPECT_EQ(lut.textureWidth(), 9);
    EXPECT_EQ(lut.textureHeight(), 3);
    ASSERT_EQ(lut.data.size(), 3u * 3u * 3u * 4u);

    // Texel (b * N + r, g) holds grid point (r, g, b).
    const auto texel = [&](int x, int y) { return lut.data.data() + (static_cast<std::size_t>(y) * 9 + x) * 4; };
    const std::uint8_t* p = texel(2 * 3 + 1, 0); // r = 1, g = 0, b = 2
    EXPECT_EQ(p[0], 128);
    EXPECT_EQ(p[1], 0);
    EXPECT_EQ(p[2], 255);
    EXPECT_EQ(p[3], 255);
}

TEST(CubeLut, LookupReturnsGridOutput)
{
    const LutData lut = parseCubeLut(identityCube(5));
    const glm::vec3 c = lut.lookup(4, 2, 0);
    EXPECT_NEAR(c.r, 1.0f, 1e-6f);
    EXPECT_NEAR(c.g, 128.0f / 255.0f, 1e-6f);
    EXPECT_NEAR(c.b, 0.0f, 1e-6f);
}

TEST(CubeLut, DomainIsNormalized)
{
    std::string text = "DOMAIN_MIN 0 0 0\nDOMAIN_MAX 2 2 2\nLUT_3D_SIZE 2\n";
    for (int i = 0; i < 8; ++i)
        text += "1 2 0\n";
    const LutData lut = parseCubeLut(text);
    const glm::vec3 c = lut.lookup(0, 0, 0);
    EXPECT_NEAR(c.r, 128.0f / 255.0f, 1e-6f);
    EXPECT_NEAR(c.g, 1.0f, 1e-6f);
    EXPECT_NEAR(c.b, 0.0f, 1e-6f);
}

TEST(CubeLut, MissingSizeThrows)
{
    try {
        (void)parseCubeLut("0 0 0\n1 1 1\n");
        FAIL() << "expected LutParseError";
    } catch (const LutParseError& e) {
        EXPECT_NE(std::string(e.what()).find("LUT_3D_SIZE not found"), std::string::npos);
    }
}

TEST(CubeLut, WrongValueCountThrows)
{
    try {
        (void)parseCubeLut("LUT_3D_SIZE 2\n0 0 0\n1 1 1\n");
        FAIL() << "expected LutParseError";
    } catch (const LutParseError& e) {
        EXPECT_NE(std::string(e.what()).find("expected 24 values, got 6"), std::string::npos);
    }
}

TEST(CubeLut, OutOfRangeSizeThrows)
{
    EXPECT_THROW((void)parseCubeLut("LUT_3D_SIZE 1e10\n0 0 0\n"), LutParseError);
    EXPECT_THROW((void)parseCubeLut("LUT_3D_SIZE 300\n0 0 0\n"), LutParseError);
    EXPECT_THROW((void)parseCubeLut("LUT_3D_SIZE 1\n0 0 0\n"), LutParseError);
}

TEST(CubeLut, DegenerateDomainThrows)
{
    std::string cube = "LUT_3D_SIZE 2\nDOMAIN_MIN 0 0.5 0\nDOMAIN_MAX 1 0.5 1\n";
    for (int i = 0; i < 8; ++i)
        cube += "0.5 0.5 0.5\n";
    try {
        (void)parseCubeLut(cube);
        FAIL() << "expected LutParseError";
    } catch (const LutParseError& e) {
        EXPECT_NE(std::string(e.what()).find("DOMAIN_MAX"), std::string::npos);
    }
}

TEST(CubeLut, MissingFileThrows)
{
    EXPECT_THROW((void)loadCubeLut("/nonexistent/look.cube"), LutParseError);
}

TEST(CubeLut, GeneratedLutAppliesTransform)
{
    const LutData inverted = generateColorGradeLut(4, [](float r, float g, float b) { return glm::vec3(1.0f - r, 1.0f - g, 1.0f - b); });
    EXPECT_EQ(inverted.size, 4);
    const glm::vec3 c = inverted.lookup(3, 0, 1);
    EXPECT_NEAR(c.r, 0.0f, 1e-6f);
    EXPECT_NEAR(c.g, 1.0f, 1e-6f);
    EXPECT_NEAR(c.b, 170.0f / 255.0f, 1e-6f);
    EXPECT_THROW((void)generateColorGradeLut(1, [](float r, float g, float b) { return glm::vec3(r, g, b); }), std::invalid_argument);
}

TEST(CubeLut, PresetsAreSeventeenCubed)
{
    const auto names = presetLutNames();
    ASSERT_EQ(names.size(), 8u);
    for (std::string_view name : names) {
        const LutData lut = generatePresetLut(name);
        EXPECT_EQ(lut.size, 17) << name;
        EXPECT_EQ(lut.data.size(), 17u * 17u * 17u * 4u) << name;
    }
    EXPECT_THROW((void)generatePresetLut("noSuchLook"), std::invalid_argument);
}

TEST(CubeLut, HighContrastPresetIsMonochrome)
{
    const LutData lut = generatePresetLut("highContrastBW");
    const glm::vec3 c = lut.lookup(16, 3, 7);
    EXPECT_FLOAT_EQ(c.r, c.g);
    EXPECT_FLOAT_EQ(c.g, c.b);
}
