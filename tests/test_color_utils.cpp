// SPDX-License-Identifier: MIT
#include "edit/ColorUtils.h"

#include <gtest/gtest.h>

namespace {

void expectColor(const glm::vec3& actual, const glm::vec3& expected)
{
    EXPECT_NEAR(actual.r, expected.r, 1e-4f);
    EXPECT_NEAR(actual.g, expected.g, 1e-4f);
    EXPECT_NEAR(actual.b, expected.b, 1e-4f);
}

}

TEST(ColorUtils, HueToRgbPrimaries)
{
    expectColor(hueToRgb(0.0f), { 1.0f, 0.0f, 0.0f });
    expectColor(hueToRgb(120.0f), { 0.0f, 1.0f, 0.0f });
    expectColor(hueToRgb(240.0f), { 0.0f, 0.0f, 1.0f });
    expectColor(hueToRgb(60.0f), { 1.0f, 1.0f, 0.0f });
    expectColor(hueToRgb(30.0f), { 1.0f, 0.5f, 0.0f });
}

TEST(ColorUtils, HueWrapsAround)
{
    expectColor(hueToRgb(360.0f), hueToRgb(0.0f));
    expectColor(hueToRgb(-120.0f), hueToRgb(240.0f));
    expectColor(hueToRgb(735.0f), hueToRgb(15.0f));
}

TEST(ColorUtils, HexParsing)
{
    expectColor(hexToRgb("#ff8000"), { 1.0f, 128.0f / 255.0f, 0.0f });
    expectColor(hexToRgb("00FF00"), { 0.0f, 1.0f, 0.0f });
    expectColor(hexToRgb("#000000"), { 0.0f, 0.0f, 0.0f });
}

TEST(ColorUtils, InvalidHexIsWhite)
{
    expectColor(hexToRgb(""), glm::vec3(1.0f));
    expectColor(hexToRgb("#fff"), glm::vec3(1.0f));
    expectColor(hexToRgb("#gg0000"), glm::vec3(1.0f));
    expectColor(hexToRgb("red"), glm::vec3(1.0f));
}
