// SPDX-License-Identifier: MIT
#include "export/Histogram.h"

#include <gtest/gtest.h>

#include <vector>

TEST(Histogram, CountsChannelsAndLuminance)
{
    const std::vector<std::uint8_t> pixels {
        255, 0, 0, 255,
        0, 255, 0, 0,
        0, 0, 255, 128,
        255, 255, 255, 255,
    };
    const HistogramData h = computeHistogram(pixels.data(), 4);

    EXPECT_EQ(h.red[255], 2u);
    EXPECT_EQ(h.red[0], 2u);
    EXPECT_EQ(h.green[255], 2u);
    EXPECT_EQ(h.blue[255], 2u);

    EXPECT_EQ(h.luminance[76], 1u);  // 0.299 * 255
    EXPECT_EQ(h.luminance[150], 1u); // 0.587 * 255
    EXPECT_EQ(h.luminance[29], 1u);  // 0.114 * 255
    EXPECT_EQ(h.luminance[255], 1u);
    EXPECT_EQ(h.max, 2u);
}

TEST(Histogram, IgnoresAlpha)
{
    const std::vector<std::uint8_t> opaque { 10, 20, 30, 255 };
    const std::vector<std::uint8_t> clear { 10, 20, 30, 0 };
    const HistogramData a = computeHistogram(opaque.data(), 1);
    const HistogramData b = computeHistogram(clear.data(), 1);
    EXPECT_EQ(a.red, b.red);
    EXPECT_EQ(a.luminance, b.luminance);
}

TEST(Histogram, EmptyInput)
{
    const HistogramData h = computeHistogram(nullptr, 0);
    EXPECT_EQ(h.max, 0u);
    for (int i = 0; i < kHistogramBins; ++i)
        EXPECT_EQ(h.luminance[i], 0u);
}

TEST(Histogram, MaxSpansAllChannels)
{
    std::vector<std::uint8_t> pixels;
    for (int i = 0; i < 10; ++i)
        pixels.insert(pixels.end(), { static_cast<std::uint8_t>(i * 20), 7, static_cast<std::uint8_t>(i * 25), 255 });
    const HistogramData h = computeHistogram(pixels.data(), 10);
    EXPECT_EQ(h.green[7], 10u);
    EXPECT_EQ(h.max, 10u);
}
