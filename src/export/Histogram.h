// SPDX-License-Identifier: MIT
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

constexpr int kHistogramBins = 256;

struct HistogramData {
    std::array<std::uint32_t, kHistogramBins> red {};
    std::array<std::uint32_t, kHistogramBins> green {};
    std::array<std::uint32_t, kHistogramBins> blue {};
    std::array<std::uint32_t, kHistogramBins> luminance {};
    // Largest bin over all four channels.
    std::uint32_t max { 0 };
};

// rgba holds pixelCount interleaved RGBA8 pixels; alpha is ignored.
[[nodiscard]] HistogramData computeHistogram(const std::uint8_t* rgba, std::size_t pixelCount);
