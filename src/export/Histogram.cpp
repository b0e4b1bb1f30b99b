// SPDX-License-Identifier: MIT
#include "export/Histogram.h"

#include <algorithm>
#include <cmath>

HistogramData computeHistogram(const std::uint8_t* rgba, std::size_t pixelCount)
{
    HistogramData histogram;
    if (!rgba)
        return histogram;

    for (std::size_t i = 0; i < pixelCount; ++i) {
        const std::uint8_t* pixel = rgba + i * 4;
        const std::uint8_t r = pixel[0];
        const std::uint8_t g = pixel[1];
        const std::uint8_t b = pixel[2];
        const long lum = std::lround(0.299 * r + 0.587 * g + 0.114 * b);

        ++histogram.red[r];
        ++histogram.green[g];
        ++histogram.blue[b];
        ++histogram.luminance[static_cast<std::size_t>(std::clamp(lum, 0L, 255L))];
    }

    for (int i = 0; i < kHistogramBins; ++i) {
        histogram.max = std::max({ histogram.max, histogram.red[i], histogram.green[i], histogram.blue[i], histogram.luminance[i] });
    }
    return histogram;
}
