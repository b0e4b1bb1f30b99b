// SPDX-License-Identifier: MIT
#include "util/CurveEngine.h"

#include <algorithm>
#include <cmath>

namespace {

constexpr float kIdentityTolerance = 0.001f;
constexpr float kSpanEpsilon = 0.0001f;

[[nodiscard]] bool near(float a, float b)
{
    return std::abs(a - b) < kIdentityTolerance;
}

[[nodiscard]] std::uint8_t toByte(float v)
{
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

// A two-point spline eases between its ends, so identity rows are written as
// an exact ramp instead of being interpolated.
void writeRow(std::vector<std::uint8_t>& data, int row, const CurveChannel& channel)
{
    const bool identity = isChannelIdentity(channel);
    for (int i = 0; i < CurveLut::Samples; ++i) {
        const float x = static_cast<float>(i) / static_cast<float>(CurveLut::Samples - 1);
        const std::uint8_t value = identity ? static_cast<std::uint8_t>(i) : toByte(interpolateCurve(channel, x));
        std::uint8_t* texel = data.data() + (static_cast<std::size_t>(row) * CurveLut::Samples + i) * 4;
        texel[0] = value;
        texel[1] = value;
        texel[2] = value;
        texel[3] = 255;
    }
}

}

float interpolateCurve(const CurveChannel& points, float x)
{
    const std::size_t count = points.size();
    if (count < 2)
        return x;

    std::size_t i = 0;
    while (i < count - 1 && points[i + 1].x < x)
        ++i;

    if (i >= count - 1)
        return points.back().y;
    if (i == 0 && x < points.front().x)
        return points.front().y;

    const CurvePoint& p0 = points[i == 0 ? 0 : i - 1];
    const CurvePoint& p1 = points[i];
    const CurvePoint& p2 = points[std::min(count - 1, i + 1)];
    const CurvePoint& p3 = points[std::min(count - 1, i + 2)];

    const float t = std::clamp((x - p1.x) / (p2.x - p1.x + kSpanEpsilon), 0.0f, 1.0f);
    const float t2 = t * t;
    const float t3 = t2 * t;

    const float y = 0.5f * (2.0f * p1.y
                        + (-p0.y + p2.y) * t
                        + (2.0f * p0.y - 5.0f * p1.y + 4.0f * p2.y - p3.y) * t2
                        + (-p0.y + 3.0f * p1.y - 3.0f * p2.y + p3.y) * t3);
    return std::clamp(y, 0.0f, 1.0f);
}

bool isChannelIdentity(const CurveChannel& points)
{
    return points.size() == 2
        && near(points[0].x, 0.0f) && near(points[0].y, 0.0f)
        && near(points[1].x, 1.0f) && near(points[1].y, 1.0f);
}

bool isCurveIdentity(const ToneCurve& curve)
{
    return isChannelIdentity(curve.rgb) && isChannelIdentity(curve.red)
        && isChannelIdentity(curve.green) && isChannelIdentity(curve.blue);
}

std::vector<std::uint8_t> generateCurveLutData(const ToneCurve& curve)
{
    std::vector<std::uint8_t> data(static_cast<std::size_t>(CurveLut::Samples) * CurveLut::Rows * 4);
    writeRow(data, CurveLut::Row_Master, curve.rgb);
    writeRow(data, CurveLut::Row_Red, curve.red);
    writeRow(data, CurveLut::Row_Green, curve.green);
    writeRow(data, CurveLut::Row_Blue, curve.blue);
    return data;
}

std::vector<std::uint8_t> identityCurveLutData()
{
    return generateCurveLutData(ToneCurve {});
}
