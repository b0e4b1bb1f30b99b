// SPDX-License-Identifier: MIT
#pragma once

#include "edit/EditState.h"

#include <cstdint>
#include <vector>

namespace CurveLut {

constexpr int Samples = 256;
constexpr int Rows = 4;

// Texture row of each channel; the shader samples rows at (row + 0.5) / Rows.
constexpr int Row_Master = 0;
constexpr int Row_Red = 1;
constexpr int Row_Green = 2;
constexpr int Row_Blue = 3;

}

// Catmull-Rom through the control points, clamped to [0, 1]. Outside the
// control span the curve holds the end value; fewer than two points is identity.
[[nodiscard]] float interpolateCurve(const CurveChannel& points, float x);

[[nodiscard]] bool isChannelIdentity(const CurveChannel& points);
[[nodiscard]] bool isCurveIdentity(const ToneCurve& curve);

// RGBA8, Samples x Rows, row-major with row 0 first.
[[nodiscard]] std::vector<std::uint8_t> generateCurveLutData(const ToneCurve& curve);
[[nodiscard]] std::vector<std::uint8_t> identityCurveLutData();
