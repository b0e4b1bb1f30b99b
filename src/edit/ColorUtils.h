// SPDX-License-Identifier: MIT
#pragma once

#include <glm/vec3.hpp>

#include <string_view>

// Fully saturated, mid-lightness RGB for a hue in degrees (wraps outside [0, 360)).
[[nodiscard]] glm::vec3 hueToRgb(float hueDegrees);

// "#rrggbb" or "rrggbb", case-insensitive. Anything else yields white.
[[nodiscard]] glm::vec3 hexToRgb(std::string_view hex);
