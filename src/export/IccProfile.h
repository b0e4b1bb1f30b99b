// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <vector>

// ICC v2 display profile describing sRGB (IEC 61966-2.1 primaries adapted to
// D50, 1024-entry tone curves). Embedded in JPEG APP2 and TIFF tag 34675.
[[nodiscard]] const std::vector<std::uint8_t>& srgbIccProfile();
