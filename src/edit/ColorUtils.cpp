// SPDX-License-Identifier: MIT
#include "edit/ColorUtils.h"

#include <cmath>

namespace {

[[nodiscard]] int hexDigit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

}

glm::vec3 hueToRgb(float hueDegrees)
{
    const float h = std::fmod(std::fmod(hueDegrees, 360.0f) + 360.0f, 360.0f);
    const float x = 1.0f - std::abs(std::fmod(h / 60.0f, 2.0f) - 1.0f);

    if (h < 60.0f)
        return { 1.0f, x, 0.0f };
    if (h < 120.0f)
        return { x, 1.0f, 0.0f };
    if (h < 180.0f)
        return { 0.0f, 1.0f, x };
    if (h < 240.0f)
        return { 0.0f, x, 1.0f };
    if (h < 300.0f)
        return { x, 0.0f, 1.0f };
    return { 1.0f, 0.0f, x };
}

glm::vec3 hexToRgb(std::string_view hex)
{
    if (!hex.empty() && hex.front() == '#')
        hex.remove_prefix(1);
    if (hex.size() != 6)
        return glm::vec3(1.0f);

    glm::vec3 rgb { 0.0f };
    for (int channel = 0; channel < 3; ++channel) {
        const int hi = hexDigit(hex[static_cast<std::size_t>(channel * 2)]);
        const int lo = hexDigit(hex[static_cast<std::size_t>(channel * 2 + 1)]);
        if (hi < 0 || lo < 0)
            return glm::vec3(1.0f);
        rgb[channel] = static_cast<float>(hi * 16 + lo) / 255.0f;
    }
    return rgb;
}
