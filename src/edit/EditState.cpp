// SPDX-License-Identifier: MIT
#include "edit/EditState.h"

namespace {

constexpr std::array<std::string_view, kColorRangeCount> kColorRangeNames = {
    "red", "orange", "yellow", "green", "aqua", "blue", "purple", "magenta"
};

}

std::string_view colorRangeName(ColorRange range)
{
    return kColorRangeNames[static_cast<std::size_t>(range)];
}

std::optional<ColorRange> parseColorRange(std::string_view name)
{
    for (std::size_t i = 0; i < kColorRangeNames.size(); ++i) {
        if (kColorRangeNames[i] == name)
            return static_cast<ColorRange>(i);
    }
    return std::nullopt;
}
