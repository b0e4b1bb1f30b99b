// SPDX-License-Identifier: MIT
#pragma once

#include "edit/EditState.h"

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

struct EditStateParseError : public std::runtime_error {
    EditStateParseError(std::size_t lineNumber, const std::string& message);
    std::size_t line;
};

// Line-oriented "key = value" text; unspecified keys keep their defaults.
//   exposure = 0.5
//   hsl.orange.saturation = -20
//   border.color = #202020
//   crop = 0.1 0.1 0.8 0.8
//   curve.rgb = 0,0.05 0.5,0.55 1,1
[[nodiscard]] EditState parseEditState(std::string_view text);
[[nodiscard]] EditState loadEditState(const std::filesystem::path& filePath);
