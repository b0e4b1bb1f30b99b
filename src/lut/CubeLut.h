// SPDX-License-Identifier: MIT
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <glm/vec3.hpp>

struct LutParseError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A size^3 color cube flattened into a (size * size) x size RGBA8 strip:
// the texel at (b * size + r, g) holds the output for grid point (r, g, b).
struct LutData {
    int size { 0 };
    std::vector<std::uint8_t> data;
    std::string title;

    [[nodiscard]] int textureWidth() const { return size * size; }
    [[nodiscard]] int textureHeight() const { return size; }
    [[nodiscard]] glm::vec3 lookup(int r, int g, int b) const;
};

[[nodiscard]] LutData parseCubeLut(std::string_view content);
[[nodiscard]] LutData loadCubeLut(const std::filesystem::path& filePath);

using ColorTransform = std::function<glm::vec3(float r, float g, float b)>;
[[nodiscard]] LutData generateColorGradeLut(int size, const ColorTransform& transform);

[[nodiscard]] std::vector<std::string_view> presetLutNames();
// Throws std::invalid_argument for unknown names.
[[nodiscard]] LutData generatePresetLut(std::string_view name);
