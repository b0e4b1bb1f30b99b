// SPDX-License-Identifier: MIT
#include "lut/CubeLut.h"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace {

constexpr int kPresetSize = 17;
// Also keeps size^3 * 3 well inside size_t and the strip inside GL texture limits.
constexpr int kMaxCubeSize = 256;

[[nodiscard]] std::uint8_t toByte(float v)
{
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

[[nodiscard]] std::size_t stripIndex(int size, int r, int g, int b)
{
    return (static_cast<std::size_t>(g) * size * size + static_cast<std::size_t>(b) * size + r) * 4;
}

[[nodiscard]] std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

[[nodiscard]] bool startsWith(std::string_view text, std::string_view prefix)
{
    return text.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] std::vector<float> parseNumbers(std::string_view text)
{
    std::vector<float> numbers;
    std::istringstream stream { std::string { text } };
    float value = 0.0f;
    while (stream >> value)
        numbers.push_back(value);
    return numbers;
}

[[nodiscard]] glm::vec3 parseTriple(std::string_view text, std::string_view keyword)
{
    const auto numbers = parseNumbers(text.substr(keyword.size()));
    if (numbers.size() < 3)
        throw LutParseError(fmt::format("Invalid .cube file: {} needs three values", keyword));
    return { numbers[0], numbers[1], numbers[2] };
}

[[nodiscard]] float luma(float r, float g, float b)
{
    return r * 0.299f + g * 0.587f + b * 0.114f;
}

struct Preset {
    std::string_view name;
    ColorTransform transform;
};

const std::vector<Preset>& presets()
{
    static const std::vector<Preset> s_presets = {
        { "warmVintage", [](float r, float g, float b) {
             const float lift = 0.05f;
             const float warmth = 0.1f;
             return glm::vec3(
                 std::pow(r, 0.95f) * (1.0f - lift) + lift + warmth * 0.5f,
                 g * (1.0f - lift) + lift,
                 std::pow(b, 1.05f) * (1.0f - lift * 0.5f) + lift * 0.5f - warmth * 0.3f);
         } },
        { "coolCinematic", [](float r, float g, float b) {
             const float lum = luma(r, g, b);
             const glm::vec3 teal { 0.0f, 0.1f, 0.15f };
             const glm::vec3 orange { 0.15f, 0.05f, -0.1f };
             const float shadowMix = 1.0f - std::sqrt(lum);
             const float highlightMix = lum * lum;
             return glm::vec3(r, g, b) * 0.95f + teal * shadowMix + orange * highlightMix;
         } },
        { "fadedFilm", [](float r, float g, float b) {
             const float lift = 0.1f;
             const float desat = 0.15f;
             const float lum = luma(r, g, b);
             const auto fade = [&](float c) { return (c * (1.0f - desat) + lum * desat) * (1.0f - lift) + lift; };
             return glm::vec3(fade(r), fade(g) + 0.02f, fade(b));
         } },
        { "highContrastBW", [](float r, float g, float b) {
             const float s = 1.0f / (1.0f + std::exp(-10.0f * (luma(r, g, b) - 0.5f)));
             return glm::vec3(s);
         } },
        { "goldenHour", [](float r, float g, float b) {
             const float warmth = 0.15f;
             const float satBoost = 1.1f;
             const float lum = luma(r, g, b);
             return glm::vec3(
                 lum + (r - lum) * satBoost + warmth,
                 lum + (g - lum) * satBoost + warmth * 0.5f,
                 lum + (b - lum) * satBoost - warmth * 0.3f);
         } },
        { "matteLook", [](float r, float g, float b) {
             const float lift = 0.08f;
             const float softHighlight = 0.95f;
             const auto matte = [&](float c) { return std::min(c * softHighlight + lift, 0.95f); };
             return glm::vec3(matte(r), matte(g), matte(b));
         } },
        { "vibrantPop", [](float r, float g, float b) {
             const float lum = luma(r, g, b);
             const float satBoost = 1.3f;
             // Negative bases stay negative so the clamp to 0 happens on write.
             const auto pop = [&](float c) {
                 const float v = lum + (c - lum) * satBoost;
                 return v <= 0.0f ? 0.0f : std::pow(v, 0.95f);
             };
             return glm::vec3(pop(r), pop(g), pop(b));
         } },
        { "crossProcess", [](float r, float g, float b) {
             const float lum = luma(r, g, b);
             return glm::vec3(
                 std::pow(r, 0.9f) + lum * 0.1f,
                 std::pow(g, 1.1f),
                 std::pow(b, 0.85f) + (1.0f - lum) * 0.15f);
         } },
    };
    return s_presets;
}

}

glm::vec3 LutData::lookup(int r, int g, int b) const
{
    const std::uint8_t* texel = data.data() + stripIndex(size, r, g, b);
    return glm::vec3(texel[0], texel[1], texel[2]) / 255.0f;
}

LutData parseCubeLut(std::string_view content)
{
    LutData lut;
    glm::vec3 domainMin { 0.0f };
    glm::vec3 domainMax { 1.0f };
    std::vector<float> values;

    std::size_t pos = 0;
    while (pos < content.size()) {
        auto end = content.find('\n', pos);
        if (end == std::string_view::npos)
            end = content.size();
        const std::string_view line = trim(content.substr(pos, end - pos));
        pos = end + 1;

        if (line.empty() || line.front() == '#')
            continue;

        if (startsWith(line, "TITLE")) {
            std::string title { trim(line.substr(5)) };
            title.erase(std::remove(title.begin(), title.end(), '"'), title.end());
            lut.title = std::move(title);
            continue;
        }
        if (startsWith(line, "LUT_3D_SIZE")) {
            const auto numbers = parseNumbers(line.substr(11));
            if (numbers.empty() || !(numbers[0] >= 2.0f && numbers[0] <= static_cast<float>(kMaxCubeSize)))
                throw LutParseError(fmt::format("Invalid .cube file: LUT_3D_SIZE must be between 2 and {}", kMaxCubeSize));
            lut.size = static_cast<int>(numbers[0]);
            continue;
        }
        if (startsWith(line, "DOMAIN_MIN")) {
            domainMin = parseTriple(line, "DOMAIN_MIN");
            continue;
        }
        if (startsWith(line, "DOMAIN_MAX")) {
            domainMax = parseTriple(line, "DOMAIN_MAX");
            continue;
        }

        // Other keywords (LUT_1D_SIZE, LUT_3D_INPUT_RANGE, ...) are not numeric and fall through here.
        const auto numbers = parseNumbers(line);
        if (numbers.size() >= 3) {
            for (int c = 0; c < 3; ++c)
                values.push_back(numbers[c]);
        }
    }

    for (int c = 0; c < 3; ++c) {
        if (!(domainMax[c] > domainMin[c]))
            throw LutParseError(fmt::format("Invalid .cube file: DOMAIN_MAX must exceed DOMAIN_MIN (component {})", c));
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        const int c = static_cast<int>(i % 3);
        values[i] = (values[i] - domainMin[c]) / (domainMax[c] - domainMin[c]);
    }

    if (lut.size == 0)
        throw LutParseError("Invalid .cube file: LUT_3D_SIZE not found");

    const std::size_t expected = static_cast<std::size_t>(lut.size) * lut.size * lut.size * 3;
    if (values.size() != expected)
        throw LutParseError(fmt::format("Invalid .cube file: expected {} values, got {}", expected, values.size()));

    const int n = lut.size;
    lut.data.resize(static_cast<std::size_t>(n) * n * n * 4);
    for (int b = 0; b < n; ++b) {
        for (int g = 0; g < n; ++g) {
            for (int r = 0; r < n; ++r) {
                // Red varies fastest in the file.
                const std::size_t src = (static_cast<std::size_t>(b) * n * n + static_cast<std::size_t>(g) * n + r) * 3;
                std::uint8_t* dst = lut.data.data() + stripIndex(n, r, g, b);
                dst[0] = toByte(values[src + 0]);
                dst[1] = toByte(values[src + 1]);
                dst[2] = toByte(values[src + 2]);
                dst[3] = 255;
            }
        }
    }

    return lut;
}

LutData loadCubeLut(const std::filesystem::path& filePath)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
        throw LutParseError(fmt::format("Failed to open LUT file {}", filePath.string()));

    std::stringstream buffer;
    buffer << file.rdbuf();
    LutData lut = parseCubeLut(buffer.str());
    std::cout << fmt::format("[CubeLut] loaded {} (size {}{})", filePath.filename().string(), lut.size,
        lut.title.empty() ? std::string {} : ", \"" + lut.title + "\"")
              << std::endl;
    return lut;
}

LutData generateColorGradeLut(int size, const ColorTransform& transform)
{
    if (size < 2)
        throw std::invalid_argument("LUT size must be at least 2");

    LutData lut;
    lut.size = size;
    lut.data.resize(static_cast<std::size_t>(size) * size * size * 4);
    const float step = 1.0f / static_cast<float>(size - 1);

    for (int b = 0; b < size; ++b) {
        for (int g = 0; g < size; ++g) {
            for (int r = 0; r < size; ++r) {
                const glm::vec3 out = transform(r * step, g * step, b * step);
                std::uint8_t* dst = lut.data.data() + stripIndex(size, r, g, b);
                dst[0] = toByte(out.r);
                dst[1] = toByte(out.g);
                dst[2] = toByte(out.b);
                dst[3] = 255;
            }
        }
    }
    return lut;
}

std::vector<std::string_view> presetLutNames()
{
    std::vector<std::string_view> names;
    for (const Preset& preset : presets())
        names.push_back(preset.name);
    return names;
}

LutData generatePresetLut(std::string_view name)
{
    for (const Preset& preset : presets()) {
        if (preset.name == name) {
            LutData lut = generateColorGradeLut(kPresetSize, preset.transform);
            lut.title = std::string { name };
            return lut;
        }
    }
    throw std::invalid_argument(fmt::format("Unknown LUT preset '{}'", name));
}
