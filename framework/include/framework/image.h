#pragma once
#include "disable_all_warnings.h"
DISABLE_WARNINGS_PUSH()
#include <glm/vec2.hpp>
DISABLE_WARNINGS_POP()
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <vector>

struct ImageLoadingException : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// 8-bit interleaved raster, top row first.
class Image {
public:
    Image() = default;
    explicit Image(const std::filesystem::path& filePath, int forceChannels = 4);
    Image(int width, int height, int channels, std::vector<std::uint8_t> pixels);

    [[nodiscard]] const std::uint8_t* get_data() const { return m_pixels.data(); }
    [[nodiscard]] std::uint8_t* get_data() { return m_pixels.data(); }
    [[nodiscard]] const std::vector<std::uint8_t>& pixels() const { return m_pixels; }
    [[nodiscard]] glm::ivec2 size() const { return { width, height }; }
    [[nodiscard]] bool empty() const { return m_pixels.empty(); }

    int width { 0 };
    int height { 0 };
    int channels { 0 };

private:
    std::vector<std::uint8_t> m_pixels;
};

// Aspect-preserving size whose longest side is at most maxDimension.
[[nodiscard]] glm::ivec2 fitWithin(glm::ivec2 size, int maxDimension);

// Box-filter (area average) resample. Returns a copy when no downsizing is needed.
[[nodiscard]] Image downsizeToFit(const Image& image, int maxDimension);
