// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Any failure while producing an export. Terminal: callers report it and stop.
struct ExportError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class ExportFormat {
    Jpeg,
    Png,
    Tiff
};

// Accepts "jpeg", "jpg", "png", "tiff" and "tif".
[[nodiscard]] std::optional<ExportFormat> parseExportFormat(std::string_view name);
[[nodiscard]] std::string_view formatName(ExportFormat format);
[[nodiscard]] std::string_view mimeType(ExportFormat format);
[[nodiscard]] std::string_view fileExtension(ExportFormat format);
[[nodiscard]] std::string contentDisposition(ExportFormat format);

struct EncodeSettings {
    int quality { 95 }; // JPEG only, 1..100
    int dpi { 300 };
};

// All encoders take top-row-first RGBA8 pixels and embed sRGB color
// information plus the requested density.
[[nodiscard]] std::vector<std::uint8_t> encodeJpeg(const std::uint8_t* rgba, int width, int height, const EncodeSettings& settings);
[[nodiscard]] std::vector<std::uint8_t> encodePng(const std::uint8_t* rgba, int width, int height, const EncodeSettings& settings);
[[nodiscard]] std::vector<std::uint8_t> encodeImage(ExportFormat format, const std::uint8_t* rgba, int width, int height, const EncodeSettings& settings);
