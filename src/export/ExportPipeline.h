// SPDX-License-Identifier: MIT
#pragma once

#include "edit/EditState.h"
#include "export/ImageEncoder.h"

#include <glm/vec2.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class ImageRenderer;

struct ExportOptions {
    ExportFormat format { ExportFormat::Jpeg };
    int quality { 95 };
    float scale { 1.0f };
    std::optional<int> maxDimension;
    int dpi { 300 };
};

struct ExportResult {
    std::vector<std::uint8_t> bytes;
    std::string mimeType;
    std::string contentDisposition;
    glm::ivec2 size { 0 };
};

// Final-resolution pixels before encoding, top row first.
struct ExportPixels {
    std::vector<std::uint8_t> rgba;
    glm::ivec2 size { 0 };
};

// Renders the edit at image size, then crops, rotates, flips and resamples
// into the export raster. Every failure is reported as ExportError.
[[nodiscard]] ExportPixels renderExportPixels(ImageRenderer& renderer, const EditState& state, const ExportOptions& options);

[[nodiscard]] ExportResult exportImage(ImageRenderer& renderer, const EditState& state, const ExportOptions& options);
