// SPDX-License-Identifier: MIT
#pragma once

#include "edit/EditState.h"

#include <glm/mat3x3.hpp>
#include <glm/vec2.hpp>

#include <optional>

// Size of the encoded image: crop (rounded to whole source pixels), swap for
// quarter-turn rotations, scale, then an aspect-preserving maxDimension clamp.
[[nodiscard]] glm::ivec2 computeExportSize(glm::ivec2 imageSize, const EditState& state, float scale, std::optional<int> maxDimension);

[[nodiscard]] bool isQuarterTurn(float rotationDegrees);

// Crop rectangle snapped to whole source pixels, normalized, top-left origin.
struct CropRegion {
    glm::vec2 origin { 0.0f };
    glm::vec2 size { 1.0f };
};

[[nodiscard]] CropRegion computeCropRegion(glm::ivec2 imageSize, const std::optional<CropRect>& crop);

// Maps a normalized output coordinate (top-left origin) into the normalized
// draw rectangle that holds the cropped image. The draw rectangle is rotated,
// straightened and flipped about the output center; coordinates that land
// outside [0, 1] are not covered by the image.
struct ExportTransform {
    glm::mat3 outputToDraw { 1.0f };
    CropRegion crop;
};

[[nodiscard]] ExportTransform buildExportTransform(glm::ivec2 imageSize, glm::ivec2 outputSize, const EditState& state);

// Source coordinate (normalized, top-left origin) seen by an output sample,
// or nullopt for uncovered samples. Mirrors export_transform.frag.
[[nodiscard]] std::optional<glm::vec2> mapOutputToSource(const ExportTransform& transform, glm::vec2 outputCoord);
