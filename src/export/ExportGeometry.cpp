// SPDX-License-Identifier: MIT
#include "export/ExportGeometry.h"

#include <glm/trigonometric.hpp>
#include <glm/vec3.hpp>

#include <algorithm>
#include <cmath>

namespace {

// glm matrices are column-major: mat3(col0, col1, col2).
glm::mat3 scale2d(glm::vec2 s)
{
    return glm::mat3(glm::vec3(s.x, 0.0f, 0.0f), glm::vec3(0.0f, s.y, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f));
}

glm::mat3 translate2d(glm::vec2 t)
{
    return glm::mat3(glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(t.x, t.y, 1.0f));
}

// y points down, so a positive angle turns clockwise on screen.
glm::mat3 rotate2d(float degrees)
{
    const float radians = glm::radians(degrees);
    const float c = std::cos(radians);
    const float s = std::sin(radians);
    return glm::mat3(glm::vec3(c, s, 0.0f), glm::vec3(-s, c, 0.0f), glm::vec3(0.0f, 0.0f, 1.0f));
}

int roundToInt(float value)
{
    return static_cast<int>(std::lround(value));
}

}

bool isQuarterTurn(float rotationDegrees)
{
    const float magnitude = std::abs(rotationDegrees);
    return magnitude == 90.0f || magnitude == 270.0f;
}

glm::ivec2 computeExportSize(glm::ivec2 imageSize, const EditState& state, float scale, std::optional<int> maxDimension)
{
    glm::ivec2 size = imageSize;
    if (state.crop) {
        size.x = roundToInt(state.crop->width * static_cast<float>(imageSize.x));
        size.y = roundToInt(state.crop->height * static_cast<float>(imageSize.y));
    }

    if (isQuarterTurn(state.rotation))
        std::swap(size.x, size.y);

    size.x = roundToInt(static_cast<float>(size.x) * scale);
    size.y = roundToInt(static_cast<float>(size.y) * scale);

    if (maxDimension && *maxDimension > 0) {
        const int maxSide = std::max(size.x, size.y);
        if (maxSide > *maxDimension) {
            const float ratio = static_cast<float>(*maxDimension) / static_cast<float>(maxSide);
            size.x = roundToInt(static_cast<float>(size.x) * ratio);
            size.y = roundToInt(static_cast<float>(size.y) * ratio);
        }
    }
    return size;
}

CropRegion computeCropRegion(glm::ivec2 imageSize, const std::optional<CropRect>& crop)
{
    CropRegion region;
    if (!crop || imageSize.x <= 0 || imageSize.y <= 0)
        return region;

    const glm::vec2 dims { imageSize };
    const glm::vec2 originPx { std::round(crop->left * dims.x), std::round(crop->top * dims.y) };
    const glm::vec2 sizePx { std::round(crop->width * dims.x), std::round(crop->height * dims.y) };
    region.origin = originPx / dims;
    region.size = sizePx / dims;
    return region;
}

ExportTransform buildExportTransform(glm::ivec2 imageSize, glm::ivec2 outputSize, const EditState& state)
{
    ExportTransform transform;
    transform.crop = computeCropRegion(imageSize, state.crop);

    const glm::vec2 output { outputSize };
    const glm::vec2 draw = isQuarterTurn(state.rotation) ? glm::vec2(output.y, output.x) : output;
    const glm::vec2 flip { state.flipH ? -1.0f : 1.0f, state.flipV ? -1.0f : 1.0f };

    // Inverse of: center, rotate, straighten, flip, draw centered.
    transform.outputToDraw = scale2d(1.0f / draw)
        * translate2d(draw * 0.5f)
        * scale2d(flip)
        * rotate2d(-state.straighten)
        * rotate2d(-state.rotation)
        * translate2d(-output * 0.5f)
        * scale2d(output);
    return transform;
}

std::optional<glm::vec2> mapOutputToSource(const ExportTransform& transform, glm::vec2 outputCoord)
{
    const glm::vec3 q = transform.outputToDraw * glm::vec3(outputCoord, 1.0f);
    if (q.x < 0.0f || q.x > 1.0f || q.y < 0.0f || q.y > 1.0f)
        return std::nullopt;
    return transform.crop.origin + glm::vec2(q.x, q.y) * transform.crop.size;
}
