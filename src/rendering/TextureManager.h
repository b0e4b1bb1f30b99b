// SPDX-License-Identifier: MIT
#pragma once

#include "edit/EditState.h"
#include "rendering/texture.h"

#include <framework/image.h>

#include <glm/vec2.hpp>

#include <cstdint>
#include <optional>
#include <vector>

struct LutData;

// Owns the source image, the tone-curve LUT and the optional imported color LUT.
class TextureManager {
public:
    explicit TextureManager(int maxImageDimension);

    // Downsizes so neither side exceeds the maximum, then uploads. Returns the
    // size every later pass works at.
    glm::ivec2 setImage(const Image& image);
    [[nodiscard]] bool hasImage() const { return m_image.valid(); }
    [[nodiscard]] glm::ivec2 imageSize() const { return m_imageSize; }
    // CPU copy of what was uploaded (post-downsize, RGBA8).
    [[nodiscard]] const Image& sourceImage() const { return m_source; }

    // Returns true when the texture was re-uploaded.
    bool updateCurveLut(const ToneCurve& curve);
    [[nodiscard]] bool curveIsIdentity() const { return m_curveIsIdentity; }

    // data is the (size * size) x size RGBA8 strip.
    void setLut(std::vector<std::uint8_t> data, int size);
    void setLut(const LutData& lut);
    void clearLut();
    [[nodiscard]] bool hasLut() const { return m_lut.valid(); }
    [[nodiscard]] int getLutSize() const { return m_lutSize; }
    [[nodiscard]] const std::vector<std::uint8_t>& getLutData() const { return m_lutData; }

    void bindImage(GLuint unit) const;
    void bindCurveLut(GLuint unit) const;
    // Binds nothing-but-valid: without an imported LUT the curve LUT stands in.
    void bindColorLut(GLuint unit) const;

    [[nodiscard]] std::uint64_t curveUploadCount() const { return m_curveUploads; }

    void dispose();

private:
    int m_maxImageDimension;

    Texture m_image;
    Image m_source;
    glm::ivec2 m_imageSize { 0 };

    Texture m_curveLut;
    std::optional<ToneCurve> m_uploadedCurve;
    bool m_curveIsIdentity { true };
    std::uint64_t m_curveUploads { 0 };

    Texture m_lut;
    std::vector<std::uint8_t> m_lutData;
    int m_lutSize { 0 };
};
