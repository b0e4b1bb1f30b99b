// SPDX-License-Identifier: MIT
#include "rendering/TextureManager.h"

#include "lut/CubeLut.h"
#include "util/CurveEngine.h"

#include <fmt/format.h>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace {

const TextureSamplerSettings kLinearClamp { GL_CLAMP_TO_EDGE, GL_CLAMP_TO_EDGE, GL_LINEAR, GL_LINEAR };

TextureData curveTextureData(std::vector<std::uint8_t> bytes)
{
    return TextureData { std::move(bytes), CurveLut::Samples, CurveLut::Rows, 4 };
}

}

TextureManager::TextureManager(int maxImageDimension)
    : m_maxImageDimension(maxImageDimension)
    , m_curveLut(curveTextureData(identityCurveLutData()), kLinearClamp)
{
    m_uploadedCurve = ToneCurve {};
}

glm::ivec2 TextureManager::setImage(const Image& image)
{
    if (image.empty() || image.width <= 0 || image.height <= 0)
        throw ImageLoadingException("Cannot use an empty image");
    if (image.channels != 4)
        throw ImageLoadingException(fmt::format("Expected RGBA8 pixels, got {} channels", image.channels));

    m_source = downsizeToFit(image, m_maxImageDimension);
    if (m_source.size() != image.size()) {
        std::cout << fmt::format("[TextureManager] downsized {}x{} -> {}x{}", image.width, image.height, m_source.width, m_source.height) << std::endl;
    }

    // The previous texture is destroyed before the new one is created.
    m_image.release();
    m_image = Texture(TextureData { m_source.pixels(), m_source.width, m_source.height, 4 }, kLinearClamp);
    m_imageSize = m_source.size();
    return m_imageSize;
}

bool TextureManager::updateCurveLut(const ToneCurve& curve)
{
    if (m_uploadedCurve && *m_uploadedCurve == curve)
        return false;

    m_curveIsIdentity = isCurveIdentity(curve);
    m_curveLut.upload(curveTextureData(generateCurveLutData(curve)));
    m_uploadedCurve = curve;
    ++m_curveUploads;
    return true;
}

void TextureManager::setLut(std::vector<std::uint8_t> data, int size)
{
    const std::size_t expected = static_cast<std::size_t>(size) * size * size * 4;
    if (size < 2 || data.size() != expected)
        throw std::invalid_argument(fmt::format("LUT of size {} needs {} bytes, got {}", size, expected, data.size()));

    m_lut.release();
    m_lut = Texture(TextureData { data, size * size, size, 4 }, kLinearClamp);
    m_lutData = std::move(data);
    m_lutSize = size;
}

void TextureManager::setLut(const LutData& lut)
{
    setLut(lut.data, lut.size);
}

void TextureManager::clearLut()
{
    m_lut.release();
    m_lutData.clear();
    m_lutSize = 0;
}

void TextureManager::bindImage(GLuint unit) const
{
    if (!hasImage())
        throw std::logic_error("TextureManager: no image has been set");
    m_image.bind(unit);
}

void TextureManager::bindCurveLut(GLuint unit) const
{
    m_curveLut.bind(unit);
}

void TextureManager::bindColorLut(GLuint unit) const
{
    if (hasLut())
        m_lut.bind(unit);
    else
        m_curveLut.bind(unit);
}

void TextureManager::dispose()
{
    m_image.release();
    m_source = Image {};
    m_imageSize = glm::ivec2(0);
    m_curveLut.release();
    m_uploadedCurve.reset();
    clearLut();
}
