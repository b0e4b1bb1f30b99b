// SPDX-License-Identifier: MIT

#include "rendering/texture.h"

#include <fmt/format.h>

#include <iostream>
#include <string_view>
#include <utility>

namespace {

GLenum pickExternalFormat(int channels)
{
    switch (channels) {
    case 1:
        return GL_RED;
    case 2:
        return GL_RG;
    case 3:
        return GL_RGB;
    case 4:
        return GL_RGBA;
    default:
        throw GpuResourceError(fmt::format("Unsupported channel count ({}) for texture upload", channels));
    }
}

std::string_view formatToString(GLenum format)
{
    switch (format) {
    case GL_RED:
        return "GL_RED";
    case GL_RG:
        return "GL_RG";
    case GL_RGB:
        return "GL_RGB";
    case GL_RGBA:
        return "GL_RGBA";
    case GL_RGBA8:
        return "GL_RGBA8";
    default:
        return "UNKNOWN";
    }
}

void allocateStorage(GLuint texture, int width, int height, const std::uint8_t* pixels, GLenum externalFormat)
{
    glBindTexture(GL_TEXTURE_2D, texture);
    // Rows of 1- to 3-channel data are not 4-byte aligned in general.
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, width, height, 0, externalFormat, GL_UNSIGNED_BYTE, pixels);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);

    GLint checkFormat = 0;
    glGetTexLevelParameteriv(GL_TEXTURE_2D, 0, GL_TEXTURE_INTERNAL_FORMAT, &checkFormat);
    if (checkFormat != GL_RGBA8) {
        std::cerr << fmt::format("[Warning] Texture internal format mismatch! expected={} got={}", formatToString(GL_RGBA8), formatToString(static_cast<GLenum>(checkFormat))) << std::endl;
    }
    glBindTexture(GL_TEXTURE_2D, 0);
}

}

Texture::Texture(const TextureData& data, TextureSamplerSettings sampler)
{
    create(sampler);
    upload(data);
}

Texture::Texture(int width, int height, TextureSamplerSettings sampler)
{
    if (width <= 0 || height <= 0)
        throw GpuResourceError(fmt::format("Invalid texture size {}x{}", width, height));

    create(sampler);
    allocateStorage(m_texture, width, height, nullptr, GL_RGBA);
    m_width = width;
    m_height = height;
}

Texture::Texture(Texture&& other) noexcept
    : m_texture(other.m_texture)
    , m_sampler(other.m_sampler)
    , m_width(other.m_width)
    , m_height(other.m_height)
{
    other.m_texture = INVALID;
    other.m_sampler = INVALID;
    other.m_width = 0;
    other.m_height = 0;
}

Texture::~Texture()
{
    release();
}

Texture& Texture::operator=(Texture&& other) noexcept
{
    if (this == &other)
        return *this;

    release();

    m_texture = other.m_texture;
    m_sampler = other.m_sampler;
    m_width = other.m_width;
    m_height = other.m_height;

    other.m_texture = INVALID;
    other.m_sampler = INVALID;
    other.m_width = 0;
    other.m_height = 0;
    return *this;
}

void Texture::create(const TextureSamplerSettings& sampler)
{
    glGenTextures(1, &m_texture);
    if (m_texture == 0) {
        m_texture = INVALID;
        throw GpuResourceError("glGenTextures failed");
    }

    glGenSamplers(1, &m_sampler);
    glSamplerParameteri(m_sampler, GL_TEXTURE_WRAP_S, sampler.wrapS);
    glSamplerParameteri(m_sampler, GL_TEXTURE_WRAP_T, sampler.wrapT);
    glSamplerParameteri(m_sampler, GL_TEXTURE_MIN_FILTER, sampler.minFilter);
    glSamplerParameteri(m_sampler, GL_TEXTURE_MAG_FILTER, sampler.magFilter);

    // Also the texture's own state, so framebuffer-attached textures sample
    // the same way when no sampler object is bound.
    glBindTexture(GL_TEXTURE_2D, m_texture);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, sampler.wrapS);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, sampler.wrapT);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, sampler.minFilter);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, sampler.magFilter);
    glBindTexture(GL_TEXTURE_2D, 0);
}

void Texture::upload(const TextureData& data)
{
    if (!valid())
        throw GpuResourceError("Upload into a released texture");
    if (data.width <= 0 || data.height <= 0)
        throw GpuResourceError(fmt::format("Invalid texture size {}x{}", data.width, data.height));

    const std::size_t expected = static_cast<std::size_t>(data.width) * data.height * data.channels;
    if (data.bytes.size() < expected)
        throw GpuResourceError(fmt::format("Texture data holds {} bytes, {}x{}x{} needs {}", data.bytes.size(), data.width, data.height, data.channels, expected));

    const GLenum externalFormat = pickExternalFormat(data.channels);
    std::cout << fmt::format("[Texture Upload] size={}x{} channels={} -> internalFormat={} externalFormat={}", data.width, data.height, data.channels, formatToString(GL_RGBA8), formatToString(externalFormat))
              << std::endl;

    if (data.width == m_width && data.height == m_height) {
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTextureSubImage2D(m_texture, 0, 0, 0, data.width, data.height, externalFormat, GL_UNSIGNED_BYTE, data.bytes.data());
        glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
    } else {
        allocateStorage(m_texture, data.width, data.height, data.bytes.data(), externalFormat);
        m_width = data.width;
        m_height = data.height;
    }
}

void Texture::bind(GLuint unit) const
{
    glBindTextureUnit(unit, m_texture);
    glBindSampler(unit, m_sampler);
}

void Texture::release()
{
    if (m_sampler != INVALID)
        glDeleteSamplers(1, &m_sampler);
    if (m_texture != INVALID)
        glDeleteTextures(1, &m_texture);
    m_sampler = INVALID;
    m_texture = INVALID;
    m_width = 0;
    m_height = 0;
}
