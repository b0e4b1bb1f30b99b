// SPDX-License-Identifier: MIT
#pragma once
#include <framework/opengl_includes.h>
#include <cstdint>
#include <stdexcept>
#include <vector>

// Texture, framebuffer or buffer creation failed (including incomplete framebuffers).
struct GpuResourceError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// 8-bit interleaved pixels, first row first.
struct TextureData {
    std::vector<std::uint8_t> bytes;
    int width { 0 };
    int height { 0 };
    int channels { 4 };
};

struct TextureSamplerSettings {
    GLint wrapS { GL_CLAMP_TO_EDGE };
    GLint wrapT { GL_CLAMP_TO_EDGE };
    GLint minFilter { GL_LINEAR };
    GLint magFilter { GL_LINEAR };
};

class Texture {
public:
    Texture() = default;
    Texture(const TextureData& data, TextureSamplerSettings sampler = {});
    // Uninitialized RGBA8 storage, e.g. for render targets.
    Texture(int width, int height, TextureSamplerSettings sampler = {});
    Texture(const Texture&) = delete;
    Texture(Texture&&) noexcept;
    ~Texture();

    Texture& operator=(const Texture&) = delete;
    Texture& operator=(Texture&& other) noexcept;

    // Replaces the contents; reallocates storage when the size changes.
    void upload(const TextureData& data);

    void bind(GLuint unit) const;
    void release();

    [[nodiscard]] bool valid() const { return m_texture != INVALID; }
    [[nodiscard]] GLuint id() const { return m_texture; }
    [[nodiscard]] GLuint samplerHandle() const { return m_sampler; }
    [[nodiscard]] int width() const { return m_width; }
    [[nodiscard]] int height() const { return m_height; }

private:
    static constexpr GLuint INVALID = 0xFFFFFFFF;
    void create(const TextureSamplerSettings& sampler);

    GLuint m_texture { INVALID };
    GLuint m_sampler { INVALID };
    int m_width { 0 };
    int m_height { 0 };
};
