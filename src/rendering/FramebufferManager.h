// SPDX-License-Identifier: MIT
#pragma once

#include "rendering/texture.h"

#include <framework/opengl_includes.h>

#include <glm/vec2.hpp>

#include <cstdint>
#include <optional>

// A framebuffer region passes draw into. framebuffer 0 is the window.
struct RenderSurface {
    GLuint framebuffer { 0 };
    glm::ivec2 origin { 0 };
    glm::ivec2 size { 0 };
};

// One framebuffer with a linear-filtered, clamp-to-edge RGBA8 color texture.
class RenderTarget {
public:
    RenderTarget(int width, int height);
    RenderTarget(const RenderTarget&) = delete;
    RenderTarget(RenderTarget&& other) noexcept;
    ~RenderTarget();

    RenderTarget& operator=(const RenderTarget&) = delete;
    RenderTarget& operator=(RenderTarget&& other) noexcept;

    [[nodiscard]] GLuint framebuffer() const { return m_framebuffer; }
    [[nodiscard]] const Texture& color() const { return m_color; }
    [[nodiscard]] glm::ivec2 size() const { return m_size; }
    [[nodiscard]] RenderSurface surface() const { return { m_framebuffer, glm::ivec2(0), m_size }; }

private:
    void release();

    GLuint m_framebuffer { 0 };
    Texture m_color;
    glm::ivec2 m_size { 0 };
};

enum class PingPong {
    A,
    B
};

// Two equally sized render targets for multi-pass rendering.
class FramebufferManager {
public:
    // No-op when both targets already have this size. Returns true when it allocated.
    bool ensureFBOs(int width, int height);

    [[nodiscard]] bool allocated() const { return m_a.has_value(); }
    [[nodiscard]] glm::ivec2 size() const { return m_size; }
    [[nodiscard]] std::uint64_t allocationCount() const { return m_allocationCount; }

    // Throws std::logic_error before the first ensureFBOs().
    [[nodiscard]] const RenderTarget& target(PingPong which) const;

    void dispose();

private:
    std::optional<RenderTarget> m_a;
    std::optional<RenderTarget> m_b;
    glm::ivec2 m_size { 0 };
    std::uint64_t m_allocationCount { 0 };
};
