// SPDX-License-Identifier: MIT
#include "rendering/FramebufferManager.h"

#include <fmt/format.h>

#include <iostream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace {

constexpr GLenum kColorAttachment = GL_COLOR_ATTACHMENT0;

std::string_view statusToString(GLenum status)
{
    switch (status) {
    case GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT:
        return "GL_FRAMEBUFFER_INCOMPLETE_ATTACHMENT";
    case GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT:
        return "GL_FRAMEBUFFER_INCOMPLETE_MISSING_ATTACHMENT";
    case GL_FRAMEBUFFER_UNSUPPORTED:
        return "GL_FRAMEBUFFER_UNSUPPORTED";
    default:
        return "UNKNOWN";
    }
}

}

RenderTarget::RenderTarget(int width, int height)
    : m_color(width, height, TextureSamplerSettings { GL_CLAMP_TO_EDGE, GL_CLAMP_TO_EDGE, GL_LINEAR, GL_LINEAR })
    , m_size(width, height)
{
    glCreateFramebuffers(1, &m_framebuffer);
    if (m_framebuffer == 0)
        throw GpuResourceError("glCreateFramebuffers failed");

    glNamedFramebufferTexture(m_framebuffer, kColorAttachment, m_color.id(), 0);
    glNamedFramebufferDrawBuffer(m_framebuffer, kColorAttachment);

    const GLenum status = glCheckNamedFramebufferStatus(m_framebuffer, GL_FRAMEBUFFER);
    if (status != GL_FRAMEBUFFER_COMPLETE) {
        release();
        throw GpuResourceError(fmt::format("Framebuffer {}x{} incomplete: {}", width, height, statusToString(status)));
    }
}

RenderTarget::RenderTarget(RenderTarget&& other) noexcept
    : m_framebuffer(other.m_framebuffer)
    , m_color(std::move(other.m_color))
    , m_size(other.m_size)
{
    other.m_framebuffer = 0;
    other.m_size = glm::ivec2(0);
}

RenderTarget::~RenderTarget()
{
    release();
}

RenderTarget& RenderTarget::operator=(RenderTarget&& other) noexcept
{
    if (this == &other)
        return *this;

    release();
    m_framebuffer = other.m_framebuffer;
    m_color = std::move(other.m_color);
    m_size = other.m_size;
    other.m_framebuffer = 0;
    other.m_size = glm::ivec2(0);
    return *this;
}

void RenderTarget::release()
{
    if (m_framebuffer)
        glDeleteFramebuffers(1, &m_framebuffer);
    m_framebuffer = 0;
    m_color.release();
}

bool FramebufferManager::ensureFBOs(int width, int height)
{
    if (width <= 0 || height <= 0)
        throw GpuResourceError(fmt::format("Invalid framebuffer size {}x{}", width, height));

    if (allocated() && m_size == glm::ivec2(width, height))
        return false;

    dispose();
    m_a.emplace(width, height);
    m_b.emplace(width, height);
    m_size = glm::ivec2(width, height);
    ++m_allocationCount;

    std::cout << fmt::format("[FramebufferManager] allocated ping-pong pair {}x{}", width, height) << std::endl;
    return true;
}

const RenderTarget& FramebufferManager::target(PingPong which) const
{
    const std::optional<RenderTarget>& slot = which == PingPong::A ? m_a : m_b;
    if (!slot)
        throw std::logic_error("FramebufferManager: framebuffers requested before ensureFBOs()");
    return *slot;
}

void FramebufferManager::dispose()
{
    m_a.reset();
    m_b.reset();
    m_size = glm::ivec2(0);
}
