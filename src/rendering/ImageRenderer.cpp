// SPDX-License-Identifier: MIT
#include "rendering/ImageRenderer.h"

#include "export/ExportGeometry.h"
#include "lut/CubeLut.h"
#include "rendering/TextureUnits.h"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

constexpr std::uint64_t kQuadTriangles = 2;

#ifndef NDEBUG
void debugTraceFramebuffer(const char* label)
{
    GLint draw = 0;
    GLint read = 0;
    glGetIntegerv(GL_DRAW_FRAMEBUFFER_BINDING, &draw);
    glGetIntegerv(GL_READ_FRAMEBUFFER_BINDING, &read);
    std::fprintf(stderr, "[ImageRenderer] %s | draw=%d read=%d\n", label, draw, read);
}
#define TRACE_FBO(label) debugTraceFramebuffer(label)
#else
#define TRACE_FBO(label) ((void)0)
#endif

[[nodiscard]] bool isValidSize(glm::ivec2 size)
{
    return size.x > 0 && size.y > 0;
}

// Blending is only enabled around the composite draw; callers get their state back.
class BlendStateGuard {
public:
    BlendStateGuard()
    {
        m_enabled = glIsEnabled(GL_BLEND);
        glGetIntegerv(GL_BLEND_SRC_RGB, &m_srcRgb);
        glGetIntegerv(GL_BLEND_DST_RGB, &m_dstRgb);
        glGetIntegerv(GL_BLEND_SRC_ALPHA, &m_srcAlpha);
        glGetIntegerv(GL_BLEND_DST_ALPHA, &m_dstAlpha);
        m_depthEnabled = glIsEnabled(GL_DEPTH_TEST);
        glDisable(GL_BLEND);
        glDisable(GL_DEPTH_TEST);
    }
    BlendStateGuard(const BlendStateGuard&) = delete;
    BlendStateGuard& operator=(const BlendStateGuard&) = delete;

    ~BlendStateGuard()
    {
        glBlendFuncSeparate(static_cast<GLenum>(m_srcRgb), static_cast<GLenum>(m_dstRgb),
            static_cast<GLenum>(m_srcAlpha), static_cast<GLenum>(m_dstAlpha));
        if (m_enabled)
            glEnable(GL_BLEND);
        else
            glDisable(GL_BLEND);
        if (m_depthEnabled)
            glEnable(GL_DEPTH_TEST);
    }

private:
    GLboolean m_enabled { GL_FALSE };
    GLboolean m_depthEnabled { GL_FALSE };
    GLint m_srcRgb { GL_ONE };
    GLint m_dstRgb { GL_ZERO };
    GLint m_srcAlpha { GL_ONE };
    GLint m_dstAlpha { GL_ZERO };
};

int parsePositiveInt(const char* name, const char* text)
{
    char* end = nullptr;
    const long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value <= 0)
        throw std::invalid_argument(fmt::format("{} must be a positive integer, got '{}'", name, text));
    return static_cast<int>(value);
}

}

RendererConfig RendererConfig::fromEnvironment()
{
    RendererConfig config;
    if (const char* dir = std::getenv("LUMAGRADE_SHADER_DIR"); dir != nullptr && *dir != '\0')
        config.shaderDirectory = dir;
    if (const char* maxDim = std::getenv("LUMAGRADE_MAX_IMAGE_DIMENSION"); maxDim != nullptr && *maxDim != '\0')
        config.maxImageDimension = parsePositiveInt("LUMAGRADE_MAX_IMAGE_DIMENSION", maxDim);
    return config;
}

ImageRenderer::ImageRenderer(RendererConfig config)
    : m_config(std::move(config))
    , m_shaders(m_config.shaderDirectory)
    , m_textures(m_config.maxImageDimension)
    , m_marshaler(m_shaders)
    , m_created(std::chrono::steady_clock::now())
{
    std::cout << fmt::format("[ImageRenderer] ready (shaders: {}, max dimension: {})", m_config.shaderDirectory.string(), m_config.maxImageDimension) << std::endl;
}

ImageRenderer::~ImageRenderer()
{
    dispose();
}

glm::ivec2 ImageRenderer::setImage(const Image& image)
{
    ensureAlive();
    return m_textures.setImage(image);
}

void ImageRenderer::setLut(const LutData& lut)
{
    ensureAlive();
    m_textures.setLut(lut);
}

void ImageRenderer::setLut(std::vector<std::uint8_t> data, int size)
{
    ensureAlive();
    m_textures.setLut(std::move(data), size);
}

void ImageRenderer::clearLut()
{
    ensureAlive();
    m_textures.clearLut();
}

float ImageRenderer::grainTime() const
{
    if (m_config.fixedGrainTime)
        return *m_config.fixedGrainTime;
    return std::chrono::duration<float>(std::chrono::steady_clock::now() - m_created).count();
}

bool ImageRenderer::render(const EditState& state, const RenderSurface& surface)
{
    ensureAlive();
    if (!m_textures.hasImage())
        return false;
    if (!isValidSize(surface.size))
        throw std::invalid_argument(fmt::format("Cannot render into a {}x{} surface", surface.size.x, surface.size.y));

    m_stats.beginFrame(surface.size);
    m_stats.curveUploaded = m_textures.updateCurveLut(state.curve);

    const RenderPlan plan = buildRenderPlan(state);
    m_stats.multiPass = plan.multiPass;
    if (plan.multiPass)
        m_stats.framebuffersAllocated = m_framebuffers.ensureFBOs(surface.size.x, surface.size.y);

    GLint previousFramebuffer = 0;
    glGetIntegerv(GL_DRAW_FRAMEBUFFER_BINDING, &previousFramebuffer);

    {
        BlendStateGuard blendGuard;
        const FrameContext frame { state, surface, grainTime() };
        for (const RenderPass& pass : plan.passes)
            std::visit([&](const auto& p) { execute(p, frame); }, pass);
    }

    glBindFramebuffer(GL_DRAW_FRAMEBUFFER, static_cast<GLuint>(previousFramebuffer));
    TRACE_FBO("render done");
    return true;
}

void ImageRenderer::execute(const BasePass& pass, const FrameContext& frame)
{
    const glm::ivec2 size = bindTarget(pass.target, frame.surface);
    m_marshaler.setFromState(frame.state, m_textures, size.x, size.y, frame.time, pass.overrides);
    // The source image is stored top row first.
    draw(ProgramId::Grade, true);
}

void ImageRenderer::execute(const ExtractPass& pass, const FrameContext& frame)
{
    bindTarget(pass.target, frame.surface);
    sourceTexture(pass.source).bind(TextureUnits::Pass_Input);
    m_shaders.setFloat(ProgramId::BloomExtract, "u_threshold", pass.threshold);
    m_shaders.setFloat(ProgramId::BloomExtract, "u_softKnee", pass.softKnee);
    draw(ProgramId::BloomExtract, false);
}

void ImageRenderer::execute(const BlurPass& pass, const FrameContext& frame)
{
    const glm::ivec2 size = bindTarget(pass.target, frame.surface);
    sourceTexture(pass.source).bind(TextureUnits::Pass_Input);
    m_shaders.setVec2(ProgramId::Blur, "u_direction", pass.direction);
    m_shaders.setVec2(ProgramId::Blur, "u_resolution", glm::vec2(size));
    m_shaders.setFloat(ProgramId::Blur, "u_radius", pass.radius);
    draw(ProgramId::Blur, false);
}

void ImageRenderer::execute(const CompositePass& pass, const FrameContext& frame)
{
    bindTarget(pass.target, frame.surface);
    sourceTexture(pass.glowSource).bind(TextureUnits::Pass_Glow);
    m_shaders.setFloat(ProgramId::Composite, "u_bloomIntensity", pass.intensity);
    m_shaders.setVec3(ProgramId::Composite, "u_bloomTint", pass.tint);

    glEnable(GL_BLEND);
    glBlendFunc(GL_ONE, GL_ONE);
    draw(ProgramId::Composite, false);
    glDisable(GL_BLEND);
}

void ImageRenderer::execute(const FinalPass& pass, const FrameContext& frame)
{
    const glm::ivec2 size = bindTarget(PassTarget::Surface, frame.surface);
    sourceTexture(pass.source).bind(TextureUnits::Pass_Input);
    m_marshaler.apply(ProgramId::Final, buildFinalUniforms(frame.state, size, frame.time));
    draw(ProgramId::Final, false);
}

glm::ivec2 ImageRenderer::bindTarget(PassTarget target, const RenderSurface& surface) const
{
    if (target == PassTarget::Surface) {
        glBindFramebuffer(GL_DRAW_FRAMEBUFFER, surface.framebuffer);
        glViewport(surface.origin.x, surface.origin.y, surface.size.x, surface.size.y);
        TRACE_FBO("bind surface");
        return surface.size;
    }

    const RenderTarget& fbo = m_framebuffers.target(target == PassTarget::A ? PingPong::A : PingPong::B);
    glBindFramebuffer(GL_DRAW_FRAMEBUFFER, fbo.framebuffer());
    glViewport(0, 0, fbo.size().x, fbo.size().y);
    TRACE_FBO(target == PassTarget::A ? "bind ping-pong A" : "bind ping-pong B");
    return fbo.size();
}

const Texture& ImageRenderer::sourceTexture(PassTarget source) const
{
    if (source == PassTarget::Surface)
        throw std::logic_error("ImageRenderer: the surface cannot be sampled by a pass");
    return m_framebuffers.target(source == PassTarget::A ? PingPong::A : PingPong::B).color();
}

void ImageRenderer::draw(ProgramId id, bool flipY)
{
    m_shaders.setInt(id, "u_flipY", flipY ? 1 : 0);
    m_shaders.drawQuad(id);
    m_stats.addPass(kQuadTriangles);
}

bool ImageRenderer::renderPreview(const EditState& state, const RenderSurface& window)
{
    ensureAlive();
    if (!m_textures.hasImage())
        return false;
    if (!isValidSize(window.size))
        throw std::invalid_argument(fmt::format("Cannot present into a {}x{} surface", window.size.x, window.size.y));

    const glm::ivec2 size = m_textures.imageSize();
    if (!m_previewFrame || m_previewFrame->size() != size)
        m_previewFrame.emplace(size.x, size.y);
    render(state, m_previewFrame->surface());

    glBlitNamedFramebuffer(m_previewFrame->framebuffer(), window.framebuffer,
        0, 0, size.x, size.y,
        window.origin.x, window.origin.y, window.origin.x + window.size.x, window.origin.y + window.size.y,
        GL_COLOR_BUFFER_BIT, GL_LINEAR);
    TRACE_FBO("preview presented");
    return true;
}

void ImageRenderer::transformInto(const RenderTarget& frame, const ExportTransform& transform, const RenderTarget& target)
{
    ensureAlive();

    GLint previousFramebuffer = 0;
    glGetIntegerv(GL_DRAW_FRAMEBUFFER_BINDING, &previousFramebuffer);

    {
        BlendStateGuard blendGuard;
        glBindFramebuffer(GL_DRAW_FRAMEBUFFER, target.framebuffer());
        glViewport(0, 0, target.size().x, target.size().y);
        const float clear[4] = { 0.0f, 0.0f, 0.0f, 0.0f };
        glClearNamedFramebufferfv(target.framebuffer(), GL_COLOR, 0, clear);
        TRACE_FBO("transformInto target");

        frame.color().bind(TextureUnits::Pass_Input);
        m_shaders.setMat3(ProgramId::ExportTransform, "u_outputToDraw", transform.outputToDraw);
        m_shaders.setVec2(ProgramId::ExportTransform, "u_cropOrigin", transform.crop.origin);
        m_shaders.setVec2(ProgramId::ExportTransform, "u_cropSize", transform.crop.size);
        draw(ProgramId::ExportTransform, false);
    }

    glBindFramebuffer(GL_DRAW_FRAMEBUFFER, static_cast<GLuint>(previousFramebuffer));
}

std::vector<std::uint8_t> ImageRenderer::readPixels(const RenderSurface& surface) const
{
    ensureAlive();
    if (!isValidSize(surface.size))
        throw std::invalid_argument(fmt::format("Cannot read a {}x{} surface", surface.size.x, surface.size.y));

    const std::size_t rowBytes = static_cast<std::size_t>(surface.size.x) * 4;
    std::vector<std::uint8_t> pixels(rowBytes * surface.size.y);

    GLint previousRead = 0;
    glGetIntegerv(GL_READ_FRAMEBUFFER_BINDING, &previousRead);
    glBindFramebuffer(GL_READ_FRAMEBUFFER, surface.framebuffer);
    if (surface.framebuffer != 0)
        glReadBuffer(GL_COLOR_ATTACHMENT0);
    glPixelStorei(GL_PACK_ALIGNMENT, 1);
    glReadPixels(surface.origin.x, surface.origin.y, surface.size.x, surface.size.y, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
    glPixelStorei(GL_PACK_ALIGNMENT, 4);
    glBindFramebuffer(GL_READ_FRAMEBUFFER, static_cast<GLuint>(previousRead));

    // GL returns the bottom row first.
    std::vector<std::uint8_t> row(rowBytes);
    for (int top = 0, bottom = surface.size.y - 1; top < bottom; ++top, --bottom) {
        std::uint8_t* a = pixels.data() + static_cast<std::size_t>(top) * rowBytes;
        std::uint8_t* b = pixels.data() + static_cast<std::size_t>(bottom) * rowBytes;
        std::memcpy(row.data(), a, rowBytes);
        std::memcpy(a, b, rowBytes);
        std::memcpy(b, row.data(), rowBytes);
    }
    return pixels;
}

void ImageRenderer::dispose()
{
    if (m_disposed)
        return;
    m_previewFrame.reset();
    m_framebuffers.dispose();
    m_textures.dispose();
    m_shaders.dispose();
    m_disposed = true;
}

void ImageRenderer::ensureAlive() const
{
    if (m_disposed)
        throw std::logic_error("ImageRenderer used after dispose()");
}
