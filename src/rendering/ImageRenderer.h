// SPDX-License-Identifier: MIT
#pragma once

#include "edit/EditState.h"
#include "rendering/FramebufferManager.h"
#include "rendering/RenderPlan.h"
#include "rendering/RenderStats.h"
#include "rendering/ShaderManager.h"
#include "rendering/TextureManager.h"
#include "rendering/UniformMarshaler.h"

#include <framework/image.h>

#include <glm/vec2.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

struct ExportTransform;
struct LutData;

struct RendererConfig {
    int maxImageDimension { 2000 };
    std::filesystem::path shaderDirectory { std::filesystem::path(RESOURCE_ROOT "shaders") };
    // Grain normally follows the seconds since the renderer was created.
    std::optional<float> fixedGrainTime;

    // Defaults overridden by LUMAGRADE_SHADER_DIR and LUMAGRADE_MAX_IMAGE_DIMENSION.
    [[nodiscard]] static RendererConfig fromEnvironment();
};

// Renders an edit of one source image through the pass plan. Needs a current
// OpenGL 4.5 context for its whole lifetime.
class ImageRenderer {
public:
    explicit ImageRenderer(RendererConfig config = {});
    ImageRenderer(const ImageRenderer&) = delete;
    ImageRenderer& operator=(const ImageRenderer&) = delete;
    ~ImageRenderer();

    // Returns the working size after the maximum-dimension constraint.
    glm::ivec2 setImage(const Image& image);
    [[nodiscard]] bool hasImage() const { return m_textures.hasImage(); }
    [[nodiscard]] glm::ivec2 imageSize() const { return m_textures.imageSize(); }

    void setLut(const LutData& lut);
    void setLut(std::vector<std::uint8_t> data, int size);
    void clearLut();
    [[nodiscard]] const TextureManager& textures() const { return m_textures; }
    [[nodiscard]] const FramebufferManager& framebuffers() const { return m_framebuffers; }

    // Returns false without drawing when no image has been set.
    bool render(const EditState& state, const RenderSurface& surface);
    // Renders at the working image size, then scales that frame into the
    // window rectangle so pixel radii match an export of the same edit.
    bool renderPreview(const EditState& state, const RenderSurface& window);
    [[nodiscard]] const RenderTarget* previewFrame() const { return m_previewFrame ? &*m_previewFrame : nullptr; }

    // Resamples a rendered frame into target with crop, rotation and flips applied.
    void transformInto(const RenderTarget& frame, const ExportTransform& transform, const RenderTarget& target);

    // RGBA8, top row first.
    [[nodiscard]] std::vector<std::uint8_t> readPixels(const RenderSurface& surface) const;

    [[nodiscard]] const RenderStats& stats() const { return m_stats; }
    [[nodiscard]] const RendererConfig& config() const { return m_config; }
    [[nodiscard]] float grainTime() const;

    void dispose();

private:
    struct FrameContext {
        const EditState& state;
        const RenderSurface& surface;
        float time;
    };

    void execute(const BasePass& pass, const FrameContext& frame);
    void execute(const ExtractPass& pass, const FrameContext& frame);
    void execute(const BlurPass& pass, const FrameContext& frame);
    void execute(const CompositePass& pass, const FrameContext& frame);
    void execute(const FinalPass& pass, const FrameContext& frame);

    // Binds the pass output and sets the viewport. Returns the target size.
    glm::ivec2 bindTarget(PassTarget target, const RenderSurface& surface) const;
    [[nodiscard]] const Texture& sourceTexture(PassTarget source) const;
    void draw(ProgramId id, bool flipY);

    void ensureAlive() const;

    RendererConfig m_config;
    ShaderManager m_shaders;
    TextureManager m_textures;
    FramebufferManager m_framebuffers;
    UniformMarshaler m_marshaler;
    RenderStats m_stats;
    std::optional<RenderTarget> m_previewFrame;
    std::chrono::steady_clock::time_point m_created;
    bool m_disposed { false };
};
