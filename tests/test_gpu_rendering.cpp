// SPDX-License-Identifier: MIT
// Needs an OpenGL 4.5 context; skipped where no window can be created.
#include "export/ExportPipeline.h"
#include "export/Histogram.h"
#include "rendering/ImageRenderer.h"
#include "rendering/ShaderManager.h"

#include <framework/window.h>

#include <gtest/gtest.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

Image solidImage(int width, int height, std::uint8_t r, std::uint8_t g, std::uint8_t b)
{
    std::vector<std::uint8_t> pixels;
    pixels.reserve(static_cast<std::size_t>(width) * height * 4);
    for (int i = 0; i < width * height; ++i)
        pixels.insert(pixels.end(), { r, g, b, 255 });
    return Image(width, height, 4, std::move(pixels));
}

// Smooth gradient with a red top half and a blue bottom half.
Image testCard(int width, int height)
{
    std::vector<std::uint8_t> pixels;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const auto shade = static_cast<std::uint8_t>(60 + x * 120 / (width - 1));
            if (y < height / 2)
                pixels.insert(pixels.end(), { shade, 20, 20, 255 });
            else
                pixels.insert(pixels.end(), { 20, 20, shade, 255 });
        }
    }
    return Image(width, height, 4, std::move(pixels));
}

double meanOf(const std::array<std::uint32_t, kHistogramBins>& bins)
{
    double sum = 0.0;
    double count = 0.0;
    for (int i = 0; i < kHistogramBins; ++i) {
        sum += static_cast<double>(i) * bins[i];
        count += bins[i];
    }
    return count > 0.0 ? sum / count : 0.0;
}

}

class GpuRendering : public ::testing::Test {
protected:
    static void SetUpTestSuite()
    {
        if (std::getenv("LUMAGRADE_SKIP_GPU_TESTS"))
            return;
        try {
            WindowSettings settings;
            settings.visible = false;
            settings.vsync = false;
            s_window = std::make_unique<Window>("lumagrade tests", glm::ivec2(64, 64), OpenGLVersion::GL45, settings);
        } catch (const WindowCreationException& e) {
            std::cerr << "[GpuRendering] no OpenGL context: " << e.what() << std::endl;
            s_window.reset();
        }
    }

    static void TearDownTestSuite() { s_window.reset(); }

    void SetUp() override
    {
        if (!s_window)
            GTEST_SKIP() << "No OpenGL 4.5 context available";
        RendererConfig config;
        config.fixedGrainTime = 0.0f;
        m_renderer = std::make_unique<ImageRenderer>(config);
    }

    void TearDown() override { m_renderer.reset(); }

    std::vector<std::uint8_t> renderAtImageSize(const EditState& state)
    {
        const glm::ivec2 size = m_renderer->imageSize();
        const RenderTarget target(size.x, size.y);
        EXPECT_TRUE(m_renderer->render(state, target.surface()));
        return m_renderer->readPixels(target.surface());
    }

    static std::unique_ptr<Window> s_window;
    std::unique_ptr<ImageRenderer> m_renderer;
};

std::unique_ptr<Window> GpuRendering::s_window;

TEST_F(GpuRendering, RenderWithoutImageDoesNothing)
{
    const RenderTarget target(8, 8);
    EXPECT_FALSE(m_renderer->render(EditState {}, target.surface()));
    EXPECT_THROW((void)exportImage(*m_renderer, EditState {}, ExportOptions {}), ExportError);
}

TEST_F(GpuRendering, DefaultEditReproducesTheSource)
{
    const Image card = testCard(32, 16);
    m_renderer->setImage(card);
    const auto pixels = renderAtImageSize(EditState {});

    ASSERT_EQ(pixels.size(), card.pixels().size());
    for (std::size_t i = 0; i < pixels.size(); ++i)
        ASSERT_NEAR(pixels[i], card.pixels()[i], 3) << "byte " << i;
    EXPECT_EQ(m_renderer->stats().passes, 1u);
    EXPECT_FALSE(m_renderer->stats().multiPass);
    EXPECT_EQ(m_renderer->stats().surfaceSize, glm::ivec2(32, 16));
}

TEST_F(GpuRendering, ZeroBloomMatchesNoBloom)
{
    m_renderer->setImage(testCard(24, 24));
    const auto reference = renderAtImageSize(EditState {});

    EditState state;
    state.bloom.threshold = 5.0f;
    state.bloom.radius = 100.0f;
    state.halation.hue = 120.0f;
    EXPECT_EQ(renderAtImageSize(state), reference);
    EXPECT_FALSE(m_renderer->framebuffers().allocated());
}

TEST_F(GpuRendering, PingPongTargetsFollowTheSurfaceSize)
{
    m_renderer->setImage(testCard(40, 20));
    EditState state;
    state.bloom.amount = 30.0f;

    const RenderTarget small(40, 20);
    ASSERT_TRUE(m_renderer->render(state, small.surface()));
    EXPECT_EQ(m_renderer->framebuffers().allocationCount(), 1u);
    EXPECT_EQ(m_renderer->framebuffers().size(), glm::ivec2(40, 20));
    EXPECT_EQ(m_renderer->stats().passes, 7u);
    EXPECT_TRUE(m_renderer->stats().multiPass);
    EXPECT_TRUE(m_renderer->stats().framebuffersAllocated);

    state.bloom.amount = 60.0f;
    ASSERT_TRUE(m_renderer->render(state, small.surface()));
    EXPECT_EQ(m_renderer->framebuffers().allocationCount(), 1u);
    EXPECT_FALSE(m_renderer->stats().framebuffersAllocated);

    const RenderTarget large(80, 40);
    ASSERT_TRUE(m_renderer->render(state, large.surface()));
    EXPECT_EQ(m_renderer->framebuffers().allocationCount(), 2u);
    EXPECT_EQ(m_renderer->framebuffers().size(), glm::ivec2(80, 40));
    EXPECT_TRUE(m_renderer->stats().framebuffersAllocated);

    // Back to the first size reallocates once, then stays.
    ASSERT_TRUE(m_renderer->render(state, small.surface()));
    EXPECT_EQ(m_renderer->framebuffers().allocationCount(), 3u);
    EXPECT_EQ(m_renderer->framebuffers().size(), glm::ivec2(40, 20));
    EXPECT_TRUE(m_renderer->stats().framebuffersAllocated);

    ASSERT_TRUE(m_renderer->render(state, small.surface()));
    EXPECT_EQ(m_renderer->framebuffers().allocationCount(), 3u);
    EXPECT_FALSE(m_renderer->stats().framebuffersAllocated);
}

TEST_F(GpuRendering, MultiPassKeepsTheImageUpright)
{
    const int width = 32;
    const int height = 32;
    m_renderer->setImage(testCard(width, height));

    EditState state;
    state.bloom.amount = 10.0f;
    state.blur.amount = 30.0f;
    const auto pixels = renderAtImageSize(state);

    const auto at = [&](int x, int y) { return pixels.data() + (static_cast<std::size_t>(y) * width + x) * 4; };
    const std::uint8_t* top = at(width / 2, 2);
    const std::uint8_t* bottom = at(width / 2, height - 3);
    EXPECT_GT(top[0], top[2]);
    EXPECT_GT(bottom[2], bottom[0]);
}

TEST_F(GpuRendering, CurveLiftsBlacks)
{
    m_renderer->setImage(solidImage(8, 8, 0, 0, 0));
    EditState state;
    state.curve.rgb = { CurvePoint { 0.0f, 0.2f }, CurvePoint { 1.0f, 1.0f } };
    const auto pixels = renderAtImageSize(state);
    EXPECT_FALSE(m_renderer->textures().curveIsIdentity());
    for (std::size_t i = 0; i < pixels.size(); i += 4) {
        ASSERT_NEAR(pixels[i], 51, 2);
        ASSERT_NEAR(pixels[i + 1], 51, 2);
        ASSERT_NEAR(pixels[i + 2], 51, 2);
    }
}

TEST_F(GpuRendering, SlightlyLiftedCurveBrightensMidGray)
{
    m_renderer->setImage(solidImage(8, 8, 128, 128, 128));
    EditState state;
    state.curve.rgb = { CurvePoint { 0.0f, 0.05f }, CurvePoint { 1.0f, 1.0f } };
    const auto pixels = renderAtImageSize(state);
    for (std::size_t i = 0; i < pixels.size(); i += 4)
        ASSERT_GT(pixels[i], 128);
}

TEST_F(GpuRendering, RevertedCurveRestoresTheIdentityRender)
{
    m_renderer->setImage(testCard(16, 16));
    const auto reference = renderAtImageSize(EditState {});
    EXPECT_TRUE(m_renderer->textures().curveIsIdentity());
    const std::uint64_t uploads = m_renderer->textures().curveUploadCount();

    EditState state;
    state.curve.green = { CurvePoint { 0.0f, 0.0f }, CurvePoint { 1.0f, 0.5f } };
    EXPECT_NE(renderAtImageSize(state), reference);
    EXPECT_EQ(m_renderer->textures().curveUploadCount(), uploads + 1);

    // Unchanged curves are not uploaded again.
    (void)renderAtImageSize(state);
    EXPECT_EQ(m_renderer->textures().curveUploadCount(), uploads + 1);

    EXPECT_EQ(renderAtImageSize(EditState {}), reference);
    EXPECT_TRUE(m_renderer->textures().curveIsIdentity());
}

TEST_F(GpuRendering, SampledIdentityChannelsMatchTheSkippedCurve)
{
    m_renderer->setImage(testCard(32, 16));
    const auto reference = renderAtImageSize(EditState {});

    // Only red is edited: the curve texture is sampled, and its green and blue
    // rows must reproduce the untouched channels.
    EditState state;
    state.curve.red = { CurvePoint { 0.0f, 0.0f }, CurvePoint { 1.0f, 0.5f } };
    const auto edited = renderAtImageSize(state);
    EXPECT_FALSE(m_renderer->textures().curveIsIdentity());

    ASSERT_EQ(edited.size(), reference.size());
    bool redChanged = false;
    for (std::size_t i = 0; i < edited.size(); i += 4) {
        ASSERT_NEAR(edited[i + 1], reference[i + 1], 1) << "pixel " << i / 4;
        ASSERT_NEAR(edited[i + 2], reference[i + 2], 1) << "pixel " << i / 4;
        redChanged = redChanged || edited[i] + 10 < reference[i];
    }
    EXPECT_TRUE(redChanged);
}

TEST_F(GpuRendering, ExportMatchesPreviewTonally)
{
    m_renderer->setImage(testCard(48, 32));
    EditState state;
    state.exposure = 0.5f;
    state.contrast = 20.0f;
    state.vignette.amount = -30.0f;
    state.bloom.amount = 40.0f;

    // A window smaller than the image, as the letterboxed preview usually is.
    const RenderTarget window(24, 16);
    ASSERT_TRUE(m_renderer->renderPreview(state, window.surface()));
    ASSERT_NE(m_renderer->previewFrame(), nullptr);
    EXPECT_EQ(m_renderer->previewFrame()->size(), glm::ivec2(48, 32));
    const auto frame = m_renderer->readPixels(m_renderer->previewFrame()->surface());
    const auto shown = m_renderer->readPixels(window.surface());

    ExportOptions options;
    options.format = ExportFormat::Png;
    const ExportPixels exported = renderExportPixels(*m_renderer, state, options);
    ASSERT_EQ(exported.size, glm::ivec2(48, 32));

    // Same working size, so bloom radii and vignette agree pixel for pixel.
    ASSERT_EQ(frame.size(), exported.rgba.size());
    for (std::size_t i = 0; i < frame.size(); ++i)
        ASSERT_NEAR(frame[i], exported.rgba[i], 2) << "byte " << i;

    const HistogramData shownHistogram = computeHistogram(shown.data(), shown.size() / 4);
    const HistogramData exportHistogram = computeHistogram(exported.rgba.data(), exported.rgba.size() / 4);
    EXPECT_NEAR(meanOf(exportHistogram.luminance), meanOf(shownHistogram.luminance), 2.0);
    EXPECT_NEAR(meanOf(exportHistogram.red), meanOf(shownHistogram.red), 2.0);
    EXPECT_NEAR(meanOf(exportHistogram.blue), meanOf(shownHistogram.blue), 2.0);
}

TEST_F(GpuRendering, PreviewFrameFollowsTheImageNotTheWindow)
{
    m_renderer->setImage(testCard(40, 20));
    const RenderTarget small(20, 10);
    const RenderTarget large(80, 40);

    ASSERT_TRUE(m_renderer->renderPreview(EditState {}, small.surface()));
    const RenderTarget* first = m_renderer->previewFrame();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->size(), glm::ivec2(40, 20));

    ASSERT_TRUE(m_renderer->renderPreview(EditState {}, large.surface()));
    EXPECT_EQ(m_renderer->previewFrame()->size(), glm::ivec2(40, 20));
    EXPECT_EQ(m_renderer->stats().surfaceSize, glm::ivec2(40, 20));

    // Upscaled blit keeps the red top half and blue bottom half.
    const auto pixels = m_renderer->readPixels(large.surface());
    const std::size_t top = (static_cast<std::size_t>(5) * 80 + 40) * 4;
    const std::size_t bottom = (static_cast<std::size_t>(35) * 80 + 40) * 4;
    EXPECT_GT(pixels[top + 0], pixels[top + 2]);
    EXPECT_GT(pixels[bottom + 2], pixels[bottom + 0]);
}

TEST_F(GpuRendering, ExportAppliesQuarterTurnAndScale)
{
    m_renderer->setImage(testCard(40, 20));
    EditState state;
    state.rotation = 90.0f;

    ExportOptions options;
    options.format = ExportFormat::Png;
    options.scale = 0.5f;
    const ExportResult result = exportImage(*m_renderer, state, options);
    EXPECT_EQ(result.size, glm::ivec2(10, 20));
    EXPECT_EQ(result.mimeType, "image/png");
    EXPECT_FALSE(result.bytes.empty());
}

TEST_F(GpuRendering, LargeImagesAreDownsizedOnUpload)
{
    RendererConfig config;
    config.maxImageDimension = 64;
    config.fixedGrainTime = 0.0f;
    m_renderer = std::make_unique<ImageRenderer>(config);
    EXPECT_EQ(m_renderer->setImage(testCard(256, 128)), glm::ivec2(64, 32));
    EXPECT_EQ(m_renderer->imageSize(), glm::ivec2(64, 32));
}

TEST_F(GpuRendering, DisposedRendererRefusesWork)
{
    m_renderer->setImage(testCard(8, 8));
    m_renderer->dispose();
    const RenderTarget target(8, 8);
    EXPECT_THROW((void)m_renderer->render(EditState {}, target.surface()), std::logic_error);
}

TEST_F(GpuRendering, BrokenShaderReportsTheDriverLog)
{
    const std::string vertex = "#version 450 core\nvoid main() { gl_Position = vec4(0.0); }\n";
    const std::string broken = "#version 450 core\nout vec4 color;\nvoid main() { color = undefinedValue; }\n";
    try {
        (void)ShaderManager::createProgram(vertex, broken, "broken.frag");
        FAIL() << "expected ShaderCompileError";
    } catch (const ShaderCompileError& e) {
        EXPECT_FALSE(e.infoLog.empty());
        EXPECT_NE(std::string(e.what()).find("broken.frag"), std::string::npos);
    }

    EXPECT_THROW((void)ShaderManager::createProgram(vertex, "out vec4 color;\nvoid main() {}\n"), ShaderLoadingException);
    EXPECT_THROW((void)ShaderManager::createProgram(vertex, "#version 450 core\n#include \"common.glsl\"\nvoid main() {}\n"), ShaderLoadingException);
}
