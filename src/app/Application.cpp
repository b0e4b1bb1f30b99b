// SPDX-License-Identifier: MIT
#include "app/CommandLine.h"
#include "app/RenderScheduler.h"
#include "edit/EditState.h"
#include "edit/EditStateIO.h"
#include "export/ExportPipeline.h"
#include "export/Histogram.h"
#include "lut/CubeLut.h"
#include "rendering/ImageRenderer.h"

// Always include window first (because it includes glfw, which includes GL which needs to be included AFTER glad).
#include <framework/disable_all_warnings.h>
#include <framework/window.h>
DISABLE_WARNINGS_PUSH()
#include <glad/glad.h>
#include <GLFW/glfw3.h>
#include <glm/common.hpp>
#include <glm/vec2.hpp>
DISABLE_WARNINGS_POP()
#include <framework/image.h>
#include <framework/shader.h>

#include <fmt/format.h>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace {

void APIENTRY glDebugOutput(GLenum source,
    GLenum type,
    GLuint id,
    GLenum severity,
    GLsizei length,
    const GLchar* message,
    const void* userParam)
{
    (void)source;
    (void)length;
    (void)userParam;
    if (severity == GL_DEBUG_SEVERITY_NOTIFICATION)
        return;
    std::fprintf(stderr, "[GL %u]%s %s\n", id, type == GL_DEBUG_TYPE_ERROR ? "[ERROR]" : "", message);
}

bool glDebugRequested()
{
    const char* flag = std::getenv("LUMAGRADE_GL_DEBUG");
    return flag != nullptr && *flag != '\0' && std::string(flag) != "0";
}

void writeFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file)
        throw ExportError(fmt::format("Cannot open {} for writing", path.string()));
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file)
        throw ExportError(fmt::format("Writing {} failed", path.string()));
}

// Largest aspect-preserving rectangle of imageSize centered in the framebuffer.
RenderSurface letterbox(glm::ivec2 framebufferSize, glm::ivec2 imageSize)
{
    const glm::vec2 fb(framebufferSize);
    const glm::vec2 image(imageSize);
    const float scale = glm::min(fb.x / image.x, fb.y / image.y);
    const glm::ivec2 size = glm::max(glm::ivec2(glm::round(image * scale)), glm::ivec2(1));
    return RenderSurface { 0, (framebufferSize - size) / 2, size };
}

void logHistogram(const HistogramData& histogram, std::size_t pixelCount)
{
    if (pixelCount == 0)
        return;
    double sum = 0.0;
    for (int i = 0; i < kHistogramBins; ++i)
        sum += static_cast<double>(i) * histogram.luminance[static_cast<std::size_t>(i)];
    const double mean = sum / static_cast<double>(pixelCount);
    const double shadowsClipped = 100.0 * histogram.luminance.front() / static_cast<double>(pixelCount);
    const double highlightsClipped = 100.0 * histogram.luminance.back() / static_cast<double>(pixelCount);
    std::cout << fmt::format("[Histogram] mean luminance {:.1f}, clipped shadows {:.2f}%, clipped highlights {:.2f}%, peak bin {}",
        mean, shadowsClipped, highlightsClipped, histogram.max)
              << std::endl;
}

} // namespace

class Application {
public:
    explicit Application(CommandLine commandLine);

    // Headless: render, encode and write the requested export.
    void runExport();
    // Interactive preview until the window closes.
    void update();

private:
    void readEditFile();
    void applyLut();
    void reloadEditFileIfChanged();
    void requestPreview();
    void renderPreview(const EditState& state);
    void submitExport();
    void printHistogram();

    CommandLine m_commandLine;
    Window m_window;
    ImageRenderer m_renderer;
    RenderScheduler m_scheduler;

    EditState m_state;
    std::optional<std::string> m_appliedLutId;
    std::optional<std::filesystem::file_time_type> m_editFileTime;
    std::chrono::steady_clock::time_point m_lastEditCheck {};
    bool m_frameDrawn { false };
};

Application::Application(CommandLine commandLine)
    : m_commandLine(std::move(commandLine))
    , m_window("lumagrade", glm::ivec2(1280, 800), OpenGLVersion::GL45,
          WindowSettings { !m_commandLine.exportPath.has_value(), true, true, glDebugRequested() })
    , m_renderer(RendererConfig::fromEnvironment())
    , m_scheduler(
          [this](const EditState& state) { renderPreview(state); },
          [this](const EditState& state, const ExportOptions& options) { return exportImage(m_renderer, state, options); })
{
    if (glDebugRequested()) {
        glEnable(GL_DEBUG_OUTPUT);
        glEnable(GL_DEBUG_OUTPUT_SYNCHRONOUS);
        glDebugMessageCallback(glDebugOutput, nullptr);
        glDebugMessageControl(GL_DONT_CARE, GL_DONT_CARE, GL_DONT_CARE, 0, nullptr, GL_TRUE);
        std::cout << "[Application] GL debug output enabled" << std::endl;
    }

    const Image image(m_commandLine.image);
    const glm::ivec2 workingSize = m_renderer.setImage(image);
    std::cout << fmt::format("[Application] loaded {} ({}x{}, working size {}x{})", m_commandLine.image.string(), image.width, image.height, workingSize.x, workingSize.y) << std::endl;

    if (m_commandLine.lutFile)
        m_renderer.setLut(loadCubeLut(*m_commandLine.lutFile));

    readEditFile();
    applyLut();

    m_window.registerKeyCallback([this](int key, int /* scancode */, int action, int /* mods */) {
        if (action != GLFW_PRESS)
            return;
        switch (key) {
        case GLFW_KEY_ESCAPE:
            m_window.close();
            break;
        case GLFW_KEY_E:
            submitExport();
            break;
        case GLFW_KEY_H:
            printHistogram();
            break;
        default:
            break;
        }
    });
    m_window.registerWindowResizeCallback([this](const glm::ivec2&) { requestPreview(); });
}

void Application::readEditFile()
{
    if (!m_commandLine.editFile)
        return;
    m_state = loadEditState(*m_commandLine.editFile);
    std::error_code ec;
    const auto writeTime = std::filesystem::last_write_time(*m_commandLine.editFile, ec);
    if (!ec)
        m_editFileTime = writeTime;
}

// An imported file or a --lut-preset wins over the edit's lutId.
void Application::applyLut()
{
    if (m_commandLine.lutFile)
        return;

    const std::optional<std::string> wanted = m_commandLine.lutPreset ? m_commandLine.lutPreset : m_state.lutId;
    if (wanted == m_appliedLutId)
        return;

    if (!wanted) {
        m_renderer.clearLut();
    } else {
        try {
            m_renderer.setLut(generatePresetLut(*wanted));
            std::cout << fmt::format("[Application] LUT preset '{}'", *wanted) << std::endl;
        } catch (const std::invalid_argument& e) {
            std::cerr << fmt::format("[Application] {}; rendering without a LUT", e.what()) << std::endl;
            m_renderer.clearLut();
        }
    }
    m_appliedLutId = wanted;
}

void Application::reloadEditFileIfChanged()
{
    if (!m_commandLine.editFile)
        return;

    const auto now = std::chrono::steady_clock::now();
    if (now - m_lastEditCheck < std::chrono::milliseconds(250))
        return;
    m_lastEditCheck = now;

    std::error_code ec;
    const auto writeTime = std::filesystem::last_write_time(*m_commandLine.editFile, ec);
    if (ec || writeTime == m_editFileTime)
        return;
    m_editFileTime = writeTime;

    try {
        m_state = loadEditState(*m_commandLine.editFile);
        applyLut();
        requestPreview();
        std::cout << fmt::format("[Application] reloaded {}", m_commandLine.editFile->string()) << std::endl;
    } catch (const EditStateParseError& e) {
        std::cerr << fmt::format("[Application] {}:{}: {}", m_commandLine.editFile->string(), e.line, e.what()) << std::endl;
    } catch (const std::runtime_error& e) {
        std::cerr << fmt::format("[Application] {}", e.what()) << std::endl;
    }
}

void Application::requestPreview()
{
    m_scheduler.requestPreview(m_state);
}

void Application::renderPreview(const EditState& state)
{
    const glm::ivec2 framebufferSize = m_window.getFrameBufferSize();
    if (framebufferSize.x <= 0 || framebufferSize.y <= 0)
        return;

    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glViewport(0, 0, framebufferSize.x, framebufferSize.y);
    glClearColor(0.11f, 0.11f, 0.12f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    m_frameDrawn = m_renderer.renderPreview(state, letterbox(framebufferSize, m_renderer.imageSize()));
}

void Application::submitExport()
{
    ExportJob job;
    job.state = m_state;
    job.options = m_commandLine.exportOptions;
    const std::filesystem::path path = fmt::format("export.{}", fileExtension(job.options.format));
    job.onComplete = [path](const ExportResult& result) {
        try {
            writeFile(path, result.bytes);
            std::cout << fmt::format("[Application] wrote {} ({}, {})", path.string(), result.mimeType, result.contentDisposition) << std::endl;
        } catch (const ExportError& e) {
            std::cerr << fmt::format("[Application] export failed: {}", e.what()) << std::endl;
        }
    };
    job.onError = [](const ExportError& e) {
        std::cerr << fmt::format("[Application] export failed: {}", e.what()) << std::endl;
    };
    m_scheduler.submitExport(std::move(job));
}

// Read from the image-sized preview frame; the window back buffer is undefined after a swap.
void Application::printHistogram()
{
    const RenderTarget* frame = m_renderer.previewFrame();
    if (!m_frameDrawn || frame == nullptr)
        return;
    const std::vector<std::uint8_t> pixels = m_renderer.readPixels(frame->surface());
    const std::size_t pixelCount = pixels.size() / 4;
    logHistogram(computeHistogram(pixels.data(), pixelCount), pixelCount);
}

void Application::runExport()
{
    const std::filesystem::path& path = *m_commandLine.exportPath;
    const ExportResult result = exportImage(m_renderer, m_state, m_commandLine.exportOptions);
    writeFile(path, result.bytes);
    std::cout << fmt::format("[Application] wrote {} {}x{} ({}, {})", path.string(), result.size.x, result.size.y, result.mimeType, result.contentDisposition) << std::endl;
}

void Application::update()
{
    requestPreview();

    while (!m_window.shouldClose()) {
        m_window.updateInput();
        reloadEditFileIfChanged();

        const std::uint64_t renderedBefore = m_scheduler.previewsRendered();
        m_scheduler.onFrame();

        // Only present frames that were drawn; the back buffer is undefined otherwise.
        if (m_scheduler.previewsRendered() != renderedBefore)
            m_window.swapBuffers();
        else
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

int main(int argc, char** argv)
{
    const std::string programName = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "lumagrade";

    try {
        const CommandLine commandLine = parseCommandLine(argc, argv);
        if (commandLine.showHelp) {
            std::cout << usageText(programName);
            return 0;
        }

        Application app(commandLine);
        if (commandLine.exportPath)
            app.runExport();
        else
            app.update();
    } catch (const UsageError& e) {
        std::cerr << fmt::format("[lumagrade][ERROR] {}\n", e.what()) << usageText(programName);
        return 2;
    } catch (const ShaderCompileError& e) {
        std::cerr << fmt::format("[lumagrade][ERROR] {}\n{}", e.what(), e.infoLog) << std::endl;
        return 1;
    } catch (const ProgramLinkError& e) {
        std::cerr << fmt::format("[lumagrade][ERROR] {}\n{}", e.what(), e.infoLog) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << fmt::format("[lumagrade][ERROR] {}", e.what()) << std::endl;
        return 1;
    }

    return 0;
}
