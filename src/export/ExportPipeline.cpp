// SPDX-License-Identifier: MIT
#include "export/ExportPipeline.h"

#include "export/ExportGeometry.h"
#include "rendering/FramebufferManager.h"
#include "rendering/ImageRenderer.h"

#include <fmt/format.h>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

void validateOptions(const ExportOptions& options)
{
    if (options.quality < 1 || options.quality > 100)
        throw ExportError(fmt::format("JPEG quality must be within 1..100, got {}", options.quality));
    if (!(options.scale > 0.0f))
        throw ExportError(fmt::format("Export scale must be positive, got {}", options.scale));
    if (options.maxDimension && *options.maxDimension <= 0)
        throw ExportError(fmt::format("Maximum dimension must be positive, got {}", *options.maxDimension));
    if (options.dpi <= 0)
        throw ExportError(fmt::format("DPI must be positive, got {}", options.dpi));
}

}

ExportPixels renderExportPixels(ImageRenderer& renderer, const EditState& state, const ExportOptions& options)
{
    validateOptions(options);
    if (!renderer.hasImage())
        throw ExportError("No image to export");

    const glm::ivec2 imageSize = renderer.imageSize();
    const glm::ivec2 outputSize = computeExportSize(imageSize, state, options.scale, options.maxDimension);
    if (outputSize.x <= 0 || outputSize.y <= 0)
        throw ExportError(fmt::format("Export size {}x{} is empty", outputSize.x, outputSize.y));

    try {
        const RenderTarget frame(imageSize.x, imageSize.y);
        if (!renderer.render(state, frame.surface()))
            throw ExportError("No image to export");

        const RenderTarget output(outputSize.x, outputSize.y);
        renderer.transformInto(frame, buildExportTransform(imageSize, outputSize, state), output);

        ExportPixels pixels;
        pixels.rgba = renderer.readPixels(output.surface());
        pixels.size = outputSize;
        return pixels;
    } catch (const GpuResourceError& e) {
        throw ExportError(fmt::format("GPU resources for export failed: {}", e.what()));
    } catch (const std::logic_error& e) {
        throw ExportError(fmt::format("Export render failed: {}", e.what()));
    }
}

ExportResult exportImage(ImageRenderer& renderer, const EditState& state, const ExportOptions& options)
{
    const auto start = std::chrono::steady_clock::now();

    ExportPixels pixels = renderExportPixels(renderer, state, options);

    EncodeSettings settings;
    settings.quality = options.quality;
    settings.dpi = options.dpi;

    ExportResult result;
    result.bytes = encodeImage(options.format, pixels.rgba.data(), pixels.size.x, pixels.size.y, settings);
    if (result.bytes.empty())
        throw ExportError(fmt::format("{} encoder produced no data", formatName(options.format)));
    result.mimeType = std::string(mimeType(options.format));
    result.contentDisposition = contentDisposition(options.format);
    result.size = pixels.size;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    std::cout << fmt::format("[ExportPipeline] {} {}x{} ({} bytes) in {} ms", formatName(options.format), result.size.x, result.size.y, result.bytes.size(), elapsed.count()) << std::endl;
    return result;
}
