// SPDX-License-Identifier: MIT
#include "export/ImageEncoder.h"

#include "export/IccProfile.h"
#include "export/TiffWriter.h"

#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>
DISABLE_WARNINGS_POP()

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// jpeglib.h needs FILE and size_t declared first.
#include <jpeglib.h>
#include <zlib.h>

namespace {

constexpr std::size_t kPngIhdrEnd = 8 + 4 + 4 + 13 + 4;
constexpr std::array<char, 12> kIccMarkerName { 'I', 'C', 'C', '_', 'P', 'R', 'O', 'F', 'I', 'L', 'E', '\0' };

void appendToVector(void* context, void* data, int size)
{
    auto* out = static_cast<std::vector<std::uint8_t>*>(context);
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

void appendU32BE(std::vector<std::uint8_t>& out, std::uint32_t v)
{
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

void appendPngChunk(std::vector<std::uint8_t>& out, const char (&type)[5], const std::vector<std::uint8_t>& payload)
{
    appendU32BE(out, static_cast<std::uint32_t>(payload.size()));
    const std::size_t typeStart = out.size();
    out.insert(out.end(), type, type + 4);
    out.insert(out.end(), payload.begin(), payload.end());
    const uLong crc = ::crc32(::crc32(0L, Z_NULL, 0), out.data() + typeStart, static_cast<uInt>(out.size() - typeStart));
    appendU32BE(out, static_cast<std::uint32_t>(crc));
}

void validateInput(const std::uint8_t* rgba, int width, int height)
{
    if (!rgba || width <= 0 || height <= 0)
        throw ExportError(fmt::format("Cannot encode an empty {}x{} image", width, height));
}

std::uint16_t clampDpi(int dpi)
{
    return static_cast<std::uint16_t>(std::clamp(dpi, 1, 65535));
}

struct JpegErrorManager {
    jpeg_error_mgr base;
    std::jmp_buf jump;
    char message[JMSG_LENGTH_MAX];
};

void onJpegError(j_common_ptr cinfo)
{
    auto* manager = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, manager->message);
    std::longjmp(manager->jump, 1);
}

// Plain data only: compressJpeg longjmps out of libjpeg on errors.
struct JpegJob {
    const std::uint8_t* rgb { nullptr };
    int width { 0 };
    int height { 0 };
    int quality { 95 };
    std::uint16_t dpi { 300 };
    const std::uint8_t* iccMarker { nullptr };
    unsigned iccMarkerSize { 0 };

    unsigned char* output { nullptr };
    unsigned long outputSize { 0 };
    char errorMessage[JMSG_LENGTH_MAX] {};
};

// Baseline JPEG with 1x1 sampling on every component (4:4:4) at any quality.
bool compressJpeg(JpegJob& job)
{
    jpeg_compress_struct cinfo;
    JpegErrorManager errors;
    cinfo.err = jpeg_std_error(&errors.base);
    errors.base.error_exit = onJpegError;
    errors.message[0] = '\0';

    if (setjmp(errors.jump)) {
        std::memcpy(job.errorMessage, errors.message, sizeof(errors.message));
        jpeg_destroy_compress(&cinfo);
        return false;
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &job.output, &job.outputSize);

    cinfo.image_width = static_cast<JDIMENSION>(job.width);
    cinfo.image_height = static_cast<JDIMENSION>(job.height);
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, job.quality, TRUE);
    for (int c = 0; c < cinfo.num_components; ++c) {
        cinfo.comp_info[c].h_samp_factor = 1;
        cinfo.comp_info[c].v_samp_factor = 1;
    }
    cinfo.write_JFIF_header = TRUE;
    cinfo.density_unit = 1; // dots per inch
    cinfo.X_density = job.dpi;
    cinfo.Y_density = job.dpi;

    jpeg_start_compress(&cinfo, TRUE);
    jpeg_write_marker(&cinfo, JPEG_APP0 + 2, job.iccMarker, job.iccMarkerSize);

    const JDIMENSION stride = static_cast<JDIMENSION>(job.width) * 3;
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(job.rgb + cinfo.next_scanline * stride);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    return true;
}

}

std::optional<ExportFormat> parseExportFormat(std::string_view name)
{
    std::string lower { name };
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "jpeg" || lower == "jpg")
        return ExportFormat::Jpeg;
    if (lower == "png")
        return ExportFormat::Png;
    if (lower == "tiff" || lower == "tif")
        return ExportFormat::Tiff;
    return std::nullopt;
}

std::string_view formatName(ExportFormat format)
{
    switch (format) {
    case ExportFormat::Jpeg:
        return "jpeg";
    case ExportFormat::Png:
        return "png";
    case ExportFormat::Tiff:
        return "tiff";
    }
    return "unknown";
}

std::string_view mimeType(ExportFormat format)
{
    switch (format) {
    case ExportFormat::Jpeg:
        return "image/jpeg";
    case ExportFormat::Png:
        return "image/png";
    case ExportFormat::Tiff:
        return "image/tiff";
    }
    return "application/octet-stream";
}

std::string_view fileExtension(ExportFormat format)
{
    switch (format) {
    case ExportFormat::Jpeg:
        return "jpg";
    case ExportFormat::Png:
        return "png";
    case ExportFormat::Tiff:
        return "tiff";
    }
    return "bin";
}

std::string contentDisposition(ExportFormat format)
{
    return fmt::format("attachment; filename=\"export.{}\"", fileExtension(format));
}

std::vector<std::uint8_t> encodeJpeg(const std::uint8_t* rgba, int width, int height, const EncodeSettings& settings)
{
    validateInput(rgba, width, height);

    const std::size_t pixelCount = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    std::vector<std::uint8_t> rgb(pixelCount * 3);
    for (std::size_t i = 0; i < pixelCount; ++i) {
        rgb[i * 3 + 0] = rgba[i * 4 + 0];
        rgb[i * 3 + 1] = rgba[i * 4 + 1];
        rgb[i * 3 + 2] = rgba[i * 4 + 2];
    }

    // APP2 ICC_PROFILE payload; the profile fits one chunk.
    const std::vector<std::uint8_t>& icc = srgbIccProfile();
    std::vector<std::uint8_t> iccMarker(kIccMarkerName.begin(), kIccMarkerName.end());
    iccMarker.push_back(1); // chunk index
    iccMarker.push_back(1); // chunk count
    iccMarker.insert(iccMarker.end(), icc.begin(), icc.end());
    if (iccMarker.size() > 65533)
        throw ExportError("ICC profile does not fit a single APP2 segment");

    JpegJob job;
    job.rgb = rgb.data();
    job.width = width;
    job.height = height;
    job.quality = std::clamp(settings.quality, 1, 100);
    job.dpi = clampDpi(settings.dpi);
    job.iccMarker = iccMarker.data();
    job.iccMarkerSize = static_cast<unsigned>(iccMarker.size());

    if (!compressJpeg(job)) {
        std::free(job.output);
        throw ExportError(fmt::format("JPEG encoder failed: {}", job.errorMessage));
    }

    std::vector<std::uint8_t> jpeg(job.output, job.output + job.outputSize);
    std::free(job.output);
    return jpeg;
}

std::vector<std::uint8_t> encodePng(const std::uint8_t* rgba, int width, int height, const EncodeSettings& settings)
{
    validateInput(rgba, width, height);

    std::vector<std::uint8_t> png;
    if (!stbi_write_png_to_func(appendToVector, &png, width, height, 4, rgba, width * 4))
        throw ExportError("PNG encoder failed");

    if (png.size() < kPngIhdrEnd || std::memcmp(&png[12], "IHDR", 4) != 0)
        throw ExportError("PNG encoder produced an unexpected header");

    std::vector<std::uint8_t> extra;
    appendPngChunk(extra, "sRGB", { 0 }); // perceptual

    const auto pixelsPerMeter = static_cast<std::uint32_t>(std::lround(std::max(settings.dpi, 1) / 0.0254));
    std::vector<std::uint8_t> phys;
    appendU32BE(phys, pixelsPerMeter);
    appendU32BE(phys, pixelsPerMeter);
    phys.push_back(1); // unit: meter
    appendPngChunk(extra, "pHYs", phys);

    png.insert(png.begin() + kPngIhdrEnd, extra.begin(), extra.end());
    return png;
}

std::vector<std::uint8_t> encodeImage(ExportFormat format, const std::uint8_t* rgba, int width, int height, const EncodeSettings& settings)
{
    switch (format) {
    case ExportFormat::Jpeg:
        return encodeJpeg(rgba, width, height, settings);
    case ExportFormat::Png:
        return encodePng(rgba, width, height, settings);
    case ExportFormat::Tiff:
        return encodeTiff(rgba, width, height, settings.dpi);
    }
    throw ExportError("Unsupported export format");
}
