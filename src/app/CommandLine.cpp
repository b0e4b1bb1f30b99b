// SPDX-License-Identifier: MIT
#include "app/CommandLine.h"

#include "lut/CubeLut.h"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <string_view>
#include <vector>

namespace {

int parseInt(std::string_view option, const std::string& text)
{
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno == ERANGE)
        throw UsageError(fmt::format("{} expects an integer, got '{}'", option, text));
    return static_cast<int>(value);
}

float parseFloat(std::string_view option, const std::string& text)
{
    char* end = nullptr;
    errno = 0;
    const float value = std::strtof(text.c_str(), &end);
    if (text.empty() || *end != '\0' || errno == ERANGE)
        throw UsageError(fmt::format("{} expects a number, got '{}'", option, text));
    return value;
}

}

CommandLine parseCommandLine(int argc, const char* const* argv)
{
    CommandLine result;
    std::optional<ExportFormat> explicitFormat;

    const std::vector<std::string> args(argv + std::min(argc, 1), argv + argc);
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size())
                throw UsageError(fmt::format("{} needs a value", arg));
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            result.showHelp = true;
        } else if (arg == "--edit") {
            result.editFile = value();
        } else if (arg == "--lut") {
            result.lutFile = value();
        } else if (arg == "--lut-preset") {
            const std::string& name = value();
            const auto names = presetLutNames();
            if (std::find(names.begin(), names.end(), name) == names.end())
                throw UsageError(fmt::format("Unknown LUT preset '{}'", name));
            result.lutPreset = name;
        } else if (arg == "--export") {
            result.exportPath = value();
        } else if (arg == "--format") {
            const std::string& name = value();
            explicitFormat = parseExportFormat(name);
            if (!explicitFormat)
                throw UsageError(fmt::format("Unsupported export format '{}'", name));
        } else if (arg == "--quality") {
            result.exportOptions.quality = parseInt(arg, value());
            if (result.exportOptions.quality < 1 || result.exportOptions.quality > 100)
                throw UsageError("--quality must be within 1..100");
        } else if (arg == "--scale") {
            result.exportOptions.scale = parseFloat(arg, value());
            if (!(result.exportOptions.scale > 0.0f))
                throw UsageError("--scale must be positive");
        } else if (arg == "--max-dimension") {
            result.exportOptions.maxDimension = parseInt(arg, value());
            if (*result.exportOptions.maxDimension <= 0)
                throw UsageError("--max-dimension must be positive");
        } else if (arg == "--dpi") {
            result.exportOptions.dpi = parseInt(arg, value());
            if (result.exportOptions.dpi <= 0)
                throw UsageError("--dpi must be positive");
        } else if (!arg.empty() && arg[0] == '-') {
            throw UsageError(fmt::format("Unknown option '{}'", arg));
        } else if (result.image.empty()) {
            result.image = arg;
        } else {
            throw UsageError(fmt::format("Unexpected argument '{}'", arg));
        }
    }

    if (result.showHelp)
        return result;
    if (result.image.empty())
        throw UsageError("No input image given");
    if (result.lutFile && result.lutPreset)
        throw UsageError("--lut and --lut-preset are mutually exclusive");

    if (explicitFormat) {
        result.exportOptions.format = *explicitFormat;
    } else if (result.exportPath) {
        std::string extension = result.exportPath->extension().string();
        if (!extension.empty())
            extension.erase(0, 1);
        result.exportOptions.format = parseExportFormat(extension).value_or(ExportFormat::Jpeg);
    }
    return result;
}

std::string usageText(const std::string& programName)
{
    return fmt::format(
        "usage: {} <image> [options]\n"
        "  --edit <file>          edit parameters (key = value lines)\n"
        "  --lut <file.cube>      imported color LUT\n"
        "  --lut-preset <name>    built-in color LUT\n"
        "  --export <out>         render headless and write <out>\n"
        "  --format <jpeg|png|tiff>\n"
        "  --quality <1..100>     JPEG quality (default 95)\n"
        "  --scale <factor>       output scale (default 1)\n"
        "  --max-dimension <px>   clamp the longest output side\n"
        "  --dpi <n>              stored density (default 300)\n"
        "Preview keys: E exports to export.<ext>, H prints the histogram, Esc quits.\n",
        programName);
}
