// SPDX-License-Identifier: MIT
#pragma once

#include "export/ExportPipeline.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

struct UsageError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CommandLine {
    std::filesystem::path image;
    std::optional<std::filesystem::path> editFile;
    std::optional<std::filesystem::path> lutFile;
    std::optional<std::string> lutPreset;
    // Set for headless export; preview mode otherwise.
    std::optional<std::filesystem::path> exportPath;
    ExportOptions exportOptions;
    bool showHelp { false };
};

// Throws UsageError for unknown options, missing values and malformed numbers.
// Without --format the export format follows the --export extension (JPEG otherwise).
[[nodiscard]] CommandLine parseCommandLine(int argc, const char* const* argv);

[[nodiscard]] std::string usageText(const std::string& programName);
