// SPDX-License-Identifier: MIT
#include "edit/EditStateIO.h"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace {

using FieldSetter = std::function<void(EditState&, std::string_view)>;

// Thrown by value parsers; turned into EditStateParseError with the line number.
struct ValueError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

[[nodiscard]] std::string_view trim(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<std::string_view> splitWhitespace(std::string_view text)
{
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto start = text.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos)
            break;
        auto end = text.find_first_of(" \t", start);
        if (end == std::string_view::npos)
            end = text.size();
        parts.push_back(text.substr(start, end - start));
        pos = end;
    }
    return parts;
}

[[nodiscard]] float parseFloat(std::string_view text)
{
    const std::string copy { text };
    if (copy.empty())
        throw ValueError("expected a number");
    char* end = nullptr;
    errno = 0;
    const float value = std::strtof(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size() || errno == ERANGE)
        throw ValueError(fmt::format("'{}' is not a number", copy));
    return value;
}

[[nodiscard]] bool parseBool(std::string_view text)
{
    if (text == "true" || text == "1" || text == "yes" || text == "on")
        return true;
    if (text == "false" || text == "0" || text == "no" || text == "off")
        return false;
    throw ValueError(fmt::format("'{}' is not a boolean", text));
}

[[nodiscard]] CurveChannel parseCurve(std::string_view text)
{
    CurveChannel points;
    for (std::string_view token : splitWhitespace(text)) {
        const auto comma = token.find(',');
        if (comma == std::string_view::npos)
            throw ValueError(fmt::format("curve point '{}' must be written as x,y", token));
        points.push_back(CurvePoint { parseFloat(token.substr(0, comma)), parseFloat(token.substr(comma + 1)) });
    }
    if (points.size() < 2)
        throw ValueError("a curve needs at least two points");
    for (std::size_t i = 1; i < points.size(); ++i) {
        if (points[i].x < points[i - 1].x)
            throw ValueError("curve points must be ordered by x");
    }
    return points;
}

[[nodiscard]] std::optional<CropRect> parseCrop(std::string_view text)
{
    if (text == "none")
        return std::nullopt;
    const auto parts = splitWhitespace(text);
    if (parts.size() != 4)
        throw ValueError("crop expects 'top left width height'");
    CropRect rect;
    rect.top = parseFloat(parts[0]);
    rect.left = parseFloat(parts[1]);
    rect.width = parseFloat(parts[2]);
    rect.height = parseFloat(parts[3]);
    if (rect.width <= 0.0f || rect.height <= 0.0f)
        throw ValueError("crop width and height must be positive");
    return rect;
}

using FloatAccessor = std::function<float&(EditState&)>;

class FieldTable {
public:
    FieldTable()
    {
        addFloat("exposure", [](EditState& s) -> float& { return s.exposure; });
        addFloat("contrast", [](EditState& s) -> float& { return s.contrast; });
        addFloat("highlights", [](EditState& s) -> float& { return s.highlights; });
        addFloat("shadows", [](EditState& s) -> float& { return s.shadows; });
        addFloat("whites", [](EditState& s) -> float& { return s.whites; });
        addFloat("blacks", [](EditState& s) -> float& { return s.blacks; });
        addFloat("temperature", [](EditState& s) -> float& { return s.temperature; });
        addFloat("tint", [](EditState& s) -> float& { return s.tint; });
        addFloat("clarity", [](EditState& s) -> float& { return s.clarity; });
        addFloat("texture", [](EditState& s) -> float& { return s.texture; });
        addFloat("dehaze", [](EditState& s) -> float& { return s.dehaze; });
        addFloat("vibrance", [](EditState& s) -> float& { return s.vibrance; });
        addFloat("saturation", [](EditState& s) -> float& { return s.saturation; });
        addFloat("fade", [](EditState& s) -> float& { return s.fade; });

        addFloat("grain.amount", [](EditState& s) -> float& { return s.grain.amount; });
        addFloat("grain.size", [](EditState& s) -> float& { return s.grain.size; });
        addFloat("grain.roughness", [](EditState& s) -> float& { return s.grain.roughness; });

        addFloat("vignette.amount", [](EditState& s) -> float& { return s.vignette.amount; });
        addFloat("vignette.midpoint", [](EditState& s) -> float& { return s.vignette.midpoint; });
        addFloat("vignette.roundness", [](EditState& s) -> float& { return s.vignette.roundness; });
        addFloat("vignette.feather", [](EditState& s) -> float& { return s.vignette.feather; });

        addFloat("splitTone.highlightHue", [](EditState& s) -> float& { return s.splitTone.highlightHue; });
        addFloat("splitTone.highlightSaturation", [](EditState& s) -> float& { return s.splitTone.highlightSaturation; });
        addFloat("splitTone.shadowHue", [](EditState& s) -> float& { return s.splitTone.shadowHue; });
        addFloat("splitTone.shadowSaturation", [](EditState& s) -> float& { return s.splitTone.shadowSaturation; });
        addFloat("splitTone.balance", [](EditState& s) -> float& { return s.splitTone.balance; });

        addWheel("colorGrading.shadows", [](EditState& s) -> ColorWheel& { return s.colorGrading.shadows; });
        addWheel("colorGrading.midtones", [](EditState& s) -> ColorWheel& { return s.colorGrading.midtones; });
        addWheel("colorGrading.highlights", [](EditState& s) -> ColorWheel& { return s.colorGrading.highlights; });
        addWheel("colorGrading.global", [](EditState& s) -> ColorWheel& { return s.colorGrading.global; });
        addFloat("colorGrading.blending", [](EditState& s) -> float& { return s.colorGrading.blending; });

        addFloat("blur.amount", [](EditState& s) -> float& { return s.blur.amount; });
        m_setters["blur.type"] = [](EditState& s, std::string_view value) {
            if (value == "gaussian")
                s.blur.type = BlurType::Gaussian;
            else if (value == "lens")
                s.blur.type = BlurType::Lens;
            else
                throw ValueError(fmt::format("unknown blur type '{}'", value));
        };

        addFloat("border.size", [](EditState& s) -> float& { return s.border.size; });
        addFloat("border.opacity", [](EditState& s) -> float& { return s.border.opacity; });
        m_setters["border.color"] = [](EditState& s, std::string_view value) { s.border.color = std::string { value }; };

        addFloat("bloom.amount", [](EditState& s) -> float& { return s.bloom.amount; });
        addFloat("bloom.threshold", [](EditState& s) -> float& { return s.bloom.threshold; });
        addFloat("bloom.radius", [](EditState& s) -> float& { return s.bloom.radius; });

        addFloat("halation.amount", [](EditState& s) -> float& { return s.halation.amount; });
        addFloat("halation.threshold", [](EditState& s) -> float& { return s.halation.threshold; });
        addFloat("halation.hue", [](EditState& s) -> float& { return s.halation.hue; });

        addFloat("skinTone.hue", [](EditState& s) -> float& { return s.skinTone.hue; });
        addFloat("skinTone.saturation", [](EditState& s) -> float& { return s.skinTone.saturation; });
        addFloat("skinTone.luminance", [](EditState& s) -> float& { return s.skinTone.luminance; });

        addFloat("calibration.redHue", [](EditState& s) -> float& { return s.calibration.redHue; });
        addFloat("calibration.redSaturation", [](EditState& s) -> float& { return s.calibration.redSaturation; });
        addFloat("calibration.greenHue", [](EditState& s) -> float& { return s.calibration.greenHue; });
        addFloat("calibration.greenSaturation", [](EditState& s) -> float& { return s.calibration.greenSaturation; });
        addFloat("calibration.blueHue", [](EditState& s) -> float& { return s.calibration.blueHue; });
        addFloat("calibration.blueSaturation", [](EditState& s) -> float& { return s.calibration.blueSaturation; });

        addFloat("sharpening.amount", [](EditState& s) -> float& { return s.sharpening.amount; });
        addFloat("sharpening.radius", [](EditState& s) -> float& { return s.sharpening.radius; });
        addFloat("sharpening.detail", [](EditState& s) -> float& { return s.sharpening.detail; });

        addFloat("noiseReduction.luminance", [](EditState& s) -> float& { return s.noiseReduction.luminance; });
        addFloat("noiseReduction.color", [](EditState& s) -> float& { return s.noiseReduction.color; });
        addFloat("noiseReduction.detail", [](EditState& s) -> float& { return s.noiseReduction.detail; });

        addFloat("chromaticAberration.amount", [](EditState& s) -> float& { return s.chromaticAberration; });
        addFloat("lutIntensity", [](EditState& s) -> float& { return s.lutIntensity; });
        addFloat("rotation", [](EditState& s) -> float& { return s.rotation; });
        addFloat("straighten", [](EditState& s) -> float& { return s.straighten; });

        for (std::size_t i = 0; i < kColorRangeCount; ++i) {
            const auto range = static_cast<ColorRange>(i);
            const std::string name { colorRangeName(range) };
            addFloat("hsl." + name + ".hue", [range](EditState& s) -> float& { return s.hsl[range].hue; });
            addFloat("hsl." + name + ".saturation", [range](EditState& s) -> float& { return s.hsl[range].saturation; });
            addFloat("hsl." + name + ".luminance", [range](EditState& s) -> float& { return s.hsl[range].luminance; });
            addFloat("grayMixer." + name, [range](EditState& s) -> float& { return s.grayMixer[range]; });
        }

        addBool("convertToGrayscale", [](EditState& s) -> bool& { return s.convertToGrayscale; });
        addBool("flipH", [](EditState& s) -> bool& { return s.flipH; });
        addBool("flipV", [](EditState& s) -> bool& { return s.flipV; });

        m_setters["lutId"] = [](EditState& s, std::string_view value) {
            if (value == "none")
                s.lutId.reset();
            else
                s.lutId = std::string { value };
        };
        m_setters["crop"] = [](EditState& s, std::string_view value) { s.crop = parseCrop(value); };
        m_setters["curve.rgb"] = [](EditState& s, std::string_view value) { s.curve.rgb = parseCurve(value); };
        m_setters["curve.red"] = [](EditState& s, std::string_view value) { s.curve.red = parseCurve(value); };
        m_setters["curve.green"] = [](EditState& s, std::string_view value) { s.curve.green = parseCurve(value); };
        m_setters["curve.blue"] = [](EditState& s, std::string_view value) { s.curve.blue = parseCurve(value); };
    }

    [[nodiscard]] const FieldSetter* find(std::string_view key) const
    {
        const auto it = m_setters.find(std::string { key });
        return it == m_setters.end() ? nullptr : &it->second;
    }

private:
    void addFloat(const std::string& key, FloatAccessor accessor)
    {
        m_setters[key] = [accessor = std::move(accessor)](EditState& s, std::string_view value) {
            accessor(s) = parseFloat(value);
        };
    }

    void addBool(const std::string& key, std::function<bool&(EditState&)> accessor)
    {
        m_setters[key] = [accessor = std::move(accessor)](EditState& s, std::string_view value) {
            accessor(s) = parseBool(value);
        };
    }

    void addWheel(const std::string& prefix, std::function<ColorWheel&(EditState&)> accessor)
    {
        addFloat(prefix + ".hue", [accessor](EditState& s) -> float& { return accessor(s).hue; });
        addFloat(prefix + ".saturation", [accessor](EditState& s) -> float& { return accessor(s).saturation; });
        addFloat(prefix + ".luminance", [accessor](EditState& s) -> float& { return accessor(s).luminance; });
    }

    std::unordered_map<std::string, FieldSetter> m_setters;
};

const FieldTable& fieldTable()
{
    static const FieldTable s_table;
    return s_table;
}

}

EditStateParseError::EditStateParseError(std::size_t lineNumber, const std::string& message)
    : std::runtime_error(fmt::format("line {}: {}", lineNumber, message))
    , line(lineNumber)
{
}

EditState parseEditState(std::string_view text)
{
    EditState state;
    std::size_t lineNumber = 0;
    std::size_t pos = 0;

    while (pos <= text.size()) {
        auto end = text.find('\n', pos);
        if (end == std::string_view::npos)
            end = text.size();
        std::string_view line = text.substr(pos, end - pos);
        pos = end + 1;
        ++lineNumber;

        // A '#' opening the value is a hex color, any other '#' starts a comment.
        std::size_t commentSearchFrom = 0;
        if (const auto eq = line.find('='); eq != std::string_view::npos) {
            const auto valueStart = line.find_first_not_of(" \t", eq + 1);
            if (valueStart != std::string_view::npos && line[valueStart] == '#' && line.find('#') > eq)
                commentSearchFrom = valueStart + 1;
        }
        if (const auto hash = line.find('#', commentSearchFrom); hash != std::string_view::npos)
            line = line.substr(0, hash);
        line = trim(line);
        if (line.empty())
            continue;

        const auto eq = line.find('=');
        if (eq == std::string_view::npos)
            throw EditStateParseError(lineNumber, fmt::format("expected 'key = value', got '{}'", line));

        const std::string_view key = trim(line.substr(0, eq));
        const std::string_view value = trim(line.substr(eq + 1));
        const FieldSetter* setter = fieldTable().find(key);
        if (!setter)
            throw EditStateParseError(lineNumber, fmt::format("unknown key '{}'", key));

        try {
            (*setter)(state, value);
        } catch (const ValueError& error) {
            throw EditStateParseError(lineNumber, fmt::format("{}: {}", key, error.what()));
        }
    }

    return state;
}

EditState loadEditState(const std::filesystem::path& filePath)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
        throw std::runtime_error(fmt::format("Failed to open edit file {}", filePath.string()));

    std::stringstream buffer;
    buffer << file.rdbuf();
    EditState state = parseEditState(buffer.str());
    std::cout << fmt::format("[EditState] loaded {}", filePath.filename().string()) << std::endl;
    return state;
}
