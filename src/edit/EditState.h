// SPDX-License-Identifier: MIT
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct CurvePoint {
    float x { 0.0f };
    float y { 0.0f };

    bool operator==(const CurvePoint& other) const { return x == other.x && y == other.y; }
    bool operator!=(const CurvePoint& other) const { return !(*this == other); }
};

using CurveChannel = std::vector<CurvePoint>;

inline CurveChannel identityCurveChannel()
{
    return { CurvePoint { 0.0f, 0.0f }, CurvePoint { 1.0f, 1.0f } };
}

// Row order matches the curve LUT texture: master first, then R, G, B.
struct ToneCurve {
    CurveChannel rgb { identityCurveChannel() };
    CurveChannel red { identityCurveChannel() };
    CurveChannel green { identityCurveChannel() };
    CurveChannel blue { identityCurveChannel() };

    bool operator==(const ToneCurve& other) const
    {
        return rgb == other.rgb && red == other.red && green == other.green && blue == other.blue;
    }
    bool operator!=(const ToneCurve& other) const { return !(*this == other); }
};

enum class ColorRange : std::size_t {
    Red,
    Orange,
    Yellow,
    Green,
    Aqua,
    Blue,
    Purple,
    Magenta
};
constexpr std::size_t kColorRangeCount = 8;

[[nodiscard]] std::string_view colorRangeName(ColorRange range);
[[nodiscard]] std::optional<ColorRange> parseColorRange(std::string_view name);

struct HslAdjustment {
    float hue { 0.0f };
    float saturation { 0.0f };
    float luminance { 0.0f };
};

// Indexed by ColorRange.
template <typename T>
struct PerColorRange {
    std::array<T, kColorRangeCount> values {};

    T& operator[](ColorRange range) { return values[static_cast<std::size_t>(range)]; }
    const T& operator[](ColorRange range) const { return values[static_cast<std::size_t>(range)]; }
};

struct GrainSettings {
    float amount { 0.0f };
    float size { 25.0f };
    float roughness { 50.0f };
};

struct VignetteSettings {
    float amount { 0.0f };
    float midpoint { 50.0f };
    float roundness { 0.0f };
    float feather { 50.0f };
};

struct SplitToneSettings {
    float highlightHue { 45.0f };
    float highlightSaturation { 0.0f };
    float shadowHue { 220.0f };
    float shadowSaturation { 0.0f };
    float balance { 0.0f };
};

struct ColorWheel {
    float hue { 0.0f };
    float saturation { 0.0f };
    float luminance { 0.0f };
};

struct ColorGradingSettings {
    ColorWheel shadows;
    ColorWheel midtones;
    ColorWheel highlights;
    ColorWheel global;
    float blending { 50.0f };
};

enum class BlurType {
    Gaussian,
    Lens
};

struct BlurSettings {
    float amount { 0.0f };
    BlurType type { BlurType::Gaussian };
};

struct BorderSettings {
    float size { 0.0f };
    std::string color { "#ffffff" };
    float opacity { 100.0f };
};

struct BloomSettings {
    float amount { 0.0f };
    float threshold { 70.0f };
    float radius { 50.0f };
};

struct HalationSettings {
    float amount { 0.0f };
    float threshold { 80.0f };
    float hue { 15.0f };
};

struct SkinToneSettings {
    float hue { 0.0f };
    float saturation { 0.0f };
    float luminance { 0.0f };
};

struct CalibrationSettings {
    float redHue { 0.0f };
    float redSaturation { 0.0f };
    float greenHue { 0.0f };
    float greenSaturation { 0.0f };
    float blueHue { 0.0f };
    float blueSaturation { 0.0f };
};

struct SharpeningSettings {
    float amount { 0.0f };
    float radius { 1.0f };
    float detail { 50.0f };
};

struct NoiseReductionSettings {
    float luminance { 0.0f };
    float color { 0.0f };
    float detail { 50.0f };
};

// Normalized to the source image, top-left origin.
struct CropRect {
    float top { 0.0f };
    float left { 0.0f };
    float width { 1.0f };
    float height { 1.0f };
};

// Complete description of one edit. Values are expected to be inside their
// documented ranges already; nothing downstream re-validates them.
struct EditState {
    float exposure { 0.0f };
    float contrast { 0.0f };
    float highlights { 0.0f };
    float shadows { 0.0f };
    float whites { 0.0f };
    float blacks { 0.0f };

    float temperature { 0.0f };
    float tint { 0.0f };

    float clarity { 0.0f };
    float texture { 0.0f };
    float dehaze { 0.0f };
    float vibrance { 0.0f };
    float saturation { 0.0f };

    ToneCurve curve;
    PerColorRange<HslAdjustment> hsl;

    float fade { 0.0f };
    GrainSettings grain;
    VignetteSettings vignette;
    SplitToneSettings splitTone;
    ColorGradingSettings colorGrading;
    BlurSettings blur;
    BorderSettings border;
    BloomSettings bloom;
    HalationSettings halation;

    SkinToneSettings skinTone;
    CalibrationSettings calibration;

    bool convertToGrayscale { false };
    PerColorRange<float> grayMixer;

    SharpeningSettings sharpening;
    NoiseReductionSettings noiseReduction;
    float chromaticAberration { 0.0f };

    std::optional<std::string> lutId;
    float lutIntensity { 100.0f };

    std::optional<CropRect> crop;
    float rotation { 0.0f };
    float straighten { 0.0f };
    bool flipH { false };
    bool flipV { false };
};
