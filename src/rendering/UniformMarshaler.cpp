// SPDX-License-Identifier: MIT
#include "rendering/UniformMarshaler.h"

#include "edit/ColorUtils.h"
#include "rendering/TextureManager.h"
#include "rendering/TextureUnits.h"

#include <array>
#include <type_traits>

namespace {

constexpr std::array<std::string_view, kColorRangeCount> kRangeSuffix {
    "Red", "Orange", "Yellow", "Green", "Aqua", "Blue", "Purple", "Magenta"
};

glm::vec3 toVec3(const HslAdjustment& adjustment)
{
    return { adjustment.hue, adjustment.saturation, adjustment.luminance };
}

glm::vec3 toVec3(const ColorWheel& wheel)
{
    return { wheel.hue, wheel.saturation, wheel.luminance };
}

std::string lowerFirst(std::string_view name)
{
    std::string out(name);
    out[0] = static_cast<char>(out[0] - 'A' + 'a');
    return out;
}

void addVignette(UniformBlock& block, const VignetteSettings& vignette, bool disabled)
{
    block.emplace_back("u_vignetteAmount", disabled ? 0.0f : vignette.amount);
    block.emplace_back("u_vignetteMidpoint", vignette.midpoint);
    block.emplace_back("u_vignetteRoundness", vignette.roundness);
    block.emplace_back("u_vignetteFeather", vignette.feather);
}

void addGrain(UniformBlock& block, const GrainSettings& grain, float time, bool disabled)
{
    block.emplace_back("u_grainAmount", disabled ? 0.0f : grain.amount);
    block.emplace_back("u_grainSize", grain.size);
    block.emplace_back("u_time", time);
}

void addBorder(UniformBlock& block, const BorderSettings& border, bool disabled)
{
    block.emplace_back("u_borderSize", disabled ? 0.0f : border.size);
    block.emplace_back("u_borderColor", hexToRgb(border.color));
    block.emplace_back("u_borderOpacity", border.opacity);
}

}

UniformBlock buildMainUniforms(const EditState& state, const MarshalContext& context, const GradeOverrides& overrides)
{
    UniformBlock block;
    block.reserve(112);

    block.emplace_back("u_exposure", state.exposure);
    block.emplace_back("u_contrast", state.contrast);
    block.emplace_back("u_highlights", state.highlights);
    block.emplace_back("u_shadows", state.shadows);
    block.emplace_back("u_whites", state.whites);
    block.emplace_back("u_blacks", state.blacks);
    block.emplace_back("u_temperature", state.temperature);
    block.emplace_back("u_tint", state.tint);

    block.emplace_back("u_clarity", state.clarity);
    block.emplace_back("u_texture", state.texture);
    block.emplace_back("u_dehaze", state.dehaze);
    block.emplace_back("u_vibrance", state.vibrance);
    block.emplace_back("u_saturation", state.saturation);

    for (std::size_t i = 0; i < kColorRangeCount; ++i) {
        const auto range = static_cast<ColorRange>(i);
        block.emplace_back("u_hsl_" + lowerFirst(kRangeSuffix[i]), toVec3(state.hsl[range]));
        block.emplace_back("u_grayMixer" + std::string(kRangeSuffix[i]), state.grayMixer[range]);
    }

    addVignette(block, state.vignette, overrides.disableVignette);
    addGrain(block, state.grain, context.time, overrides.disableGrain);

    block.emplace_back("u_lutSize", static_cast<float>(context.lutSize));
    block.emplace_back("u_lutIntensity", state.lutIntensity / 100.0f);
    block.emplace_back("u_hasLut", context.hasLut ? 1 : 0);
    block.emplace_back("u_curveIsIdentity", context.curveIdentity ? 1 : 0);

    block.emplace_back("u_fade", state.fade);

    block.emplace_back("u_splitHighlightHue", state.splitTone.highlightHue);
    block.emplace_back("u_splitHighlightSat", state.splitTone.highlightSaturation);
    block.emplace_back("u_splitShadowHue", state.splitTone.shadowHue);
    block.emplace_back("u_splitShadowSat", state.splitTone.shadowSaturation);
    block.emplace_back("u_splitBalance", state.splitTone.balance);

    block.emplace_back("u_blurAmount", overrides.disableBlur ? 0.0f : state.blur.amount);
    block.emplace_back("u_blurType", state.blur.type == BlurType::Lens ? 1 : 0);
    block.emplace_back("u_resolution", glm::vec2(context.outputSize));

    addBorder(block, state.border, overrides.disableBorder);

    block.emplace_back("u_bloomAmount", overrides.disableBloom ? 0.0f : state.bloom.amount);
    block.emplace_back("u_bloomThreshold", state.bloom.threshold);
    block.emplace_back("u_bloomRadius", state.bloom.radius);

    block.emplace_back("u_halationAmount", overrides.disableHalation ? 0.0f : state.halation.amount);
    block.emplace_back("u_halationThreshold", state.halation.threshold);
    block.emplace_back("u_halationHue", state.halation.hue);

    block.emplace_back("u_skinHue", state.skinTone.hue);
    block.emplace_back("u_skinSaturation", state.skinTone.saturation);
    block.emplace_back("u_skinLuminance", state.skinTone.luminance);

    block.emplace_back("u_sharpeningAmount", state.sharpening.amount);
    block.emplace_back("u_sharpeningRadius", state.sharpening.radius);
    block.emplace_back("u_sharpeningDetail", state.sharpening.detail);

    block.emplace_back("u_noiseReductionLuminance", state.noiseReduction.luminance);
    block.emplace_back("u_noiseReductionColor", state.noiseReduction.color);
    block.emplace_back("u_noiseReductionDetail", state.noiseReduction.detail);

    block.emplace_back("u_calibrationRedHue", state.calibration.redHue);
    block.emplace_back("u_calibrationRedSat", state.calibration.redSaturation);
    block.emplace_back("u_calibrationGreenHue", state.calibration.greenHue);
    block.emplace_back("u_calibrationGreenSat", state.calibration.greenSaturation);
    block.emplace_back("u_calibrationBlueHue", state.calibration.blueHue);
    block.emplace_back("u_calibrationBlueSat", state.calibration.blueSaturation);

    block.emplace_back("u_convertToGrayscale", state.convertToGrayscale ? 1 : 0);
    block.emplace_back("u_caAmount", state.chromaticAberration);

    block.emplace_back("u_cgShadows", toVec3(state.colorGrading.shadows));
    block.emplace_back("u_cgMidtones", toVec3(state.colorGrading.midtones));
    block.emplace_back("u_cgHighlights", toVec3(state.colorGrading.highlights));
    block.emplace_back("u_cgGlobal", toVec3(state.colorGrading.global));
    block.emplace_back("u_cgBlending", state.colorGrading.blending);

    return block;
}

UniformBlock buildFinalUniforms(const EditState& state, glm::ivec2 outputSize, float time)
{
    UniformBlock block;
    block.emplace_back("u_resolution", glm::vec2(outputSize));
    addVignette(block, state.vignette, false);
    addGrain(block, state.grain, time, false);
    addBorder(block, state.border, false);
    return block;
}

const UniformValue* findUniform(const UniformBlock& block, std::string_view name)
{
    for (const auto& [key, value] : block) {
        if (key == name)
            return &value;
    }
    return nullptr;
}

UniformMarshaler::UniformMarshaler(const ShaderManager& shaders)
    : m_shaders(shaders)
{
}

void UniformMarshaler::setFromState(const EditState& state, const TextureManager& textures, int outputWidth, int outputHeight, float time, const GradeOverrides& overrides) const
{
    textures.bindImage(TextureUnits::Grade_Image);
    textures.bindCurveLut(TextureUnits::Grade_CurveLut);
    textures.bindColorLut(TextureUnits::Grade_ColorLut);

    MarshalContext context;
    context.outputSize = glm::ivec2(outputWidth, outputHeight);
    context.time = time;
    context.curveIdentity = textures.curveIsIdentity();
    context.hasLut = textures.hasLut();
    context.lutSize = textures.getLutSize();

    apply(ProgramId::Grade, buildMainUniforms(state, context, overrides));
}

void UniformMarshaler::apply(ProgramId id, const UniformBlock& block) const
{
    for (const auto& [name, value] : block) {
        if (!m_shaders.has(id, name))
            continue;

        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, int>)
                m_shaders.setInt(id, name, v);
            else if constexpr (std::is_same_v<T, float>)
                m_shaders.setFloat(id, name, v);
            else if constexpr (std::is_same_v<T, glm::vec2>)
                m_shaders.setVec2(id, name, v);
            else
                m_shaders.setVec3(id, name, v);
        },
            value);
    }
}
