// SPDX-License-Identifier: MIT
#pragma once

#include "edit/EditState.h"
#include "rendering/ShaderManager.h"

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

class TextureManager;

// Effects a dedicated pass handles instead of the grade pass. Each one zeroes
// the matching amount so the grade shader skips it.
struct GradeOverrides {
    bool disableVignette { false };
    bool disableGrain { false };
    bool disableBlur { false };
    bool disableBloom { false };
    bool disableHalation { false };
    bool disableBorder { false };

    bool operator==(const GradeOverrides& other) const
    {
        return disableVignette == other.disableVignette && disableGrain == other.disableGrain
            && disableBlur == other.disableBlur && disableBloom == other.disableBloom
            && disableHalation == other.disableHalation && disableBorder == other.disableBorder;
    }
    bool operator!=(const GradeOverrides& other) const { return !(*this == other); }
};

using UniformValue = std::variant<int, float, glm::vec2, glm::vec3>;
using UniformBlock = std::vector<std::pair<std::string, UniformValue>>;

struct MarshalContext {
    glm::ivec2 outputSize { 0 };
    float time { 0.0f };
    bool curveIdentity { true };
    bool hasLut { false };
    int lutSize { 0 };
};

// Every grade.frag uniform for one pass. Pure, so it is testable without a context.
[[nodiscard]] UniformBlock buildMainUniforms(const EditState& state, const MarshalContext& context, const GradeOverrides& overrides = {});
// Vignette, grain and border for final.frag.
[[nodiscard]] UniformBlock buildFinalUniforms(const EditState& state, glm::ivec2 outputSize, float time);

// nullptr when the block does not contain the name.
[[nodiscard]] const UniformValue* findUniform(const UniformBlock& block, std::string_view name);

// Writes uniform blocks into programs. Names the program does not declare
// (or the compiler removed) are skipped.
class UniformMarshaler {
public:
    explicit UniformMarshaler(const ShaderManager& shaders);

    // Binds image, curve LUT and color LUT, then writes the full grade uniform set.
    void setFromState(const EditState& state, const TextureManager& textures, int outputWidth, int outputHeight, float time, const GradeOverrides& overrides = {}) const;

    void apply(ProgramId id, const UniformBlock& block) const;

private:
    const ShaderManager& m_shaders;
};
