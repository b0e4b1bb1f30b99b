// SPDX-License-Identifier: MIT
#include "rendering/RenderPlan.h"

#include "edit/ColorUtils.h"

#include <optional>

namespace {

struct Glow {
    float threshold;
    float radius;
    float intensity;
    glm::vec3 tint;
};

// One ping-pong pair only holds a single glow; bloom takes precedence.
std::optional<Glow> selectGlow(const EditState& state)
{
    if (bloomActive(state)) {
        return Glow { state.bloom.threshold / 100.0f, state.bloom.radius / 100.0f * 30.0f,
            state.bloom.amount / 100.0f, glm::vec3(1.0f) };
    }
    if (halationActive(state)) {
        return Glow { state.halation.threshold / 100.0f, kHalationBlurRadius,
            state.halation.amount / 100.0f * 0.5f, hueToRgb(state.halation.hue) };
    }
    return std::nullopt;
}

}

bool bloomActive(const EditState& state)
{
    return state.bloom.amount > 0.0f;
}

bool halationActive(const EditState& state)
{
    return state.halation.amount > 0.0f;
}

bool heavyBlurActive(const EditState& state)
{
    return state.blur.amount > kHeavyBlurThreshold;
}

RenderPlan buildRenderPlan(const EditState& state)
{
    RenderPlan plan;
    const bool heavyBlur = heavyBlurActive(state);
    const std::optional<Glow> glow = selectGlow(state);

    if (!glow && !heavyBlur) {
        plan.passes.emplace_back(BasePass { PassTarget::Surface, GradeOverrides {} });
        return plan;
    }

    plan.multiPass = true;

    GradeOverrides overrides;
    overrides.disableBloom = true;
    overrides.disableHalation = true;
    overrides.disableVignette = true;
    overrides.disableGrain = true;
    overrides.disableBorder = true;
    overrides.disableBlur = heavyBlur;

    plan.passes.emplace_back(BasePass { PassTarget::A, overrides });

    if (glow) {
        plan.passes.emplace_back(ExtractPass { PassTarget::A, PassTarget::B, glow->threshold, 0.5f });
        plan.passes.emplace_back(BlurPass { PassTarget::B, PassTarget::A, glm::vec2(1.0f, 0.0f), glow->radius });
        plan.passes.emplace_back(BlurPass { PassTarget::A, PassTarget::B, glm::vec2(0.0f, 1.0f), glow->radius });
        // A was used as blur scratch; grade into it again before compositing.
        plan.passes.emplace_back(BasePass { PassTarget::A, overrides });
        plan.passes.emplace_back(CompositePass { PassTarget::B, PassTarget::A, glow->intensity, glow->tint });
    }

    if (heavyBlur) {
        const float radius = state.blur.amount / 100.0f * 15.0f;
        plan.passes.emplace_back(BlurPass { PassTarget::A, PassTarget::B, glm::vec2(1.0f, 0.0f), radius });
        plan.passes.emplace_back(BlurPass { PassTarget::B, PassTarget::A, glm::vec2(0.0f, 1.0f), radius });
    }

    plan.passes.emplace_back(FinalPass { PassTarget::A });
    return plan;
}
