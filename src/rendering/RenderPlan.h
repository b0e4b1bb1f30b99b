// SPDX-License-Identifier: MIT
#pragma once

#include "edit/EditState.h"
#include "rendering/UniformMarshaler.h"

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <variant>
#include <vector>

// Where a pass writes. Surface is the caller's framebuffer (window or export target).
enum class PassTarget {
    Surface,
    A,
    B
};

// grade.frag over the source image.
struct BasePass {
    PassTarget target { PassTarget::Surface };
    GradeOverrides overrides;
};

// Soft-knee bright pass.
struct ExtractPass {
    PassTarget source { PassTarget::A };
    PassTarget target { PassTarget::B };
    float threshold { 0.0f };
    float softKnee { 0.5f };
};

// One direction of the separable 13-tap Gaussian.
struct BlurPass {
    PassTarget source { PassTarget::A };
    PassTarget target { PassTarget::B };
    glm::vec2 direction { 1.0f, 0.0f };
    float radius { 0.0f };
};

// Adds the blurred glow on top of whatever the target already holds.
struct CompositePass {
    PassTarget glowSource { PassTarget::B };
    PassTarget target { PassTarget::A };
    float intensity { 0.0f };
    glm::vec3 tint { 1.0f };
};

// Vignette, grain and border onto the surface.
struct FinalPass {
    PassTarget source { PassTarget::A };
};

using RenderPass = std::variant<BasePass, ExtractPass, BlurPass, CompositePass, FinalPass>;

struct RenderPlan {
    std::vector<RenderPass> passes;
    bool multiPass { false };
};

// Blur amounts above this use the separable two-pass blur.
constexpr float kHeavyBlurThreshold = 20.0f;
constexpr float kHalationBlurRadius = 25.0f;

[[nodiscard]] bool bloomActive(const EditState& state);
[[nodiscard]] bool halationActive(const EditState& state);
[[nodiscard]] bool heavyBlurActive(const EditState& state);

// Derives the ordered pass list for one frame. Does not touch the GPU.
[[nodiscard]] RenderPlan buildRenderPlan(const EditState& state);
