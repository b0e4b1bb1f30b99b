// SPDX-License-Identifier: MIT
#pragma once

#include <glm/vec2.hpp>

#include <cstdint>

// What the most recent ImageRenderer::render call did.
struct RenderStats {
    std::uint64_t passes { 0 };
    std::uint64_t triangles { 0 };
    glm::ivec2 surfaceSize { 0 };
    bool multiPass { false };
    bool curveUploaded { false };
    bool framebuffersAllocated { false };

    void beginFrame(glm::ivec2 size)
    {
        *this = RenderStats {};
        surfaceSize = size;
    }

    void addPass(std::uint64_t triangleCount)
    {
        ++passes;
        triangles += triangleCount;
    }
};
