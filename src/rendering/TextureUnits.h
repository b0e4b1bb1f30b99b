// SPDX-License-Identifier: MIT
#pragma once

#include <framework/opengl_includes.h>

namespace TextureUnits {

// Grade inputs: bound for every pass that runs grade.frag.
constexpr GLuint Grade_Image    = 0;
constexpr GLuint Grade_CurveLut = 1;
constexpr GLuint Grade_ColorLut = 2;

// Inputs of the framebuffer-fed passes (blur, extract, composite, final, export).
constexpr GLuint Pass_Input = 0;
constexpr GLuint Pass_Glow  = 3;

} // namespace TextureUnits
