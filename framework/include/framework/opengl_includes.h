#pragma once
#include "disable_all_warnings.h"
DISABLE_WARNINGS_PUSH()
// glad must come before anything that pulls in GL/gl.h (GLFW included).
#include <glad/glad.h>
DISABLE_WARNINGS_POP()
