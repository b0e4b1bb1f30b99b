#pragma once

// Third-party headers (glm, stb, glad) are wrapped in these so the project
// can build with warnings-as-errors.
#if defined(__clang__)
#define DISABLE_WARNINGS_PUSH() \
    _Pragma("clang diagnostic push") \
    _Pragma("clang diagnostic ignored \"-Weverything\"")
#define DISABLE_WARNINGS_POP() _Pragma("clang diagnostic pop")
#elif defined(__GNUC__)
#define DISABLE_WARNINGS_PUSH() \
    _Pragma("GCC diagnostic push") \
    _Pragma("GCC diagnostic ignored \"-Wall\"") \
    _Pragma("GCC diagnostic ignored \"-Wextra\"") \
    _Pragma("GCC diagnostic ignored \"-Wpedantic\"") \
    _Pragma("GCC diagnostic ignored \"-Wconversion\"") \
    _Pragma("GCC diagnostic ignored \"-Wsign-conversion\"") \
    _Pragma("GCC diagnostic ignored \"-Wshadow\"")
#define DISABLE_WARNINGS_POP() _Pragma("GCC diagnostic pop")
#elif defined(_MSC_VER)
#define DISABLE_WARNINGS_PUSH() __pragma(warning(push, 0))
#define DISABLE_WARNINGS_POP() __pragma(warning(pop))
#else
#define DISABLE_WARNINGS_PUSH()
#define DISABLE_WARNINGS_POP()
#endif
