#pragma once
#include "disable_all_warnings.h"
#include "opengl_includes.h"
DISABLE_WARNINGS_PUSH()
#include <GLFW/glfw3.h>
#include <glm/vec2.hpp>
DISABLE_WARNINGS_POP()
#include <functional>
#include <stdexcept>
#include <string_view>
#include <vector>

struct WindowCreationException : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

enum class OpenGLVersion {
    GL41,
    GL45,
    GL46
};

struct WindowSettings {
    bool visible { true };
    bool resizable { true };
    bool vsync { true };
    bool debugContext { false };
};

class Window {
public:
    Window(std::string_view title, const glm::ivec2& windowSize, OpenGLVersion glVersion, WindowSettings settings = {});
    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;
    ~Window();

    void close();
    [[nodiscard]] bool shouldClose() const;

    void updateInput();
    void swapBuffers();
    void makeCurrent();

    using KeyCallback = std::function<void(int key, int scancode, int action, int mods)>;
    using WindowResizeCallback = std::function<void(const glm::ivec2& size)>;
    void registerKeyCallback(KeyCallback&&);
    void registerWindowResizeCallback(WindowResizeCallback&&);

    [[nodiscard]] bool isKeyPressed(int key) const;

    [[nodiscard]] glm::ivec2 getWindowSize() const;
    [[nodiscard]] glm::ivec2 getFrameBufferSize() const;
    [[nodiscard]] float getAspectRatio() const;

    [[nodiscard]] GLFWwindow* handle() const { return m_pWindow; }

private:
    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void windowSizeCallback(GLFWwindow* window, int width, int height);

    GLFWwindow* m_pWindow { nullptr };
    glm::ivec2 m_windowSize;

    std::vector<KeyCallback> m_keyCallbacks;
    std::vector<WindowResizeCallback> m_windowResizeCallbacks;
};
