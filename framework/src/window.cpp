#include <framework/window.h>
#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <fmt/format.h>
DISABLE_WARNINGS_POP()
#include <iostream>
#include <string>
#include <utility>

namespace {

void glfwErrorCallback(int error, const char* description)
{
    std::cerr << fmt::format("[Window][GLFW {}] {}", error, description) << std::endl;
}

struct ContextVersion {
    int major;
    int minor;
};

ContextVersion toContextVersion(OpenGLVersion version)
{
    switch (version) {
    case OpenGLVersion::GL41:
        return { 4, 1 };
    case OpenGLVersion::GL46:
        return { 4, 6 };
    case OpenGLVersion::GL45:
    default:
        return { 4, 5 };
    }
}

int s_windowCount = 0;

}

Window::Window(std::string_view title, const glm::ivec2& windowSize, OpenGLVersion glVersion, WindowSettings settings)
    : m_windowSize(windowSize)
{
    glfwSetErrorCallback(glfwErrorCallback);
    if (s_windowCount == 0 && !glfwInit())
        throw WindowCreationException("Could not initialize GLFW");

    const ContextVersion contextVersion = toContextVersion(glVersion);
    glfwDefaultWindowHints();
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, contextVersion.major);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, contextVersion.minor);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
    glfwWindowHint(GLFW_VISIBLE, settings.visible ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_RESIZABLE, settings.resizable ? GLFW_TRUE : GLFW_FALSE);
    glfwWindowHint(GLFW_OPENGL_DEBUG_CONTEXT, settings.debugContext ? GLFW_TRUE : GLFW_FALSE);

    const std::string titleString { title };
    m_pWindow = glfwCreateWindow(windowSize.x, windowSize.y, titleString.c_str(), nullptr, nullptr);
    if (m_pWindow == nullptr) {
        if (s_windowCount == 0)
            glfwTerminate();
        throw WindowCreationException(fmt::format("Could not create an OpenGL {}.{} window", contextVersion.major, contextVersion.minor));
    }
    ++s_windowCount;

    glfwMakeContextCurrent(m_pWindow);
    if (!gladLoadGLLoader(reinterpret_cast<GLADloadproc>(glfwGetProcAddress))) {
        glfwDestroyWindow(m_pWindow);
        m_pWindow = nullptr;
        if (--s_windowCount == 0)
            glfwTerminate();
        throw WindowCreationException("Could not load OpenGL function pointers");
    }
    glfwSwapInterval(settings.vsync ? 1 : 0);

    glfwSetWindowUserPointer(m_pWindow, this);
    glfwSetKeyCallback(m_pWindow, keyCallback);
    glfwSetWindowSizeCallback(m_pWindow, windowSizeCallback);

    std::cout << fmt::format("[Window] OpenGL {} on {}",
        reinterpret_cast<const char*>(glGetString(GL_VERSION)),
        reinterpret_cast<const char*>(glGetString(GL_RENDERER)))
              << std::endl;
}

Window::~Window()
{
    if (m_pWindow == nullptr)
        return;
    glfwDestroyWindow(m_pWindow);
    if (--s_windowCount == 0)
        glfwTerminate();
}

void Window::close()
{
    glfwSetWindowShouldClose(m_pWindow, GLFW_TRUE);
}

bool Window::shouldClose() const
{
    return glfwWindowShouldClose(m_pWindow) != 0;
}

void Window::updateInput()
{
    glfwPollEvents();
}

void Window::swapBuffers()
{
    glfwSwapBuffers(m_pWindow);
}

void Window::makeCurrent()
{
    glfwMakeContextCurrent(m_pWindow);
}

void Window::registerKeyCallback(KeyCallback&& callback)
{
    m_keyCallbacks.push_back(std::move(callback));
}

void Window::registerWindowResizeCallback(WindowResizeCallback&& callback)
{
    m_windowResizeCallbacks.push_back(std::move(callback));
}

bool Window::isKeyPressed(int key) const
{
    return glfwGetKey(m_pWindow, key) == GLFW_PRESS;
}

glm::ivec2 Window::getWindowSize() const
{
    return m_windowSize;
}

glm::ivec2 Window::getFrameBufferSize() const
{
    glm::ivec2 size { 0 };
    glfwGetFramebufferSize(m_pWindow, &size.x, &size.y);
    return size;
}

float Window::getAspectRatio() const
{
    const glm::ivec2 size = getFrameBufferSize();
    if (size.y == 0)
        return 1.0f;
    return static_cast<float>(size.x) / static_cast<float>(size.y);
}

void Window::keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods)
{
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    for (const auto& callback : self->m_keyCallbacks)
        callback(key, scancode, action, mods);
}

void Window::windowSizeCallback(GLFWwindow* window, int width, int height)
{
    auto* self = static_cast<Window*>(glfwGetWindowUserPointer(window));
    self->m_windowSize = glm::ivec2(width, height);
    for (const auto& callback : self->m_windowResizeCallbacks)
        callback(self->m_windowSize);
}
