#include <framework/shader.h>
#include <framework/disable_all_warnings.h>
DISABLE_WARNINGS_PUSH()
#include <fmt/format.h>
DISABLE_WARNINGS_POP()
#include <cassert>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

static constexpr GLuint invalid = 0xFFFFFFFF;

static std::string shaderInfoLog(GLuint shader);
static std::string programInfoLog(GLuint program);
static void ensureNoIncludeDirective(const std::string& label, const std::string& source);
static void ensureVersionDirective(const std::string& label, const std::string& source);

Shader::Shader(GLuint program)
    : m_program(program)
{
}

Shader::Shader()
    : m_program(invalid)
{
}

Shader::Shader(Shader&& other) noexcept
    : m_program(other.m_program)
{
    other.m_program = invalid;
}

Shader::~Shader()
{
    if (m_program != invalid)
        glDeleteProgram(m_program);
}

Shader& Shader::operator=(Shader&& other) noexcept
{
    if (this == &other)
        return *this;
    if (m_program != invalid)
        glDeleteProgram(m_program);

    m_program = other.m_program;
    other.m_program = invalid;
    return *this;
}

void Shader::bind() const
{
    assert(m_program != invalid);
    glUseProgram(m_program);
}

bool Shader::valid() const
{
    return m_program != invalid;
}

GLint Shader::getUniformLocation(const std::string& name) const
{
    if (m_program == invalid)
        return -1;
    return glGetUniformLocation(m_program, name.c_str());
}

ShaderBuilder::~ShaderBuilder()
{
    freeShaders();
}

ShaderBuilder& ShaderBuilder::addStageSource(GLuint shaderStage, const std::string& source, const std::string& label)
{
    ensureNoIncludeDirective(label, source);
    ensureVersionDirective(label, source);
    const GLuint shader = glCreateShader(shaderStage);
    const char* shaderSourcePtr = source.c_str();
    glShaderSource(shader, 1, &shaderSourcePtr, nullptr);
    glCompileShader(shader);

    GLint compileSuccessful = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compileSuccessful);
    if (!compileSuccessful) {
        std::string log = shaderInfoLog(shader);
        glDeleteShader(shader);
        std::cerr << fmt::format("[Shader][ERROR] {} failed to compile:\n{}", label, log) << std::endl;
        throw ShaderCompileError(fmt::format("Failed to compile shader {}", label), std::move(log));
    }

    m_shaders.push_back(shader);
    return *this;
}

Shader ShaderBuilder::build()
{
    GLuint program = glCreateProgram();
    for (GLuint shader : m_shaders)
        glAttachShader(program, shader);
    glLinkProgram(program);

    GLint linkSuccessful = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &linkSuccessful);
    if (!linkSuccessful) {
        std::string log = programInfoLog(program);
        glDeleteProgram(program);
        std::cerr << fmt::format("[Shader][ERROR] program failed to link:\n{}", log) << std::endl;
        throw ProgramLinkError("Shader program failed to link", std::move(log));
    }

    for (GLuint shader : m_shaders)
        glDetachShader(program, shader);

    return Shader(program);
}

void ShaderBuilder::freeShaders()
{
    for (GLuint shader : m_shaders)
        glDeleteShader(shader);
    m_shaders.clear();
}

static void ensureNoIncludeDirective(const std::string& label, const std::string& source)
{
    enum class State { Normal, LineComment, BlockComment };

    State state = State::Normal;
    std::size_t lineNumber = 1;
    bool lineHasCode = false;

    for (std::size_t i = 0; i < source.size(); ++i) {
        const char c = source[i];
        const char next = (i + 1 < source.size()) ? source[i + 1] : '\0';

        if (c == '\n') {
            ++lineNumber;
            lineHasCode = false;
            if (state == State::LineComment)
                state = State::Normal;
            continue;
        }

        if (state == State::LineComment)
            continue;
        if (state == State::BlockComment) {
            if (c == '*' && next == '/') {
                state = State::Normal;
                ++i;
            }
            continue;
        }

        if (c == '/' && next == '/') {
            state = State::LineComment;
            ++i;
            continue;
        }
        if (c == '/' && next == '*') {
            state = State::BlockComment;
            ++i;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r')
            continue;

        if (c == '#' && !lineHasCode) {
            std::size_t j = i + 1;
            while (j < source.size() && (source[j] == ' ' || source[j] == '\t'))
                ++j;
            if (source.compare(j, 7, "include") == 0) {
                const char after = (j + 7 < source.size()) ? source[j + 7] : '\0';
                if (!std::isalnum(static_cast<unsigned char>(after)) && after != '_') {
                    throw ShaderLoadingException(fmt::format(
                        "Shader {} contains forbidden #include directive on line {}.", label, lineNumber));
                }
            }
        }
        lineHasCode = true;
    }
}

// The first non-blank line must be the #version directive.
static void ensureVersionDirective(const std::string& label, const std::string& source)
{
    std::istringstream input(source);
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        const auto firstNonSpace = line.find_first_not_of(" \t\r");
        if (firstNonSpace == std::string::npos)
            continue;
        const std::string trimmed = line.substr(firstNonSpace);
        if (trimmed.rfind("#version", 0) == 0)
            return;
        throw ShaderLoadingException(fmt::format(
            "Shader {} must begin with #version directive (encountered '{}' on line {}).",
            label, trimmed, lineNumber));
    }
    throw ShaderLoadingException(fmt::format("Shader {} is missing a #version directive.", label));
}

static std::string shaderInfoLog(GLuint shader)
{
    GLint logLength = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);
    if (logLength <= 0)
        return {};

    std::string logBuffer(static_cast<size_t>(logLength), '\0');
    glGetShaderInfoLog(shader, logLength, nullptr, logBuffer.data());
    while (!logBuffer.empty() && logBuffer.back() == '\0')
        logBuffer.pop_back();
    return logBuffer;
}

static std::string programInfoLog(GLuint program)
{
    GLint logLength = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);
    if (logLength <= 0)
        return {};

    std::string logBuffer(static_cast<size_t>(logLength), '\0');
    glGetProgramInfoLog(program, logLength, nullptr, logBuffer.data());
    while (!logBuffer.empty() && logBuffer.back() == '\0')
        logBuffer.pop_back();
    return logBuffer;
}
