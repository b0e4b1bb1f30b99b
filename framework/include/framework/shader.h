#pragma once
#include "disable_all_warnings.h"
#include "opengl_includes.h"
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct ShaderLoadingException : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Carries the driver's info log so callers can surface it verbatim.
struct ShaderCompileError : public ShaderLoadingException {
    ShaderCompileError(const std::string& what, std::string log)
        : ShaderLoadingException(what)
        , infoLog(std::move(log))
    {
    }
    std::string infoLog;
};

struct ProgramLinkError : public ShaderLoadingException {
    ProgramLinkError(const std::string& what, std::string log)
        : ShaderLoadingException(what)
        , infoLog(std::move(log))
    {
    }
    std::string infoLog;
};

class Shader {
public:
    Shader();
    Shader(const Shader&) = delete;
    Shader(Shader&&) noexcept;
    ~Shader();

    Shader& operator=(Shader&&) noexcept;

    void bind() const;

    // Returns -1 for names the linker optimized away or that never existed.
    [[nodiscard]] GLint getUniformLocation(const std::string& name) const;

    [[nodiscard]] GLuint id() const { return m_program; }
    [[nodiscard]] bool valid() const;

private:
    friend class ShaderBuilder;
    explicit Shader(GLuint program);

private:
    GLuint m_program;
};

class ShaderBuilder {
public:
    ShaderBuilder() = default;
    ShaderBuilder(const ShaderBuilder&) = delete;
    ShaderBuilder(ShaderBuilder&&) = default;
    ~ShaderBuilder();

    // label is only used in error messages.
    ShaderBuilder& addStageSource(GLuint shaderStage, const std::string& source, const std::string& label);
    Shader build();

private:
    void freeShaders();

private:
    std::vector<GLuint> m_shaders;
};
