// SPDX-License-Identifier: MIT

#include "rendering/ShaderManager.h"

#include "rendering/texture.h"

#include <framework/opengl_includes.h>

#include <fmt/format.h>
#include <glm/gtc/type_ptr.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

// Interleaved position / texture coordinate, two triangles.
constexpr std::array<float, 24> kFullscreenQuad = {
    -1.0f, -1.0f, 0.0f, 0.0f,
     1.0f, -1.0f, 1.0f, 0.0f,
    -1.0f,  1.0f, 0.0f, 1.0f,
    -1.0f,  1.0f, 0.0f, 1.0f,
     1.0f, -1.0f, 1.0f, 0.0f,
     1.0f,  1.0f, 1.0f, 1.0f,
};

struct ProgramFiles {
    ProgramId id;
    const char* fragment;
};

constexpr std::array<ProgramFiles, kProgramCount> kProgramFiles { {
    { ProgramId::Grade, "grade.frag" },
    { ProgramId::Blur, "blur.frag" },
    { ProgramId::BloomExtract, "bloom_extract.frag" },
    { ProgramId::Composite, "composite.frag" },
    { ProgramId::Final, "final.frag" },
    { ProgramId::ExportTransform, "export_transform.frag" },
} };

constexpr const char* kVertexFile = "fullscreen.vert";

std::string readShaderFile(const std::filesystem::path& filePath)
{
    if (!std::filesystem::exists(filePath))
        throw ShaderLoadingException(fmt::format("File {} does not exist", filePath.string()));

    std::ifstream file(filePath, std::ios::binary);
    if (!file)
        throw ShaderLoadingException(fmt::format("Failed to open shader file {}", filePath.string()));
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::size_t indexOf(ProgramId id)
{
    return static_cast<std::size_t>(id);
}

}

std::string_view programName(ProgramId id)
{
    switch (id) {
    case ProgramId::Grade:
        return "grade";
    case ProgramId::Blur:
        return "blur";
    case ProgramId::BloomExtract:
        return "bloom_extract";
    case ProgramId::Composite:
        return "composite";
    case ProgramId::Final:
        return "final";
    case ProgramId::ExportTransform:
        return "export_transform";
    }
    return "unknown";
}

ShaderManager::ShaderManager(const std::filesystem::path& shaderDirectory)
{
    const std::string vertexSource = readShaderFile(shaderDirectory / kVertexFile);

    for (const ProgramFiles& files : kProgramFiles) {
        const std::filesystem::path fragmentPath = shaderDirectory / files.fragment;
        Entry& entry = m_programs[indexOf(files.id)];
        entry.shader = createProgram(vertexSource, readShaderFile(fragmentPath), fragmentPath.string());
        entry.locations = cacheUniformLocations(entry.shader, activeUniformNames(entry.shader));
        std::cout << fmt::format("[ShaderManager] {} linked, {} uniforms", programName(files.id), entry.locations.size()) << std::endl;
    }

    createQuad();
}

ShaderManager::~ShaderManager()
{
    dispose();
}

Shader ShaderManager::createProgram(const std::string& vertexSource, const std::string& fragmentSource, const std::string& label)
{
    ShaderBuilder builder;
    builder.addStageSource(GL_VERTEX_SHADER, vertexSource, label + " (vertex)");
    builder.addStageSource(GL_FRAGMENT_SHADER, fragmentSource, label);
    return builder.build();
}

UniformLocations ShaderManager::cacheUniformLocations(const Shader& program, const std::vector<std::string>& names)
{
    UniformLocations locations;
    for (const std::string& name : names) {
        if (const GLint loc = program.getUniformLocation(name); loc >= 0)
            locations.emplace(name, loc);
    }
    return locations;
}

std::vector<std::string> ShaderManager::activeUniformNames(const Shader& program)
{
    std::vector<std::string> names;
    if (!program.valid())
        return names;

    GLint count = 0;
    GLint maxLength = 0;
    glGetProgramiv(program.id(), GL_ACTIVE_UNIFORMS, &count);
    glGetProgramiv(program.id(), GL_ACTIVE_UNIFORM_MAX_LENGTH, &maxLength);

    std::string buffer(static_cast<std::size_t>(std::max(maxLength, 1)), '\0');
    for (GLint i = 0; i < count; ++i) {
        GLsizei length = 0;
        GLint size = 0;
        GLenum type = GL_NONE;
        glGetActiveUniform(program.id(), static_cast<GLuint>(i), maxLength, &length, &size, &type, buffer.data());
        std::string name = buffer.substr(0, static_cast<std::size_t>(length));
        // Arrays report "name[0]"; the base name resolves to the same location.
        if (const auto bracket = name.find('['); bracket != std::string::npos)
            name.erase(bracket);
        names.push_back(std::move(name));
    }
    return names;
}

void ShaderManager::bind(ProgramId id) const
{
    program(id).bind();
}

void ShaderManager::drawQuad(ProgramId id) const
{
    if (m_quadVao == 0)
        throw std::logic_error("ShaderManager: draw after dispose");

    bind(id);
    glBindVertexArray(m_quadVao);
    glDrawArrays(GL_TRIANGLES, 0, 6);
    glBindVertexArray(0);
}

const Shader& ShaderManager::program(ProgramId id) const
{
    const Shader& shader = m_programs[indexOf(id)].shader;
    if (!shader.valid())
        throw std::logic_error(fmt::format("ShaderManager: program {} is not available", programName(id)));
    return shader;
}

const UniformLocations& ShaderManager::uniforms(ProgramId id) const
{
    return m_programs[indexOf(id)].locations;
}

GLint ShaderManager::location(ProgramId id, const std::string& name) const
{
    const UniformLocations& locations = uniforms(id);
    const auto it = locations.find(name);
    return it == locations.end() ? -1 : it->second;
}

bool ShaderManager::has(ProgramId id, const std::string& name) const
{
    return location(id, name) >= 0;
}

void ShaderManager::setInt(ProgramId id, const std::string& name, int value) const
{
    if (const GLint loc = location(id, name); loc >= 0)
        glProgramUniform1i(program(id).id(), loc, value);
}

void ShaderManager::setFloat(ProgramId id, const std::string& name, float value) const
{
    if (const GLint loc = location(id, name); loc >= 0)
        glProgramUniform1f(program(id).id(), loc, value);
}

void ShaderManager::setVec2(ProgramId id, const std::string& name, const glm::vec2& value) const
{
    if (const GLint loc = location(id, name); loc >= 0)
        glProgramUniform2fv(program(id).id(), loc, 1, glm::value_ptr(value));
}

void ShaderManager::setVec3(ProgramId id, const std::string& name, const glm::vec3& value) const
{
    if (const GLint loc = location(id, name); loc >= 0)
        glProgramUniform3fv(program(id).id(), loc, 1, glm::value_ptr(value));
}

void ShaderManager::setMat3(ProgramId id, const std::string& name, const glm::mat3& value) const
{
    if (const GLint loc = location(id, name); loc >= 0)
        glProgramUniformMatrix3fv(program(id).id(), loc, 1, GL_FALSE, glm::value_ptr(value));
}

void ShaderManager::dispose()
{
    if (m_quadVbo)
        glDeleteBuffers(1, &m_quadVbo);
    if (m_quadVao)
        glDeleteVertexArrays(1, &m_quadVao);
    m_quadVbo = 0;
    m_quadVao = 0;

    for (Entry& entry : m_programs) {
        entry.shader = Shader {};
        entry.locations.clear();
    }
}

void ShaderManager::createQuad()
{
    glGenVertexArrays(1, &m_quadVao);
    glGenBuffers(1, &m_quadVbo);
    if (m_quadVao == 0 || m_quadVbo == 0)
        throw GpuResourceError("Failed to create the full-screen quad");

    glBindVertexArray(m_quadVao);
    glBindBuffer(GL_ARRAY_BUFFER, m_quadVbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(kFullscreenQuad), kFullscreenQuad.data(), GL_STATIC_DRAW);

    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), reinterpret_cast<void*>(0));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), reinterpret_cast<void*>(2 * sizeof(float)));

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}
