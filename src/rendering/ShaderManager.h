// SPDX-License-Identifier: MIT

#pragma once

#include <framework/shader.h>

#include <glm/mat3x3.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <array>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

enum class ProgramId : std::size_t {
    Grade,
    Blur,
    BloomExtract,
    Composite,
    Final,
    ExportTransform
};
constexpr std::size_t kProgramCount = 6;

[[nodiscard]] std::string_view programName(ProgramId id);

using UniformLocations = std::unordered_map<std::string, GLint>;

// Owns every program of the renderer plus the one full-screen quad they all
// draw. Programs and their uniform locations are resolved once at
// construction and never change afterwards.
class ShaderManager {
public:
    explicit ShaderManager(const std::filesystem::path& shaderDirectory);
    ShaderManager(const ShaderManager&) = delete;
    ShaderManager& operator=(const ShaderManager&) = delete;
    ~ShaderManager();

    [[nodiscard]] static Shader createProgram(const std::string& vertexSource, const std::string& fragmentSource, const std::string& label = "program");
    // Names without a location (never declared or optimized away) are left out.
    [[nodiscard]] static UniformLocations cacheUniformLocations(const Shader& program, const std::vector<std::string>& names);
    [[nodiscard]] static std::vector<std::string> activeUniformNames(const Shader& program);

    void bind(ProgramId id) const;
    // Binds the shared quad and draws it with the given program.
    void drawQuad(ProgramId id) const;

    [[nodiscard]] const Shader& program(ProgramId id) const;
    [[nodiscard]] const UniformLocations& uniforms(ProgramId id) const;
    [[nodiscard]] GLint location(ProgramId id, const std::string& name) const;
    [[nodiscard]] bool has(ProgramId id, const std::string& name) const;

    void setInt(ProgramId id, const std::string& name, int value) const;
    void setFloat(ProgramId id, const std::string& name, float value) const;
    void setVec2(ProgramId id, const std::string& name, const glm::vec2& value) const;
    void setVec3(ProgramId id, const std::string& name, const glm::vec3& value) const;
    void setMat3(ProgramId id, const std::string& name, const glm::mat3& value) const;

    void dispose();

private:
    struct Entry {
        Shader shader;
        UniformLocations locations;
    };

    void createQuad();

    std::array<Entry, kProgramCount> m_programs;
    GLuint m_quadVao { 0 };
    GLuint m_quadVbo { 0 };
};
