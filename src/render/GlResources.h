#pragma once

#include "graphlens/render/GlRenderer.h"

#include <GLES3/gl3.h>

#include <string>
#include <utility>

namespace graphlens::gl {

/// Move-only owner of a GL object name
template <typename Deleter>
class Handle {
public:
    Handle() = default;
    explicit Handle(GLuint id) : id_(id) {}
    ~Handle() { reset(); }

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    Handle(Handle&& other) noexcept : id_(std::exchange(other.id_, 0)) {}
    Handle& operator=(Handle&& other) noexcept {
        if (this != &other) {
            reset();
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    GLuint id() const { return id_; }
    explicit operator bool() const { return id_ != 0; }

    void reset() {
        if (id_ != 0) {
            Deleter{}(id_);
            id_ = 0;
        }
    }

private:
    GLuint id_ = 0;
};

struct BufferDeleter {
    void operator()(GLuint id) const { glDeleteBuffers(1, &id); }
};
struct VertexArrayDeleter {
    void operator()(GLuint id) const { glDeleteVertexArrays(1, &id); }
};
struct ShaderDeleter {
    void operator()(GLuint id) const { glDeleteShader(id); }
};
struct ProgramDeleter {
    void operator()(GLuint id) const { glDeleteProgram(id); }
};

using Buffer = Handle<BufferDeleter>;
using VertexArray = Handle<VertexArrayDeleter>;
using Shader = Handle<ShaderDeleter>;
using Program = Handle<ProgramDeleter>;

inline Buffer createBuffer() {
    GLuint id = 0;
    glGenBuffers(1, &id);
    if (id == 0) {
        throw RenderContextError("glGenBuffers failed");
    }
    return Buffer(id);
}

inline VertexArray createVertexArray() {
    GLuint id = 0;
    glGenVertexArrays(1, &id);
    if (id == 0) {
        throw RenderContextError("glGenVertexArrays failed");
    }
    return VertexArray(id);
}

inline Shader compileShader(GLenum type, const char* source) {
    Shader shader(glCreateShader(type));
    if (!shader) {
        throw RenderContextError("glCreateShader failed");
    }
    glShaderSource(shader.id(), 1, &source, nullptr);
    glCompileShader(shader.id());

    GLint success = GL_FALSE;
    glGetShaderiv(shader.id(), GL_COMPILE_STATUS, &success);
    if (!success) {
        char log[1024] = {};
        glGetShaderInfoLog(shader.id(), sizeof(log), nullptr, log);
        throw RenderContextError(std::string("Shader compile error: ") + log);
    }
    return shader;
}

inline Program linkProgram(const char* vertexSource, const char* fragmentSource) {
    Shader vs = compileShader(GL_VERTEX_SHADER, vertexSource);
    Shader fs = compileShader(GL_FRAGMENT_SHADER, fragmentSource);

    Program program(glCreateProgram());
    if (!program) {
        throw RenderContextError("glCreateProgram failed");
    }
    glAttachShader(program.id(), vs.id());
    glAttachShader(program.id(), fs.id());
    glLinkProgram(program.id());

    GLint success = GL_FALSE;
    glGetProgramiv(program.id(), GL_LINK_STATUS, &success);
    if (!success) {
        char log[1024] = {};
        glGetProgramInfoLog(program.id(), sizeof(log), nullptr, log);
        throw RenderContextError(std::string("Program link error: ") + log);
    }

    // Shaders are released with their handles once linked
    glDetachShader(program.id(), vs.id());
    glDetachShader(program.id(), fs.id());
    return program;
}

}  // namespace graphlens::gl
