#include "GLES2Device.h"

#include <vector>

namespace {
    const GLvoid* bufferGLOffset(std::size_t offset) {
        return reinterpret_cast<const GLvoid*>(offset);
    }
}

namespace carto::gpu {
    GLES2Device::GLES2Device(std::shared_ptr<GLExtensions> glExtensions) :
        _glExtensions(std::move(glExtensions))
    {
    }

    void GLES2Device::notifyContextLost() {
        _contextLost = true;
    }

    bool GLES2Device::isGLSL3Supported() const {
        return _glExtensions->GLES3_supported();
    }

    bool GLES2Device::isVertexArraySupported() const {
        return _glExtensions->GLES3_supported() || _glExtensions->GL_OES_vertex_array_object_supported();
    }

    bool GLES2Device::isContextLost() const {
        if (_contextLost) {
            return true;
        }
        if (_glExtensions->GL_EXT_robustness_supported()) {
            return _glExtensions->glGetGraphicsResetStatusEXT() != GL_NO_ERROR;
        }
        return false;
    }

    GLuint GLES2Device::createShader(GLenum type) {
        return glCreateShader(type);
    }

    void GLES2Device::shaderSource(GLuint shader, const std::string& source) {
        const char* shaderSource = source.c_str();
        glShaderSource(shader, 1, &shaderSource, NULL);
    }

    void GLES2Device::compileShader(GLuint shader) {
        glCompileShader(shader);
    }

    bool GLES2Device::getShaderCompileStatus(GLuint shader) const {
        GLint isShaderCompiled = 0;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &isShaderCompiled);
        return isShaderCompiled != 0;
    }

    std::string GLES2Device::getShaderInfoLog(GLuint shader) const {
        GLint infoLogLength = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &infoLogLength);
        std::vector<char> infoLog(infoLogLength + 1);
        GLsizei charactersWritten = 0;
        glGetShaderInfoLog(shader, infoLogLength, &charactersWritten, infoLog.data());
        return std::string(infoLog.begin(), infoLog.begin() + charactersWritten);
    }

    void GLES2Device::deleteShader(GLuint shader) {
        glDeleteShader(shader);
    }

    GLuint GLES2Device::createProgram() {
        return glCreateProgram();
    }

    void GLES2Device::attachShader(GLuint program, GLuint shader) {
        glAttachShader(program, shader);
    }

    void GLES2Device::bindAttribLocation(GLuint program, GLuint index, const std::string& name) {
        glBindAttribLocation(program, index, name.c_str());
    }

    void GLES2Device::linkProgram(GLuint program) {
        glLinkProgram(program);
    }

    bool GLES2Device::getProgramLinkStatus(GLuint program) const {
        GLint isLinked = 0;
        glGetProgramiv(program, GL_LINK_STATUS, &isLinked);
        return isLinked != 0;
    }

    std::string GLES2Device::getProgramInfoLog(GLuint program) const {
        GLint infoLogLength = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &infoLogLength);
        std::vector<char> infoLog(infoLogLength + 1);
        GLsizei charactersWritten = 0;
        glGetProgramInfoLog(program, infoLogLength, &charactersWritten, infoLog.data());
        return std::string(infoLog.begin(), infoLog.begin() + charactersWritten);
    }

    void GLES2Device::deleteProgram(GLuint program) {
        glDeleteProgram(program);
    }

    void GLES2Device::useProgram(GLuint program) {
        glUseProgram(program);
    }

    std::optional<GLint> GLES2Device::getUniformLocation(GLuint program, const std::string& name) const {
        GLint location = glGetUniformLocation(program, name.c_str());
        if (location < 0) {
            return std::optional<GLint>();
        }
        return location;
    }

    void GLES2Device::uniform1i(GLint location, GLint value) {
        glUniform1i(location, value);
    }

    void GLES2Device::uniform1f(GLint location, GLfloat value) {
        glUniform1f(location, value);
    }

    void GLES2Device::uniform2f(GLint location, GLfloat x, GLfloat y) {
        glUniform2f(location, x, y);
    }

    void GLES2Device::uniform3f(GLint location, GLfloat x, GLfloat y, GLfloat z) {
        glUniform3f(location, x, y, z);
    }

    void GLES2Device::uniform4f(GLint location, GLfloat x, GLfloat y, GLfloat z, GLfloat w) {
        glUniform4f(location, x, y, z, w);
    }

    void GLES2Device::uniformMatrix4fv(GLint location, const GLfloat* values) {
        glUniformMatrix4fv(location, 1, GL_FALSE, values);
    }

    void GLES2Device::activeTexture(GLenum unit) {
        glActiveTexture(unit);
    }

    void GLES2Device::bindTexture(GLenum target, GLuint texture) {
        glBindTexture(target, texture);
    }

    GLuint GLES2Device::createBuffer() {
        GLuint buffer = 0;
        glGenBuffers(1, &buffer);
        return buffer;
    }

    void GLES2Device::deleteBuffer(GLuint buffer) {
        glDeleteBuffers(1, &buffer);
    }

    void GLES2Device::bindBuffer(GLenum target, GLuint buffer) {
        glBindBuffer(target, buffer);
    }

    void GLES2Device::bufferData(GLenum target, GLsizeiptr size, const void* data, GLenum usage) {
        glBufferData(target, size, data, usage);
    }

    void GLES2Device::bufferSubData(GLenum target, GLintptr offset, GLsizeiptr size, const void* data) {
        glBufferSubData(target, offset, size, data);
    }

    GLuint GLES2Device::createVertexArray() {
        GLuint vertexArray = 0;
        if (_glExtensions->GLES3_supported()) {
            glGenVertexArrays(1, &vertexArray);
        } else if (_glExtensions->GL_OES_vertex_array_object_supported()) {
            _glExtensions->glGenVertexArraysOES(1, &vertexArray);
        }
        return vertexArray;
    }

    void GLES2Device::deleteVertexArray(GLuint vertexArray) {
        if (_glExtensions->GLES3_supported()) {
            glDeleteVertexArrays(1, &vertexArray);
        } else if (_glExtensions->GL_OES_vertex_array_object_supported()) {
            _glExtensions->glDeleteVertexArraysOES(1, &vertexArray);
        }
    }

    void GLES2Device::bindVertexArray(GLuint vertexArray) {
        if (_glExtensions->GLES3_supported()) {
            glBindVertexArray(vertexArray);
        } else if (_glExtensions->GL_OES_vertex_array_object_supported()) {
            _glExtensions->glBindVertexArrayOES(vertexArray);
        }
    }

    void GLES2Device::enableVertexAttribArray(GLuint index) {
        glEnableVertexAttribArray(index);
    }

    void GLES2Device::disableVertexAttribArray(GLuint index) {
        glDisableVertexAttribArray(index);
    }

    void GLES2Device::vertexAttribPointer(GLuint index, GLint components, GLenum type, bool normalized, GLsizei stride, std::size_t offset) {
        glVertexAttribPointer(index, components, type, normalized ? GL_TRUE : GL_FALSE, stride, bufferGLOffset(offset));
    }

    void GLES2Device::enable(GLenum cap) {
        glEnable(cap);
    }

    void GLES2Device::disable(GLenum cap) {
        glDisable(cap);
    }

    void GLES2Device::depthFunc(GLenum func) {
        glDepthFunc(func);
    }

    void GLES2Device::depthMask(bool mask) {
        glDepthMask(mask ? GL_TRUE : GL_FALSE);
    }

    void GLES2Device::depthRange(GLfloat nearValue, GLfloat farValue) {
        glDepthRangef(nearValue, farValue);
    }

    void GLES2Device::stencilMask(GLuint mask) {
        glStencilMask(mask);
    }

    void GLES2Device::stencilFunc(GLenum func, GLint ref, GLuint mask) {
        glStencilFunc(func, ref, mask);
    }

    void GLES2Device::stencilOp(GLenum fail, GLenum depthFail, GLenum pass) {
        glStencilOp(fail, depthFail, pass);
    }

    void GLES2Device::blendFunc(GLenum src, GLenum dst) {
        glBlendFunc(src, dst);
    }

    void GLES2Device::blendColor(GLfloat r, GLfloat g, GLfloat b, GLfloat a) {
        glBlendColor(r, g, b, a);
    }

    void GLES2Device::colorMask(bool r, bool g, bool b, bool a) {
        glColorMask(r ? GL_TRUE : GL_FALSE, g ? GL_TRUE : GL_FALSE, b ? GL_TRUE : GL_FALSE, a ? GL_TRUE : GL_FALSE);
    }

    void GLES2Device::cullFace(GLenum mode) {
        glCullFace(mode);
    }

    void GLES2Device::frontFace(GLenum mode) {
        glFrontFace(mode);
    }

    void GLES2Device::drawElements(GLenum mode, GLsizei count, GLenum type, std::size_t offset) {
        glDrawElements(mode, count, type, bufferGLOffset(offset));
    }
}
