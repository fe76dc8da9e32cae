/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_GLDEVICE_H_
#define _CARTO_GPU_GLDEVICE_H_

#include <cstddef>
#include <optional>
#include <string>

#include <GLES3/gl3.h>
#include <GLES2/gl2ext.h>

namespace carto { namespace gpu {
    /**
     * Thin wrapper over the OpenGL ES entry points used by the program and draw code.
     * All calls must be made on the thread that owns the graphics context.
     */
    class GLDevice {
    public:
        virtual ~GLDevice() = default;

        // Capabilities
        virtual bool isGLSL3Supported() const = 0;
        virtual bool isVertexArraySupported() const = 0;
        virtual bool isContextLost() const = 0;

        // Shaders and programs
        virtual GLuint createShader(GLenum type) = 0;
        virtual void shaderSource(GLuint shader, const std::string& source) = 0;
        virtual void compileShader(GLuint shader) = 0;
        virtual bool getShaderCompileStatus(GLuint shader) const = 0;
        virtual std::string getShaderInfoLog(GLuint shader) const = 0;
        virtual void deleteShader(GLuint shader) = 0;

        virtual GLuint createProgram() = 0;
        virtual void attachShader(GLuint program, GLuint shader) = 0;
        virtual void bindAttribLocation(GLuint program, GLuint index, const std::string& name) = 0;
        virtual void linkProgram(GLuint program) = 0;
        virtual bool getProgramLinkStatus(GLuint program) const = 0;
        virtual std::string getProgramInfoLog(GLuint program) const = 0;
        virtual void deleteProgram(GLuint program) = 0;
        virtual void useProgram(GLuint program) = 0;

        // Returns an empty optional if the uniform is not active in the linked program
        virtual std::optional<GLint> getUniformLocation(GLuint program, const std::string& name) const = 0;

        virtual void uniform1i(GLint location, GLint value) = 0;
        virtual void uniform1f(GLint location, GLfloat value) = 0;
        virtual void uniform2f(GLint location, GLfloat x, GLfloat y) = 0;
        virtual void uniform3f(GLint location, GLfloat x, GLfloat y, GLfloat z) = 0;
        virtual void uniform4f(GLint location, GLfloat x, GLfloat y, GLfloat z, GLfloat w) = 0;
        virtual void uniformMatrix4fv(GLint location, const GLfloat* values) = 0;

        // Textures
        virtual void activeTexture(GLenum unit) = 0;
        virtual void bindTexture(GLenum target, GLuint texture) = 0;

        // Buffers and vertex arrays
        virtual GLuint createBuffer() = 0;
        virtual void deleteBuffer(GLuint buffer) = 0;
        virtual void bindBuffer(GLenum target, GLuint buffer) = 0;
        virtual void bufferData(GLenum target, GLsizeiptr size, const void* data, GLenum usage) = 0;
        virtual void bufferSubData(GLenum target, GLintptr offset, GLsizeiptr size, const void* data) = 0;

        virtual GLuint createVertexArray() = 0;
        virtual void deleteVertexArray(GLuint vertexArray) = 0;
        virtual void bindVertexArray(GLuint vertexArray) = 0;
        virtual void enableVertexAttribArray(GLuint index) = 0;
        virtual void disableVertexAttribArray(GLuint index) = 0;
        virtual void vertexAttribPointer(GLuint index, GLint components, GLenum type, bool normalized, GLsizei stride, std::size_t offset) = 0;

        // Fixed function state
        virtual void enable(GLenum cap) = 0;
        virtual void disable(GLenum cap) = 0;
        virtual void depthFunc(GLenum func) = 0;
        virtual void depthMask(bool mask) = 0;
        virtual void depthRange(GLfloat nearValue, GLfloat farValue) = 0;
        virtual void stencilMask(GLuint mask) = 0;
        virtual void stencilFunc(GLenum func, GLint ref, GLuint mask) = 0;
        virtual void stencilOp(GLenum fail, GLenum depthFail, GLenum pass) = 0;
        virtual void blendFunc(GLenum src, GLenum dst) = 0;
        virtual void blendColor(GLfloat r, GLfloat g, GLfloat b, GLfloat a) = 0;
        virtual void colorMask(bool r, bool g, bool b, bool a) = 0;
        virtual void cullFace(GLenum mode) = 0;
        virtual void frontFace(GLenum mode) = 0;

        // Drawing
        virtual void drawElements(GLenum mode, GLsizei count, GLenum type, std::size_t offset) = 0;
    };
} }

#endif
