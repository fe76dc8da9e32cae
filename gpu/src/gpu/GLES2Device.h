/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_GLES2DEVICE_H_
#define _CARTO_GPU_GLES2DEVICE_H_

#include "GLDevice.h"
#include "GLExtensions.h"

#include <memory>

namespace carto { namespace gpu {
    /**
     * GLDevice implementation calling the OpenGL ES 2.0/3.0 API of the current EGL context.
     * Vertex arrays use the core GLES3 entry points or GL_OES_vertex_array_object.
     */
    class GLES2Device final : public GLDevice {
    public:
        explicit GLES2Device(std::shared_ptr<GLExtensions> glExtensions);

        // Marks the context as lost, for platforms that report loss through an event instead of GL_EXT_robustness
        void notifyContextLost();

        virtual bool isGLSL3Supported() const override;
        virtual bool isVertexArraySupported() const override;
        virtual bool isContextLost() const override;

        virtual GLuint createShader(GLenum type) override;
        virtual void shaderSource(GLuint shader, const std::string& source) override;
        virtual void compileShader(GLuint shader) override;
        virtual bool getShaderCompileStatus(GLuint shader) const override;
        virtual std::string getShaderInfoLog(GLuint shader) const override;
        virtual void deleteShader(GLuint shader) override;

        virtual GLuint createProgram() override;
        virtual void attachShader(GLuint program, GLuint shader) override;
        virtual void bindAttribLocation(GLuint program, GLuint index, const std::string& name) override;
        virtual void linkProgram(GLuint program) override;
        virtual bool getProgramLinkStatus(GLuint program) const override;
        virtual std::string getProgramInfoLog(GLuint program) const override;
        virtual void deleteProgram(GLuint program) override;
        virtual void useProgram(GLuint program) override;

        virtual std::optional<GLint> getUniformLocation(GLuint program, const std::string& name) const override;

        virtual void uniform1i(GLint location, GLint value) override;
        virtual void uniform1f(GLint location, GLfloat value) override;
        virtual void uniform2f(GLint location, GLfloat x, GLfloat y) override;
        virtual void uniform3f(GLint location, GLfloat x, GLfloat y, GLfloat z) override;
        virtual void uniform4f(GLint location, GLfloat x, GLfloat y, GLfloat z, GLfloat w) override;
        virtual void uniformMatrix4fv(GLint location, const GLfloat* values) override;

        virtual void activeTexture(GLenum unit) override;
        virtual void bindTexture(GLenum target, GLuint texture) override;

        virtual GLuint createBuffer() override;
        virtual void deleteBuffer(GLuint buffer) override;
        virtual void bindBuffer(GLenum target, GLuint buffer) override;
        virtual void bufferData(GLenum target, GLsizeiptr size, const void* data, GLenum usage) override;
        virtual void bufferSubData(GLenum target, GLintptr offset, GLsizeiptr size, const void* data) override;

        virtual GLuint createVertexArray() override;
        virtual void deleteVertexArray(GLuint vertexArray) override;
        virtual void bindVertexArray(GLuint vertexArray) override;
        virtual void enableVertexAttribArray(GLuint index) override;
        virtual void disableVertexAttribArray(GLuint index) override;
        virtual void vertexAttribPointer(GLuint index, GLint components, GLenum type, bool normalized, GLsizei stride, std::size_t offset) override;

        virtual void enable(GLenum cap) override;
        virtual void disable(GLenum cap) override;
        virtual void depthFunc(GLenum func) override;
        virtual void depthMask(bool mask) override;
        virtual void depthRange(GLfloat nearValue, GLfloat farValue) override;
        virtual void stencilMask(GLuint mask) override;
        virtual void stencilFunc(GLenum func, GLint ref, GLuint mask) override;
        virtual void stencilOp(GLenum fail, GLenum depthFail, GLenum pass) override;
        virtual void blendFunc(GLenum src, GLenum dst) override;
        virtual void blendColor(GLfloat r, GLfloat g, GLfloat b, GLfloat a) override;
        virtual void colorMask(bool r, bool g, bool b, bool a) override;
        virtual void cullFace(GLenum mode) override;
        virtual void frontFace(GLenum mode) override;

        virtual void drawElements(GLenum mode, GLsizei count, GLenum type, std::size_t offset) override;

    private:
        const std::shared_ptr<GLExtensions> _glExtensions;
        bool _contextLost = false;
    };
} }

#endif
