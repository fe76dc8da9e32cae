/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_GLCONTEXT_H_
#define _CARTO_GPU_GLCONTEXT_H_

#include "GLDevice.h"
#include "DrawModes.h"
#include "Logger.h"

#include <memory>
#include <optional>
#include <set>

namespace carto { namespace gpu {
    /**
     * Tracks the GL state set through it and skips device calls that would not change anything.
     * State changed behind its back (by other renderers sharing the context) must be followed by resetState().
     */
    class GLContext final {
    public:
        explicit GLContext(std::shared_ptr<GLDevice> device, std::shared_ptr<Logger> logger);

        GLContext(const GLContext&) = delete;
        GLContext& operator = (const GLContext&) = delete;

        GLDevice& getDevice() const { return *_device; }
        const std::shared_ptr<Logger>& getLogger() const { return _logger; }

        bool isGLSL3Supported() const;
        bool isContextLost() const;

        void resetState();

        void useProgram(GLuint program);
        void forgetProgram(GLuint program);
        void setActiveTexture(GLenum unit);
        void bindTexture2D(GLuint texture);

        GLuint createVertexArray();
        void deleteVertexArray(GLuint vertexArray);
        void bindVertexArray(GLuint vertexArray);
        // Enables the given attribute arrays in the bound vertex array. Without a vertex array object
        // bound, arrays enabled by earlier calls and missing from the set are disabled.
        void enableVertexAttribArrays(const std::set<GLuint>& indices);
        void bindVertexBuffer(GLuint buffer);
        void bindElementBuffer(GLuint buffer);
        void forgetBuffer(GLuint buffer);

        void setDepthMode(const DepthMode& depthMode);
        void setStencilMode(const StencilMode& stencilMode);
        void setColorMode(const ColorMode& colorMode);
        void setCullFace(const CullFaceMode& cullFaceMode);

    private:
        const std::shared_ptr<GLDevice> _device;
        const std::shared_ptr<Logger> _logger;

        std::optional<GLuint> _program;
        std::optional<GLenum> _activeTexture;
        std::optional<GLuint> _vertexArray;
        std::set<GLuint> _enabledVertexAttribArrays;
        std::optional<GLuint> _vertexBuffer;
        std::optional<GLuint> _elementBuffer;
        std::optional<DepthMode> _depthMode;
        std::optional<StencilMode> _stencilMode;
        std::optional<ColorMode> _colorMode;
        std::optional<CullFaceMode> _cullFaceMode;
    };
} }

#endif
