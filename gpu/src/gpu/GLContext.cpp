#include "GLContext.h"

#include <stdexcept>

namespace carto::gpu {
    GLContext::GLContext(std::shared_ptr<GLDevice> device, std::shared_ptr<Logger> logger) :
        _device(std::move(device)), _logger(std::move(logger))
    {
        if (!_device) {
            throw std::invalid_argument("Null device");
        }
        if (!_logger) {
            throw std::invalid_argument("Null logger");
        }
    }

    bool GLContext::isGLSL3Supported() const {
        return _device->isGLSL3Supported();
    }

    bool GLContext::isContextLost() const {
        return _device->isContextLost();
    }

    void GLContext::resetState() {
        _program.reset();
        _activeTexture.reset();
        _vertexArray.reset();
        _enabledVertexAttribArrays.clear();
        _vertexBuffer.reset();
        _elementBuffer.reset();
        _depthMode.reset();
        _stencilMode.reset();
        _colorMode.reset();
        _cullFaceMode.reset();
    }

    void GLContext::useProgram(GLuint program) {
        if (_program != program) {
            _device->useProgram(program);
            _program = program;
        }
    }

    void GLContext::forgetProgram(GLuint program) {
        if (_program == program) {
            _program.reset();
        }
    }

    void GLContext::setActiveTexture(GLenum unit) {
        if (_activeTexture != unit) {
            _device->activeTexture(unit);
            _activeTexture = unit;
        }
    }

    void GLContext::bindTexture2D(GLuint texture) {
        _device->bindTexture(GL_TEXTURE_2D, texture);
    }

    GLuint GLContext::createVertexArray() {
        if (!_device->isVertexArraySupported()) {
            return 0;
        }
        return _device->createVertexArray();
    }

    void GLContext::deleteVertexArray(GLuint vertexArray) {
        if (vertexArray == 0) {
            return;
        }
        if (_vertexArray == vertexArray) {
            _vertexArray.reset();
            _elementBuffer.reset();
        }
        _device->deleteVertexArray(vertexArray);
    }

    void GLContext::bindVertexArray(GLuint vertexArray) {
        if (_vertexArray != vertexArray) {
            if (_device->isVertexArraySupported()) {
                _device->bindVertexArray(vertexArray);
            }
            _vertexArray = vertexArray;
            _elementBuffer.reset(); // element buffer binding is part of the vertex array state
        }
    }

    void GLContext::enableVertexAttribArrays(const std::set<GLuint>& indices) {
        if (_vertexArray && *_vertexArray != 0) {
            for (GLuint index : indices) {
                _device->enableVertexAttribArray(index);
            }
            return;
        }

        for (GLuint index : _enabledVertexAttribArrays) {
            if (indices.count(index) == 0) {
                _device->disableVertexAttribArray(index);
            }
        }
        for (GLuint index : indices) {
            if (_enabledVertexAttribArrays.count(index) == 0) {
                _device->enableVertexAttribArray(index);
            }
        }
        _enabledVertexAttribArrays = indices;
    }

    void GLContext::bindVertexBuffer(GLuint buffer) {
        if (_vertexBuffer != buffer) {
            _device->bindBuffer(GL_ARRAY_BUFFER, buffer);
            _vertexBuffer = buffer;
        }
    }

    void GLContext::bindElementBuffer(GLuint buffer) {
        if (_elementBuffer != buffer) {
            _device->bindBuffer(GL_ELEMENT_ARRAY_BUFFER, buffer);
            _elementBuffer = buffer;
        }
    }

    void GLContext::forgetBuffer(GLuint buffer) {
        if (_vertexBuffer == buffer) {
            _vertexBuffer.reset();
        }
        if (_elementBuffer == buffer) {
            _elementBuffer.reset();
        }
    }

    void GLContext::setDepthMode(const DepthMode& depthMode) {
        if (_depthMode == depthMode) {
            return;
        }
        if (depthMode.func == GL_ALWAYS && !depthMode.mask) {
            _device->disable(GL_DEPTH_TEST);
        } else {
            _device->enable(GL_DEPTH_TEST);
            _device->depthFunc(depthMode.func);
            _device->depthMask(depthMode.mask);
            _device->depthRange(depthMode.range[0], depthMode.range[1]);
        }
        _depthMode = depthMode;
    }

    void GLContext::setStencilMode(const StencilMode& stencilMode) {
        if (_stencilMode == stencilMode) {
            return;
        }
        if (stencilMode.func == GL_ALWAYS && !stencilMode.mask) {
            _device->disable(GL_STENCIL_TEST);
        } else {
            _device->enable(GL_STENCIL_TEST);
            _device->stencilMask(stencilMode.mask);
            _device->stencilOp(stencilMode.fail, stencilMode.depthFail, stencilMode.pass);
            _device->stencilFunc(stencilMode.func, stencilMode.ref, stencilMode.testMask);
        }
        _stencilMode = stencilMode;
    }

    void GLContext::setColorMode(const ColorMode& colorMode) {
        if (_colorMode == colorMode) {
            return;
        }
        if (!colorMode.isBlendingEnabled()) {
            _device->disable(GL_BLEND);
        } else {
            _device->enable(GL_BLEND);
            _device->blendFunc(colorMode.blendSrc, colorMode.blendDst);
            _device->blendColor(colorMode.blendColor[0], colorMode.blendColor[1], colorMode.blendColor[2], colorMode.blendColor[3]);
        }
        _device->colorMask(colorMode.mask[0], colorMode.mask[1], colorMode.mask[2], colorMode.mask[3]);
        _colorMode = colorMode;
    }

    void GLContext::setCullFace(const CullFaceMode& cullFaceMode) {
        if (_cullFaceMode == cullFaceMode) {
            return;
        }
        if (!cullFaceMode.enable) {
            _device->disable(GL_CULL_FACE);
        } else {
            _device->enable(GL_CULL_FACE);
            _device->cullFace(cullFaceMode.mode);
            _device->frontFace(cullFaceMode.frontFace);
        }
        _cullFaceMode = cullFaceMode;
    }
}
