/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_DRAWMODES_H_
#define _CARTO_GPU_DRAWMODES_H_

#include "GLDevice.h"

#include <array>

namespace carto { namespace gpu {
    enum class DrawMode {
        LINES, TRIANGLES, LINE_STRIP
    };

    struct DepthMode {
        GLenum func;
        bool mask;
        std::array<float, 2> range;

        explicit DepthMode(GLenum func, bool mask, const std::array<float, 2>& range) : func(func), mask(mask), range(range) { }

        bool operator == (const DepthMode& other) const { return func == other.func && mask == other.mask && range == other.range; }
        bool operator != (const DepthMode& other) const { return !(*this == other); }

        static DepthMode disabled() { return DepthMode(GL_ALWAYS, false, { { 0.0f, 1.0f } }); }
    };

    struct StencilMode {
        GLenum func;
        GLuint testMask;
        GLint ref;
        GLuint mask;
        GLenum fail;
        GLenum depthFail;
        GLenum pass;

        explicit StencilMode(GLenum func, GLuint testMask, GLint ref, GLuint mask, GLenum fail, GLenum depthFail, GLenum pass) : func(func), testMask(testMask), ref(ref), mask(mask), fail(fail), depthFail(depthFail), pass(pass) { }

        bool operator == (const StencilMode& other) const {
            return func == other.func && testMask == other.testMask && ref == other.ref && mask == other.mask && fail == other.fail && depthFail == other.depthFail && pass == other.pass;
        }
        bool operator != (const StencilMode& other) const { return !(*this == other); }

        static StencilMode disabled() { return StencilMode(GL_ALWAYS, 0, 0, 0, GL_KEEP, GL_KEEP, GL_KEEP); }
    };

    struct ColorMode {
        GLenum blendSrc;
        GLenum blendDst;
        std::array<float, 4> blendColor;
        std::array<bool, 4> mask;

        explicit ColorMode(GLenum blendSrc, GLenum blendDst, const std::array<float, 4>& blendColor, const std::array<bool, 4>& mask) : blendSrc(blendSrc), blendDst(blendDst), blendColor(blendColor), mask(mask) { }

        bool isBlendingEnabled() const { return !(blendSrc == GL_ONE && blendDst == GL_ZERO); }

        bool operator == (const ColorMode& other) const { return blendSrc == other.blendSrc && blendDst == other.blendDst && blendColor == other.blendColor && mask == other.mask; }
        bool operator != (const ColorMode& other) const { return !(*this == other); }

        static ColorMode unblended() { return ColorMode(GL_ONE, GL_ZERO, { { 0, 0, 0, 0 } }, { { true, true, true, true } }); }
        static ColorMode alphaBlended() { return ColorMode(GL_ONE, GL_ONE_MINUS_SRC_ALPHA, { { 0, 0, 0, 0 } }, { { true, true, true, true } }); }
        static ColorMode disabled() { return ColorMode(GL_ONE, GL_ZERO, { { 0, 0, 0, 0 } }, { { false, false, false, false } }); }
    };

    struct CullFaceMode {
        bool enable;
        GLenum mode;
        GLenum frontFace;

        explicit CullFaceMode(bool enable, GLenum mode, GLenum frontFace) : enable(enable), mode(mode), frontFace(frontFace) { }

        bool operator == (const CullFaceMode& other) const { return enable == other.enable && mode == other.mode && frontFace == other.frontFace; }
        bool operator != (const CullFaceMode& other) const { return !(*this == other); }

        static CullFaceMode disabled() { return CullFaceMode(false, GL_BACK, GL_CCW); }
        static CullFaceMode backCCW() { return CullFaceMode(true, GL_BACK, GL_CCW); }
    };
} }

#endif
