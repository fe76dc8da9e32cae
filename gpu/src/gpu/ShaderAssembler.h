/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_SHADERASSEMBLER_H_
#define _CARTO_GPU_SHADERASSEMBLER_H_

#include "ShaderSource.h"

#include <string>
#include <vector>

namespace carto { namespace gpu {
    struct ShaderDefines {
        bool glsl3Supported;
        bool showOverdrawInspector;
        bool hasTerrain;
        std::string projectionDefine;
        std::vector<std::string> configurationDefines;
        std::vector<std::string> extraDefines;

        ShaderDefines() : glsl3Supported(false), showOverdrawInspector(false), hasTerrain(false), projectionDefine(), configurationDefines(), extraDefines() { }
    };

    struct AssembledShaders {
        std::string vertexSource;
        std::string fragmentSource;
    };

    std::vector<std::string> buildDefineList(const ShaderDefines& defines);

    AssembledShaders assembleShaders(const ShaderSource& prelude, const ShaderSource& projectionPrelude, const ShaderSource& source, const ShaderDefines& defines);

    // Convert GLSL ES 3.00 constructs used by the built-in shaders to GLSL ES 1.00
    std::string transpileVertexShaderToGLSL1(const std::string& source);
    std::string transpileFragmentShaderToGLSL1(const std::string& source);
} }

#endif
