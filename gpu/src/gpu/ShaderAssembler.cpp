#include "ShaderAssembler.h"

#include <regex>

#include <boost/algorithm/string.hpp>

namespace {
    const std::regex inQualifierRe(R"(\bin\s)");
    const std::regex outQualifierRe(R"(\bout\s)");
    const std::regex textureCallRe(R"(\btexture\()");
    const std::regex fragColorRe(R"(\bfragColor\b)");

    std::string joinStage(const std::vector<std::string>& defines, const std::string& prelude, const std::string& projectionPrelude, const std::string& source) {
        std::vector<std::string> parts(defines);
        parts.push_back(prelude);
        parts.push_back(projectionPrelude);
        parts.push_back(source);
        return boost::algorithm::join(parts, "\n");
    }
}

namespace carto::gpu {
    std::vector<std::string> buildDefineList(const ShaderDefines& defines) {
        std::vector<std::string> defineList;
        if (defines.glsl3Supported) {
            defineList.push_back("#version 300 es");
        }
        defineList.insert(defineList.end(), defines.configurationDefines.begin(), defines.configurationDefines.end());
        if (defines.showOverdrawInspector) {
            defineList.push_back("#define OVERDRAW_INSPECTOR;");
        }
        if (defines.hasTerrain) {
            defineList.push_back("#define TERRAIN3D;");
        }
        if (!defines.projectionDefine.empty()) {
            defineList.push_back(defines.projectionDefine);
        }
        defineList.insert(defineList.end(), defines.extraDefines.begin(), defines.extraDefines.end());
        return defineList;
    }

    AssembledShaders assembleShaders(const ShaderSource& prelude, const ShaderSource& projectionPrelude, const ShaderSource& source, const ShaderDefines& defines) {
        std::vector<std::string> defineList = buildDefineList(defines);

        AssembledShaders shaders;
        shaders.vertexSource = joinStage(defineList, prelude.getVertexSource(), projectionPrelude.getVertexSource(), source.getVertexSource());
        shaders.fragmentSource = joinStage(defineList, prelude.getFragmentSource(), projectionPrelude.getFragmentSource(), source.getFragmentSource());

        if (!defines.glsl3Supported) {
            shaders.vertexSource = transpileVertexShaderToGLSL1(shaders.vertexSource);
            shaders.fragmentSource = transpileFragmentShaderToGLSL1(shaders.fragmentSource);
        }
        return shaders;
    }

    std::string transpileVertexShaderToGLSL1(const std::string& source) {
        std::string result = std::regex_replace(source, inQualifierRe, "attribute ");
        result = std::regex_replace(result, outQualifierRe, "varying ");
        result = std::regex_replace(result, textureCallRe, "texture2D(");
        return result;
    }

    std::string transpileFragmentShaderToGLSL1(const std::string& source) {
        std::string result = std::regex_replace(source, inQualifierRe, "varying ");
        boost::replace_all(result, "out highp vec4 fragColor;", "");
        result = std::regex_replace(result, fragColorRe, "gl_FragColor");
        result = std::regex_replace(result, textureCallRe, "texture2D(");
        return result;
    }
}
