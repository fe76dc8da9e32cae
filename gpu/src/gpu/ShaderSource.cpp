#include "ShaderSource.h"

#include <regex>
#include <set>

#include <boost/algorithm/string.hpp>

namespace {
    const std::regex pragmaRe(R"(#pragma mapbox: (\w+) (\w+) (\w+) (\w+))");
    const std::regex attributeRe(R"(^\s*(in\s+(?:(?:highp|mediump|lowp)\s+)?\w+\s+\w+))");
    const std::regex uniformRe(R"(^\s*(uniform\s+(?:(?:highp|mediump|lowp)\s+)?\w+\s+\w+))");

    std::vector<std::string> findDeclarations(const std::string& source, const std::regex& re) {
        std::vector<std::string> lines;
        boost::split(lines, source, boost::is_any_of("\n"));

        std::vector<std::string> declarations;
        for (const std::string& line : lines) {
            std::smatch match;
            if (std::regex_search(line, match, re)) {
                declarations.push_back(boost::trim_copy(match[1].str()));
            }
        }
        return declarations;
    }

    template <typename Func>
    std::string replacePragmas(const std::string& source, Func func) {
        std::string result;
        std::string::const_iterator last = source.cbegin();
        for (std::sregex_iterator it(source.cbegin(), source.cend(), pragmaRe); it != std::sregex_iterator(); it++) {
            const std::smatch& match = *it;
            result.append(last, match[0].first);
            result.append(func(match[1].str(), match[2].str(), match[3].str(), match[4].str()));
            last = match[0].second;
        }
        result.append(last, source.cend());
        return result;
    }

    std::string expandFragmentPragma(const std::string& operation, const std::string& precision, const std::string& type, const std::string& name) {
        if (operation == "define") {
            return "\n#ifndef HAS_UNIFORM_u_" + name + "\n"
                "in " + precision + " " + type + " " + name + ";\n"
                "#else\n"
                "uniform " + precision + " " + type + " u_" + name + ";\n"
                "#endif\n";
        }
        return "\n#ifdef HAS_UNIFORM_u_" + name + "\n"
            "    " + precision + " " + type + " " + name + " = u_" + name + ";\n"
            "#endif\n";
    }

    std::string expandVertexPragma(const std::string& operation, const std::string& precision, const std::string& type, const std::string& name, bool usedByFragment) {
        std::string attribType = (type == "float" ? "vec2" : "vec4");
        std::string unpackType = (name.find("color") != std::string::npos ? "color" : attribType);

        if (operation == "define") {
            return "\n#ifndef HAS_UNIFORM_u_" + name + "\n"
                "uniform lowp float u_" + name + "_t;\n"
                "in " + precision + " " + attribType + " a_" + name + ";\n" +
                (usedByFragment ? "out " + precision + " " + type + " " + name + ";\n" : std::string()) +
                "#else\n"
                "uniform " + precision + " " + type + " u_" + name + ";\n"
                "#endif\n";
        }

        // Varyings are already declared, locals are not
        std::string declaration = (usedByFragment ? std::string() : precision + " " + type + " ");
        std::string value = (unpackType == "vec4" ? "a_" + name : "unpack_mix_" + unpackType + "(a_" + name + ", u_" + name + "_t)");
        return "\n#ifndef HAS_UNIFORM_u_" + name + "\n"
            "    " + declaration + name + " = " + value + ";\n"
            "#else\n"
            "    " + precision + " " + type + " " + name + " = u_" + name + ";\n"
            "#endif\n";
    }
}

namespace carto::gpu {
    ShaderSource ShaderSource::compile(const std::string& fragmentSource, const std::string& vertexSource) {
        std::vector<std::string> staticAttributes = findDeclarations(vertexSource, attributeRe);
        std::vector<std::string> staticUniforms = findDeclarations(vertexSource, uniformRe);
        std::vector<std::string> fragmentUniforms = findDeclarations(fragmentSource, uniformRe);
        staticUniforms.insert(staticUniforms.end(), fragmentUniforms.begin(), fragmentUniforms.end());

        std::set<std::string> fragmentPragmas;
        std::string expandedFragmentSource = replacePragmas(fragmentSource, [&fragmentPragmas](const std::string& operation, const std::string& precision, const std::string& type, const std::string& name) {
            fragmentPragmas.insert(name);
            return expandFragmentPragma(operation, precision, type, name);
        });

        std::string expandedVertexSource = replacePragmas(vertexSource, [&fragmentPragmas](const std::string& operation, const std::string& precision, const std::string& type, const std::string& name) {
            return expandVertexPragma(operation, precision, type, name, fragmentPragmas.count(name) > 0);
        });

        return ShaderSource(std::move(expandedVertexSource), std::move(expandedFragmentSource), std::move(staticAttributes), std::move(staticUniforms));
    }

    std::vector<std::string> tokenizeDeclarations(const std::vector<std::string>& declarations) {
        std::vector<std::string> names;
        for (const std::string& declaration : declarations) {
            std::string trimmed = boost::trim_copy(declaration);
            if (trimmed.empty()) {
                continue;
            }
            std::vector<std::string> tokens;
            boost::split(tokens, trimmed, boost::is_any_of(" \t"), boost::token_compress_on);
            names.push_back(tokens.back());
        }
        return names;
    }
}
