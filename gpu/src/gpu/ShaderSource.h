/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_SHADERSOURCE_H_
#define _CARTO_GPU_SHADERSOURCE_H_

#include <string>
#include <vector>
#include <utility>

namespace carto { namespace gpu {
    /**
     * Preprocessed vertex and fragment shader text of a rendering feature, together with
     * the attribute and uniform declarations found in the unexpanded text (for example "in vec2 a_pos").
     */
    class ShaderSource final {
    public:
        explicit ShaderSource(std::string vertexSource, std::string fragmentSource, std::vector<std::string> staticAttributes, std::vector<std::string> staticUniforms) : _vertexSource(std::move(vertexSource)), _fragmentSource(std::move(fragmentSource)), _staticAttributes(std::move(staticAttributes)), _staticUniforms(std::move(staticUniforms)) { }

        const std::string& getVertexSource() const { return _vertexSource; }
        const std::string& getFragmentSource() const { return _fragmentSource; }
        const std::vector<std::string>& getStaticAttributes() const { return _staticAttributes; }
        const std::vector<std::string>& getStaticUniforms() const { return _staticUniforms; }

        // Extracts declarations and expands '#pragma mapbox: define|initialize <precision> <type> <name>' directives
        static ShaderSource compile(const std::string& fragmentSource, const std::string& vertexSource);

    private:
        const std::string _vertexSource;
        const std::string _fragmentSource;
        const std::vector<std::string> _staticAttributes;
        const std::vector<std::string> _staticUniforms;
    };

    // Returns the declared names (last token of each declaration), skipping empty declarations
    std::vector<std::string> tokenizeDeclarations(const std::vector<std::string>& declarations);
} }

#endif
