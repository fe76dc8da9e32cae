#include "Shaders.h"
#include "ShaderSources.h"

namespace {
    std::shared_ptr<const carto::gpu::ShaderSource> compileShaderSource(const std::string& fsh, const std::string& vsh) {
        return std::make_shared<const carto::gpu::ShaderSource>(carto::gpu::ShaderSource::compile(fsh, vsh));
    }
}

namespace carto::gpu {
    const std::string Shaders::MERCATOR_PROJECTION_DEFINE = "#define PROJECTION_MERCATOR";
    const std::string Shaders::GLOBE_PROJECTION_DEFINE = "#define GLOBE";

    const std::shared_ptr<const ShaderSource>& Shaders::getPrelude() {
        static const std::shared_ptr<const ShaderSource> source = compileShaderSource(preludeFsh, preludeVsh);
        return source;
    }

    const std::shared_ptr<const ShaderSource>& Shaders::getProjectionMercator() {
        static const std::shared_ptr<const ShaderSource> source = compileShaderSource(projectionMercatorFsh, projectionMercatorVsh);
        return source;
    }

    const std::shared_ptr<const ShaderSource>& Shaders::getProjectionGlobe() {
        static const std::shared_ptr<const ShaderSource> source = compileShaderSource(projectionGlobeFsh, projectionGlobeVsh);
        return source;
    }

    const std::shared_ptr<const ShaderSource>& Shaders::getBackground() {
        static const std::shared_ptr<const ShaderSource> source = compileShaderSource(backgroundFsh, backgroundVsh);
        return source;
    }

    const std::shared_ptr<const ShaderSource>& Shaders::getFill() {
        static const std::shared_ptr<const ShaderSource> source = compileShaderSource(fillFsh, fillVsh);
        return source;
    }

    const std::shared_ptr<const ShaderSource>& Shaders::getLine() {
        static const std::shared_ptr<const ShaderSource> source = compileShaderSource(lineFsh, lineVsh);
        return source;
    }
}
