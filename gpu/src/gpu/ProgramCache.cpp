#include "ProgramCache.h"
#include "LayerUniforms.h"

#include <stdexcept>

#include <boost/algorithm/string.hpp>

namespace carto::gpu {
    ProgramCache::ProgramCache(GLContext& context) :
        _context(context), _showOverdrawInspector(false), _terrainEnabled(false), _projectionVariant(ProjectionVariant::MERCATOR), _programInfoMap(), _programMap()
    {
        registerProgram("background", Shaders::getBackground(), buildBackgroundUniforms);
        registerProgram("fill", Shaders::getFill(), buildFillUniforms);
        registerProgram("line", Shaders::getLine(), buildLineUniforms);
    }

    void ProgramCache::registerProgram(const std::string& name, std::shared_ptr<const ShaderSource> source, UniformBindingsBuilder fixedUniformsBuilder) {
        if (!source) {
            throw std::invalid_argument("Null shader source for program " + name);
        }
        _programInfoMap[name] = ProgramInfo { std::move(source), std::move(fixedUniformsBuilder) };
    }

    Program& ProgramCache::useProgram(const std::string& name, const std::shared_ptr<const ProgramConfiguration>& configuration, bool forceSimpleProjection, const std::vector<std::string>& defines) {
        auto infoIt = _programInfoMap.find(name);
        if (infoIt == _programInfoMap.end()) {
            throw std::invalid_argument("Unknown program: " + name);
        }

        ProjectionVariant projectionVariant = (forceSimpleProjection ? ProjectionVariant::MERCATOR : _projectionVariant);
        std::string configurationKey = (configuration ? configuration->getCacheKey() : std::string());
        std::string programId = name + configurationKey + "/" + getProjectionVariantName(projectionVariant) + (_showOverdrawInspector ? "/overdraw" : "") + (_terrainEnabled ? "/terrain" : "") + "/" + boost::algorithm::join(defines, "/");

        auto it = _programMap.find(programId);
        if (it == _programMap.end()) {
            ProgramOptions options;
            options.showOverdrawInspector = _showOverdrawInspector;
            options.hasTerrain = _terrainEnabled;
            options.extraDefines = defines;
            if (projectionVariant == ProjectionVariant::GLOBE) {
                options.projectionPrelude = Shaders::getProjectionGlobe();
                options.projectionDefine = Shaders::GLOBE_PROJECTION_DEFINE;
            }

            auto program = std::make_unique<Program>(_context, name, *infoIt->second.source, configuration, UniformBuilders(infoIt->second.fixedUniformsBuilder), options);
            it = _programMap.emplace(programId, std::move(program)).first;
        }
        return *it->second;
    }

    void ProgramCache::reset() {
        _programMap.clear();
        _context.resetState();
    }

    std::string ProgramCache::getProjectionVariantName(ProjectionVariant projectionVariant) {
        switch (projectionVariant) {
        case ProjectionVariant::GLOBE:
            return "globe";
        default:
            return "mercator";
        }
    }
}
