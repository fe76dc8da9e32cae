/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_PROGRAMCACHE_H_
#define _CARTO_GPU_PROGRAMCACHE_H_

#include "Program.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace carto { namespace gpu {
    enum class ProjectionVariant {
        MERCATOR, GLOBE
    };

    /**
     * Builds programs on demand and keeps them for reuse. Programs are keyed by name, configuration,
     * projection variant, debug and terrain flags and extra defines.
     * Background, fill and line programs are registered by default.
     */
    class ProgramCache final {
    public:
        explicit ProgramCache(GLContext& context);

        ProgramCache(const ProgramCache&) = delete;
        ProgramCache& operator = (const ProgramCache&) = delete;

        void registerProgram(const std::string& name, std::shared_ptr<const ShaderSource> source, UniformBindingsBuilder fixedUniformsBuilder);

        bool isShowOverdrawInspector() const { return _showOverdrawInspector; }
        void setShowOverdrawInspector(bool showOverdrawInspector) { _showOverdrawInspector = showOverdrawInspector; }

        bool isTerrainEnabled() const { return _terrainEnabled; }
        void setTerrainEnabled(bool terrainEnabled) { _terrainEnabled = terrainEnabled; }

        ProjectionVariant getProjectionVariant() const { return _projectionVariant; }
        void setProjectionVariant(ProjectionVariant projectionVariant) { _projectionVariant = projectionVariant; }

        std::size_t getProgramCount() const { return _programMap.size(); }

        Program& useProgram(const std::string& name, const std::shared_ptr<const ProgramConfiguration>& configuration = std::shared_ptr<const ProgramConfiguration>(), bool forceSimpleProjection = false, const std::vector<std::string>& defines = std::vector<std::string>());

        // Drops all programs and the cached context state, for example after the context has been lost
        void reset();

    private:
        struct ProgramInfo {
            std::shared_ptr<const ShaderSource> source;
            UniformBindingsBuilder fixedUniformsBuilder;
        };

        static std::string getProjectionVariantName(ProjectionVariant projectionVariant);

        GLContext& _context;
        bool _showOverdrawInspector;
        bool _terrainEnabled;
        ProjectionVariant _projectionVariant;

        std::map<std::string, ProgramInfo> _programInfoMap;
        std::map<std::string, std::unique_ptr<Program>> _programMap;
    };
} }

#endif
