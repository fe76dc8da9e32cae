/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_PROGRAM_H_
#define _CARTO_GPU_PROGRAM_H_

#include "GLContext.h"
#include "DrawModes.h"
#include "Uniform.h"
#include "ShaderSource.h"
#include "Shaders.h"
#include "TerrainUniforms.h"
#include "ProjectionUniforms.h"
#include "ProgramConfiguration.h"
#include "VertexBuffer.h"
#include "IndexBuffer.h"
#include "Segment.h"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>

namespace carto { namespace gpu {
    struct ProgramOptions {
        std::shared_ptr<const ShaderSource> prelude;
        std::shared_ptr<const ShaderSource> projectionPrelude;
        std::string projectionDefine;
        bool showOverdrawInspector;
        bool hasTerrain;
        std::vector<std::string> extraDefines;

        ProgramOptions() : prelude(Shaders::getPrelude()), projectionPrelude(Shaders::getProjectionMercator()), projectionDefine(Shaders::MERCATOR_PROJECTION_DEFINE), showOverdrawInspector(false), hasTerrain(false), extraDefines() { }
    };

    /**
     * Builders of the four uniform binding groups of a program. An empty data-driven builder
     * means the uniforms of the configuration are used.
     */
    struct UniformBuilders {
        UniformBindingsBuilder fixed;
        UniformBindingsBuilder terrain;
        UniformBindingsBuilder projection;
        UniformBindingsBuilder dataDriven;

        UniformBuilders() : fixed(), terrain(buildTerrainUniforms), projection(buildProjectionUniforms), dataDriven() { }
        explicit UniformBuilders(UniformBindingsBuilder fixed) : fixed(std::move(fixed)), terrain(buildTerrainUniforms), projection(buildProjectionUniforms), dataDriven() { }
    };

    struct DrawParameters {
        DrawMode drawMode;
        DepthMode depthMode;
        StencilMode stencilMode;
        ColorMode colorMode;
        CullFaceMode cullFaceMode;
        std::optional<UniformValues> uniformValues;
        std::optional<TerrainData> terrainData;
        std::optional<ProjectionData> projectionData;
        std::shared_ptr<const ProgramConfiguration> configuration;
        FeatureState featureState;
        float zoom;

        DrawParameters() : drawMode(DrawMode::TRIANGLES), depthMode(DepthMode::disabled()), stencilMode(StencilMode::disabled()), colorMode(ColorMode::unblended()), cullFaceMode(CullFaceMode::disabled()), uniformValues(), terrainData(), projectionData(), configuration(), featureState(), zoom(0) { }
    };

    struct DrawBuffers {
        std::shared_ptr<VertexBuffer> layoutVertexBuffer;
        std::shared_ptr<IndexBuffer> indexBuffer;
        std::array<std::shared_ptr<VertexBuffer>, 3> dynamicLayoutBuffers;

        explicit DrawBuffers(std::shared_ptr<VertexBuffer> layoutVertexBuffer, std::shared_ptr<IndexBuffer> indexBuffer) : layoutVertexBuffer(std::move(layoutVertexBuffer)), indexBuffer(std::move(indexBuffer)), dynamicLayoutBuffers() { }
    };

    /**
     * Linked GPU program with its attribute table and uniform binding groups.
     * If the context is lost while the program is built, the program is marked as failed and
     * all draw calls are ignored. A new program must be created once the context is restored.
     */
    class Program final {
    public:
        class ProgramException : public std::runtime_error {
        public:
            explicit ProgramException(const std::string& msg) : runtime_error(msg) { }
        };

        explicit Program(GLContext& context, const std::string& name, const ShaderSource& source, std::shared_ptr<const ProgramConfiguration> configuration, const UniformBuilders& builders, const ProgramOptions& options);
        ~Program();

        Program(const Program&) = delete;
        Program& operator = (const Program&) = delete;

        std::uint64_t getId() const { return _id; }
        const std::string& getName() const { return _name; }
        GLuint getProgram() const { return _program; }
        bool isFailed() const { return _failed; }

        const std::map<std::string, int>& getAttributes() const { return _attributes; }
        std::size_t getAttributeCount() const { return _attributeCount; }

        const UniformBindings& getFixedUniforms() const { return _fixedUniforms; }
        const UniformBindings& getTerrainUniforms() const { return _terrainUniforms; }
        const UniformBindings& getProjectionUniforms() const { return _projectionUniforms; }
        const UniformBindings& getDataDrivenUniforms() const { return _dataDrivenUniforms; }

        void draw(const DrawParameters& parameters, const std::string& layerId, const DrawBuffers& buffers, SegmentVector& segments);

        // Number of indices per primitive
        static std::size_t getPrimitiveSize(DrawMode drawMode);

    private:
        static GLenum getGLDrawMode(DrawMode drawMode);

        void setUniformValues(UniformBindings& uniforms, const UniformValues& values);

        GLContext& _context;
        const std::uint64_t _id;
        const std::string _name;
        GLuint _program;
        bool _failed;

        std::map<std::string, int> _attributes;
        std::size_t _attributeCount;

        UniformBindings _fixedUniforms;
        UniformBindings _terrainUniforms;
        UniformBindings _projectionUniforms;
        UniformBindings _dataDrivenUniforms;
    };
} }

#endif
