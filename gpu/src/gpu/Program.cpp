#include "Program.h"
#include "ShaderAssembler.h"

#include <atomic>
#include <set>

namespace {
    std::uint64_t nextProgramId() {
        static std::atomic<std::uint64_t> counter(0);
        return ++counter;
    }

    void compileShader(carto::gpu::GLDevice& device, GLuint shader, const std::string& source, const std::string& stageName) {
        device.shaderSource(shader, source);
        device.compileShader(shader);
        if (!device.getShaderCompileStatus(shader)) {
            throw carto::gpu::Program::ProgramException("Could not compile " + stageName + " shader: " + device.getShaderInfoLog(shader));
        }
    }
}

namespace carto::gpu {
    Program::Program(GLContext& context, const std::string& name, const ShaderSource& source, std::shared_ptr<const ProgramConfiguration> configuration, const UniformBuilders& builders, const ProgramOptions& options) :
        _context(context), _id(nextProgramId()), _name(name), _program(0), _failed(false), _attributes(), _attributeCount(0), _fixedUniforms(), _terrainUniforms(), _projectionUniforms(), _dataDrivenUniforms()
    {
        std::vector<std::string> attributeNames = tokenizeDeclarations(source.getStaticAttributes());
        if (configuration) {
            // Binder attributes are plain names; empty entries keep their slot and are left unbound
            std::vector<std::string> binderAttributeNames = configuration->getBinderAttributes();
            attributeNames.insert(attributeNames.end(), binderAttributeNames.begin(), binderAttributeNames.end());
        }
        _attributeCount = attributeNames.size();

        std::vector<std::string> uniformNames;
        std::set<std::string> uniformNameSet;
        auto addUniformNames = [&uniformNames, &uniformNameSet](const std::vector<std::string>& declarations) {
            for (const std::string& uniformName : tokenizeDeclarations(declarations)) {
                if (uniformNameSet.insert(uniformName).second) {
                    uniformNames.push_back(uniformName);
                }
            }
        };
        addUniformNames(options.prelude->getStaticUniforms());
        addUniformNames(options.projectionPrelude->getStaticUniforms());
        addUniformNames(source.getStaticUniforms());
        if (configuration) {
            addUniformNames(configuration->getBinderUniforms());
        }

        ShaderDefines defines;
        defines.glsl3Supported = _context.isGLSL3Supported();
        defines.showOverdrawInspector = options.showOverdrawInspector;
        defines.hasTerrain = options.hasTerrain;
        defines.projectionDefine = options.projectionDefine;
        if (configuration) {
            defines.configurationDefines = configuration->getDefines();
        }
        defines.extraDefines = options.extraDefines;
        AssembledShaders shaders = assembleShaders(*options.prelude, *options.projectionPrelude, source, defines);

        GLDevice& device = _context.getDevice();
        GLuint fragmentShader = 0;
        GLuint vertexShader = 0;
        try {
            _program = device.createProgram();

            fragmentShader = device.createShader(GL_FRAGMENT_SHADER);
            if (device.isContextLost()) {
                _failed = true;
                _context.getLogger()->write(Logger::Severity::WARNING, "Context lost while creating program " + _name);
                return;
            }
            compileShader(device, fragmentShader, shaders.fragmentSource, "fragment");

            vertexShader = device.createShader(GL_VERTEX_SHADER);
            if (device.isContextLost()) {
                _failed = true;
                _context.getLogger()->write(Logger::Severity::WARNING, "Context lost while creating program " + _name);
                return;
            }
            compileShader(device, vertexShader, shaders.vertexSource, "vertex");

            device.attachShader(_program, fragmentShader);
            device.attachShader(_program, vertexShader);

            for (std::size_t i = 0; i < attributeNames.size(); i++) {
                if (!attributeNames[i].empty()) {
                    device.bindAttribLocation(_program, static_cast<GLuint>(i), attributeNames[i]);
                    _attributes[attributeNames[i]] = static_cast<int>(i);
                }
            }

            device.linkProgram(_program);
            if (!device.getProgramLinkStatus(_program)) {
                throw ProgramException("Program failed to link: " + device.getProgramInfoLog(_program));
            }
        }
        catch (const std::exception&) {
            if (_program != 0) {
                device.deleteProgram(_program);
                _program = 0;
            }
            if (vertexShader != 0) {
                device.deleteShader(vertexShader);
            }
            if (fragmentShader != 0) {
                device.deleteShader(fragmentShader);
            }
            throw;
        }
        device.deleteShader(vertexShader);
        device.deleteShader(fragmentShader);

        UniformLocations locations;
        for (const std::string& uniformName : uniformNames) {
            if (std::optional<GLint> location = device.getUniformLocation(_program, uniformName)) {
                locations.emplace(uniformName, *location);
            }
        }

        if (builders.fixed) {
            _fixedUniforms = builders.fixed(_context, locations);
        }
        if (builders.terrain) {
            _terrainUniforms = builders.terrain(_context, locations);
        }
        if (builders.projection) {
            _projectionUniforms = builders.projection(_context, locations);
        }
        if (builders.dataDriven) {
            _dataDrivenUniforms = builders.dataDriven(_context, locations);
        } else if (configuration) {
            _dataDrivenUniforms = configuration->getUniforms(_context, locations);
        }

        _context.getLogger()->write(Logger::Severity::INFO, "Created program " + _name + " with " + std::to_string(_attributeCount) + " attributes and " + std::to_string(locations.size()) + " active uniforms");
    }

    Program::~Program() {
        if (_program != 0 && !_failed) {
            _context.forgetProgram(_program);
            _context.getDevice().deleteProgram(_program);
        }
    }

    void Program::draw(const DrawParameters& parameters, const std::string& layerId, const DrawBuffers& buffers, SegmentVector& segments) {
        if (_failed) {
            return;
        }

        _context.useProgram(_program);
        _context.setDepthMode(parameters.depthMode);
        _context.setStencilMode(parameters.stencilMode);
        _context.setColorMode(parameters.colorMode);
        _context.setCullFace(parameters.cullFaceMode);

        if (parameters.terrainData) {
            const TerrainData& terrainData = *parameters.terrainData;
            _context.setActiveTexture(GL_TEXTURE0 + TERRAIN_DEPTH_TEXTURE_UNIT);
            _context.bindTexture2D(terrainData.depthTexture);
            _context.setActiveTexture(GL_TEXTURE0 + TERRAIN_TEXTURE_UNIT);
            _context.bindTexture2D(terrainData.texture);
            setUniformValues(_terrainUniforms, terrainData.getUniformValues());
        }

        if (parameters.projectionData) {
            setUniformValues(_projectionUniforms, parameters.projectionData->getUniformValues());
        }

        if (parameters.uniformValues) {
            setUniformValues(_fixedUniforms, *parameters.uniformValues);
        }

        if (parameters.configuration) {
            parameters.configuration->setUniforms(_context, _dataDrivenUniforms, parameters.featureState, EvaluationParameters(parameters.zoom));
        }

        std::size_t primitiveSize = getPrimitiveSize(parameters.drawMode);

        if (segments.empty()) {
            return;
        }
        if (!buffers.layoutVertexBuffer || !buffers.indexBuffer) {
            _context.getLogger()->write(Logger::Severity::ERROR, "Missing vertex or index buffer for layer " + layerId);
            return;
        }

        std::vector<std::shared_ptr<VertexBuffer>> paintVertexBuffers;
        if (parameters.configuration) {
            paintVertexBuffers = parameters.configuration->getPaintVertexBuffers();
        }

        for (std::size_t i = 0; i < segments.size(); i++) {
            Segment& segment = segments[i];
            VertexArrayObject& vertexArray = segment.getVertexArray(_context, layerId);
            vertexArray.bind(*this, *buffers.layoutVertexBuffer, paintVertexBuffers, *buffers.indexBuffer, segment.vertexOffset, buffers.dynamicLayoutBuffers);

            _context.getDevice().drawElements(getGLDrawMode(parameters.drawMode), static_cast<GLsizei>(segment.primitiveLength * primitiveSize), GL_UNSIGNED_SHORT, segment.primitiveOffset * primitiveSize * 2);
        }
    }

    std::size_t Program::getPrimitiveSize(DrawMode drawMode) {
        switch (drawMode) {
        case DrawMode::LINES:
            return 2;
        case DrawMode::TRIANGLES:
            return 3;
        case DrawMode::LINE_STRIP:
            return 1;
        }
        return 1;
    }

    GLenum Program::getGLDrawMode(DrawMode drawMode) {
        switch (drawMode) {
        case DrawMode::LINES:
            return GL_LINES;
        case DrawMode::TRIANGLES:
            return GL_TRIANGLES;
        case DrawMode::LINE_STRIP:
            return GL_LINE_STRIP;
        }
        return GL_TRIANGLES;
    }

    void Program::setUniformValues(UniformBindings& uniforms, const UniformValues& values) {
        for (auto it = uniforms.begin(); it != uniforms.end(); it++) {
            auto valueIt = values.find(it->first);
            if (valueIt == values.end()) {
                continue;
            }
            if (!it->second.set(valueIt->second)) {
                _context.getLogger()->write(Logger::Severity::WARNING, "Value type does not match uniform " + it->first + " of program " + _name);
            }
        }
    }
}
