#define BOOST_TEST_MODULE GPU

#include "GLDevice.h"
#include "GLContext.h"
#include "Logger.h"
#include "Uniform.h"
#include "VertexBuffer.h"
#include "IndexBuffer.h"
#include "ShaderSource.h"
#include "ShaderAssembler.h"
#include "Shaders.h"
#include "Program.h"
#include "ProgramCache.h"
#include "ProgramConfiguration.h"
#include "LayerUniforms.h"
#include "Segment.h"

#include <algorithm>
#include <iterator>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/test/included/unit_test.hpp>

using namespace carto::gpu;

struct DeviceCall {
    std::string name;
    std::vector<double> args;
};

class RecordingDevice : public GLDevice {
public:
    bool glsl3Supported = true;
    bool vertexArraySupported = true;
    bool contextLost = false;
    GLenum loseContextOnShaderType = 0;
    GLenum failingShaderType = 0;
    bool linkFails = false;
    std::set<std::string> inactiveUniforms;

    std::vector<DeviceCall> calls;
    std::map<GLenum, std::string> shaderSources;
    mutable std::vector<std::string> uniformQueries;
    mutable std::map<std::string, GLint> uniformLocations;

    std::size_t count(const std::string& name) const {
        return std::count_if(calls.begin(), calls.end(), [&name](const DeviceCall& call) { return call.name == name; });
    }

    std::vector<DeviceCall> find(const std::string& name) const {
        std::vector<DeviceCall> result;
        std::copy_if(calls.begin(), calls.end(), std::back_inserter(result), [&name](const DeviceCall& call) { return call.name == name; });
        return result;
    }

    bool contains(const std::string& name, const std::vector<double>& args) const {
        return std::any_of(calls.begin(), calls.end(), [&](const DeviceCall& call) { return call.name == name && call.args == args; });
    }

    GLint location(const std::string& name) const { return uniformLocations.at(name); }

    virtual bool isGLSL3Supported() const override { return glsl3Supported; }
    virtual bool isVertexArraySupported() const override { return vertexArraySupported; }
    virtual bool isContextLost() const override { return contextLost; }

    virtual GLuint createShader(GLenum type) override {
        GLuint shader = _nextObject++;
        _shaderTypes[shader] = type;
        if (type == loseContextOnShaderType) {
            contextLost = true;
        }
        record("createShader", { static_cast<double>(type) });
        return shader;
    }
    virtual void shaderSource(GLuint shader, const std::string& source) override {
        shaderSources[_shaderTypes.at(shader)] = source;
        record("shaderSource", { static_cast<double>(shader) });
    }
    virtual void compileShader(GLuint shader) override { record("compileShader", { static_cast<double>(shader) }); }
    virtual bool getShaderCompileStatus(GLuint shader) const override { return _shaderTypes.at(shader) != failingShaderType; }
    virtual std::string getShaderInfoLog(GLuint shader) const override { return "ERROR: 0:1: syntax error"; }
    virtual void deleteShader(GLuint shader) override { record("deleteShader", { static_cast<double>(shader) }); }

    virtual GLuint createProgram() override {
        GLuint program = _nextObject++;
        record("createProgram", { static_cast<double>(program) });
        return program;
    }
    virtual void attachShader(GLuint program, GLuint shader) override { record("attachShader", { static_cast<double>(program), static_cast<double>(shader) }); }
    virtual void bindAttribLocation(GLuint program, GLuint index, const std::string& name) override {
        attribBindings.emplace_back(index, name);
        record("bindAttribLocation", { static_cast<double>(program), static_cast<double>(index) });
    }
    virtual void linkProgram(GLuint program) override { record("linkProgram", { static_cast<double>(program) }); }
    virtual bool getProgramLinkStatus(GLuint program) const override { return !linkFails; }
    virtual std::string getProgramInfoLog(GLuint program) const override { return "vertex and fragment varyings do not match"; }
    virtual void deleteProgram(GLuint program) override { record("deleteProgram", { static_cast<double>(program) }); }
    virtual void useProgram(GLuint program) override { record("useProgram", { static_cast<double>(program) }); }

    virtual std::optional<GLint> getUniformLocation(GLuint program, const std::string& name) const override {
        uniformQueries.push_back(name);
        if (inactiveUniforms.count(name) > 0) {
            return std::optional<GLint>();
        }
        auto it = uniformLocations.find(name);
        if (it == uniformLocations.end()) {
            it = uniformLocations.emplace(name, static_cast<GLint>(uniformLocations.size())).first;
        }
        return it->second;
    }

    virtual void uniform1i(GLint location, GLint value) override { record("uniform1i", { static_cast<double>(location), static_cast<double>(value) }); }
    virtual void uniform1f(GLint location, GLfloat value) override { record("uniform1f", { static_cast<double>(location), value }); }
    virtual void uniform2f(GLint location, GLfloat x, GLfloat y) override { record("uniform2f", { static_cast<double>(location), x, y }); }
    virtual void uniform3f(GLint location, GLfloat x, GLfloat y, GLfloat z) override { record("uniform3f", { static_cast<double>(location), x, y, z }); }
    virtual void uniform4f(GLint location, GLfloat x, GLfloat y, GLfloat z, GLfloat w) override { record("uniform4f", { static_cast<double>(location), x, y, z, w }); }
    virtual void uniformMatrix4fv(GLint location, const GLfloat* values) override { record("uniformMatrix4fv", { static_cast<double>(location), values[0], values[15] }); }

    virtual void activeTexture(GLenum unit) override { record("activeTexture", { static_cast<double>(unit) }); }
    virtual void bindTexture(GLenum target, GLuint texture) override { record("bindTexture", { static_cast<double>(target), static_cast<double>(texture) }); }

    virtual GLuint createBuffer() override {
        GLuint buffer = _nextObject++;
        record("createBuffer", { static_cast<double>(buffer) });
        return buffer;
    }
    virtual void deleteBuffer(GLuint buffer) override { record("deleteBuffer", { static_cast<double>(buffer) }); }
    virtual void bindBuffer(GLenum target, GLuint buffer) override { record("bindBuffer", { static_cast<double>(target), static_cast<double>(buffer) }); }
    virtual void bufferData(GLenum target, GLsizeiptr size, const void* data, GLenum usage) override { record("bufferData", { static_cast<double>(target), static_cast<double>(size), static_cast<double>(usage) }); }
    virtual void bufferSubData(GLenum target, GLintptr offset, GLsizeiptr size, const void* data) override { record("bufferSubData", { static_cast<double>(target), static_cast<double>(offset), static_cast<double>(size) }); }

    virtual GLuint createVertexArray() override {
        GLuint vertexArray = _nextObject++;
        record("createVertexArray", { static_cast<double>(vertexArray) });
        return vertexArray;
    }
    virtual void deleteVertexArray(GLuint vertexArray) override { record("deleteVertexArray", { static_cast<double>(vertexArray) }); }
    virtual void bindVertexArray(GLuint vertexArray) override { record("bindVertexArray", { static_cast<double>(vertexArray) }); }
    virtual void enableVertexAttribArray(GLuint index) override { record("enableVertexAttribArray", { static_cast<double>(index) }); }
    virtual void disableVertexAttribArray(GLuint index) override { record("disableVertexAttribArray", { static_cast<double>(index) }); }
    virtual void vertexAttribPointer(GLuint index, GLint components, GLenum type, bool normalized, GLsizei stride, std::size_t offset) override {
        record("vertexAttribPointer", { static_cast<double>(index), static_cast<double>(components), static_cast<double>(type), normalized ? 1.0 : 0.0, static_cast<double>(stride), static_cast<double>(offset) });
    }

    virtual void enable(GLenum cap) override { record("enable", { static_cast<double>(cap) }); }
    virtual void disable(GLenum cap) override { record("disable", { static_cast<double>(cap) }); }
    virtual void depthFunc(GLenum func) override { record("depthFunc", { static_cast<double>(func) }); }
    virtual void depthMask(bool mask) override { record("depthMask", { mask ? 1.0 : 0.0 }); }
    virtual void depthRange(GLfloat nearValue, GLfloat farValue) override { record("depthRange", { nearValue, farValue }); }
    virtual void stencilMask(GLuint mask) override { record("stencilMask", { static_cast<double>(mask) }); }
    virtual void stencilFunc(GLenum func, GLint ref, GLuint mask) override { record("stencilFunc", { static_cast<double>(func), static_cast<double>(ref), static_cast<double>(mask) }); }
    virtual void stencilOp(GLenum fail, GLenum depthFail, GLenum pass) override { record("stencilOp", { static_cast<double>(fail), static_cast<double>(depthFail), static_cast<double>(pass) }); }
    virtual void blendFunc(GLenum src, GLenum dst) override { record("blendFunc", { static_cast<double>(src), static_cast<double>(dst) }); }
    virtual void blendColor(GLfloat r, GLfloat g, GLfloat b, GLfloat a) override { record("blendColor", { r, g, b, a }); }
    virtual void colorMask(bool r, bool g, bool b, bool a) override { record("colorMask", { r ? 1.0 : 0.0, g ? 1.0 : 0.0, b ? 1.0 : 0.0, a ? 1.0 : 0.0 }); }
    virtual void cullFace(GLenum mode) override { record("cullFace", { static_cast<double>(mode) }); }
    virtual void frontFace(GLenum mode) override { record("frontFace", { static_cast<double>(mode) }); }

    virtual void drawElements(GLenum mode, GLsizei count, GLenum type, std::size_t offset) override {
        record("drawElements", { static_cast<double>(mode), static_cast<double>(count), static_cast<double>(type), static_cast<double>(offset) });
    }

    std::vector<std::pair<GLuint, std::string>> attribBindings;

private:
    void record(const std::string& name, std::vector<double> args) {
        calls.push_back(DeviceCall { name, std::move(args) });
    }

    GLuint _nextObject = 1;
    std::map<GLuint, GLenum> _shaderTypes;
};

class RecordingLogger : public Logger {
public:
    std::vector<std::pair<Severity, std::string>> messages;

    virtual void write(Severity severity, const std::string& msg) override {
        messages.emplace_back(severity, msg);
    }

    std::size_t count(Severity severity) const {
        return std::count_if(messages.begin(), messages.end(), [severity](const std::pair<Severity, std::string>& message) { return message.first == severity; });
    }
};

struct TestEnvironment {
    std::shared_ptr<RecordingDevice> device;
    std::shared_ptr<RecordingLogger> logger;
    std::unique_ptr<GLContext> context;

    TestEnvironment() : device(std::make_shared<RecordingDevice>()), logger(std::make_shared<RecordingLogger>()), context() {
        context = std::make_unique<GLContext>(device, logger);
    }
};

class FixedConfiguration : public ProgramConfiguration {
public:
    explicit FixedConfiguration(std::vector<std::string> attributes, std::vector<std::string> uniforms) : _attributes(std::move(attributes)), _uniforms(std::move(uniforms)) { }

    virtual std::vector<std::string> getBinderAttributes() const override { return _attributes; }
    virtual std::vector<std::string> getBinderUniforms() const override { return _uniforms; }
    virtual std::vector<std::string> getDefines() const override { return std::vector<std::string>(); }
    virtual std::string getCacheKey() const override { return "/fixed"; }

    virtual UniformBindings getUniforms(GLContext& context, const UniformLocations& locations) const override { return UniformBindings(); }
    virtual void setUniforms(GLContext& context, UniformBindings& uniforms, const FeatureState& featureState, const EvaluationParameters& parameters) const override { }

    virtual std::vector<std::shared_ptr<VertexBuffer>> getPaintVertexBuffers() const override { return std::vector<std::shared_ptr<VertexBuffer>>(); }

private:
    std::vector<std::string> _attributes;
    std::vector<std::string> _uniforms;
};

static std::shared_ptr<VertexBuffer> createPositionBuffer(GLContext& context, std::size_t vertexCount) {
    std::vector<VertexAttribute> attributes { VertexAttribute("a_pos", AttributeType::INT16, 2, 0) };
    return std::make_shared<VertexBuffer>(context, attributes, 4, std::vector<std::uint8_t>(vertexCount * 4));
}

static std::shared_ptr<VertexBuffer> createPropertyBuffer(GLContext& context, const std::string& attributeName, std::size_t vertexCount) {
    std::vector<VertexAttribute> attributes { VertexAttribute(attributeName, AttributeType::FLOAT32, 2, 0) };
    return std::make_shared<VertexBuffer>(context, attributes, 8, std::vector<std::uint8_t>(vertexCount * 8));
}

static std::shared_ptr<IndexBuffer> createIndexBuffer(GLContext& context, std::size_t indexCount) {
    return std::make_shared<IndexBuffer>(context, std::vector<std::uint16_t>(indexCount, 0));
}

static std::unique_ptr<Program> createBackgroundProgram(GLContext& context) {
    return std::make_unique<Program>(context, "background", *Shaders::getBackground(), std::shared_ptr<const ProgramConfiguration>(), UniformBuilders(buildBackgroundUniforms), ProgramOptions());
}

// Test declaration name extraction
BOOST_AUTO_TEST_CASE(tokenizeDeclarationNames) {
    std::vector<std::string> names = tokenizeDeclarations({ "in vec2 a_pos", "", "   ", "uniform highp vec4  u_color" });
    BOOST_CHECK(names == std::vector<std::string>({ "a_pos", "u_color" }));
}

// Test declaration extraction and pragma expansion of the built-in shaders
BOOST_AUTO_TEST_CASE(shaderSourceCompile) {
    const ShaderSource& fill = *Shaders::getFill();
    BOOST_CHECK(fill.getStaticAttributes() == std::vector<std::string>({ "in vec2 a_pos" }));
    BOOST_CHECK(fill.getStaticUniforms() == std::vector<std::string>({ "uniform vec2 u_fill_translate" }));

    BOOST_CHECK(fill.getVertexSource().find("#pragma") == std::string::npos);
    BOOST_CHECK(fill.getVertexSource().find("#ifndef HAS_UNIFORM_u_color") != std::string::npos);
    BOOST_CHECK(fill.getVertexSource().find("in highp vec4 a_color;") != std::string::npos);
    BOOST_CHECK(fill.getVertexSource().find("out highp vec4 color;") != std::string::npos);
    BOOST_CHECK(fill.getVertexSource().find("color = unpack_mix_color(a_color, u_color_t);") != std::string::npos);
    BOOST_CHECK(fill.getVertexSource().find("opacity = unpack_mix_vec2(a_opacity, u_opacity_t);") != std::string::npos);
    BOOST_CHECK(fill.getFragmentSource().find("in highp vec4 color;") != std::string::npos);
    BOOST_CHECK(fill.getFragmentSource().find("uniform highp vec4 u_color;") != std::string::npos);
    BOOST_CHECK(fill.getFragmentSource().find("highp vec4 color = u_color;") != std::string::npos);

    const ShaderSource& line = *Shaders::getLine();
    BOOST_CHECK(line.getStaticAttributes() == std::vector<std::string>({ "in vec2 a_pos", "in vec2 a_extrude" }));
    BOOST_CHECK(line.getVertexSource().find("in mediump vec2 a_width;") != std::string::npos);
    BOOST_CHECK(line.getVertexSource().find("mediump float width = unpack_mix_vec2(a_width, u_width_t);") != std::string::npos);
    BOOST_CHECK(line.getVertexSource().find("out mediump float width;") == std::string::npos);

    const ShaderSource& prelude = *Shaders::getPrelude();
    std::vector<std::string> preludeUniforms = tokenizeDeclarations(prelude.getStaticUniforms());
    BOOST_CHECK(std::find(preludeUniforms.begin(), preludeUniforms.end(), "u_terrain") != preludeUniforms.end());
    BOOST_CHECK(std::find(preludeUniforms.begin(), preludeUniforms.end(), "u_depth") != preludeUniforms.end());

    std::vector<std::string> globeUniforms = tokenizeDeclarations(Shaders::getProjectionGlobe()->getStaticUniforms());
    BOOST_CHECK(globeUniforms.size() == 5);
}

// Test define ordering
BOOST_AUTO_TEST_CASE(defineList) {
    ShaderDefines defines;
    BOOST_CHECK(buildDefineList(defines).empty());

    defines.glsl3Supported = true;
    defines.showOverdrawInspector = true;
    defines.hasTerrain = true;
    defines.projectionDefine = "#define GLOBE";
    defines.configurationDefines = { "#define HAS_UNIFORM_u_color" };
    defines.extraDefines = { "#define A", "#define B" };
    std::vector<std::string> expected = { "#version 300 es", "#define HAS_UNIFORM_u_color", "#define OVERDRAW_INSPECTOR;", "#define TERRAIN3D;", "#define GLOBE", "#define A", "#define B" };
    BOOST_CHECK(buildDefineList(defines) == expected);

    defines.glsl3Supported = false;
    defines.showOverdrawInspector = false;
    defines.projectionDefine = "";
    expected = { "#define HAS_UNIFORM_u_color", "#define TERRAIN3D;", "#define A", "#define B" };
    BOOST_CHECK(buildDefineList(defines) == expected);
}

// Test stage text assembly
BOOST_AUTO_TEST_CASE(shaderAssembly) {
    ShaderSource prelude("VP", "FP", {}, {});
    ShaderSource projectionPrelude("VJ", "FJ", {}, {});
    ShaderSource layer("VL", "FL", {}, {});

    ShaderDefines defines;
    defines.glsl3Supported = true;
    defines.extraDefines = { "#define A" };
    AssembledShaders shaders = assembleShaders(prelude, projectionPrelude, layer, defines);
    BOOST_CHECK_EQUAL(shaders.vertexSource, "#version 300 es\n#define A\nVP\nVJ\nVL");
    BOOST_CHECK_EQUAL(shaders.fragmentSource, "#version 300 es\n#define A\nFP\nFJ\nFL");

    defines.glsl3Supported = false;
    defines.extraDefines.clear();
    shaders = assembleShaders(prelude, projectionPrelude, layer, defines);
    BOOST_CHECK_EQUAL(shaders.vertexSource, "VP\nVJ\nVL");
}

// Test conversion to GLSL ES 1.00
BOOST_AUTO_TEST_CASE(legacyTranspilation) {
    std::string vsh = "in vec2 a_pos;\nout float v_margin;\nint index = 0;\nvec4 c = texture(s, p);";
    BOOST_CHECK_EQUAL(transpileVertexShaderToGLSL1(vsh), "attribute vec2 a_pos;\nvarying float v_margin;\nint index = 0;\nvec4 c = texture2D(s, p);");

    std::string fsh = "out highp vec4 fragColor;\nin float v_margin;\nvoid main() { fragColor = texture(s, p); }";
    BOOST_CHECK_EQUAL(transpileFragmentShaderToGLSL1(fsh), "\nvarying float v_margin;\nvoid main() { gl_FragColor = texture2D(s, p); }");

    ShaderDefines defines;
    defines.glsl3Supported = false;
    AssembledShaders shaders = assembleShaders(*Shaders::getPrelude(), *Shaders::getProjectionMercator(), *Shaders::getFill(), defines);
    BOOST_CHECK(shaders.vertexSource.find("#version") == std::string::npos);
    BOOST_CHECK(shaders.vertexSource.find("attribute vec2 a_pos;") != std::string::npos);
    BOOST_CHECK(shaders.fragmentSource.find("fragColor") == std::string::npos);
    BOOST_CHECK(shaders.fragmentSource.find("gl_FragColor = color * opacity;") != std::string::npos);
    BOOST_CHECK(shaders.fragmentSource.find("varying highp vec4 color;") != std::string::npos);
}

// Test redundant state elimination
BOOST_AUTO_TEST_CASE(contextStateCache) {
    TestEnvironment env;
    env.context->useProgram(3);
    env.context->useProgram(3);
    BOOST_CHECK(env.device->count("useProgram") == 1);

    env.context->setDepthMode(DepthMode::disabled());
    env.context->setDepthMode(DepthMode::disabled());
    BOOST_CHECK(env.device->count("disable") == 1);

    env.context->setDepthMode(DepthMode(GL_LEQUAL, true, { { 0.0f, 1.0f } }));
    BOOST_CHECK(env.device->contains("enable", { static_cast<double>(GL_DEPTH_TEST) }));
    BOOST_CHECK(env.device->contains("depthFunc", { static_cast<double>(GL_LEQUAL) }));

    env.context->setColorMode(ColorMode::alphaBlended());
    env.context->setColorMode(ColorMode::alphaBlended());
    BOOST_CHECK(env.device->count("blendFunc") == 1);

    env.context->resetState();
    env.context->useProgram(3);
    BOOST_CHECK(env.device->count("useProgram") == 2);
}

// Test uniform value caching and type checks
BOOST_AUTO_TEST_CASE(uniformSetter) {
    TestEnvironment env;
    Uniform uniform(*env.context, UniformType::FLOAT, 0);
    BOOST_CHECK(uniform.set(1.0f));
    BOOST_CHECK(uniform.set(1.0f));
    BOOST_CHECK(env.device->count("uniform1f") == 1);
    BOOST_CHECK(uniform.set(2.0f));
    BOOST_CHECK(env.device->count("uniform1f") == 2);
    BOOST_CHECK(env.device->contains("uniform1f", { 0.0, 2.0 }));
    BOOST_CHECK(!uniform.set(cglib::vec2<float>(1, 2)));
    BOOST_CHECK(env.device->count("uniform2f") == 0);

    Uniform inactive(*env.context, UniformType::VEC4, std::optional<GLint>());
    BOOST_CHECK(inactive.set(cglib::vec4<float>(1, 1, 1, 1)));
    BOOST_CHECK(env.device->count("uniform4f") == 0);
}

// Test vertex buffer validation
BOOST_AUTO_TEST_CASE(vertexBufferSize) {
    TestEnvironment env;
    std::vector<VertexAttribute> attributes { VertexAttribute("a_pos", AttributeType::INT16, 2, 0) };
    BOOST_CHECK_THROW(VertexBuffer(*env.context, attributes, 4, std::vector<std::uint8_t>(6)), std::invalid_argument);

    VertexBuffer buffer(*env.context, attributes, 4, std::vector<std::uint8_t>(12));
    BOOST_CHECK(buffer.getLength() == 3);
    BOOST_CHECK_THROW(buffer.updateData(std::vector<std::uint8_t>(12)), std::logic_error);
    BOOST_CHECK(buffer.getId() != createPositionBuffer(*env.context, 1)->getId());
}

// Test attribute location assignment
BOOST_AUTO_TEST_CASE(attributeIndices) {
    TestEnvironment env;
    auto configuration = std::make_shared<FixedConfiguration>(std::vector<std::string>({ "a_color", "", "a_opacity" }), std::vector<std::string>());

    for (int i = 0; i < 2; i++) {
        env.device->attribBindings.clear();
        Program program(*env.context, "fill", *Shaders::getFill(), configuration, UniformBuilders(buildFillUniforms), ProgramOptions());
        // The empty slot at index 2 is counted but not bound
        BOOST_CHECK(program.getAttributeCount() == 4);
        BOOST_CHECK(program.getAttributes() == (std::map<std::string, int> { { "a_pos", 0 }, { "a_color", 1 }, { "a_opacity", 3 } }));
        BOOST_CHECK(env.device->attribBindings == (std::vector<std::pair<GLuint, std::string>> { { 0, "a_pos" }, { 1, "a_color" }, { 3, "a_opacity" } }));
    }
}

// Test that every uniform name is resolved once, in first occurrence order
BOOST_AUTO_TEST_CASE(uniformDeduplication) {
    TestEnvironment env;
    ProgramOptions options;
    options.prelude = std::make_shared<const ShaderSource>("", "", std::vector<std::string>(), std::vector<std::string>({ "uniform mat4 u_shared", "uniform float u_prelude" }));
    options.projectionPrelude = std::make_shared<const ShaderSource>("", "", std::vector<std::string>(), std::vector<std::string>({ "uniform mat4 u_shared" }));
    ShaderSource layer("", "", { "in vec2 a_pos" }, { "uniform float u_layer", "uniform mat4 u_shared" });
    auto configuration = std::make_shared<FixedConfiguration>(std::vector<std::string>(), std::vector<std::string>({ "u_shared", "u_config", "u_layer" }));

    Program program(*env.context, "test", layer, configuration, UniformBuilders(), options);
    BOOST_CHECK(env.device->uniformQueries == std::vector<std::string>({ "u_shared", "u_prelude", "u_layer", "u_config" }));
}

// Test that eliminated uniforms are omitted and pushes to them are ignored
BOOST_AUTO_TEST_CASE(inactiveUniforms) {
    TestEnvironment env;
    env.device->inactiveUniforms = { "u_opacity" };
    std::unique_ptr<Program> program = createBackgroundProgram(*env.context);
    BOOST_CHECK(!program->getFixedUniforms().at("u_opacity").getLocation());
    BOOST_CHECK(program->getFixedUniforms().at("u_color").getLocation());

    SegmentVector segments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 2);
    DrawParameters parameters;
    parameters.uniformValues = backgroundUniformValues(cglib::vec4<float>(1, 0, 0, 1), 0.5f);
    program->draw(parameters, "background", DrawBuffers(createPositionBuffer(*env.context, 4), createIndexBuffer(*env.context, 6)), segments);
    BOOST_CHECK(env.device->count("uniform4f") == 1);
    BOOST_CHECK(env.device->count("uniform1f") == 0);
    BOOST_CHECK(env.logger->count(Logger::Severity::WARNING) == 0);
}

// Test compile and link failures
BOOST_AUTO_TEST_CASE(programFailures) {
    {
        TestEnvironment env;
        env.device->failingShaderType = GL_FRAGMENT_SHADER;
        try {
            createBackgroundProgram(*env.context);
            BOOST_ERROR("Expected exception");
        }
        catch (const Program::ProgramException& ex) {
            BOOST_CHECK_EQUAL(std::string(ex.what()), "Could not compile fragment shader: ERROR: 0:1: syntax error");
        }
        BOOST_CHECK(env.device->count("createShader") == 1);
        BOOST_CHECK(env.device->count("deleteProgram") == 1);
        BOOST_CHECK(env.device->count("deleteShader") == 1);
    }
    {
        TestEnvironment env;
        env.device->failingShaderType = GL_VERTEX_SHADER;
        try {
            createBackgroundProgram(*env.context);
            BOOST_ERROR("Expected exception");
        }
        catch (const Program::ProgramException& ex) {
            BOOST_CHECK_EQUAL(std::string(ex.what()), "Could not compile vertex shader: ERROR: 0:1: syntax error");
        }
        BOOST_CHECK(env.device->count("deleteShader") == 2);
    }
    {
        TestEnvironment env;
        env.device->linkFails = true;
        try {
            createBackgroundProgram(*env.context);
            BOOST_ERROR("Expected exception");
        }
        catch (const Program::ProgramException& ex) {
            BOOST_CHECK_EQUAL(std::string(ex.what()), "Program failed to link: vertex and fragment varyings do not match");
        }
        BOOST_CHECK(env.device->count("linkProgram") == 1);
        BOOST_CHECK(env.device->count("deleteProgram") == 1);
        BOOST_CHECK(env.device->uniformQueries.empty());
    }
}

// Test that a program built on a lost context ignores all draws
BOOST_AUTO_TEST_CASE(contextLoss) {
    for (GLenum shaderType : { GL_FRAGMENT_SHADER, GL_VERTEX_SHADER }) {
        TestEnvironment env;
        std::shared_ptr<VertexBuffer> vertexBuffer = createPositionBuffer(*env.context, 4);
        std::shared_ptr<IndexBuffer> indexBuffer = createIndexBuffer(*env.context, 6);
        env.device->calls.clear();

        env.device->loseContextOnShaderType = shaderType;
        std::unique_ptr<Program> program = createBackgroundProgram(*env.context);
        BOOST_CHECK(program->isFailed());
        BOOST_CHECK(env.device->calls.back().name == "createShader");
        BOOST_CHECK(env.device->count("linkProgram") == 0);
        BOOST_CHECK(env.logger->count(Logger::Severity::WARNING) == 1);

        std::size_t callCount = env.device->calls.size();
        SegmentVector segments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 2);
        DrawParameters parameters;
        parameters.uniformValues = backgroundUniformValues(cglib::vec4<float>(1, 0, 0, 1), 1.0f);
        parameters.terrainData = TerrainData();
        for (int i = 0; i < 3; i++) {
            BOOST_CHECK_NO_THROW(program->draw(parameters, "background", DrawBuffers(vertexBuffer, indexBuffer), segments));
        }
        BOOST_CHECK(env.device->calls.size() == callCount);
    }
}

// Test index count and byte offset of the draw calls
BOOST_AUTO_TEST_CASE(primitiveSizes) {
    BOOST_CHECK(Program::getPrimitiveSize(DrawMode::LINES) == 2);
    BOOST_CHECK(Program::getPrimitiveSize(DrawMode::TRIANGLES) == 3);
    BOOST_CHECK(Program::getPrimitiveSize(DrawMode::LINE_STRIP) == 1);

    TestEnvironment env;
    std::unique_ptr<Program> program = createBackgroundProgram(*env.context);
    DrawBuffers buffers(createPositionBuffer(*env.context, 8), createIndexBuffer(*env.context, 36));

    DrawParameters parameters;
    SegmentVector segments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 6);

    parameters.drawMode = DrawMode::TRIANGLES;
    program->draw(parameters, "background", buffers, segments);
    BOOST_CHECK(env.device->find("drawElements").back().args == std::vector<double>({ GL_TRIANGLES, 18, GL_UNSIGNED_SHORT, 0 }));

    parameters.drawMode = DrawMode::LINE_STRIP;
    program->draw(parameters, "background", buffers, segments);
    BOOST_CHECK(env.device->find("drawElements").back().args == std::vector<double>({ GL_LINE_STRIP, 6, GL_UNSIGNED_SHORT, 0 }));

    SegmentVector offsetSegments = SegmentVector::simpleSegment(env.logger, 4, 5, 4, 3);
    parameters.drawMode = DrawMode::LINES;
    program->draw(parameters, "background", buffers, offsetSegments);
    BOOST_CHECK(env.device->find("drawElements").back().args == std::vector<double>({ GL_LINES, 6, GL_UNSIGNED_SHORT, 20 }));
    BOOST_CHECK(env.device->contains("vertexAttribPointer", { 0, 2, GL_SHORT, 0, 4, 16 }));
}

// Test that segments are drawn in order
BOOST_AUTO_TEST_CASE(segmentOrder) {
    TestEnvironment env;
    std::unique_ptr<Program> program = createBackgroundProgram(*env.context);
    DrawBuffers buffers(createPositionBuffer(*env.context, 8), createIndexBuffer(*env.context, 12));

    SegmentVector segments(env.logger);
    Segment& segment1 = segments.prepareSegment(4, 0, 0);
    segment1.vertexLength += 4;
    segment1.primitiveLength += 2;
    Segment& segment2 = segments.prepareSegment(4, 4, 2, 1.0f);
    segment2.vertexLength += 4;
    segment2.primitiveLength += 2;
    BOOST_CHECK(segments.size() == 2);

    program->draw(DrawParameters(), "background", buffers, segments);
    std::vector<DeviceCall> draws = env.device->find("drawElements");
    BOOST_REQUIRE(draws.size() == 2);
    BOOST_CHECK(draws[0].args == std::vector<double>({ GL_TRIANGLES, 6, GL_UNSIGNED_SHORT, 0 }));
    BOOST_CHECK(draws[1].args == std::vector<double>({ GL_TRIANGLES, 6, GL_UNSIGNED_SHORT, 12 }));
}

// Test vertex array binding cache
BOOST_AUTO_TEST_CASE(vertexArrayCache) {
    TestEnvironment env;
    std::unique_ptr<Program> program = createBackgroundProgram(*env.context);
    std::shared_ptr<IndexBuffer> indexBuffer = createIndexBuffer(*env.context, 6);
    DrawBuffers buffers(createPositionBuffer(*env.context, 4), indexBuffer);
    SegmentVector segments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 2);

    program->draw(DrawParameters(), "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 1);
    std::size_t pointerCount = env.device->count("vertexAttribPointer");
    BOOST_CHECK(pointerCount == 1);

    program->draw(DrawParameters(), "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 1);
    BOOST_CHECK(env.device->count("vertexAttribPointer") == pointerCount);
    BOOST_CHECK(env.device->count("drawElements") == 2);

    buffers.layoutVertexBuffer = createPositionBuffer(*env.context, 4);
    program->draw(DrawParameters(), "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 2);
    BOOST_CHECK(env.device->count("deleteVertexArray") == 1);

    program->draw(DrawParameters(), "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 2);

    buffers.dynamicLayoutBuffers[0] = createPropertyBuffer(*env.context, "a_dynamic", 4);
    program->draw(DrawParameters(), "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 3);

    buffers.indexBuffer = createIndexBuffer(*env.context, 6);
    program->draw(DrawParameters(), "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 4);
    program->draw(DrawParameters(), "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 4);

    DrawParameters parameters;
    auto configuration = std::make_shared<PaintPropertyConfiguration>();
    configuration->addSource("color", createPropertyBuffer(*env.context, "a_color", 4));
    parameters.configuration = configuration;
    program->draw(parameters, "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 5);
    program->draw(parameters, "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 5);

    auto otherConfiguration = std::make_shared<PaintPropertyConfiguration>();
    otherConfiguration->addSource("color", createPropertyBuffer(*env.context, "a_color", 4));
    parameters.configuration = otherConfiguration;
    program->draw(parameters, "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 6);
    program->draw(parameters, "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 6);
    BOOST_CHECK(env.device->count("deleteVertexArray") == 5);

    program->draw(DrawParameters(), "other", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 7);
    BOOST_CHECK(segments[0].vertexArrays.size() == 2);

    segments.destroy();
    BOOST_CHECK(segments[0].vertexArrays.empty());
    BOOST_CHECK(env.device->count("deleteVertexArray") == 7);
}

// Test binding without vertex array support
BOOST_AUTO_TEST_CASE(vertexArrayUnsupported) {
    TestEnvironment env;
    env.device->vertexArraySupported = false;
    std::unique_ptr<Program> program = createBackgroundProgram(*env.context);
    DrawBuffers buffers(createPositionBuffer(*env.context, 4), createIndexBuffer(*env.context, 6));
    SegmentVector segments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 2);

    program->draw(DrawParameters(), "background", buffers, segments);
    program->draw(DrawParameters(), "background", buffers, segments);
    BOOST_CHECK(env.device->count("createVertexArray") == 0);
    BOOST_CHECK(env.device->count("bindVertexArray") == 0);
    BOOST_CHECK(env.device->count("vertexAttribPointer") == 2);
    BOOST_CHECK(env.device->count("drawElements") == 2);
    BOOST_CHECK(env.device->count("enableVertexAttribArray") == 1);
}

// Test that attribute arrays left enabled by an earlier draw are disabled without vertex array support
BOOST_AUTO_TEST_CASE(staleAttributeArrays) {
    TestEnvironment env;
    env.device->vertexArraySupported = false;
    auto configuration = std::make_shared<FixedConfiguration>(std::vector<std::string>({ "a_dynamic" }), std::vector<std::string>());
    Program fillProgram(*env.context, "fill", *Shaders::getFill(), configuration, UniformBuilders(buildFillUniforms), ProgramOptions());
    std::unique_ptr<Program> backgroundProgram = createBackgroundProgram(*env.context);
    BOOST_REQUIRE(fillProgram.getAttributes().at("a_dynamic") == 1);

    DrawBuffers buffers(createPositionBuffer(*env.context, 4), createIndexBuffer(*env.context, 6));
    buffers.dynamicLayoutBuffers[0] = createPropertyBuffer(*env.context, "a_dynamic", 4);
    SegmentVector fillSegments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 2);
    fillProgram.draw(DrawParameters(), "fill", buffers, fillSegments);
    BOOST_CHECK(env.device->contains("enableVertexAttribArray", { 1 }));
    BOOST_CHECK(env.device->count("disableVertexAttribArray") == 0);

    buffers.dynamicLayoutBuffers[0].reset();
    SegmentVector backgroundSegments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 2);
    backgroundProgram->draw(DrawParameters(), "background", buffers, backgroundSegments);
    BOOST_CHECK(env.device->find("disableVertexAttribArray").size() == 1);
    BOOST_CHECK(env.device->contains("disableVertexAttribArray", { 1 }));
    BOOST_CHECK(!env.device->contains("disableVertexAttribArray", { 0 }));
    BOOST_CHECK(env.device->find("enableVertexAttribArray").size() == 2);

    // Vertex array objects keep their own attribute state
    TestEnvironment vaoEnv;
    Program vaoFillProgram(*vaoEnv.context, "fill", *Shaders::getFill(), configuration, UniformBuilders(buildFillUniforms), ProgramOptions());
    DrawBuffers vaoBuffers(createPositionBuffer(*vaoEnv.context, 4), createIndexBuffer(*vaoEnv.context, 6));
    vaoBuffers.dynamicLayoutBuffers[0] = createPropertyBuffer(*vaoEnv.context, "a_dynamic", 4);
    SegmentVector vaoSegments = SegmentVector::simpleSegment(vaoEnv.logger, 0, 0, 4, 2);
    vaoFillProgram.draw(DrawParameters(), "fill", vaoBuffers, vaoSegments);
    BOOST_CHECK(vaoEnv.device->count("enableVertexAttribArray") == 2);
    BOOST_CHECK(vaoEnv.device->count("disableVertexAttribArray") == 0);
}

// Test a draw without optional inputs
BOOST_AUTO_TEST_CASE(absentPayloads) {
    TestEnvironment env;
    std::unique_ptr<Program> program = createBackgroundProgram(*env.context);
    DrawBuffers buffers(createPositionBuffer(*env.context, 4), createIndexBuffer(*env.context, 6));
    SegmentVector segments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 6);
    env.device->calls.clear();

    program->draw(DrawParameters(), "background", buffers, segments);
    BOOST_CHECK(env.device->count("useProgram") == 1);
    BOOST_CHECK(env.device->count("activeTexture") == 0);
    BOOST_CHECK(env.device->count("bindTexture") == 0);
    for (const DeviceCall& call : env.device->calls) {
        BOOST_CHECK(!boost::starts_with(call.name, "uniform"));
    }
    BOOST_CHECK(env.device->count("drawElements") == 1);

    SegmentVector emptySegments(env.logger);
    program->draw(DrawParameters(), "background", buffers, emptySegments);
    BOOST_CHECK(env.device->count("drawElements") == 1);
}

// Test terrain textures and uniforms
BOOST_AUTO_TEST_CASE(terrainUniforms) {
    TestEnvironment env;
    std::unique_ptr<Program> program = createBackgroundProgram(*env.context);
    DrawBuffers buffers(createPositionBuffer(*env.context, 4), createIndexBuffer(*env.context, 6));
    SegmentVector segments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 2);

    DrawParameters parameters;
    TerrainData terrainData;
    terrainData.depthTexture = 11;
    terrainData.texture = 12;
    terrainData.terrainDim = 256;
    terrainData.terrainExaggeration = 1.5f;
    parameters.terrainData = terrainData;
    program->draw(parameters, "background", buffers, segments);

    std::vector<DeviceCall> textureCalls;
    for (const DeviceCall& call : env.device->calls) {
        if (call.name == "activeTexture" || call.name == "bindTexture") {
            textureCalls.push_back(call);
        }
    }
    BOOST_REQUIRE(textureCalls.size() == 4);
    BOOST_CHECK(textureCalls[0].args == std::vector<double>({ GL_TEXTURE2 }));
    BOOST_CHECK(textureCalls[1].args == std::vector<double>({ GL_TEXTURE_2D, 11 }));
    BOOST_CHECK(textureCalls[2].args == std::vector<double>({ GL_TEXTURE3 }));
    BOOST_CHECK(textureCalls[3].args == std::vector<double>({ GL_TEXTURE_2D, 12 }));

    BOOST_CHECK(env.device->contains("uniform1i", { static_cast<double>(env.device->location("u_depth")), 2 }));
    BOOST_CHECK(env.device->contains("uniform1i", { static_cast<double>(env.device->location("u_terrain")), 3 }));
    BOOST_CHECK(env.device->contains("uniform1f", { static_cast<double>(env.device->location("u_terrain_dim")), 256 }));
    BOOST_CHECK(env.device->contains("uniform1f", { static_cast<double>(env.device->location("u_terrain_exaggeration")), 1.5 }));
    BOOST_CHECK(env.device->count("uniformMatrix4fv") == 1);
    BOOST_CHECK(env.device->count("uniform4f") == 1);
}

// Test that only present projection fields are pushed
BOOST_AUTO_TEST_CASE(projectionUniforms) {
    TestEnvironment env;
    std::unique_ptr<Program> program = createBackgroundProgram(*env.context);
    DrawBuffers buffers(createPositionBuffer(*env.context, 4), createIndexBuffer(*env.context, 6));
    SegmentVector segments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 2);

    DrawParameters parameters;
    ProjectionData projectionData;
    projectionData.mainMatrix = cglib::mat4x4<float>::identity();
    parameters.projectionData = projectionData;
    program->draw(parameters, "background", buffers, segments);
    BOOST_CHECK(env.device->count("uniformMatrix4fv") == 1);
    BOOST_CHECK(env.device->contains("uniformMatrix4fv", { static_cast<double>(env.device->location("u_projection_matrix")), 1, 1 }));

    projectionData.projectionTransition = 0.25f;
    projectionData.mainMatrix.reset();
    parameters.projectionData = projectionData;
    program->draw(parameters, "background", buffers, segments);
    BOOST_CHECK(env.device->count("uniformMatrix4fv") == 1);
    BOOST_CHECK(env.device->count("uniform1f") == 0);
}

// Test fixed uniform pushes and type mismatches
BOOST_AUTO_TEST_CASE(fixedUniforms) {
    TestEnvironment env;
    std::unique_ptr<Program> program = createBackgroundProgram(*env.context);
    DrawBuffers buffers(createPositionBuffer(*env.context, 4), createIndexBuffer(*env.context, 6));
    SegmentVector segments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 2);

    DrawParameters parameters;
    parameters.uniformValues = backgroundUniformValues(cglib::vec4<float>(0, 0.5f, 1, 1), 0.75f);
    program->draw(parameters, "background", buffers, segments);
    BOOST_CHECK(env.device->contains("uniform4f", { static_cast<double>(env.device->location("u_color")), 0, 0.5, 1, 1 }));
    BOOST_CHECK(env.device->contains("uniform1f", { static_cast<double>(env.device->location("u_opacity")), 0.75 }));

    parameters.uniformValues = UniformValues { { "u_opacity", cglib::vec2<float>(1, 1) } };
    BOOST_CHECK_NO_THROW(program->draw(parameters, "background", buffers, segments));
    BOOST_CHECK(env.device->count("uniform1f") == 1);
    BOOST_CHECK(env.device->count("uniform2f") == 0);
    BOOST_CHECK(env.logger->count(Logger::Severity::WARNING) == 1);
    BOOST_CHECK(env.device->count("drawElements") == 2);
}

// Test paint property binders
BOOST_AUTO_TEST_CASE(paintPropertyConfiguration) {
    TestEnvironment env;
    std::shared_ptr<VertexBuffer> opacityBuffer = createPropertyBuffer(*env.context, "a_opacity", 4);
    auto configuration = std::make_shared<PaintPropertyConfiguration>();
    configuration->addConstant("color", cglib::vec4<float>(1, 0, 0, 1));
    configuration->addComposite("opacity", opacityBuffer, 0, 10);
    BOOST_CHECK_THROW(configuration->addSource("color", opacityBuffer), std::invalid_argument);

    BOOST_CHECK_EQUAL(configuration->getCacheKey(), "/u_color/z_opacity");
    BOOST_CHECK(configuration->getDefines() == std::vector<std::string>({ "#define HAS_UNIFORM_u_color" }));
    BOOST_CHECK(configuration->getBinderAttributes() == std::vector<std::string>({ "a_opacity" }));
    BOOST_CHECK(configuration->getBinderUniforms() == std::vector<std::string>({ "u_color", "u_opacity_t" }));
    BOOST_CHECK(configuration->getPaintVertexBuffers().size() == 1);

    Program program(*env.context, "fill", *Shaders::getFill(), configuration, UniformBuilders(buildFillUniforms), ProgramOptions());
    BOOST_CHECK(program.getAttributes().at("a_opacity") == 1);
    BOOST_CHECK(program.getDataDrivenUniforms().size() == 2);
    BOOST_CHECK(env.device->shaderSources[GL_VERTEX_SHADER].find("#define HAS_UNIFORM_u_color") != std::string::npos);
    BOOST_CHECK(env.device->shaderSources[GL_FRAGMENT_SHADER].find("#define HAS_UNIFORM_u_color") != std::string::npos);

    DrawBuffers buffers(createPositionBuffer(*env.context, 4), createIndexBuffer(*env.context, 6));
    SegmentVector segments = SegmentVector::simpleSegment(env.logger, 0, 0, 4, 2);
    DrawParameters parameters;
    parameters.configuration = configuration;
    parameters.zoom = 5;
    parameters.featureState = FeatureState { { "color", cglib::vec4<float>(0, 1, 0, 1) } };
    program.draw(parameters, "fill", buffers, segments);
    BOOST_CHECK(env.device->contains("uniform4f", { static_cast<double>(env.device->location("u_color")), 0, 1, 0, 1 }));
    BOOST_CHECK(env.device->contains("uniform1f", { static_cast<double>(env.device->location("u_opacity_t")), 0.5 }));
    BOOST_CHECK(env.device->contains("vertexAttribPointer", { 1, 2, GL_FLOAT, 0, 8, 0 }));

    parameters.zoom = 20;
    parameters.featureState.clear();
    program.draw(parameters, "fill", buffers, segments);
    BOOST_CHECK(env.device->contains("uniform4f", { static_cast<double>(env.device->location("u_color")), 1, 0, 0, 1 }));
    BOOST_CHECK(env.device->contains("uniform1f", { static_cast<double>(env.device->location("u_opacity_t")), 1 }));
}

// Test program reuse, variants and reset
BOOST_AUTO_TEST_CASE(programCache) {
    TestEnvironment env;
    ProgramCache cache(*env.context);

    Program& fill1 = cache.useProgram("fill");
    Program& fill2 = cache.useProgram("fill");
    BOOST_CHECK(&fill1 == &fill2);
    BOOST_CHECK(cache.getProgramCount() == 1);
    BOOST_CHECK(env.device->shaderSources[GL_VERTEX_SHADER].find("#define PROJECTION_MERCATOR") != std::string::npos);

    cache.useProgram("fill", std::shared_ptr<const ProgramConfiguration>(), false, { "#define PATTERN" });
    BOOST_CHECK(cache.getProgramCount() == 2);

    cache.setShowOverdrawInspector(true);
    cache.setTerrainEnabled(true);
    cache.useProgram("line");
    BOOST_CHECK(env.device->shaderSources[GL_FRAGMENT_SHADER].find("#define OVERDRAW_INSPECTOR;") != std::string::npos);
    BOOST_CHECK(env.device->shaderSources[GL_VERTEX_SHADER].find("#define TERRAIN3D;") != std::string::npos);
    BOOST_CHECK(cache.getProgramCount() == 3);

    cache.setShowOverdrawInspector(false);
    cache.setTerrainEnabled(false);
    cache.setProjectionVariant(ProjectionVariant::GLOBE);
    Program& globeFill = cache.useProgram("fill");
    BOOST_CHECK(&globeFill != &fill1);
    BOOST_CHECK(env.device->shaderSources[GL_VERTEX_SHADER].find("#define GLOBE") != std::string::npos);
    BOOST_CHECK(env.device->shaderSources[GL_VERTEX_SHADER].find("u_projection_fallback_matrix") != std::string::npos);
    BOOST_CHECK(&cache.useProgram("fill", std::shared_ptr<const ProgramConfiguration>(), true) == &fill1);
    BOOST_CHECK(cache.getProgramCount() == 4);

    BOOST_CHECK_THROW(cache.useProgram("symbol"), std::invalid_argument);

    std::size_t createCount = env.device->count("createProgram");
    cache.reset();
    BOOST_CHECK(cache.getProgramCount() == 0);
    BOOST_CHECK(env.device->count("deleteProgram") == 4);
    cache.useProgram("fill");
    BOOST_CHECK(env.device->count("createProgram") == createCount + 1);
}

// Test that programs registered after a context loss are rebuilt after reset
BOOST_AUTO_TEST_CASE(programCacheContextLoss) {
    TestEnvironment env;
    ProgramCache cache(*env.context);
    env.device->loseContextOnShaderType = GL_FRAGMENT_SHADER;
    BOOST_CHECK(cache.useProgram("background").isFailed());
    BOOST_CHECK(cache.useProgram("background").isFailed());

    env.device->loseContextOnShaderType = 0;
    env.device->contextLost = false;
    cache.reset();
    BOOST_CHECK(!cache.useProgram("background").isFailed());

    cache.registerProgram("custom", std::make_shared<const ShaderSource>(ShaderSource::compile("void main() { fragColor = vec4(1.0); }", "in vec2 a_pos;\nvoid main() { gl_Position = projectTile(a_pos); }")), UniformBindingsBuilder());
    BOOST_CHECK(cache.useProgram("custom").getAttributes().at("a_pos") == 0);
}

// Test segment splitting
BOOST_AUTO_TEST_CASE(segmentVector) {
    auto logger = std::make_shared<RecordingLogger>();
    SegmentVector segments(logger);

    Segment& segment1 = segments.prepareSegment(100, 0, 0);
    segment1.vertexLength += 100;
    segment1.primitiveLength += 50;
    Segment& segment2 = segments.prepareSegment(200, 100, 50);
    BOOST_CHECK(&segment1 == &segment2);
    segment2.vertexLength += 200;
    segment2.primitiveLength += 100;

    Segment& segment3 = segments.prepareSegment(65300, 300, 150);
    BOOST_CHECK(segments.size() == 2);
    BOOST_CHECK(segment3.vertexOffset == 300);
    BOOST_CHECK(segment3.primitiveOffset == 150);
    BOOST_CHECK(segment3.vertexLength == 0);
    segment3.vertexLength += 10;

    segments.prepareSegment(10, 310, 155, 2.0f);
    BOOST_CHECK(segments.size() == 3);
    BOOST_CHECK(logger->count(Logger::Severity::WARNING) == 0);

    segments.prepareSegment(70000, 320, 160, 2.0f);
    BOOST_CHECK(logger->count(Logger::Severity::WARNING) == 1);
    BOOST_CHECK(segments.size() == 4);
}
