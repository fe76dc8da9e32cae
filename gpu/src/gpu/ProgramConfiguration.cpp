#include "ProgramConfiguration.h"

#include <algorithm>
#include <stdexcept>

namespace carto::gpu {
    void PaintPropertyConfiguration::addConstant(const std::string& name, const UniformValue& value) {
        addBinder(Binder(name, BinderKind::CONSTANT, value, std::shared_ptr<VertexBuffer>(), 0, 0));
    }

    void PaintPropertyConfiguration::addSource(const std::string& name, std::shared_ptr<VertexBuffer> buffer) {
        if (!buffer) {
            throw std::invalid_argument("Null vertex buffer for property " + name);
        }
        addBinder(Binder(name, BinderKind::SOURCE, 0.0f, std::move(buffer), 0, 0));
    }

    void PaintPropertyConfiguration::addComposite(const std::string& name, std::shared_ptr<VertexBuffer> buffer, float minZoom, float maxZoom) {
        if (!buffer) {
            throw std::invalid_argument("Null vertex buffer for property " + name);
        }
        addBinder(Binder(name, BinderKind::COMPOSITE, 0.0f, std::move(buffer), minZoom, maxZoom));
    }

    std::vector<std::string> PaintPropertyConfiguration::getBinderAttributes() const {
        std::vector<std::string> attributes;
        for (const Binder& binder : _binders) {
            if (binder.kind != BinderKind::CONSTANT) {
                attributes.push_back("a_" + binder.name);
            }
        }
        return attributes;
    }

    std::vector<std::string> PaintPropertyConfiguration::getBinderUniforms() const {
        std::vector<std::string> uniforms;
        for (const Binder& binder : _binders) {
            if (binder.kind == BinderKind::CONSTANT) {
                uniforms.push_back("u_" + binder.name);
            } else if (binder.kind == BinderKind::COMPOSITE) {
                uniforms.push_back("u_" + binder.name + "_t");
            }
        }
        return uniforms;
    }

    std::vector<std::string> PaintPropertyConfiguration::getDefines() const {
        std::vector<std::string> defines;
        for (const Binder& binder : _binders) {
            if (binder.kind == BinderKind::CONSTANT) {
                defines.push_back("#define HAS_UNIFORM_u_" + binder.name);
            }
        }
        return defines;
    }

    std::string PaintPropertyConfiguration::getCacheKey() const {
        std::string key;
        for (const Binder& binder : _binders) {
            switch (binder.kind) {
            case BinderKind::CONSTANT:
                key += "/u_" + binder.name;
                break;
            case BinderKind::SOURCE:
                key += "/a_" + binder.name;
                break;
            case BinderKind::COMPOSITE:
                key += "/z_" + binder.name;
                break;
            }
        }
        return key;
    }

    UniformBindings PaintPropertyConfiguration::getUniforms(GLContext& context, const UniformLocations& locations) const {
        UniformBindings bindings;
        for (const Binder& binder : _binders) {
            if (binder.kind == BinderKind::CONSTANT) {
                std::string uniformName = "u_" + binder.name;
                bindings.emplace(uniformName, Uniform(context, static_cast<UniformType>(binder.value.index()), findUniformLocation(locations, uniformName)));
            } else if (binder.kind == BinderKind::COMPOSITE) {
                std::string uniformName = "u_" + binder.name + "_t";
                bindings.emplace(uniformName, Uniform(context, UniformType::FLOAT, findUniformLocation(locations, uniformName)));
            }
        }
        return bindings;
    }

    void PaintPropertyConfiguration::setUniforms(GLContext& context, UniformBindings& uniforms, const FeatureState& featureState, const EvaluationParameters& parameters) const {
        for (const Binder& binder : _binders) {
            std::string uniformName;
            UniformValue value;
            if (binder.kind == BinderKind::CONSTANT) {
                uniformName = "u_" + binder.name;
                auto it = featureState.find(binder.name);
                value = (it != featureState.end() ? it->second : binder.value);
            } else if (binder.kind == BinderKind::COMPOSITE) {
                uniformName = "u_" + binder.name + "_t";
                float t = 0;
                if (binder.maxZoom > binder.minZoom) {
                    t = std::min(1.0f, std::max(0.0f, (parameters.zoom - binder.minZoom) / (binder.maxZoom - binder.minZoom)));
                }
                value = t;
            } else {
                continue;
            }

            auto uniformIt = uniforms.find(uniformName);
            if (uniformIt == uniforms.end()) {
                continue;
            }
            if (!uniformIt->second.set(value)) {
                context.getLogger()->write(Logger::Severity::WARNING, "Value type does not match uniform " + uniformName);
            }
        }
    }

    std::vector<std::shared_ptr<VertexBuffer>> PaintPropertyConfiguration::getPaintVertexBuffers() const {
        std::vector<std::shared_ptr<VertexBuffer>> buffers;
        for (const Binder& binder : _binders) {
            if (binder.buffer) {
                buffers.push_back(binder.buffer);
            }
        }
        return buffers;
    }

    void PaintPropertyConfiguration::addBinder(Binder binder) {
        auto it = std::find_if(_binders.begin(), _binders.end(), [&binder](const Binder& other) {
            return other.name == binder.name;
        });
        if (it != _binders.end()) {
            throw std::invalid_argument("Property already bound: " + binder.name);
        }
        _binders.push_back(std::move(binder));
    }
}
