/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_PROGRAMCONFIGURATION_H_
#define _CARTO_GPU_PROGRAMCONFIGURATION_H_

#include "Uniform.h"
#include "VertexBuffer.h"

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <utility>

namespace carto { namespace gpu {
    // Per-feature property overrides, keyed by property name
    using FeatureState = std::map<std::string, UniformValue>;

    struct EvaluationParameters {
        float zoom;

        explicit EvaluationParameters(float zoom) : zoom(zoom) { }
    };

    /**
     * Data-driven styling of a program: extra attributes, uniforms and defines, and the per-frame
     * evaluation of the data-driven uniforms.
     */
    class ProgramConfiguration {
    public:
        virtual ~ProgramConfiguration() = default;

        // Attribute names appended after the static attributes. An empty name reserves an index without binding it.
        virtual std::vector<std::string> getBinderAttributes() const = 0;
        virtual std::vector<std::string> getBinderUniforms() const = 0;
        virtual std::vector<std::string> getDefines() const = 0;
        virtual std::string getCacheKey() const = 0;

        virtual UniformBindings getUniforms(GLContext& context, const UniformLocations& locations) const = 0;
        virtual void setUniforms(GLContext& context, UniformBindings& uniforms, const FeatureState& featureState, const EvaluationParameters& parameters) const = 0;

        // Per-feature buffers to attach when a vertex array binding is built
        virtual std::vector<std::shared_ptr<VertexBuffer>> getPaintVertexBuffers() const = 0;
    };

    /**
     * Paint properties bound either as constants (uniform u_<name>), per-feature source values
     * (attribute a_<name>) or zoom-interpolated composite values (attribute a_<name> and uniform u_<name>_t).
     */
    class PaintPropertyConfiguration : public ProgramConfiguration {
    public:
        PaintPropertyConfiguration() = default;

        void addConstant(const std::string& name, const UniformValue& value);
        void addSource(const std::string& name, std::shared_ptr<VertexBuffer> buffer);
        void addComposite(const std::string& name, std::shared_ptr<VertexBuffer> buffer, float minZoom, float maxZoom);

        virtual std::vector<std::string> getBinderAttributes() const override;
        virtual std::vector<std::string> getBinderUniforms() const override;
        virtual std::vector<std::string> getDefines() const override;
        virtual std::string getCacheKey() const override;

        virtual UniformBindings getUniforms(GLContext& context, const UniformLocations& locations) const override;
        virtual void setUniforms(GLContext& context, UniformBindings& uniforms, const FeatureState& featureState, const EvaluationParameters& parameters) const override;

        virtual std::vector<std::shared_ptr<VertexBuffer>> getPaintVertexBuffers() const override;

    private:
        enum class BinderKind {
            CONSTANT, SOURCE, COMPOSITE
        };

        struct Binder {
            std::string name;
            BinderKind kind;
            UniformValue value;
            std::shared_ptr<VertexBuffer> buffer;
            float minZoom;
            float maxZoom;

            explicit Binder(std::string name, BinderKind kind, UniformValue value, std::shared_ptr<VertexBuffer> buffer, float minZoom, float maxZoom) : name(std::move(name)), kind(kind), value(std::move(value)), buffer(std::move(buffer)), minZoom(minZoom), maxZoom(maxZoom) { }
        };

        void addBinder(Binder binder);

        std::vector<Binder> _binders;
    };
} }

#endif
