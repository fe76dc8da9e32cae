#include "LayerUniforms.h"

namespace carto::gpu {
    UniformBindings buildBackgroundUniforms(GLContext& context, const UniformLocations& locations) {
        UniformBindings bindings;
        bindings.emplace("u_color", Uniform(context, UniformType::VEC4, findUniformLocation(locations, "u_color")));
        bindings.emplace("u_opacity", Uniform(context, UniformType::FLOAT, findUniformLocation(locations, "u_opacity")));
        return bindings;
    }

    UniformValues backgroundUniformValues(const cglib::vec4<float>& color, float opacity) {
        UniformValues values;
        values.emplace("u_color", color);
        values.emplace("u_opacity", opacity);
        return values;
    }

    UniformBindings buildFillUniforms(GLContext& context, const UniformLocations& locations) {
        UniformBindings bindings;
        bindings.emplace("u_fill_translate", Uniform(context, UniformType::VEC2, findUniformLocation(locations, "u_fill_translate")));
        return bindings;
    }

    UniformValues fillUniformValues(const cglib::vec2<float>& translate) {
        UniformValues values;
        values.emplace("u_fill_translate", translate);
        return values;
    }

    UniformBindings buildLineUniforms(GLContext& context, const UniformLocations& locations) {
        UniformBindings bindings;
        bindings.emplace("u_ratio", Uniform(context, UniformType::FLOAT, findUniformLocation(locations, "u_ratio")));
        bindings.emplace("u_device_pixel_ratio", Uniform(context, UniformType::FLOAT, findUniformLocation(locations, "u_device_pixel_ratio")));
        return bindings;
    }

    UniformValues lineUniformValues(float ratio, float devicePixelRatio) {
        UniformValues values;
        values.emplace("u_ratio", ratio);
        values.emplace("u_device_pixel_ratio", devicePixelRatio);
        return values;
    }
}
