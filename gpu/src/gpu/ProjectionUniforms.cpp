#include "ProjectionUniforms.h"

namespace carto::gpu {
    UniformValues ProjectionData::getUniformValues() const {
        UniformValues values;
        if (mainMatrix) {
            values.emplace(PROJECTION_MAIN_MATRIX_UNIFORM, *mainMatrix);
        }
        if (tileMercatorCoords) {
            values.emplace(PROJECTION_TILE_MERCATOR_COORDS_UNIFORM, *tileMercatorCoords);
        }
        if (clippingPlane) {
            values.emplace(PROJECTION_CLIPPING_PLANE_UNIFORM, *clippingPlane);
        }
        if (projectionTransition) {
            values.emplace(PROJECTION_TRANSITION_UNIFORM, *projectionTransition);
        }
        if (fallbackMatrix) {
            values.emplace(PROJECTION_FALLBACK_MATRIX_UNIFORM, *fallbackMatrix);
        }
        return values;
    }

    UniformBindings buildProjectionUniforms(GLContext& context, const UniformLocations& locations) {
        UniformBindings bindings;
        bindings.emplace(PROJECTION_MAIN_MATRIX_UNIFORM, Uniform(context, UniformType::MAT4, findUniformLocation(locations, PROJECTION_MAIN_MATRIX_UNIFORM)));
        bindings.emplace(PROJECTION_TILE_MERCATOR_COORDS_UNIFORM, Uniform(context, UniformType::VEC4, findUniformLocation(locations, PROJECTION_TILE_MERCATOR_COORDS_UNIFORM)));
        bindings.emplace(PROJECTION_CLIPPING_PLANE_UNIFORM, Uniform(context, UniformType::VEC4, findUniformLocation(locations, PROJECTION_CLIPPING_PLANE_UNIFORM)));
        bindings.emplace(PROJECTION_TRANSITION_UNIFORM, Uniform(context, UniformType::FLOAT, findUniformLocation(locations, PROJECTION_TRANSITION_UNIFORM)));
        bindings.emplace(PROJECTION_FALLBACK_MATRIX_UNIFORM, Uniform(context, UniformType::MAT4, findUniformLocation(locations, PROJECTION_FALLBACK_MATRIX_UNIFORM)));
        return bindings;
    }
}
