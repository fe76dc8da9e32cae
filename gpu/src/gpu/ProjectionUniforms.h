/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_PROJECTIONUNIFORMS_H_
#define _CARTO_GPU_PROJECTIONUNIFORMS_H_

#include "Uniform.h"

#include <optional>

#include <cglib/vec.h>
#include <cglib/mat.h>

namespace carto { namespace gpu {
    struct ProjectionData {
        std::optional<cglib::mat4x4<float>> mainMatrix;
        std::optional<cglib::vec4<float>> tileMercatorCoords;
        std::optional<cglib::vec4<float>> clippingPlane;
        std::optional<float> projectionTransition;
        std::optional<cglib::mat4x4<float>> fallbackMatrix;

        // Values of the present fields, keyed by uniform name
        UniformValues getUniformValues() const;
    };

    // Uniform names of the ProjectionData fields
    constexpr const char* PROJECTION_MAIN_MATRIX_UNIFORM = "u_projection_matrix";
    constexpr const char* PROJECTION_TILE_MERCATOR_COORDS_UNIFORM = "u_projection_tile_mercator_coords";
    constexpr const char* PROJECTION_CLIPPING_PLANE_UNIFORM = "u_projection_clipping_plane";
    constexpr const char* PROJECTION_TRANSITION_UNIFORM = "u_projection_transition";
    constexpr const char* PROJECTION_FALLBACK_MATRIX_UNIFORM = "u_projection_fallback_matrix";

    UniformBindings buildProjectionUniforms(GLContext& context, const UniformLocations& locations);
} }

#endif
