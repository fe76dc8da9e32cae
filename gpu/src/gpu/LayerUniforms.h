/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_LAYERUNIFORMS_H_
#define _CARTO_GPU_LAYERUNIFORMS_H_

#include "Uniform.h"

#include <cglib/vec.h>

namespace carto { namespace gpu {
    UniformBindings buildBackgroundUniforms(GLContext& context, const UniformLocations& locations);
    UniformValues backgroundUniformValues(const cglib::vec4<float>& color, float opacity);

    UniformBindings buildFillUniforms(GLContext& context, const UniformLocations& locations);
    UniformValues fillUniformValues(const cglib::vec2<float>& translate);

    UniformBindings buildLineUniforms(GLContext& context, const UniformLocations& locations);
    UniformValues lineUniformValues(float ratio, float devicePixelRatio);
} }

#endif
