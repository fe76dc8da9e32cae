/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_TERRAINUNIFORMS_H_
#define _CARTO_GPU_TERRAINUNIFORMS_H_

#include "Uniform.h"

#include <cglib/vec.h>
#include <cglib/mat.h>

namespace carto { namespace gpu {
    // Texture units reserved for terrain inputs. Other renderers sharing the context must not bind these.
    constexpr GLenum TERRAIN_DEPTH_TEXTURE_UNIT = 2;
    constexpr GLenum TERRAIN_TEXTURE_UNIT = 3;

    struct TerrainData {
        GLuint depthTexture;
        GLuint texture;
        float terrainDim;
        cglib::mat4x4<float> terrainMatrix;
        cglib::vec4<float> terrainUnpack;
        float terrainExaggeration;

        TerrainData() : depthTexture(0), texture(0), terrainDim(0), terrainMatrix(cglib::mat4x4<float>::identity()), terrainUnpack(0, 0, 0, 0), terrainExaggeration(1) { }

        UniformValues getUniformValues() const;
    };

    UniformBindings buildTerrainUniforms(GLContext& context, const UniformLocations& locations);
} }

#endif
