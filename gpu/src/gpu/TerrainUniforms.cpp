#include "TerrainUniforms.h"

namespace carto::gpu {
    UniformValues TerrainData::getUniformValues() const {
        UniformValues values;
        values.emplace("u_depth", static_cast<int>(TERRAIN_DEPTH_TEXTURE_UNIT));
        values.emplace("u_terrain", static_cast<int>(TERRAIN_TEXTURE_UNIT));
        values.emplace("u_terrain_dim", terrainDim);
        values.emplace("u_terrain_matrix", terrainMatrix);
        values.emplace("u_terrain_unpack", terrainUnpack);
        values.emplace("u_terrain_exaggeration", terrainExaggeration);
        return values;
    }

    UniformBindings buildTerrainUniforms(GLContext& context, const UniformLocations& locations) {
        UniformBindings bindings;
        bindings.emplace("u_depth", Uniform(context, UniformType::INT, findUniformLocation(locations, "u_depth")));
        bindings.emplace("u_terrain", Uniform(context, UniformType::INT, findUniformLocation(locations, "u_terrain")));
        bindings.emplace("u_terrain_dim", Uniform(context, UniformType::FLOAT, findUniformLocation(locations, "u_terrain_dim")));
        bindings.emplace("u_terrain_matrix", Uniform(context, UniformType::MAT4, findUniformLocation(locations, "u_terrain_matrix")));
        bindings.emplace("u_terrain_unpack", Uniform(context, UniformType::VEC4, findUniformLocation(locations, "u_terrain_unpack")));
        bindings.emplace("u_terrain_exaggeration", Uniform(context, UniformType::FLOAT, findUniformLocation(locations, "u_terrain_exaggeration")));
        return bindings;
    }
}
