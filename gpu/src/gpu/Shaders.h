/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_SHADERS_H_
#define _CARTO_GPU_SHADERS_H_

#include "ShaderSource.h"

#include <memory>
#include <string>

namespace carto { namespace gpu {
    /**
     * Built-in shader sources, compiled (declarations extracted, pragmas expanded) on first use.
     */
    class Shaders final {
    public:
        static const std::string MERCATOR_PROJECTION_DEFINE;
        static const std::string GLOBE_PROJECTION_DEFINE;

        static const std::shared_ptr<const ShaderSource>& getPrelude();
        static const std::shared_ptr<const ShaderSource>& getProjectionMercator();
        static const std::shared_ptr<const ShaderSource>& getProjectionGlobe();

        static const std::shared_ptr<const ShaderSource>& getBackground();
        static const std::shared_ptr<const ShaderSource>& getFill();
        static const std::shared_ptr<const ShaderSource>& getLine();

    private:
        Shaders() = delete;
    };
} }

#endif
