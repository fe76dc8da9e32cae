/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_UNIFORM_H_
#define _CARTO_GPU_UNIFORM_H_

#include "GLContext.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <utility>

#include <cglib/vec.h>
#include <cglib/mat.h>

namespace carto { namespace gpu {
    // The order of the alternatives matches UniformType
    using UniformValue = std::variant<int, float, cglib::vec2<float>, cglib::vec3<float>, cglib::vec4<float>, cglib::mat4x4<float>>;

    enum class UniformType {
        INT, FLOAT, VEC2, VEC3, VEC4, MAT4
    };

    class Uniform final {
    public:
        explicit Uniform(GLContext& context, UniformType type, std::optional<GLint> location) : _context(&context), _type(type), _location(std::move(location)), _current() { }

        UniformType getType() const { return _type; }
        const std::optional<GLint>& getLocation() const { return _location; }

        // Returns false if the value type does not match the uniform type. Unchanged values are not pushed again.
        bool set(const UniformValue& value);

    private:
        static bool isEqual(const UniformValue& value1, const UniformValue& value2);

        GLContext* _context;
        UniformType _type;
        std::optional<GLint> _location;
        std::optional<UniformValue> _current;
    };

    using UniformValues = std::map<std::string, UniformValue>;
    using UniformLocations = std::map<std::string, GLint>;
    using UniformBindings = std::map<std::string, Uniform>;
    using UniformBindingsBuilder = std::function<UniformBindings(GLContext&, const UniformLocations&)>;

    std::optional<GLint> findUniformLocation(const UniformLocations& locations, const std::string& name);
} }

#endif
