#include "Uniform.h"

#include <algorithm>

namespace carto::gpu {
    bool Uniform::set(const UniformValue& value) {
        if (value.index() != static_cast<std::size_t>(_type)) {
            return false;
        }
        if (!_location) {
            return true;
        }
        if (_current && isEqual(*_current, value)) {
            return true;
        }

        GLDevice& device = _context->getDevice();
        switch (_type) {
        case UniformType::INT:
            device.uniform1i(*_location, std::get<int>(value));
            break;
        case UniformType::FLOAT:
            device.uniform1f(*_location, std::get<float>(value));
            break;
        case UniformType::VEC2: {
                const cglib::vec2<float>& vec = std::get<cglib::vec2<float>>(value);
                device.uniform2f(*_location, vec(0), vec(1));
            }
            break;
        case UniformType::VEC3: {
                const cglib::vec3<float>& vec = std::get<cglib::vec3<float>>(value);
                device.uniform3f(*_location, vec(0), vec(1), vec(2));
            }
            break;
        case UniformType::VEC4: {
                const cglib::vec4<float>& vec = std::get<cglib::vec4<float>>(value);
                device.uniform4f(*_location, vec(0), vec(1), vec(2), vec(3));
            }
            break;
        case UniformType::MAT4:
            device.uniformMatrix4fv(*_location, std::get<cglib::mat4x4<float>>(value).data());
            break;
        }
        _current = value;
        return true;
    }

    bool Uniform::isEqual(const UniformValue& value1, const UniformValue& value2) {
        if (value1.index() != value2.index()) {
            return false;
        }
        switch (value1.index()) {
        case 0:
            return std::get<0>(value1) == std::get<0>(value2);
        case 1:
            return std::get<1>(value1) == std::get<1>(value2);
        case 2:
            return std::equal(std::get<2>(value1).cbegin(), std::get<2>(value1).cend(), std::get<2>(value2).cbegin());
        case 3:
            return std::equal(std::get<3>(value1).cbegin(), std::get<3>(value1).cend(), std::get<3>(value2).cbegin());
        case 4:
            return std::equal(std::get<4>(value1).cbegin(), std::get<4>(value1).cend(), std::get<4>(value2).cbegin());
        case 5:
            return std::equal(std::get<5>(value1).data(), std::get<5>(value1).data() + 16, std::get<5>(value2).data());
        default:
            return false;
        }
    }

    std::optional<GLint> findUniformLocation(const UniformLocations& locations, const std::string& name) {
        auto it = locations.find(name);
        if (it == locations.end()) {
            return std::optional<GLint>();
        }
        return it->second;
    }
}
