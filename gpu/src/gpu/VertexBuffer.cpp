#include "VertexBuffer.h"

#include <atomic>
#include <stdexcept>

namespace {
    std::uint64_t nextVertexBufferId() {
        static std::atomic<std::uint64_t> counter(0);
        return ++counter;
    }
}

namespace carto::gpu {
    VertexBuffer::VertexBuffer(GLContext& context, std::vector<VertexAttribute> attributes, std::size_t itemSize, const std::vector<std::uint8_t>& data, bool dynamicDraw) :
        _context(context), _id(nextVertexBufferId()), _attributes(std::move(attributes)), _itemSize(itemSize), _dynamicDraw(dynamicDraw), _length(0), _buffer(0)
    {
        if (itemSize == 0 || data.size() % itemSize != 0) {
            throw std::invalid_argument("Vertex data size is not a multiple of the item size");
        }
        _length = data.size() / itemSize;
        _buffer = _context.getDevice().createBuffer();
        _context.bindVertexBuffer(_buffer);
        _context.getDevice().bufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(data.size()), data.data(), _dynamicDraw ? GL_DYNAMIC_DRAW : GL_STATIC_DRAW);
    }

    VertexBuffer::~VertexBuffer() {
        if (_buffer != 0) {
            _context.forgetBuffer(_buffer);
            _context.getDevice().deleteBuffer(_buffer);
        }
    }

    void VertexBuffer::bind() {
        _context.bindVertexBuffer(_buffer);
    }

    void VertexBuffer::updateData(const std::vector<std::uint8_t>& data) {
        if (!_dynamicDraw) {
            throw std::logic_error("Static vertex buffers cannot be updated");
        }
        if (data.size() != _length * _itemSize) {
            throw std::invalid_argument("Vertex data length does not match the buffer length");
        }
        bind();
        _context.getDevice().bufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(data.size()), data.data());
    }

    void VertexBuffer::getAttributeIndices(const std::map<std::string, int>& programAttributes, std::set<GLuint>& indices) const {
        for (const VertexAttribute& attribute : _attributes) {
            auto it = programAttributes.find(attribute.name);
            if (it != programAttributes.end()) {
                indices.insert(static_cast<GLuint>(it->second));
            }
        }
    }

    void VertexBuffer::setVertexAttribPointers(const std::map<std::string, int>& programAttributes, std::size_t vertexOffset) {
        for (const VertexAttribute& attribute : _attributes) {
            auto it = programAttributes.find(attribute.name);
            if (it != programAttributes.end()) {
                _context.getDevice().vertexAttribPointer(static_cast<GLuint>(it->second), attribute.components, getGLType(attribute.type), attribute.normalized, static_cast<GLsizei>(_itemSize), attribute.offset + _itemSize * vertexOffset);
            }
        }
    }

    GLenum VertexBuffer::getGLType(AttributeType type) {
        switch (type) {
        case AttributeType::INT8:
            return GL_BYTE;
        case AttributeType::UINT8:
            return GL_UNSIGNED_BYTE;
        case AttributeType::INT16:
            return GL_SHORT;
        case AttributeType::UINT16:
            return GL_UNSIGNED_SHORT;
        case AttributeType::INT32:
            return GL_INT;
        case AttributeType::UINT32:
            return GL_UNSIGNED_INT;
        default:
            return GL_FLOAT;
        }
    }
}
