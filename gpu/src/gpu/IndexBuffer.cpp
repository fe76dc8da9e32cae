#include "IndexBuffer.h"

#include <atomic>
#include <stdexcept>

namespace {
    std::uint64_t nextIndexBufferId() {
        static std::atomic<std::uint64_t> counter(0);
        return ++counter;
    }
}

namespace carto::gpu {
    IndexBuffer::IndexBuffer(GLContext& context, const std::vector<std::uint16_t>& indices, bool dynamicDraw) :
        _context(context), _id(nextIndexBufferId()), _dynamicDraw(dynamicDraw), _length(indices.size()), _buffer(0)
    {
        _buffer = _context.getDevice().createBuffer();
        // Binding the element buffer would modify the currently bound vertex array
        _context.bindVertexArray(0);
        _context.bindElementBuffer(_buffer);
        _context.getDevice().bufferData(GL_ELEMENT_ARRAY_BUFFER, static_cast<GLsizeiptr>(indices.size() * sizeof(std::uint16_t)), indices.data(), _dynamicDraw ? GL_DYNAMIC_DRAW : GL_STATIC_DRAW);
    }

    IndexBuffer::~IndexBuffer() {
        if (_buffer != 0) {
            _context.forgetBuffer(_buffer);
            _context.getDevice().deleteBuffer(_buffer);
        }
    }

    void IndexBuffer::bind() {
        _context.bindElementBuffer(_buffer);
    }

    void IndexBuffer::updateData(const std::vector<std::uint16_t>& indices) {
        if (!_dynamicDraw) {
            throw std::logic_error("Static index buffers cannot be updated");
        }
        if (indices.size() != _length) {
            throw std::invalid_argument("Index data length does not match the buffer length");
        }
        _context.bindVertexArray(0);
        bind();
        _context.getDevice().bufferSubData(GL_ELEMENT_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(indices.size() * sizeof(std::uint16_t)), indices.data());
    }
}
