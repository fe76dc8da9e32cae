#include "VertexArrayObject.h"
#include "Program.h"

#include <set>

namespace carto::gpu {
    VertexArrayObject::VertexArrayObject(GLContext& context) :
        _context(context), _vertexArray(0), _bindingKey()
    {
    }

    VertexArrayObject::~VertexArrayObject() {
        destroy();
    }

    void VertexArrayObject::bind(const Program& program, VertexBuffer& layoutVertexBuffer, const std::vector<std::shared_ptr<VertexBuffer>>& paintVertexBuffers, IndexBuffer& indexBuffer, std::size_t vertexOffset, const std::array<std::shared_ptr<VertexBuffer>, 3>& dynamicVertexBuffers) {
        BindingKey bindingKey;
        bindingKey.programId = program.getId();
        bindingKey.layoutVertexBufferId = layoutVertexBuffer.getId();
        for (const std::shared_ptr<VertexBuffer>& buffer : paintVertexBuffers) {
            bindingKey.paintVertexBufferIds.push_back(buffer ? buffer->getId() : 0);
        }
        bindingKey.indexBufferId = indexBuffer.getId();
        bindingKey.vertexOffset = vertexOffset;
        for (std::size_t i = 0; i < dynamicVertexBuffers.size(); i++) {
            bindingKey.dynamicVertexBufferIds[i] = (dynamicVertexBuffers[i] ? dynamicVertexBuffers[i]->getId() : 0);
        }

        if (_vertexArray == 0 || !_bindingKey || *_bindingKey != bindingKey) {
            freshBind(program, layoutVertexBuffer, paintVertexBuffers, indexBuffer, vertexOffset, dynamicVertexBuffers);
            if (_vertexArray != 0) {
                _bindingKey = bindingKey;
            }
        } else {
            _context.bindVertexArray(_vertexArray);
        }
    }

    void VertexArrayObject::destroy() {
        if (_vertexArray != 0) {
            _context.deleteVertexArray(_vertexArray);
            _vertexArray = 0;
        }
        _bindingKey.reset();
    }

    void VertexArrayObject::freshBind(const Program& program, VertexBuffer& layoutVertexBuffer, const std::vector<std::shared_ptr<VertexBuffer>>& paintVertexBuffers, IndexBuffer& indexBuffer, std::size_t vertexOffset, const std::array<std::shared_ptr<VertexBuffer>, 3>& dynamicVertexBuffers) {
        destroy();

        _vertexArray = _context.createVertexArray();
        _context.bindVertexArray(_vertexArray);

        std::vector<VertexBuffer*> buffers;
        buffers.push_back(&layoutVertexBuffer);
        for (const std::shared_ptr<VertexBuffer>& buffer : paintVertexBuffers) {
            if (buffer) {
                buffers.push_back(buffer.get());
            }
        }
        for (const std::shared_ptr<VertexBuffer>& buffer : dynamicVertexBuffers) {
            if (buffer) {
                buffers.push_back(buffer.get());
            }
        }

        const std::map<std::string, int>& attributes = program.getAttributes();
        std::set<GLuint> attributeIndices;
        for (VertexBuffer* buffer : buffers) {
            buffer->getAttributeIndices(attributes, attributeIndices);
        }
        _context.enableVertexAttribArrays(attributeIndices);
        for (VertexBuffer* buffer : buffers) {
            buffer->bind();
            buffer->setVertexAttribPointers(attributes, vertexOffset);
        }
        indexBuffer.bind();
    }
}
