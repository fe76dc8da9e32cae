/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_VERTEXARRAYOBJECT_H_
#define _CARTO_GPU_VERTEXARRAYOBJECT_H_

#include "GLContext.h"
#include "VertexBuffer.h"
#include "IndexBuffer.h"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace carto { namespace gpu {
    class Program;

    /**
     * Vertex array state of one segment drawn by one layer. The vertex array is rebuilt only when
     * the program, a buffer or the vertex offset differs from the previous bind.
     * Without vertex array support the attribute pointers are specified on every bind.
     */
    class VertexArrayObject final {
    public:
        explicit VertexArrayObject(GLContext& context);
        ~VertexArrayObject();

        VertexArrayObject(const VertexArrayObject&) = delete;
        VertexArrayObject& operator = (const VertexArrayObject&) = delete;

        GLuint getVertexArray() const { return _vertexArray; }

        void bind(const Program& program, VertexBuffer& layoutVertexBuffer, const std::vector<std::shared_ptr<VertexBuffer>>& paintVertexBuffers, IndexBuffer& indexBuffer, std::size_t vertexOffset, const std::array<std::shared_ptr<VertexBuffer>, 3>& dynamicVertexBuffers);
        void destroy();

    private:
        struct BindingKey {
            std::uint64_t programId;
            std::uint64_t layoutVertexBufferId;
            std::vector<std::uint64_t> paintVertexBufferIds;
            std::uint64_t indexBufferId;
            std::size_t vertexOffset;
            std::array<std::uint64_t, 3> dynamicVertexBufferIds;

            bool operator == (const BindingKey& other) const {
                return programId == other.programId && layoutVertexBufferId == other.layoutVertexBufferId && paintVertexBufferIds == other.paintVertexBufferIds && indexBufferId == other.indexBufferId && vertexOffset == other.vertexOffset && dynamicVertexBufferIds == other.dynamicVertexBufferIds;
            }
            bool operator != (const BindingKey& other) const { return !(*this == other); }
        };

        void freshBind(const Program& program, VertexBuffer& layoutVertexBuffer, const std::vector<std::shared_ptr<VertexBuffer>>& paintVertexBuffers, IndexBuffer& indexBuffer, std::size_t vertexOffset, const std::array<std::shared_ptr<VertexBuffer>, 3>& dynamicVertexBuffers);

        GLContext& _context;
        GLuint _vertexArray;
        std::optional<BindingKey> _bindingKey;
    };
} }

#endif
