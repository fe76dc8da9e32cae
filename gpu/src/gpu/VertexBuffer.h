/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_VERTEXBUFFER_H_
#define _CARTO_GPU_VERTEXBUFFER_H_

#include "GLContext.h"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <utility>

namespace carto { namespace gpu {
    enum class AttributeType {
        INT8, UINT8, INT16, UINT16, INT32, UINT32, FLOAT32
    };

    struct VertexAttribute {
        std::string name;
        AttributeType type;
        int components;
        std::size_t offset;
        bool normalized;

        explicit VertexAttribute(std::string name, AttributeType type, int components, std::size_t offset, bool normalized = false) : name(std::move(name)), type(type), components(components), offset(offset), normalized(normalized) { }
    };

    class VertexBuffer final {
    public:
        explicit VertexBuffer(GLContext& context, std::vector<VertexAttribute> attributes, std::size_t itemSize, const std::vector<std::uint8_t>& data, bool dynamicDraw = false);
        ~VertexBuffer();

        VertexBuffer(const VertexBuffer&) = delete;
        VertexBuffer& operator = (const VertexBuffer&) = delete;

        std::uint64_t getId() const { return _id; }
        GLuint getBuffer() const { return _buffer; }
        const std::vector<VertexAttribute>& getAttributes() const { return _attributes; }
        std::size_t getItemSize() const { return _itemSize; }
        std::size_t getLength() const { return _length; }
        bool isDynamicDraw() const { return _dynamicDraw; }

        void bind();
        void updateData(const std::vector<std::uint8_t>& data);

        void getAttributeIndices(const std::map<std::string, int>& programAttributes, std::set<GLuint>& indices) const;
        void setVertexAttribPointers(const std::map<std::string, int>& programAttributes, std::size_t vertexOffset);

    private:
        static GLenum getGLType(AttributeType type);

        GLContext& _context;
        const std::uint64_t _id;
        const std::vector<VertexAttribute> _attributes;
        const std::size_t _itemSize;
        const bool _dynamicDraw;
        std::size_t _length;
        GLuint _buffer;
    };
} }

#endif
