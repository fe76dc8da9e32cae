/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_INDEXBUFFER_H_
#define _CARTO_GPU_INDEXBUFFER_H_

#include "GLContext.h"

#include <cstdint>
#include <vector>

namespace carto { namespace gpu {
    class IndexBuffer final {
    public:
        explicit IndexBuffer(GLContext& context, const std::vector<std::uint16_t>& indices, bool dynamicDraw = false);
        ~IndexBuffer();

        IndexBuffer(const IndexBuffer&) = delete;
        IndexBuffer& operator = (const IndexBuffer&) = delete;

        std::uint64_t getId() const { return _id; }
        GLuint getBuffer() const { return _buffer; }
        std::size_t getLength() const { return _length; }
        bool isDynamicDraw() const { return _dynamicDraw; }

        void bind();
        void updateData(const std::vector<std::uint16_t>& indices);

    private:
        GLContext& _context;
        const std::uint64_t _id;
        const bool _dynamicDraw;
        std::size_t _length;
        GLuint _buffer;
    };
} }

#endif
