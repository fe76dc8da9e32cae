/*
 * Copyright (c) 2016 CartoDB. All rights reserved.
 * Copying and using this code is allowed only according
 * to license terms, as given in https://cartodb.com/terms/
 */

#ifndef _CARTO_GPU_SEGMENT_H_
#define _CARTO_GPU_SEGMENT_H_

#include "VertexArrayObject.h"
#include "Logger.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace carto { namespace gpu {
    /**
     * Contiguous range of vertices and primitives of a geometry batch, with the vertex array
     * bindings of the layers drawing it.
     */
    struct Segment {
        std::size_t vertexOffset;
        std::size_t primitiveOffset;
        std::size_t vertexLength;
        std::size_t primitiveLength;
        std::optional<float> sortKey;
        std::unordered_map<std::string, std::unique_ptr<VertexArrayObject>> vertexArrays;

        explicit Segment(std::size_t vertexOffset, std::size_t primitiveOffset, std::size_t vertexLength = 0, std::size_t primitiveLength = 0, std::optional<float> sortKey = std::optional<float>()) : vertexOffset(vertexOffset), primitiveOffset(primitiveOffset), vertexLength(vertexLength), primitiveLength(primitiveLength), sortKey(sortKey), vertexArrays() { }

        VertexArrayObject& getVertexArray(GLContext& context, const std::string& layerId);
    };

    class SegmentVector final {
    public:
        // Largest vertex count addressable by 16-bit indices
        static constexpr std::size_t MAX_VERTEX_ARRAY_LENGTH = 65535;

        explicit SegmentVector(std::shared_ptr<Logger> logger);

        SegmentVector(const SegmentVector&) = delete;
        SegmentVector& operator = (const SegmentVector&) = delete;
        SegmentVector(SegmentVector&&) = default;

        bool empty() const { return _segments.empty(); }
        std::size_t size() const { return _segments.size(); }
        Segment& operator [] (std::size_t index) { return *_segments.at(index); }
        const Segment& operator [] (std::size_t index) const { return *_segments.at(index); }

        // Returns the segment the next numVertices vertices are appended to, starting a new one when needed
        Segment& prepareSegment(std::size_t numVertices, std::size_t layoutVertexLength, std::size_t indexArrayLength, std::optional<float> sortKey = std::optional<float>());

        void destroy();

        static SegmentVector simpleSegment(std::shared_ptr<Logger> logger, std::size_t vertexOffset, std::size_t primitiveOffset, std::size_t vertexLength, std::size_t primitiveLength);

    private:
        std::shared_ptr<Logger> _logger;
        std::vector<std::unique_ptr<Segment>> _segments;
    };
} }

#endif
