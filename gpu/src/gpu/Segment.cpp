#include "Segment.h"

namespace carto::gpu {
    VertexArrayObject& Segment::getVertexArray(GLContext& context, const std::string& layerId) {
        std::unique_ptr<VertexArrayObject>& vertexArray = vertexArrays[layerId];
        if (!vertexArray) {
            vertexArray = std::make_unique<VertexArrayObject>(context);
        }
        return *vertexArray;
    }

    SegmentVector::SegmentVector(std::shared_ptr<Logger> logger) :
        _logger(std::move(logger)), _segments()
    {
    }

    Segment& SegmentVector::prepareSegment(std::size_t numVertices, std::size_t layoutVertexLength, std::size_t indexArrayLength, std::optional<float> sortKey) {
        if (numVertices > MAX_VERTEX_ARRAY_LENGTH && _logger) {
            _logger->write(Logger::Severity::WARNING, "Max vertices per segment is " + std::to_string(MAX_VERTEX_ARRAY_LENGTH) + ": bucket requested " + std::to_string(numVertices));
        }

        if (!_segments.empty()) {
            Segment& segment = *_segments.back();
            if (segment.vertexLength + numVertices <= MAX_VERTEX_ARRAY_LENGTH && segment.sortKey == sortKey) {
                return segment;
            }
        }

        _segments.push_back(std::make_unique<Segment>(layoutVertexLength, indexArrayLength, 0, 0, sortKey));
        return *_segments.back();
    }

    void SegmentVector::destroy() {
        for (const std::unique_ptr<Segment>& segment : _segments) {
            for (auto it = segment->vertexArrays.begin(); it != segment->vertexArrays.end(); it++) {
                it->second->destroy();
            }
            segment->vertexArrays.clear();
        }
    }

    SegmentVector SegmentVector::simpleSegment(std::shared_ptr<Logger> logger, std::size_t vertexOffset, std::size_t primitiveOffset, std::size_t vertexLength, std::size_t primitiveLength) {
        SegmentVector segments(std::move(logger));
        segments._segments.push_back(std::make_unique<Segment>(vertexOffset, primitiveOffset, vertexLength, primitiveLength));
        return segments;
    }
}
