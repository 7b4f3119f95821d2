#include "paint/render/render.h"
#include "paint/geometry/coordinate_transform.h"
#include "paint/symmetry/symmetry_engine.h"

#include <algorithm>

namespace paint {

void buildRenderList(
    const StrokeRange& visible,
    const StrokeData* inProgress,
    const SymmetryConfig& config,
    std::vector<StrokeData>& out
) {
    out.clear();
    const std::size_t perStroke = symmetry::isActive(config) ? static_cast<std::size_t>(config.axisCount) : 1;
    out.reserve((visible.size() + (inProgress ? 1 : 0)) * perStroke);

    for (const StrokeHandle& stroke : visible) {
        if (!stroke) continue;
        symmetry::expandInto(*stroke, config, out);
    }
    if (inProgress && !inProgress->points.empty()) {
        symmetry::expandInto(*inProgress, config, out);
    }
}

void rebuildLineBuffer(
    const std::vector<StrokeData>& strokes,
    const ViewTransformState& view,
    std::vector<float>& lineVertices,
    std::vector<RenderRange>* outRanges
) {
    lineVertices.clear();
    if (outRanges) outRanges->clear();

    std::size_t total = 0;
    for (const auto& s : strokes) total += s.points.size() * lineVertexFloats;
    if (lineVertices.capacity() < total) {
        lineVertices.reserve(std::max(total, defaultLineCapacityFloats));
    }
    if (outRanges) outRanges->reserve(strokes.size());

    // Same matrix for every vertex; compose once.
    const Matrix3 toRender = viewToRenderMatrix().multiply(canvasToViewMatrix(view));

    for (const auto& s : strokes) {
        const std::size_t start = lineVertices.size();
        const float axis = s.metadata.symmetryAxis < 0 ? 0.0f : static_cast<float>(s.metadata.symmetryAxis);
        for (const auto& p : s.points) {
            const Point2 r = toRender.transformPoint(p.x, p.y);
            lineVertices.push_back(static_cast<float>(r.x));
            lineVertices.push_back(static_cast<float>(r.y));
            lineVertices.push_back(p.pressure);
            lineVertices.push_back(axis);
        }
        if (outRanges) {
            outRanges->push_back(RenderRange{
                static_cast<std::uint32_t>(start),
                static_cast<std::uint32_t>(lineVertices.size() - start),
            });
        }
    }
}

} // namespace paint
