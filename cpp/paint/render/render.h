#ifndef PAINT_RENDER_H
#define PAINT_RENDER_H

#include "paint/core/types.h"
#include "paint/history/history_buffer.h"
#include "paint/view/view_transform.h"
#include <cstdint>
#include <vector>

namespace paint {

struct RenderRange {
    std::uint32_t offset; // float offset into line buffer
    std::uint32_t count;  // float count
};

// Flattens the visible history (plus the stroke in progress, when given)
// into the list the renderer draws: every stroke replaced by its symmetry
// copies, in history order, in-progress stroke last.
void buildRenderList(
    const StrokeRange& visible,
    const StrokeData* inProgress,
    const SymmetryConfig& config,
    std::vector<StrokeData>& out
);

// Rebuild the line vertex buffer from an already expanded render list.
// Vertex layout: renderX, renderY, pressure, axis (4 floats). One range is
// written per stroke, in the same order as `strokes`.
void rebuildLineBuffer(
    const std::vector<StrokeData>& strokes,
    const ViewTransformState& view,
    std::vector<float>& lineVertices,
    std::vector<RenderRange>* outRanges
);

} // namespace paint

#endif // PAINT_RENDER_H
