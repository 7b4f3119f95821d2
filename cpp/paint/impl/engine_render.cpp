// PaintEngine render list and line buffer

#include "paint/engine.h"
#include "paint/internal/engine_state.h"

std::vector<StrokeData> PaintEngine::buildRenderList() const {
    const EngineState& s = state();
    std::vector<StrokeData> out;
    if (s.session_.isDrawing()) {
        const StrokeData inProgress = s.session_.inProgressStroke();
        paint::buildRenderList(s.historyBuffer_.visibleStrokes(), &inProgress, s.symmetryManager_.config(), out);
    } else {
        paint::buildRenderList(s.historyBuffer_.visibleStrokes(), nullptr, s.symmetryManager_.config(), out);
    }
    return out;
}

void PaintEngine::rebuildLineBuffer() const {
    const EngineState& s = state();
    const double t0 = emscripten_get_now();

    s.renderList = buildRenderList();
    paint::rebuildLineBuffer(s.renderList, s.viewTransform_.state(), s.lineVertices, &s.lineRanges);
    s.renderDirty = false;

    const double t1 = emscripten_get_now();
    s.lastRebuildMs = static_cast<float>(t1 - t0);
}

PaintEngine::BufferMeta PaintEngine::getLineBufferMeta() const {
    const EngineState& s = state();
    if (s.renderDirty) rebuildLineBuffer();
    const std::uint32_t vertexCount = static_cast<std::uint32_t>(s.lineVertices.size() / lineVertexFloats);
    const std::uint32_t capacityVertices = static_cast<std::uint32_t>(s.lineVertices.capacity() / lineVertexFloats);
    const std::uint32_t floatCount = static_cast<std::uint32_t>(s.lineVertices.size());
    return BufferMeta{s.generation, vertexCount, capacityVertices, floatCount, reinterpret_cast<std::uintptr_t>(s.lineVertices.data())};
}

const std::vector<paint::RenderRange>& PaintEngine::getLineRanges() const {
    const EngineState& s = state();
    if (s.renderDirty) rebuildLineBuffer();
    return s.lineRanges;
}

PaintEngine::RangeBufferMeta PaintEngine::getLineRangesMeta() const {
    const EngineState& s = state();
    if (s.renderDirty) rebuildLineBuffer();
    return RangeBufferMeta{
        s.generation,
        static_cast<std::uint32_t>(s.lineRanges.size()),
        reinterpret_cast<std::uintptr_t>(s.lineRanges.data()),
    };
}
