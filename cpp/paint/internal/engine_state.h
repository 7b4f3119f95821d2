#pragma once

#include "paint/core/types.h"
#include "paint/history/history_buffer.h"
#include "paint/interaction/stroke_session.h"
#include "paint/protocol/protocol_types.h"
#include "paint/render/render.h"
#include "paint/symmetry/symmetry_engine.h"
#include "paint/view/view_transform.h"

#include <cstddef>
#include <cstdint>
#include <vector>

class PaintEngineListener;
struct EngineConfig;

// Everything a PaintEngine owns. Each piece of state has exactly one owner
// here; collaborators only ever receive const views of it.
struct EngineState {
    explicit EngineState(const EngineConfig& config);

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;

    // Construction-time configuration, restored by PaintEngine::reset().
    SymmetryConfig initialSymmetry{};
    BrushSettings initialBrush{};

    HistoryBuffer historyBuffer_;
    StrokeSessionController session_;
    SymmetryManager symmetryManager_;
    ViewTransformManager viewTransform_;
    BrushSettings brush_{};

    mutable std::vector<StrokeData> renderList;
    mutable std::vector<float> lineVertices;
    mutable std::vector<paint::RenderRange> lineRanges;
    mutable bool renderDirty{true};
    mutable float lastRebuildMs{0.0f};
    float lastApplyMs{0.0f};
    std::uint32_t generation{0};

    static constexpr std::size_t kMaxEvents = 2048;
    std::vector<paint::protocol::EngineEvent> eventQueue_{};
    std::size_t eventHead_{0};
    std::size_t eventTail_{0};
    std::size_t eventCount_{0};
    bool eventOverflowed_{false};
    std::uint32_t eventOverflowGeneration_{0};
    std::vector<paint::protocol::EngineEvent> eventBuffer_{};

    bool pendingEngineReset_{false};
    bool pendingSessionChanged_{false};
    bool pendingStrokeCommitted_{false};
    std::uint32_t pendingCommittedPoints_{0};
    bool pendingHistoryChanged_{false};
    bool pendingSymmetryChanged_{false};
    bool pendingViewChanged_{false};
    bool pendingBrushChanged_{false};

    std::vector<PaintEngineListener*> listeners_{};

    mutable EngineError lastError{EngineError::Ok};
};
