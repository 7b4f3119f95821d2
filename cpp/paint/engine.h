#pragma once

#include "paint/core/types.h"
#include "paint/core/util.h"
#include "paint/history/history_buffer.h"
#include "paint/interaction/input_event.h"
#include "paint/interaction/stroke_session.h"
#include "paint/protocol/protocol_types.h"
#include "paint/render/render.h"
#include "paint/view/view_transform.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

struct EngineState;

// Runtime configuration applied at construction. Every field goes through
// the same clamps as the corresponding setter.
struct EngineConfig {
    std::size_t maxHistorySize = kDefaultMaxHistorySize;
    SymmetryConfig symmetry{};
    BrushSettings brush{};
    // Clock used for commit timestamps; nullptr selects wall-clock time.
    StrokeSessionController::NowFn now = nullptr;
};

// Observer notified synchronously at the end of every mutation that changed
// something. `events` holds the coalesced events of that mutation, in order.
class PaintEngineListener {
public:
    virtual ~PaintEngineListener() = default;
    virtual void onEngineEvents(const paint::protocol::EngineEvent* events, std::size_t count) = 0;
};

class PaintEngine {
    friend class PaintEngineTestAccessor;
public:
    using EngineEvent = paint::protocol::EngineEvent;
    using EventType = paint::protocol::EventType;
    using CommandOp = paint::protocol::CommandOp;

    PaintEngine();
    explicit PaintEngine(const EngineConfig& config);
    ~PaintEngine();

    PaintEngine(const PaintEngine&) = delete;
    PaintEngine& operator=(const PaintEngine&) = delete;

    // Drops history, the stroke in progress and queued events; restores
    // symmetry, view and brush to the construction-time configuration.
    void reset();

    // ==============================================================================
    // Input
    // ==============================================================================
    void handleInputEvent(const NormalizedInputEvent& ev);
    void beginStroke(const StrokePoint& point, DeviceType deviceType = DeviceType::Unknown);
    void continueStroke(const StrokePoint& point);
    // Returns the committed stroke, or nullptr when no stroke was in progress.
    StrokeHandle endStroke(const StrokePoint& point);
    void cancelStroke();

    SessionState getSessionState() const noexcept;
    bool isDrawing() const noexcept { return getSessionState() == SessionState::Drawing; }
    const std::vector<StrokePoint>& getCurrentPoints() const noexcept;

    // ==============================================================================
    // Symmetry
    // ==============================================================================
    void setSymmetryEnabled(bool enabled);
    void toggleSymmetry();
    void setAxisCount(int axisCount);
    void setCenterPoint(const Point2& center);
    void resetSymmetry();
    const SymmetryConfig& getSymmetryConfig() const noexcept;

    // ==============================================================================
    // History
    // ==============================================================================
    struct HistoryMeta {
        std::uint32_t depth;
        std::uint32_t cursor;
        std::uint32_t generation;
    };

    HistoryMeta getHistoryMeta() const noexcept;
    bool canUndo() const noexcept;
    bool canRedo() const noexcept;
    void undo();
    void redo();
    void clearHistory();
    void setMaxHistorySize(std::size_t maxHistorySize);

    StrokeRange getVisibleStrokes() const;
    HistorySnapshotPtr getHistorySnapshot() const noexcept;

    // ==============================================================================
    // View
    // ==============================================================================
    void updateViewTransform(const ViewTransformState& next);
    void setZoom(double zoom);
    void setPan(double canvasX, double canvasY);
    void setRotation(double radians);
    void resetView();
    const ViewTransformState& getViewTransform() const noexcept;

    // ==============================================================================
    // Brush
    // ==============================================================================
    void setBrushSize(float size);
    void setOpacity(float opacity);
    void setColor(float r, float g, float b, float a);
    // Applies every field through the same clamps and publishes one change.
    void setBrush(const BrushSettings& brush);
    const BrushSettings& getBrushSettings() const noexcept;

    // ==============================================================================
    // Render
    // ==============================================================================
    // Committed visible strokes plus the stroke in progress, each expanded
    // into its symmetry copies.
    std::vector<StrokeData> buildRenderList() const;

    struct BufferMeta {
        std::uint32_t generation;
        std::uint32_t vertexCount;
        std::uint32_t capacity;   // in vertices
        std::uint32_t floatCount; // convenience for view length
        std::uintptr_t ptr;       // byte offset in WASM linear memory
    };

    void rebuildLineBuffer() const;
    BufferMeta getLineBufferMeta() const;
    const std::vector<paint::RenderRange>& getLineRanges() const;

    struct RangeBufferMeta {
        std::uint32_t generation;
        std::uint32_t count;      // in ranges
        std::uintptr_t ptr;       // RenderRange array in WASM linear memory
    };

    RangeBufferMeta getLineRangesMeta() const;

    // ==============================================================================
    // Events
    // ==============================================================================
    struct EventBufferMeta {
        std::uint32_t generation;
        std::uint32_t count;
        std::uintptr_t ptr;
    };

    EventBufferMeta pollEvents(std::uint32_t maxEvents);
    void ackResync(std::uint32_t resyncGeneration);

    // Listeners are not owned; remove them before they are destroyed.
    void addListener(PaintEngineListener* listener);
    void removeListener(PaintEngineListener* listener);

    // ==============================================================================
    // Host command buffer
    // ==============================================================================
    // Scratch memory the host writes command buffers into.
    std::uintptr_t allocBytes(std::uint32_t byteCount);
    void freeBytes(std::uintptr_t ptr);

    void applyCommandBuffer(std::uintptr_t ptr, std::uint32_t byteCount);
    EngineError getLastError() const noexcept;
    void clearError() const noexcept;

    struct EngineStats {
        std::uint32_t generation;
        std::uint32_t strokeCount;
        std::uint32_t visibleStrokeCount;
        std::uint32_t committedPointCount;
        std::uint32_t inProgressPointCount;
        std::uint32_t renderStrokeCount;
        std::uint32_t lineVertexCount;
        float lastRebuildMs;
        float lastApplyMs;
    };

    EngineStats getStats() const;
    std::uint32_t getGeneration() const noexcept;

private:
    EngineState& state() noexcept { return *state_; }
    const EngineState& state() const noexcept { return *state_; }

    void setError(EngineError err) const noexcept;

    // Brush writes without publishing; callers flush.
    void applyBrushSize(float size);
    void applyOpacity(float opacity);
    void applyColor(float r, float g, float b, float a);

    // Event recording (impl/engine_event.cpp)
    void clearEventState();
    void recordHistoryChanged();
    void recordSessionChanged();
    void recordStrokeCommitted(const StrokeData& stroke);
    void recordSymmetryChanged();
    void recordViewChanged();
    void recordBrushChanged();
    void recordEngineReset();
    bool pushEvent(const EngineEvent& ev);
    void flushPendingEvents();
    void notifyListeners(const std::vector<EngineEvent>& batch);

    // Marks the render data stale and advances the engine generation.
    void markRenderDirty() noexcept;

    std::unique_ptr<EngineState> state_;
};
