// PaintEngine construction, configuration setters, history and render access.
// Event plumbing lives in impl/engine_event.cpp, input and the host command
// buffer in impl/engine_input.cpp.
#include "paint/engine.h"
#include "paint/internal/engine_state.h"
#include "paint/core/logging.h"

#include <cmath>
#include <cstdlib>

EngineState::EngineState(const EngineConfig& config)
    : initialSymmetry(config.symmetry),
      initialBrush(config.brush),
      historyBuffer_(config.maxHistorySize),
      session_(historyBuffer_, config.now),
      symmetryManager_(config.symmetry),
      brush_(config.brush)
{
    eventQueue_.resize(kMaxEvents);
    lineVertices.reserve(defaultLineCapacityFloats);
}

PaintEngine::PaintEngine() : PaintEngine(EngineConfig{}) {}

PaintEngine::PaintEngine(const EngineConfig& config)
    : state_(std::make_unique<EngineState>(config))
{
    // Route the configured brush through the setter clamps.
    BrushSettings& b = state_->brush_;
    b.brushSize = std::isfinite(b.brushSize) ? paint::clampValue(b.brushSize, kMinBrushSize, kMaxBrushSize) : kDefaultBrushSize;
    b.opacity = std::isfinite(b.opacity) ? paint::clampValue(b.opacity, 0.0f, 1.0f) : 1.0f;
    for (float& c : b.color) c = std::isfinite(c) ? paint::clampValue(c, 0.0f, 1.0f) : 0.0f;
    state_->initialBrush = b;
}

PaintEngine::~PaintEngine() = default;

void PaintEngine::markRenderDirty() noexcept {
    state_->renderDirty = true;
    state_->generation++;
}

std::uint32_t PaintEngine::getGeneration() const noexcept {
    return state_->generation;
}

std::uintptr_t PaintEngine::allocBytes(std::uint32_t byteCount) {
    void* p = std::malloc(byteCount);
    return reinterpret_cast<std::uintptr_t>(p);
}

void PaintEngine::freeBytes(std::uintptr_t ptr) {
    std::free(reinterpret_cast<void*>(ptr));
}

void PaintEngine::reset() {
    EngineState& s = state();
    s.session_.cancelStroke();
    s.historyBuffer_.clear();

    s.symmetryManager_.reset();
    s.symmetryManager_.setEnabled(s.initialSymmetry.enabled);
    s.symmetryManager_.setAxisCount(s.initialSymmetry.axisCount);
    s.symmetryManager_.setCenterPoint(s.initialSymmetry.centerPoint);

    s.viewTransform_.reset();
    s.brush_ = s.initialBrush;

    clearEventState();
    clearError();
    recordEngineReset();
    flushPendingEvents();
}

// ==============================================================================
// Symmetry
// ==============================================================================

void PaintEngine::setSymmetryEnabled(bool enabled) {
    const std::uint32_t before = state_->symmetryManager_.getGeneration();
    state_->symmetryManager_.setEnabled(enabled);
    if (state_->symmetryManager_.getGeneration() != before) recordSymmetryChanged();
    flushPendingEvents();
}

void PaintEngine::toggleSymmetry() {
    state_->symmetryManager_.toggle();
    recordSymmetryChanged();
    flushPendingEvents();
}

void PaintEngine::setAxisCount(int axisCount) {
    const std::uint32_t before = state_->symmetryManager_.getGeneration();
    state_->symmetryManager_.setAxisCount(axisCount);
    if (state_->symmetryManager_.getGeneration() != before) recordSymmetryChanged();
    flushPendingEvents();
}

void PaintEngine::setCenterPoint(const Point2& center) {
    const std::uint32_t before = state_->symmetryManager_.getGeneration();
    state_->symmetryManager_.setCenterPoint(center);
    if (state_->symmetryManager_.getGeneration() != before) recordSymmetryChanged();
    flushPendingEvents();
}

void PaintEngine::resetSymmetry() {
    state_->symmetryManager_.reset();
    recordSymmetryChanged();
    flushPendingEvents();
}

const SymmetryConfig& PaintEngine::getSymmetryConfig() const noexcept {
    return state_->symmetryManager_.config();
}

// ==============================================================================
// History
// ==============================================================================

PaintEngine::HistoryMeta PaintEngine::getHistoryMeta() const noexcept {
    const HistoryBuffer& h = state_->historyBuffer_;
    return HistoryMeta{
        static_cast<std::uint32_t>(h.getHistorySize()),
        static_cast<std::uint32_t>(h.getCursor()),
        h.getGeneration(),
    };
}

bool PaintEngine::canUndo() const noexcept { return state_->historyBuffer_.canUndo(); }
bool PaintEngine::canRedo() const noexcept { return state_->historyBuffer_.canRedo(); }

void PaintEngine::undo() {
    if (!state_->historyBuffer_.undo()) {
        PAINT_LOG_DEBUG("undo: nothing to undo");
        return;
    }
    recordHistoryChanged();
    flushPendingEvents();
}

void PaintEngine::redo() {
    if (!state_->historyBuffer_.redo()) {
        PAINT_LOG_DEBUG("redo: nothing to redo");
        return;
    }
    recordHistoryChanged();
    flushPendingEvents();
}

void PaintEngine::clearHistory() {
    state_->historyBuffer_.clear();
    recordHistoryChanged();
    flushPendingEvents();
}

void PaintEngine::setMaxHistorySize(std::size_t maxHistorySize) {
    const std::uint32_t before = state_->historyBuffer_.getGeneration();
    state_->historyBuffer_.setMaxHistorySize(maxHistorySize);
    if (state_->historyBuffer_.getGeneration() != before) recordHistoryChanged();
    flushPendingEvents();
}

StrokeRange PaintEngine::getVisibleStrokes() const {
    return state_->historyBuffer_.visibleStrokes();
}

HistorySnapshotPtr PaintEngine::getHistorySnapshot() const noexcept {
    return state_->historyBuffer_.snapshot();
}

// ==============================================================================
// View
// ==============================================================================

void PaintEngine::updateViewTransform(const ViewTransformState& next) {
    const std::uint32_t before = state_->viewTransform_.getGeneration();
    state_->viewTransform_.update(next);
    if (state_->viewTransform_.getGeneration() != before) recordViewChanged();
    flushPendingEvents();
}

void PaintEngine::setZoom(double zoom) {
    const std::uint32_t before = state_->viewTransform_.getGeneration();
    state_->viewTransform_.setZoom(zoom);
    if (state_->viewTransform_.getGeneration() != before) recordViewChanged();
    flushPendingEvents();
}

void PaintEngine::setPan(double canvasX, double canvasY) {
    const std::uint32_t before = state_->viewTransform_.getGeneration();
    state_->viewTransform_.setPan(PanOffset{canvasX, canvasY});
    if (state_->viewTransform_.getGeneration() != before) recordViewChanged();
    flushPendingEvents();
}

void PaintEngine::setRotation(double radians) {
    const std::uint32_t before = state_->viewTransform_.getGeneration();
    state_->viewTransform_.setRotation(radians);
    if (state_->viewTransform_.getGeneration() != before) recordViewChanged();
    flushPendingEvents();
}

void PaintEngine::resetView() {
    state_->viewTransform_.reset();
    recordViewChanged();
    flushPendingEvents();
}

const ViewTransformState& PaintEngine::getViewTransform() const noexcept {
    return state_->viewTransform_.state();
}

// ==============================================================================
// Brush
// ==============================================================================

void PaintEngine::setBrushSize(float size) {
    applyBrushSize(size);
    flushPendingEvents();
}

void PaintEngine::setOpacity(float opacity) {
    applyOpacity(opacity);
    flushPendingEvents();
}

void PaintEngine::setColor(float r, float g, float b, float a) {
    applyColor(r, g, b, a);
    flushPendingEvents();
}

void PaintEngine::setBrush(const BrushSettings& brush) {
    applyColor(brush.color[0], brush.color[1], brush.color[2], brush.color[3]);
    applyBrushSize(brush.brushSize);
    applyOpacity(brush.opacity);
    flushPendingEvents();
}

void PaintEngine::applyBrushSize(float size) {
    if (!std::isfinite(size)) {
        PAINT_LOG_WARN("setBrushSize: ignoring non-finite size");
        return;
    }
    const float next = paint::clampValue(size, kMinBrushSize, kMaxBrushSize);
    if (next == state_->brush_.brushSize) return;
    state_->brush_.brushSize = next;
    recordBrushChanged();
}

void PaintEngine::applyOpacity(float opacity) {
    if (!std::isfinite(opacity)) {
        PAINT_LOG_WARN("setOpacity: ignoring non-finite opacity");
        return;
    }
    const float next = paint::clampValue(opacity, 0.0f, 1.0f);
    if (next == state_->brush_.opacity) return;
    state_->brush_.opacity = next;
    recordBrushChanged();
}

void PaintEngine::applyColor(float r, float g, float b, float a) {
    if (!std::isfinite(r) || !std::isfinite(g) || !std::isfinite(b) || !std::isfinite(a)) {
        PAINT_LOG_WARN("setColor: ignoring non-finite component");
        return;
    }
    const std::array<float, 4> next{
        paint::clampValue(r, 0.0f, 1.0f),
        paint::clampValue(g, 0.0f, 1.0f),
        paint::clampValue(b, 0.0f, 1.0f),
        paint::clampValue(a, 0.0f, 1.0f),
    };
    if (next == state_->brush_.color) return;
    state_->brush_.color = next;
    recordBrushChanged();
}

const BrushSettings& PaintEngine::getBrushSettings() const noexcept {
    return state_->brush_;
}

// ==============================================================================
// Errors & stats
// ==============================================================================

EngineError PaintEngine::getLastError() const noexcept { return state_->lastError; }
void PaintEngine::clearError() const noexcept { state_->lastError = EngineError::Ok; }
void PaintEngine::setError(EngineError err) const noexcept { state_->lastError = err; }

PaintEngine::EngineStats PaintEngine::getStats() const {
    const EngineState& s = state();
    if (s.renderDirty) rebuildLineBuffer();

    const StrokeRange visible = s.historyBuffer_.visibleStrokes();
    std::uint32_t committedPoints = 0;
    for (const StrokeHandle& stroke : visible) {
        committedPoints += static_cast<std::uint32_t>(stroke->points.size());
    }

    return EngineStats{
        s.generation,
        static_cast<std::uint32_t>(s.historyBuffer_.getHistorySize()),
        static_cast<std::uint32_t>(visible.size()),
        committedPoints,
        static_cast<std::uint32_t>(s.session_.currentPoints().size()),
        static_cast<std::uint32_t>(s.renderList.size()),
        static_cast<std::uint32_t>(s.lineVertices.size() / lineVertexFloats),
        s.lastRebuildMs,
        s.lastApplyMs,
    };
}
