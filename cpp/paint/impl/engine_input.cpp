// PaintEngine input handling and host command buffer entry point

#include "paint/engine.h"
#include "paint/internal/engine_state.h"
#include "paint/command/commands.h"
#include "paint/command/command_dispatch.h"
#include "paint/core/logging.h"

#include <cmath>

namespace {

bool isFiniteSample(const StrokePoint& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.pressure);
}

} // namespace

void PaintEngine::handleInputEvent(const NormalizedInputEvent& ev) {
    const StrokePoint point = toStrokePoint(ev);
    switch (ev.type) {
        case InputEventType::Start:
            beginStroke(point, ev.deviceType);
            break;
        case InputEventType::Move:
            continueStroke(point);
            break;
        case InputEventType::End:
            endStroke(point);
            break;
    }
}

void PaintEngine::beginStroke(const StrokePoint& point, DeviceType deviceType) {
    if (!isFiniteSample(point)) {
        PAINT_LOG_WARN("beginStroke: ignoring non-finite sample");
        return;
    }
    state_->session_.startStroke(point, deviceType);
    recordSessionChanged();
    flushPendingEvents();
}

void PaintEngine::continueStroke(const StrokePoint& point) {
    if (!isFiniteSample(point)) {
        PAINT_LOG_WARN("continueStroke: ignoring non-finite sample");
        return;
    }
    if (!state_->session_.continueStroke(point)) {
        PAINT_LOG_DEBUG("continueStroke: no stroke in progress");
        return;
    }
    recordSessionChanged();
    flushPendingEvents();
}

StrokeHandle PaintEngine::endStroke(const StrokePoint& point) {
    if (!isFiniteSample(point)) {
        PAINT_LOG_WARN("endStroke: ignoring non-finite sample");
        return nullptr;
    }
    StrokeHandle committed = state_->session_.endStroke(point);
    if (!committed) {
        PAINT_LOG_DEBUG("endStroke: no stroke in progress");
        return nullptr;
    }
    recordSessionChanged();
    recordStrokeCommitted(*committed);
    flushPendingEvents();
    return committed;
}

void PaintEngine::cancelStroke() {
    if (!state_->session_.cancelStroke()) {
        PAINT_LOG_DEBUG("cancelStroke: no stroke in progress");
        return;
    }
    recordSessionChanged();
    flushPendingEvents();
}

SessionState PaintEngine::getSessionState() const noexcept {
    return state_->session_.state();
}

const std::vector<StrokePoint>& PaintEngine::getCurrentPoints() const noexcept {
    return state_->session_.currentPoints();
}

void PaintEngine::applyCommandBuffer(std::uintptr_t ptr, std::uint32_t byteCount) {
    clearError();
    const double t0 = emscripten_get_now();
    const std::uint8_t* src = reinterpret_cast<const std::uint8_t*>(ptr);

    auto commandCallback = [](void* ctx, std::uint32_t op, std::uint32_t id, const std::uint8_t* payload, std::uint32_t payloadByteCount) -> EngineError {
        return paint::dispatchCommand(reinterpret_cast<PaintEngine*>(ctx), op, id, payload, payloadByteCount);
    };

    const EngineError err = paint::parseCommandBuffer(src, byteCount, commandCallback, this);
    if (err != EngineError::Ok) {
        PAINT_LOG_WARN("applyCommandBuffer: rejected with error %u", static_cast<unsigned>(err));
        setError(err);
    }

    const double t1 = emscripten_get_now();
    state_->lastApplyMs = static_cast<float>(t1 - t0);
}
