#include "paint/interaction/stroke_session.h"
#include "paint/history/history_buffer.h"
#include "paint/core/logging.h"
#include "paint/core/util.h"

#include <memory>
#include <utility>

StrokeSessionController::StrokeSessionController(HistoryBuffer& historyBuffer, NowFn now)
    : historyBuffer_(historyBuffer), now_(now ? now : &paint::nowEpochMs)
{
    currentStroke_.reserve(256);
}

void StrokeSessionController::resetSession() {
    state_ = SessionState::Idle;
    currentStroke_.clear();
    deviceType_ = DeviceType::Unknown;
}

std::string StrokeSessionController::nextStrokeId(std::int64_t commitMs) {
    idSequence_++;
    return "stroke_" + std::to_string(commitMs) + "_" + std::to_string(idSequence_);
}

StrokeData StrokeSessionController::inProgressStroke() const {
    StrokeData out;
    out.id = kInProgressStrokeId;
    out.points = currentStroke_;
    out.timestamp = currentStroke_.empty() ? 0 : currentStroke_.back().timestamp;
    out.metadata.deviceType = deviceType_;
    out.metadata.totalPoints = static_cast<std::uint32_t>(currentStroke_.size());
    return out;
}

bool StrokeSessionController::startStroke(const StrokePoint& point, DeviceType deviceType) {
    const bool replaced = isDrawing();
    if (replaced) {
        PAINT_LOG_DEBUG("startStroke while drawing: discarding %zu pending point(s)", currentStroke_.size());
        resetSession();
    }

    state_ = SessionState::Drawing;
    deviceType_ = deviceType;
    currentStroke_.push_back(point);
    return replaced;
}

bool StrokeSessionController::continueStroke(const StrokePoint& point) {
    if (!isDrawing()) return false;
    currentStroke_.push_back(point);
    return true;
}

StrokeHandle StrokeSessionController::endStroke(const StrokePoint& point) {
    if (!isDrawing()) return nullptr;

    currentStroke_.push_back(point);

    auto stroke = std::make_shared<StrokeData>();
    stroke->timestamp = now_();
    stroke->id = nextStrokeId(stroke->timestamp);
    stroke->points = std::move(currentStroke_);
    stroke->metadata.deviceType = deviceType_;
    stroke->metadata.totalPoints = static_cast<std::uint32_t>(stroke->points.size());

    StrokeHandle frozen = std::move(stroke);
    resetSession();
    historyBuffer_.commit(frozen);
    committedCount_++;
    return frozen;
}

bool StrokeSessionController::cancelStroke() {
    if (!isDrawing()) return false;
    resetSession();
    return true;
}
