#pragma once

#include "paint/core/types.h"
#include <cstdint>
#include <string>
#include <vector>

class HistoryBuffer; // Commit target

enum class SessionState : std::uint8_t {
    Idle = 0,
    Drawing = 1,
};

// Turns a stream of positioned samples into committed strokes.
//
//   Idle    --start-->    Drawing   stroke = [point]
//   Drawing --continue--> Drawing   point appended
//   Drawing --end-->      Idle      point appended, stroke frozen and committed
//   Drawing --cancel-->   Idle      stroke discarded
//
// continue/end/cancel while Idle are ignored. A start while Drawing cancels
// the stroke in progress (nothing is committed) and begins a new one.
class StrokeSessionController {
public:
    using NowFn = std::int64_t(*)();

    static constexpr const char* kInProgressStrokeId = "in_progress";

    explicit StrokeSessionController(HistoryBuffer& historyBuffer, NowFn now = nullptr);

    // ==============================================================================
    // State Query
    // ==============================================================================
    SessionState state() const noexcept { return state_; }
    bool isDrawing() const noexcept { return state_ == SessionState::Drawing; }
    const std::vector<StrokePoint>& currentPoints() const noexcept { return currentStroke_; }
    DeviceType currentDeviceType() const noexcept { return deviceType_; }

    // Provisional StrokeData for the stroke in progress (id "in_progress").
    // Only meaningful while Drawing.
    StrokeData inProgressStroke() const;

    // ==============================================================================
    // Transitions
    // ==============================================================================
    // Returns true when a stroke in progress was implicitly cancelled.
    bool startStroke(const StrokePoint& point, DeviceType deviceType = DeviceType::Unknown);
    // Returns false when ignored (no session).
    bool continueStroke(const StrokePoint& point);
    // Returns the committed stroke, or nullptr when ignored (no session).
    StrokeHandle endStroke(const StrokePoint& point);
    // Returns false when ignored (no session).
    bool cancelStroke();

    std::uint32_t getCommittedCount() const noexcept { return committedCount_; }

private:
    std::string nextStrokeId(std::int64_t commitMs);
    void resetSession();

    HistoryBuffer& historyBuffer_;
    NowFn now_;

    SessionState state_ = SessionState::Idle;
    std::vector<StrokePoint> currentStroke_;
    DeviceType deviceType_ = DeviceType::Unknown;

    std::uint32_t committedCount_ = 0;
    std::uint64_t idSequence_ = 0;
};
