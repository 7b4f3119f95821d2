#pragma once

#include "paint/core/types.h"
#include <cstdint>

enum class InputEventType : std::uint8_t {
    Start = 0,
    Move = 1,
    End = 2,
};

// Sample produced by the upstream input normaliser: already resampled,
// smoothed and expressed in Canvas space.
struct NormalizedInputEvent {
    InputEventType type = InputEventType::Move;
    double canvasX = 0.0;
    double canvasY = 0.0;
    float pressure = 0.5f;
    std::int64_t timestamp = 0;
    DeviceType deviceType = DeviceType::Unknown;
};

inline StrokePoint toStrokePoint(const NormalizedInputEvent& ev) noexcept {
    return StrokePoint{ev.canvasX, ev.canvasY, ev.pressure, ev.timestamp};
}
