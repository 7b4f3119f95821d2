#pragma once

#include "paint/core/types.h"
#include <cstdint>

struct PanOffset {
    double canvasX = 0.0;
    double canvasY = 0.0;
};

// Zoom/pan/rotation applied on top of Canvas space to obtain View space.
struct ViewTransformState {
    double zoom = 1.0;
    PanOffset panOffset{};
    double rotation = 0.0; // radians, normalized to [0, 2pi)
};

namespace paint {

double clampZoom(double zoom) noexcept;
double normalizeRotation(double radians) noexcept;

} // namespace paint

// Owns the process-lifetime ViewTransformState. Every write goes through the
// same clamps so the published state always satisfies zoom in [0.1, 10] and
// rotation in [0, 2pi).
class ViewTransformManager {
public:
    ViewTransformManager() = default;

    const ViewTransformState& state() const noexcept { return state_; }
    std::uint32_t getGeneration() const noexcept { return generation_; }

    void setZoom(double zoom);
    void setPan(const PanOffset& pan);
    void setRotation(double radians);
    void update(const ViewTransformState& next);
    void reset();

    bool isIdentity() const noexcept;

private:
    ViewTransformState state_{};
    std::uint32_t generation_ = 0;
};
