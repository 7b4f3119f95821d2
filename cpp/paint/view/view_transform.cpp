#include "paint/view/view_transform.h"
#include "paint/core/logging.h"
#include "paint/core/util.h"

#include <cmath>

namespace paint {

namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;
}

double clampZoom(double zoom) noexcept {
    return clampValue(zoom, kMinZoom, kMaxZoom);
}

double normalizeRotation(double radians) noexcept {
    double r = std::fmod(radians, kTwoPi);
    if (r < 0.0) r += kTwoPi;
    // fmod of a tiny negative value can round back up to exactly 2pi
    if (r >= kTwoPi) r = 0.0;
    return r;
}

} // namespace paint

void ViewTransformManager::setZoom(double zoom) {
    if (!std::isfinite(zoom)) {
        PAINT_LOG_WARN("setZoom: ignoring non-finite zoom");
        return;
    }
    const double next = paint::clampZoom(zoom);
    if (next == state_.zoom) return;
    state_.zoom = next;
    generation_++;
}

void ViewTransformManager::setPan(const PanOffset& pan) {
    if (!std::isfinite(pan.canvasX) || !std::isfinite(pan.canvasY)) {
        PAINT_LOG_WARN("setPan: ignoring non-finite offset");
        return;
    }
    if (pan.canvasX == state_.panOffset.canvasX && pan.canvasY == state_.panOffset.canvasY) return;
    state_.panOffset = pan;
    generation_++;
}

void ViewTransformManager::setRotation(double radians) {
    if (!std::isfinite(radians)) {
        PAINT_LOG_WARN("setRotation: ignoring non-finite angle");
        return;
    }
    const double next = paint::normalizeRotation(radians);
    if (next == state_.rotation) return;
    state_.rotation = next;
    generation_++;
}

void ViewTransformManager::update(const ViewTransformState& next) {
    setZoom(next.zoom);
    setPan(next.panOffset);
    setRotation(next.rotation);
}

void ViewTransformManager::reset() {
    state_ = ViewTransformState{};
    generation_++;
}

bool ViewTransformManager::isIdentity() const noexcept {
    return state_.zoom == 1.0
        && state_.panOffset.canvasX == 0.0
        && state_.panOffset.canvasY == 0.0
        && state_.rotation == 0.0;
}
