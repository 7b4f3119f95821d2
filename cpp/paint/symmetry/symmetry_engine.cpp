#include "paint/symmetry/symmetry_engine.h"
#include "paint/core/logging.h"
#include "paint/core/util.h"

#include <cmath>

namespace paint::symmetry {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

Point2 applyRotation(double x, double y, const Point2& center, double cosT, double sinT) noexcept {
    const double dx = x - center.x;
    const double dy = y - center.y;
    return Point2{center.x + dx * cosT - dy * sinT, center.y + dx * sinT + dy * cosT};
}

StrokePoint rotateSample(const StrokePoint& p, const Point2& center, double cosT, double sinT) noexcept {
    const Point2 r = applyRotation(p.x, p.y, center, cosT, sinT);
    return StrokePoint{r.x, r.y, p.pressure, p.timestamp};
}

} // namespace

double axisAngle(int axisIndex, int axisCount) noexcept {
    if (axisCount <= 0) return 0.0;
    return kTwoPi * static_cast<double>(axisIndex) / static_cast<double>(axisCount);
}

Point2 rotateAbout(const Point2& p, const Point2& center, double theta) noexcept {
    return applyRotation(p.x, p.y, center, std::cos(theta), std::sin(theta));
}

bool isActive(const SymmetryConfig& config) noexcept {
    return config.enabled && config.axisCount > 1;
}

std::string copyId(const std::string& sourceId, int axisIndex) {
    return sourceId + "_axis_" + std::to_string(axisIndex);
}

void expandInto(const StrokeData& stroke, const SymmetryConfig& config, std::vector<StrokeData>& out) {
    if (!isActive(config)) {
        out.push_back(stroke);
        return;
    }

    const int n = config.axisCount;
    out.reserve(out.size() + static_cast<std::size_t>(n));
    for (int k = 0; k < n; ++k) {
        StrokeData copy;
        copy.id = copyId(stroke.id, k);
        copy.timestamp = stroke.timestamp;
        copy.metadata = stroke.metadata;
        copy.metadata.symmetryAxis = k;
        copy.metadata.sourceStrokeId = stroke.id;

        if (k == 0) {
            copy.points = stroke.points;
        } else {
            const double theta = axisAngle(k, n);
            const double cosT = std::cos(theta);
            const double sinT = std::sin(theta);
            copy.points.reserve(stroke.points.size());
            for (const StrokePoint& p : stroke.points) {
                copy.points.push_back(rotateSample(p, config.centerPoint, cosT, sinT));
            }
        }
        out.push_back(std::move(copy));
    }
}

std::vector<StrokeData> expand(const StrokeData& stroke, const SymmetryConfig& config) {
    std::vector<StrokeData> out;
    expandInto(stroke, config, out);
    return out;
}

std::vector<StrokePoint> expandPoint(const StrokePoint& point, const SymmetryConfig& config) {
    std::vector<StrokePoint> out;
    if (!isActive(config)) {
        out.push_back(point);
        return out;
    }
    const int n = config.axisCount;
    out.reserve(static_cast<std::size_t>(n));
    out.push_back(point);
    for (int k = 1; k < n; ++k) {
        const double theta = axisAngle(k, n);
        out.push_back(rotateSample(point, config.centerPoint, std::cos(theta), std::sin(theta)));
    }
    return out;
}

} // namespace paint::symmetry

SymmetryManager::SymmetryManager(const SymmetryConfig& initial) {
    config_.enabled = initial.enabled;
    config_.axisCount = paint::clampValue(initial.axisCount, kMinAxisCount, kMaxAxisCount);
    config_.centerPoint = initial.centerPoint;
}

void SymmetryManager::setEnabled(bool enabled) {
    if (config_.enabled == enabled) return;
    config_.enabled = enabled;
    generation_++;
}

void SymmetryManager::toggle() {
    config_.enabled = !config_.enabled;
    generation_++;
}

void SymmetryManager::setAxisCount(int axisCount) {
    const int clamped = paint::clampValue(axisCount, kMinAxisCount, kMaxAxisCount);
    if (clamped != axisCount) {
        PAINT_LOG_DEBUG("setAxisCount: %d clamped to %d", axisCount, clamped);
    }
    if (clamped == config_.axisCount) return;
    config_.axisCount = clamped;
    generation_++;
}

void SymmetryManager::setCenterPoint(const Point2& center) {
    if (!std::isfinite(center.x) || !std::isfinite(center.y)) {
        PAINT_LOG_WARN("setCenterPoint: ignoring non-finite center");
        return;
    }
    if (center.x == config_.centerPoint.x && center.y == config_.centerPoint.y) return;
    config_.centerPoint = center;
    generation_++;
}

void SymmetryManager::reset() {
    config_ = SymmetryConfig{};
    generation_++;
}
