#pragma once

#include "paint/core/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace paint::symmetry {

// Angle of copy k for an N-fold rotational symmetry: 2*pi*k/N.
double axisAngle(int axisIndex, int axisCount) noexcept;

// Rotates p about center by theta using
//   x' = cx + (x-cx)*cos(theta) - (y-cy)*sin(theta)
//   y' = cy + (x-cx)*sin(theta) + (y-cy)*cos(theta)
// Every symmetry call site goes through this function.
Point2 rotateAbout(const Point2& p, const Point2& center, double theta) noexcept;

// True when the config produces more than the source stroke.
bool isActive(const SymmetryConfig& config) noexcept;

// Id of copy k of a stroke: "<sourceId>_axis_<k>".
std::string copyId(const std::string& sourceId, int axisIndex);

// One stroke -> its rotational copies. Disabled configs (or axisCount <= 1)
// return the stroke unchanged. Copy 0 carries the source points verbatim.
std::vector<StrokeData> expand(const StrokeData& stroke, const SymmetryConfig& config);

// Incremental form for a single sample: the k-th element is the sample as it
// appears in copy k of expand().
std::vector<StrokePoint> expandPoint(const StrokePoint& point, const SymmetryConfig& config);

// Appends expand(stroke, config) to out; used to flatten many strokes in order.
void expandInto(const StrokeData& stroke, const SymmetryConfig& config, std::vector<StrokeData>& out);

} // namespace paint::symmetry

// Owner of the process-lifetime SymmetryConfig. axisCount is clamped to
// [2, 16] on every write; the center point is accepted as given, even
// outside the canvas.
class SymmetryManager {
public:
    SymmetryManager() = default;
    explicit SymmetryManager(const SymmetryConfig& initial);

    const SymmetryConfig& config() const noexcept { return config_; }
    std::uint32_t getGeneration() const noexcept { return generation_; }

    void setEnabled(bool enabled);
    void toggle();
    void setAxisCount(int axisCount);
    void setCenterPoint(const Point2& center);
    void reset();

private:
    SymmetryConfig config_{};
    std::uint32_t generation_ = 0;
};
