#pragma once

#include "paint/core/matrix3.h"
#include "paint/core/types.h"
#include "paint/view/view_transform.h"

#include <stdexcept>
#include <string>

// =============================================================================
// Coordinate spaces
// =============================================================================
//
// Device  : viewport pixels, origin top-left, Y-down, unbounded.
// Canvas  : logical 0..1024 square, Y-down, symmetry center at (512, 512).
// View    : Canvas after zoom, then rotation (both about the canvas center),
//           then pan.
// Render  : GPU clip space, [-1, 1] on both axes, Y-up.
//
// Each space has its own point type so a conversion can never be skipped by
// accident. None of the conversions clamp; use the validators instead.

struct DevicePoint { double deviceX; double deviceY; };
struct CanvasPoint { double canvasX; double canvasY; };
struct ViewPoint { double viewX; double viewY; };
struct RenderPoint { double renderX; double renderY; };

// On-screen placement of the canvas element, in device pixels.
struct CanvasBounds {
    double left = 0.0;
    double top = 0.0;
    double width = kCanvasSize;
    double height = kCanvasSize;
};

class CoordinateTransformError : public std::runtime_error {
public:
    CoordinateTransformError(const std::string& message, const char* transformType)
        : std::runtime_error(message), transformType_(transformType) {}

    const char* transformType() const noexcept { return transformType_; }

private:
    const char* transformType_;
};

namespace paint {

// Matrix builders (exposed for debug collaborators)
Matrix3 deviceToCanvasMatrix(const CanvasBounds& bounds);
Matrix3 canvasToViewMatrix(const ViewTransformState& view) noexcept;
Matrix3 viewToRenderMatrix() noexcept;

// Device <-> Canvas (used by input handling)
CanvasPoint deviceToCanvas(const DevicePoint& p, const CanvasBounds& bounds);
DevicePoint canvasToDevice(const CanvasPoint& p, const CanvasBounds& bounds);

// Canvas <-> View
ViewPoint canvasToView(const CanvasPoint& p, const ViewTransformState& view) noexcept;
CanvasPoint viewToCanvas(const ViewPoint& p, const ViewTransformState& view);

// View <-> Render (pure scale + Y flip)
RenderPoint viewToRender(const ViewPoint& p) noexcept;
ViewPoint renderToView(const RenderPoint& p) noexcept;

// Canvas <-> Render through the view transform
RenderPoint canvasToRender(const CanvasPoint& p, const ViewTransformState& view) noexcept;
CanvasPoint renderToCanvas(const RenderPoint& p, const ViewTransformState& view);

// Validation helpers
bool isValidCanvas(const CanvasPoint& p) noexcept;
bool isValidRender(const RenderPoint& p) noexcept;
bool isValidDevice(const DevicePoint& p) noexcept;

inline CanvasPoint toCanvasPoint(const Point2& p) noexcept { return CanvasPoint{p.x, p.y}; }
inline Point2 toPoint2(const CanvasPoint& p) noexcept { return Point2{p.canvasX, p.canvasY}; }

} // namespace paint
