#include "paint/geometry/coordinate_transform.h"

#include <cmath>

namespace paint {

namespace {

void requireValidBounds(const CanvasBounds& bounds, const char* transformType) {
    if (!(bounds.width > 0.0) || !(bounds.height > 0.0)
        || !std::isfinite(bounds.width) || !std::isfinite(bounds.height)) {
        throw CoordinateTransformError("Canvas bounds must have a positive finite size", transformType);
    }
}

Matrix3 invertOrThrow(const Matrix3& m, const char* transformType) {
    Matrix3 inv;
    if (!m.invert(inv)) {
        throw CoordinateTransformError("Transform matrix is singular and cannot be inverted", transformType);
    }
    return inv;
}

} // namespace

Matrix3 deviceToCanvasMatrix(const CanvasBounds& bounds) {
    requireValidBounds(bounds, "device-to-canvas");
    const double sx = kCanvasSize / bounds.width;
    const double sy = kCanvasSize / bounds.height;
    return Matrix3::scale(sx, sy).multiply(Matrix3::translation(-bounds.left, -bounds.top));
}

Matrix3 canvasToViewMatrix(const ViewTransformState& view) noexcept {
    const Matrix3 zoom = Matrix3::translation(kCanvasCenterX, kCanvasCenterY)
        .multiply(Matrix3::scale(view.zoom, view.zoom))
        .multiply(Matrix3::translation(-kCanvasCenterX, -kCanvasCenterY));
    const Matrix3 rotation = Matrix3::rotationAround(view.rotation, kCanvasCenterX, kCanvasCenterY);
    const Matrix3 pan = Matrix3::translation(view.panOffset.canvasX, view.panOffset.canvasY);
    // zoom first, then rotation, then pan
    return pan.multiply(rotation).multiply(zoom);
}

Matrix3 viewToRenderMatrix() noexcept {
    return Matrix3::translation(-1.0, 1.0).multiply(Matrix3::scale(2.0 / kCanvasSize, -2.0 / kCanvasSize));
}

CanvasPoint deviceToCanvas(const DevicePoint& p, const CanvasBounds& bounds) {
    requireValidBounds(bounds, "device-to-canvas");
    return CanvasPoint{
        (p.deviceX - bounds.left) * (kCanvasSize / bounds.width),
        (p.deviceY - bounds.top) * (kCanvasSize / bounds.height),
    };
}

DevicePoint canvasToDevice(const CanvasPoint& p, const CanvasBounds& bounds) {
    requireValidBounds(bounds, "canvas-to-device");
    return DevicePoint{
        p.canvasX * (bounds.width / kCanvasSize) + bounds.left,
        p.canvasY * (bounds.height / kCanvasSize) + bounds.top,
    };
}

ViewPoint canvasToView(const CanvasPoint& p, const ViewTransformState& view) noexcept {
    const Point2 out = canvasToViewMatrix(view).transformPoint(p.canvasX, p.canvasY);
    return ViewPoint{out.x, out.y};
}

CanvasPoint viewToCanvas(const ViewPoint& p, const ViewTransformState& view) {
    const Matrix3 inv = invertOrThrow(canvasToViewMatrix(view), "view-to-canvas");
    const Point2 out = inv.transformPoint(p.viewX, p.viewY);
    return CanvasPoint{out.x, out.y};
}

RenderPoint viewToRender(const ViewPoint& p) noexcept {
    return RenderPoint{
        p.viewX * (2.0 / kCanvasSize) - 1.0,
        1.0 - p.viewY * (2.0 / kCanvasSize),
    };
}

ViewPoint renderToView(const RenderPoint& p) noexcept {
    return ViewPoint{
        (p.renderX + 1.0) * (kCanvasSize / 2.0),
        (1.0 - p.renderY) * (kCanvasSize / 2.0),
    };
}

RenderPoint canvasToRender(const CanvasPoint& p, const ViewTransformState& view) noexcept {
    return viewToRender(canvasToView(p, view));
}

CanvasPoint renderToCanvas(const RenderPoint& p, const ViewTransformState& view) {
    return viewToCanvas(renderToView(p), view);
}

bool isValidCanvas(const CanvasPoint& p) noexcept {
    return p.canvasX >= 0.0 && p.canvasX <= kCanvasSize
        && p.canvasY >= 0.0 && p.canvasY <= kCanvasSize;
}

bool isValidRender(const RenderPoint& p) noexcept {
    return p.renderX >= -1.0 && p.renderX <= 1.0
        && p.renderY >= -1.0 && p.renderY <= 1.0;
}

bool isValidDevice(const DevicePoint& p) noexcept {
    return p.deviceX >= 0.0 && p.deviceY >= 0.0;
}

} // namespace paint
