#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "paint/engine.h"
#include "paint/geometry/coordinate_transform.h"

#ifdef EMSCRIPTEN
namespace {

void beginStrokeJs(PaintEngine& e, double x, double y, float pressure, double timestamp, DeviceType deviceType) {
    e.beginStroke(StrokePoint{x, y, pressure, static_cast<std::int64_t>(timestamp)}, deviceType);
}

void continueStrokeJs(PaintEngine& e, double x, double y, float pressure, double timestamp) {
    e.continueStroke(StrokePoint{x, y, pressure, static_cast<std::int64_t>(timestamp)});
}

bool endStrokeJs(PaintEngine& e, double x, double y, float pressure, double timestamp) {
    return e.endStroke(StrokePoint{x, y, pressure, static_cast<std::int64_t>(timestamp)}) != nullptr;
}

void setCenterPointJs(PaintEngine& e, double x, double y) {
    e.setCenterPoint(Point2{x, y});
}

void updateViewTransformJs(PaintEngine& e, double zoom, double panX, double panY, double rotation) {
    ViewTransformState next;
    next.zoom = zoom;
    next.panOffset = PanOffset{panX, panY};
    next.rotation = rotation;
    e.updateViewTransform(next);
}

// Device pixels -> Canvas space for the canvas element's bounding rect.
CanvasPoint deviceToCanvasJs(double deviceX, double deviceY, double left, double top, double width, double height) {
    return paint::deviceToCanvas(DevicePoint{deviceX, deviceY}, CanvasBounds{left, top, width, height});
}

} // namespace

EMSCRIPTEN_BINDINGS(symmetry_paint_module) {
    emscripten::enum_<DeviceType>("DeviceType")
        .value("Unknown", DeviceType::Unknown)
        .value("Mouse", DeviceType::Mouse)
        .value("Pen", DeviceType::Pen)
        .value("Touch", DeviceType::Touch);

    emscripten::enum_<SessionState>("SessionState")
        .value("Idle", SessionState::Idle)
        .value("Drawing", SessionState::Drawing);

    emscripten::enum_<EngineError>("EngineError")
        .value("Ok", EngineError::Ok)
        .value("InvalidMagic", EngineError::InvalidMagic)
        .value("UnsupportedVersion", EngineError::UnsupportedVersion)
        .value("BufferTruncated", EngineError::BufferTruncated)
        .value("InvalidPayloadSize", EngineError::InvalidPayloadSize)
        .value("UnknownCommand", EngineError::UnknownCommand)
        .value("InvalidOperation", EngineError::InvalidOperation)
        .value("InvalidHeader", EngineError::InvalidHeader)
        .value("TrailingBytes", EngineError::TrailingBytes);

    emscripten::class_<PaintEngine>("PaintEngine")
        .constructor<>()
        .function("reset", &PaintEngine::reset)
        .function("allocBytes", &PaintEngine::allocBytes)
        .function("freeBytes", &PaintEngine::freeBytes)
        .function("applyCommandBuffer", &PaintEngine::applyCommandBuffer)
        .function("getLastError", &PaintEngine::getLastError)
        .function("clearError", &PaintEngine::clearError)
        .function("beginStroke", &beginStrokeJs)
        .function("continueStroke", &continueStrokeJs)
        .function("endStroke", &endStrokeJs)
        .function("cancelStroke", &PaintEngine::cancelStroke)
        .function("getSessionState", &PaintEngine::getSessionState)
        .function("setSymmetryEnabled", &PaintEngine::setSymmetryEnabled)
        .function("toggleSymmetry", &PaintEngine::toggleSymmetry)
        .function("setAxisCount", &PaintEngine::setAxisCount)
        .function("setCenterPoint", &setCenterPointJs)
        .function("resetSymmetry", &PaintEngine::resetSymmetry)
        .function("undo", &PaintEngine::undo)
        .function("redo", &PaintEngine::redo)
        .function("canUndo", &PaintEngine::canUndo)
        .function("canRedo", &PaintEngine::canRedo)
        .function("clearHistory", &PaintEngine::clearHistory)
        .function("setMaxHistorySize", &PaintEngine::setMaxHistorySize)
        .function("getHistoryMeta", &PaintEngine::getHistoryMeta)
        .function("updateViewTransform", &updateViewTransformJs)
        .function("setZoom", &PaintEngine::setZoom)
        .function("setPan", &PaintEngine::setPan)
        .function("setRotation", &PaintEngine::setRotation)
        .function("resetView", &PaintEngine::resetView)
        .function("setBrushSize", &PaintEngine::setBrushSize)
        .function("setOpacity", &PaintEngine::setOpacity)
        .function("setColor", &PaintEngine::setColor)
        .function("getLineBufferMeta", &PaintEngine::getLineBufferMeta)
        .function("getLineRangesMeta", &PaintEngine::getLineRangesMeta)
        .function("pollEvents", &PaintEngine::pollEvents)
        .function("ackResync", &PaintEngine::ackResync)
        .function("getStats", &PaintEngine::getStats)
        .function("getGeneration", &PaintEngine::getGeneration);

    emscripten::function("deviceToCanvas", &deviceToCanvasJs);

    emscripten::value_object<CanvasPoint>("CanvasPoint")
        .field("canvasX", &CanvasPoint::canvasX)
        .field("canvasY", &CanvasPoint::canvasY);

    emscripten::value_object<PaintEngine::HistoryMeta>("HistoryMeta")
        .field("depth", &PaintEngine::HistoryMeta::depth)
        .field("cursor", &PaintEngine::HistoryMeta::cursor)
        .field("generation", &PaintEngine::HistoryMeta::generation);

    emscripten::value_object<PaintEngine::BufferMeta>("BufferMeta")
        .field("generation", &PaintEngine::BufferMeta::generation)
        .field("vertexCount", &PaintEngine::BufferMeta::vertexCount)
        .field("capacity", &PaintEngine::BufferMeta::capacity)
        .field("floatCount", &PaintEngine::BufferMeta::floatCount)
        .field("ptr", &PaintEngine::BufferMeta::ptr);

    emscripten::value_object<PaintEngine::RangeBufferMeta>("RangeBufferMeta")
        .field("generation", &PaintEngine::RangeBufferMeta::generation)
        .field("count", &PaintEngine::RangeBufferMeta::count)
        .field("ptr", &PaintEngine::RangeBufferMeta::ptr);

    emscripten::value_object<PaintEngine::EventBufferMeta>("EventBufferMeta")
        .field("generation", &PaintEngine::EventBufferMeta::generation)
        .field("count", &PaintEngine::EventBufferMeta::count)
        .field("ptr", &PaintEngine::EventBufferMeta::ptr);

    emscripten::value_object<PaintEngine::EngineStats>("EngineStats")
        .field("generation", &PaintEngine::EngineStats::generation)
        .field("strokeCount", &PaintEngine::EngineStats::strokeCount)
        .field("visibleStrokeCount", &PaintEngine::EngineStats::visibleStrokeCount)
        .field("committedPointCount", &PaintEngine::EngineStats::committedPointCount)
        .field("inProgressPointCount", &PaintEngine::EngineStats::inProgressPointCount)
        .field("renderStrokeCount", &PaintEngine::EngineStats::renderStrokeCount)
        .field("lineVertexCount", &PaintEngine::EngineStats::lineVertexCount)
        .field("lastRebuildMs", &PaintEngine::EngineStats::lastRebuildMs)
        .field("lastApplyMs", &PaintEngine::EngineStats::lastApplyMs);
}
#endif
