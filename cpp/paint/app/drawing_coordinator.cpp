#include "paint/app/drawing_coordinator.h"
#include "paint/core/logging.h"

DrawingCoordinator::DrawingCoordinator(PaintEngine& engine, RenderSink& sink)
    : engine_(engine), sink_(sink)
{
    if (!sink_.initialize()) {
        throw EngineInitError("DrawingCoordinator: render backend failed to initialize");
    }
    // A sink that fails its first frame must not stay registered.
    render();
    engine_.addListener(this);
}

DrawingCoordinator::~DrawingCoordinator() {
    engine_.removeListener(this);
}

void DrawingCoordinator::handleInputEvent(const NormalizedInputEvent& ev) {
    PAINT_LOG_DEBUG("input %s (%.1f, %.1f) p=%.2f",
        ev.type == InputEventType::Start ? "start" : ev.type == InputEventType::Move ? "move" : "end",
        ev.canvasX, ev.canvasY, static_cast<double>(ev.pressure));
    engine_.handleInputEvent(ev);
}

void DrawingCoordinator::render() {
    const std::vector<StrokeData> strokes = engine_.buildRenderList();
    const BrushSettings& brush = engine_.getBrushSettings();
    const ViewTransformState& view = engine_.getViewTransform();

    sink_.clear();
    for (const StrokeData& stroke : strokes) {
        sink_.drawStroke(stroke, brush, view);
    }
    frameCount_++;
}

void DrawingCoordinator::onEngineEvents(const paint::protocol::EngineEvent* events, std::size_t count) {
    bool needsRedraw = false;
    for (std::size_t i = 0; i < count; ++i) {
        if (events[i].type != static_cast<std::uint16_t>(paint::protocol::EventType::Overflow)) {
            needsRedraw = true;
            break;
        }
    }
    if (needsRedraw) render();
}
