#pragma once

#include "paint/engine.h"

#include <cstdint>
#include <stdexcept>
#include <string>

// Drawing backend the coordinator pushes frames to (WebGL in the browser,
// a recording fake in tests).
class RenderSink {
public:
    virtual ~RenderSink() = default;

    // Acquire the backend. Returning false makes coordinator construction fail.
    virtual bool initialize() = 0;
    virtual void clear() = 0;
    virtual void drawStroke(const StrokeData& stroke, const BrushSettings& brush, const ViewTransformState& view) = 0;
};

// Raised when the drawing backend cannot be brought up. Fatal: there is no
// partially initialized coordinator to recover.
class EngineInitError : public std::runtime_error {
public:
    explicit EngineInitError(const std::string& message) : std::runtime_error(message) {}
};

// Wires a PaintEngine to a RenderSink: forwards input to the engine and
// redraws the expanded render list whenever the engine publishes a change.
class DrawingCoordinator : public PaintEngineListener {
public:
    DrawingCoordinator(PaintEngine& engine, RenderSink& sink);
    ~DrawingCoordinator() override;

    DrawingCoordinator(const DrawingCoordinator&) = delete;
    DrawingCoordinator& operator=(const DrawingCoordinator&) = delete;

    void handleInputEvent(const NormalizedInputEvent& ev);

    // Clears the sink and draws every visible stroke, plus the stroke in
    // progress, with symmetry applied.
    void render();

    std::uint32_t getFrameCount() const noexcept { return frameCount_; }

    void onEngineEvents(const paint::protocol::EngineEvent* events, std::size_t count) override;

private:
    PaintEngine& engine_;
    RenderSink& sink_;
    std::uint32_t frameCount_ = 0;
};
