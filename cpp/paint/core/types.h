#ifndef PAINT_CORE_TYPES_H
#define PAINT_CORE_TYPES_H

#include <array>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// Lightweight types and constants used by the paint engine.

// Canvas space is a fixed logical square; the symmetry center defaults to its middle.
static constexpr double kCanvasSize = 1024.0;
static constexpr double kCanvasCenterX = 512.0;
static constexpr double kCanvasCenterY = 512.0;

// Clamp ranges for configuration writes
static constexpr int kMinAxisCount = 2;
static constexpr int kMaxAxisCount = 16;
static constexpr int kDefaultAxisCount = 8;
static constexpr double kMinZoom = 0.1;
static constexpr double kMaxZoom = 10.0;
static constexpr float kMinBrushSize = 1.0f;
static constexpr float kMaxBrushSize = 100.0f;
static constexpr float kDefaultBrushSize = 2.0f;

// History defaults
static constexpr std::size_t kDefaultMaxHistorySize = 100;

// Capacity defaults
static constexpr std::size_t defaultLineCapacityFloats = 16384;
static constexpr std::size_t lineVertexFloats = 4; // x, y, pressure, axis

// Command buffer format constants
static constexpr std::uint32_t commandMagicSpcb = 0x42435053; // "SPCB"
static constexpr std::uint32_t commandVersion = 1;
static constexpr std::size_t commandHeaderBytes = 4 * 4;
static constexpr std::size_t perCommandHeaderBytes = 4 * 4;

struct Point2 { double x; double y; };

enum class DeviceType : std::uint8_t {
    Unknown = 0,
    Mouse = 1,
    Pen = 2,
    Touch = 3,
};

inline const char* deviceTypeName(DeviceType type) noexcept {
    switch (type) {
        case DeviceType::Mouse: return "mouse";
        case DeviceType::Pen: return "pen";
        case DeviceType::Touch: return "touch";
        default: return "unknown";
    }
}

struct StrokePoint {
    double x;
    double y;
    float pressure;
    std::int64_t timestamp;
};

struct StrokeMetadata {
    DeviceType deviceType = DeviceType::Unknown;
    std::uint32_t totalPoints = 0;
    // Set only on symmetry copies; -1 marks a source stroke.
    std::int32_t symmetryAxis = -1;
    std::string sourceStrokeId;
};

struct StrokeData {
    std::string id;
    std::vector<StrokePoint> points;
    std::int64_t timestamp = 0;
    StrokeMetadata metadata;
};

// Committed strokes are shared read-only between history snapshots.
using StrokeHandle = std::shared_ptr<const StrokeData>;

struct SymmetryConfig {
    bool enabled = true;
    int axisCount = kDefaultAxisCount;
    Point2 centerPoint{kCanvasCenterX, kCanvasCenterY};
};

struct BrushSettings {
    std::array<float, 4> color{0.0f, 0.0f, 0.0f, 1.0f};
    float brushSize = kDefaultBrushSize;
    float opacity = 1.0f;
};

enum class EngineError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    UnknownCommand = 5,
    InvalidOperation = 6,
    InvalidHeader = 7,  // non-zero reserved word
    TrailingBytes = 8,  // bytes left after the declared commands
};

#endif // PAINT_CORE_TYPES_H
