/**
 * @file protocol_types.h
 * @brief POD types shared between PaintEngine and its host (JS/WASM or native).
 *
 * Changes to the layout of these structs are a protocol change: bump
 * commandVersion in paint/core/types.h and update the host encoder.
 */

#ifndef PAINT_PROTOCOL_TYPES_H
#define PAINT_PROTOCOL_TYPES_H

#include <cstdint>

namespace paint {
namespace protocol {

// =============================================================================
// Event Stream Types
// =============================================================================

enum class EventType : std::uint16_t {
    Overflow = 1,
    HistoryChanged = 2,      // a = history generation, b = cursor, c = size
    SessionChanged = 3,      // a = SessionState, b = points in progress
    StrokeCommitted = 4,     // a = history generation, b = point count
    SymmetryChanged = 5,     // a = symmetry generation, b = enabled, c = axisCount
    ViewChanged = 6,         // a = view generation
    BrushChanged = 7,
    EngineReset = 8,
};

struct EngineEvent {
    std::uint16_t type;
    std::uint16_t flags;
    std::uint32_t a;
    std::uint32_t b;
    std::uint32_t c;
    std::uint32_t d;
};

// =============================================================================
// Command Buffer
// =============================================================================
//
// Header:  u32 magic ("SPCB"), u32 version, u32 commandCount, u32 reserved
// Command: u32 op, u32 id (reserved, 0), u32 payloadByteCount, u32 reserved,
//          payload bytes

enum class CommandOp : std::uint32_t {
    BeginStroke = 1,
    ContinueStroke = 2,
    EndStroke = 3,
    CancelStroke = 4,
    SetSymmetryEnabled = 10,
    SetAxisCount = 11,
    SetCenterPoint = 12,
    ResetSymmetry = 13,
    SetViewTransform = 20,
    ResetView = 21,
    Undo = 30,
    Redo = 31,
    ClearHistory = 32,
    SetBrush = 40,
    ResetAll = 50,
};

// One normalized input sample in Canvas space.
struct StrokeSamplePayload {
    float x;
    float y;
    float pressure;
    std::uint32_t deviceType;
    std::uint32_t timestampLo;
    std::uint32_t timestampHi;
};

struct SymmetryEnabledPayload { std::uint32_t enabled; };
struct AxisCountPayload { std::int32_t axisCount; };
struct CenterPointPayload { float x, y; };
struct ViewTransformPayload { float zoom, panX, panY, rotation; };
struct BrushPayload { float r, g, b, a, size, opacity; };

static_assert(sizeof(StrokeSamplePayload) == 24, "StrokeSamplePayload layout");
static_assert(sizeof(ViewTransformPayload) == 16, "ViewTransformPayload layout");
static_assert(sizeof(BrushPayload) == 24, "BrushPayload layout");

} // namespace protocol
} // namespace paint

#endif // PAINT_PROTOCOL_TYPES_H
