#include "paint/command/command_dispatch.h"
#include "paint/engine.h"
#include "paint/protocol/protocol_types.h"

#include <cstring>

namespace paint {

namespace {

using protocol::CommandOp;

DeviceType decodeDeviceType(std::uint32_t v) {
    switch (v) {
        case static_cast<std::uint32_t>(DeviceType::Mouse): return DeviceType::Mouse;
        case static_cast<std::uint32_t>(DeviceType::Pen): return DeviceType::Pen;
        case static_cast<std::uint32_t>(DeviceType::Touch): return DeviceType::Touch;
        default: return DeviceType::Unknown;
    }
}

StrokePoint decodeSample(const protocol::StrokeSamplePayload& p) {
    const std::uint64_t ts = (static_cast<std::uint64_t>(p.timestampHi) << 32) | p.timestampLo;
    return StrokePoint{
        static_cast<double>(p.x),
        static_cast<double>(p.y),
        p.pressure,
        static_cast<std::int64_t>(ts),
    };
}

template <typename T>
bool readPayload(const std::uint8_t* payload, std::uint32_t payloadByteCount, T& out) {
    if (payloadByteCount != sizeof(T)) return false;
    std::memcpy(&out, payload, sizeof(T));
    return true;
}

} // namespace

EngineError dispatchCommand(
    PaintEngine* self,
    std::uint32_t op,
    std::uint32_t /*id*/,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
) {
    if (!self) return EngineError::InvalidOperation;

    switch (op) {
        case static_cast<std::uint32_t>(CommandOp::BeginStroke): {
            protocol::StrokeSamplePayload p;
            if (!readPayload(payload, payloadByteCount, p)) return EngineError::InvalidPayloadSize;
            self->beginStroke(decodeSample(p), decodeDeviceType(p.deviceType));
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::ContinueStroke): {
            protocol::StrokeSamplePayload p;
            if (!readPayload(payload, payloadByteCount, p)) return EngineError::InvalidPayloadSize;
            self->continueStroke(decodeSample(p));
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::EndStroke): {
            protocol::StrokeSamplePayload p;
            if (!readPayload(payload, payloadByteCount, p)) return EngineError::InvalidPayloadSize;
            self->endStroke(decodeSample(p));
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::CancelStroke): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            self->cancelStroke();
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SetSymmetryEnabled): {
            protocol::SymmetryEnabledPayload p;
            if (!readPayload(payload, payloadByteCount, p)) return EngineError::InvalidPayloadSize;
            self->setSymmetryEnabled(p.enabled != 0);
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SetAxisCount): {
            protocol::AxisCountPayload p;
            if (!readPayload(payload, payloadByteCount, p)) return EngineError::InvalidPayloadSize;
            self->setAxisCount(p.axisCount);
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SetCenterPoint): {
            protocol::CenterPointPayload p;
            if (!readPayload(payload, payloadByteCount, p)) return EngineError::InvalidPayloadSize;
            self->setCenterPoint(Point2{p.x, p.y});
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::ResetSymmetry): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            self->resetSymmetry();
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SetViewTransform): {
            protocol::ViewTransformPayload p;
            if (!readPayload(payload, payloadByteCount, p)) return EngineError::InvalidPayloadSize;
            ViewTransformState next;
            next.zoom = p.zoom;
            next.panOffset = PanOffset{p.panX, p.panY};
            next.rotation = p.rotation;
            self->updateViewTransform(next);
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::ResetView): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            self->resetView();
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::Undo): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            self->undo();
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::Redo): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            self->redo();
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::ClearHistory): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            self->clearHistory();
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::SetBrush): {
            protocol::BrushPayload p;
            if (!readPayload(payload, payloadByteCount, p)) return EngineError::InvalidPayloadSize;
            BrushSettings brush;
            brush.color = {p.r, p.g, p.b, p.a};
            brush.brushSize = p.size;
            brush.opacity = p.opacity;
            self->setBrush(brush);
            break;
        }
        case static_cast<std::uint32_t>(CommandOp::ResetAll): {
            if (payloadByteCount != 0) return EngineError::InvalidPayloadSize;
            self->reset();
            break;
        }
        default:
            return EngineError::UnknownCommand;
    }
    return EngineError::Ok;
}

} // namespace paint
