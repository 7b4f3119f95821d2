#pragma once

#include "paint/core/types.h"
#include <cstdint>

class PaintEngine;

namespace paint {

/**
 * Applies one decoded command to the engine through its public API.
 * Used as the callback for parseCommandBuffer.
 */
EngineError dispatchCommand(
    PaintEngine* engine,
    std::uint32_t op,
    std::uint32_t id,
    const std::uint8_t* payload,
    std::uint32_t payloadByteCount
);

} // namespace paint
