#ifndef PAINT_COMMAND_COMMANDS_H
#define PAINT_COMMAND_COMMANDS_H

#include "paint/core/types.h"
#include <cstdint>
#include <cstddef>

namespace paint {

using CommandCallback = EngineError(*)(void* ctx, std::uint32_t op, std::uint32_t id, const std::uint8_t* payload, std::uint32_t payloadByteCount);

// Parse a command buffer and invoke the callback for each command.
// Framing errors (truncation, non-zero reserved words, trailing bytes) reject
// the buffer before any callback runs. A callback error stops the batch and is
// returned; commands already delivered stay applied.
EngineError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx);

} // namespace paint

#endif // PAINT_COMMAND_COMMANDS_H
