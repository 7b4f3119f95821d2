#include "paint/command/commands.h"
#include "paint/core/logging.h"
#include "paint/core/util.h"

#include <vector>

namespace paint {

namespace {

struct CommandView {
    std::uint32_t op;
    std::uint32_t id;
    std::uint32_t payloadByteCount;
    std::size_t payloadOffset;
};

// Reads the command starting at `offset`. Bounds are checked against the
// bytes remaining so a hostile payloadByteCount cannot wrap the offset.
EngineError readCommand(const std::uint8_t* src, std::uint32_t byteCount, std::size_t offset, CommandView& out) {
    const std::size_t remaining = byteCount - offset;
    if (perCommandHeaderBytes > remaining) {
        return EngineError::BufferTruncated;
    }
    out.op = readU32(src, offset);
    out.id = readU32(src, offset + 4);
    out.payloadByteCount = readU32(src, offset + 8);
    if (readU32(src, offset + 12) != 0) {
        return EngineError::InvalidHeader;
    }
    if (out.payloadByteCount > remaining - perCommandHeaderBytes) {
        return EngineError::BufferTruncated;
    }
    out.payloadOffset = offset + perCommandHeaderBytes;
    return EngineError::Ok;
}

} // namespace

EngineError parseCommandBuffer(const std::uint8_t* src, std::uint32_t byteCount, CommandCallback cb, void* ctx) {
    if (!src || byteCount < commandHeaderBytes) {
        return EngineError::BufferTruncated;
    }
    if (readU32(src, 0) != commandMagicSpcb) {
        return EngineError::InvalidMagic;
    }
    if (readU32(src, 4) != commandVersion) {
        return EngineError::UnsupportedVersion;
    }
    const std::uint32_t commandCount = readU32(src, 8);
    if (readU32(src, 12) != 0) {
        return EngineError::InvalidHeader;
    }

    // Framing is validated for the whole buffer before any command runs, so
    // a malformed buffer never applies a prefix of its commands.
    std::vector<CommandView> commands;
    std::size_t o = commandHeaderBytes;
    for (std::uint32_t i = 0; i < commandCount; i++) {
        CommandView cmd{};
        const EngineError err = readCommand(src, byteCount, o, cmd);
        if (err != EngineError::Ok) {
            PAINT_LOG_WARN("parseCommandBuffer: command %u malformed (error %u)", i, static_cast<unsigned>(err));
            return err;
        }
        o = cmd.payloadOffset + cmd.payloadByteCount;
        commands.push_back(cmd);
    }
    if (o != byteCount) {
        PAINT_LOG_WARN("parseCommandBuffer: %zu trailing bytes", static_cast<std::size_t>(byteCount - o));
        return EngineError::TrailingBytes;
    }

    if (!cb) return EngineError::Ok;

    for (const CommandView& cmd : commands) {
        const EngineError err = cb(ctx, cmd.op, cmd.id, src + cmd.payloadOffset, cmd.payloadByteCount);
        if (err != EngineError::Ok) return err;
    }

    return EngineError::Ok;
}

} // namespace paint
