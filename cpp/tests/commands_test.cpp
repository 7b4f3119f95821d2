#include <gtest/gtest.h>
#include "paint/command/commands.h"
#include "paint/engine.h"
#include "paint/protocol/protocol_types.h"
#include "tests/test_accessors.h"

#include <cstring>
#include <vector>

using paint::protocol::CommandOp;

namespace {

struct Ctx { int count = 0; };

EngineError countingCb(void* ctx, std::uint32_t op, std::uint32_t id, const std::uint8_t* payload, std::uint32_t payloadByteCount) {
    Ctx* c = reinterpret_cast<Ctx*>(ctx);
    (void)payload; (void)payloadByteCount; (void)id; (void)op;
    c->count++;
    return EngineError::Ok;
}

class CommandBufferBuilder {
public:
    explicit CommandBufferBuilder(std::uint32_t magic = commandMagicSpcb, std::uint32_t version = commandVersion) {
        pushU32(magic);
        pushU32(version);
        pushU32(0); // command count, patched in add()
        pushU32(0); // reserved
    }

    template <typename T>
    CommandBufferBuilder& add(CommandOp op, const T& payload) {
        return addRaw(op, &payload, sizeof(T));
    }

    CommandBufferBuilder& add(CommandOp op) {
        return addRaw(op, nullptr, 0);
    }

    CommandBufferBuilder& addRaw(CommandOp op, const void* payload, std::uint32_t bytes) {
        return addRawOp(static_cast<std::uint32_t>(op), payload, bytes);
    }

    CommandBufferBuilder& addRawOp(std::uint32_t op, const void* payload, std::uint32_t bytes) {
        pushU32(op);
        pushU32(0);
        pushU32(bytes);
        pushU32(0);
        if (bytes) {
            const auto* p = static_cast<const std::uint8_t*>(payload);
            buf.insert(buf.end(), p, p + bytes);
        }
        count++;
        std::memcpy(buf.data() + 8, &count, 4);
        return *this;
    }

    std::uintptr_t ptr() const { return reinterpret_cast<std::uintptr_t>(buf.data()); }
    std::uint32_t size() const { return static_cast<std::uint32_t>(buf.size()); }

    std::vector<std::uint8_t> buf;

private:
    void pushU32(std::uint32_t v) {
        std::uint8_t b[4];
        std::memcpy(b, &v, 4);
        buf.insert(buf.end(), b, b + 4);
    }

    std::uint32_t count = 0;
};

paint::protocol::StrokeSamplePayload sample(float x, float y, DeviceType device = DeviceType::Pen) {
    return paint::protocol::StrokeSamplePayload{x, y, 0.5f, static_cast<std::uint32_t>(device), 1000u, 0u};
}

} // namespace

TEST(CommandsTest, ParseSingle) {
    CommandBufferBuilder b;
    b.add(CommandOp::Undo);

    Ctx ctx;
    const EngineError err = paint::parseCommandBuffer(b.buf.data(), b.size(), &countingCb, &ctx);
    EXPECT_EQ(err, EngineError::Ok);
    EXPECT_EQ(ctx.count, 1);
}

TEST(CommandsTest, RejectsBadHeader) {
    Ctx ctx;
    CommandBufferBuilder badMagic(0x12345678);
    EXPECT_EQ(paint::parseCommandBuffer(badMagic.buf.data(), badMagic.size(), &countingCb, &ctx), EngineError::InvalidMagic);

    CommandBufferBuilder badVersion(commandMagicSpcb, 9);
    EXPECT_EQ(paint::parseCommandBuffer(badVersion.buf.data(), badVersion.size(), &countingCb, &ctx), EngineError::UnsupportedVersion);

    EXPECT_EQ(paint::parseCommandBuffer(nullptr, 0, &countingCb, &ctx), EngineError::BufferTruncated);
    EXPECT_EQ(ctx.count, 0);
}

TEST(CommandsTest, RejectsTruncatedPayload) {
    CommandBufferBuilder b;
    b.add(CommandOp::SetAxisCount, paint::protocol::AxisCountPayload{4});
    Ctx ctx;
    EXPECT_EQ(paint::parseCommandBuffer(b.buf.data(), b.size() - 2, &countingCb, &ctx), EngineError::BufferTruncated);
    EXPECT_EQ(ctx.count, 0);
}

TEST(CommandsTest, StrokeCommandsDriveTheSession) {
    PaintEngine engine;
    CommandBufferBuilder b;
    b.add(CommandOp::SetSymmetryEnabled, paint::protocol::SymmetryEnabledPayload{0});
    b.add(CommandOp::BeginStroke, sample(100.0f, 100.0f));
    b.add(CommandOp::ContinueStroke, sample(150.0f, 150.0f));
    b.add(CommandOp::EndStroke, sample(200.0f, 200.0f));

    engine.applyCommandBuffer(b.ptr(), b.size());
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
    EXPECT_FALSE(engine.getSymmetryConfig().enabled);

    const StrokeRange visible = engine.getVisibleStrokes();
    ASSERT_EQ(visible.size(), 1u);
    EXPECT_EQ(visible[0]->points.size(), 3u);
    EXPECT_EQ(visible[0]->metadata.deviceType, DeviceType::Pen);
    EXPECT_EQ(visible[0]->points[0].timestamp, 1000);
}

TEST(CommandsTest, ConfigurationCommands) {
    PaintEngine engine;
    CommandBufferBuilder b;
    b.add(CommandOp::SetAxisCount, paint::protocol::AxisCountPayload{1});
    b.add(CommandOp::SetCenterPoint, paint::protocol::CenterPointPayload{300.0f, 400.0f});
    b.add(CommandOp::SetViewTransform, paint::protocol::ViewTransformPayload{20.0f, 5.0f, 6.0f, 0.0f});
    b.add(CommandOp::SetBrush, paint::protocol::BrushPayload{1.0f, 0.0f, 0.0f, 1.0f, 8.0f, 0.5f});

    engine.applyCommandBuffer(b.ptr(), b.size());
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
    EXPECT_EQ(engine.getSymmetryConfig().axisCount, 2);
    EXPECT_DOUBLE_EQ(engine.getSymmetryConfig().centerPoint.x, 300.0);
    EXPECT_DOUBLE_EQ(engine.getViewTransform().zoom, 10.0);
    EXPECT_DOUBLE_EQ(engine.getViewTransform().panOffset.canvasY, 6.0);
    EXPECT_FLOAT_EQ(engine.getBrushSettings().brushSize, 8.0f);
    EXPECT_FLOAT_EQ(engine.getBrushSettings().opacity, 0.5f);
    EXPECT_FLOAT_EQ(engine.getBrushSettings().color[0], 1.0f);
}

TEST(CommandsTest, ErrorStopsBatchButKeepsEarlierCommands) {
    PaintEngine engine;
    CommandBufferBuilder b;
    b.add(CommandOp::SetAxisCount, paint::protocol::AxisCountPayload{5});
    b.addRawOp(999, nullptr, 0);
    b.add(CommandOp::SetAxisCount, paint::protocol::AxisCountPayload{6});

    engine.applyCommandBuffer(b.ptr(), b.size());
    EXPECT_EQ(engine.getLastError(), EngineError::UnknownCommand);
    EXPECT_EQ(engine.getSymmetryConfig().axisCount, 5);

    // Next successful call clears the error.
    CommandBufferBuilder ok;
    ok.add(CommandOp::ResetSymmetry);
    engine.applyCommandBuffer(ok.ptr(), ok.size());
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
    EXPECT_EQ(engine.getSymmetryConfig().axisCount, 8);
}

TEST(CommandsTest, PayloadSizeMismatchIsRejected) {
    PaintEngine engine;
    CommandBufferBuilder b;
    const std::uint16_t tooSmall = 3;
    b.addRaw(CommandOp::SetAxisCount, &tooSmall, sizeof(tooSmall));
    engine.applyCommandBuffer(b.ptr(), b.size());
    EXPECT_EQ(PaintEngineTestAccessor::lastError(engine), EngineError::InvalidPayloadSize);

    CommandBufferBuilder b2;
    const std::uint32_t junk = 1;
    b2.addRaw(CommandOp::Undo, &junk, sizeof(junk));
    engine.applyCommandBuffer(b2.ptr(), b2.size());
    EXPECT_EQ(engine.getLastError(), EngineError::InvalidPayloadSize);
}

TEST(CommandsTest, HistoryCommands) {
    PaintEngine engine;
    CommandBufferBuilder b;
    b.add(CommandOp::BeginStroke, sample(1.0f, 1.0f));
    b.add(CommandOp::EndStroke, sample(2.0f, 2.0f));
    b.add(CommandOp::BeginStroke, sample(3.0f, 3.0f));
    b.add(CommandOp::EndStroke, sample(4.0f, 4.0f));
    b.add(CommandOp::Undo);
    engine.applyCommandBuffer(b.ptr(), b.size());
    EXPECT_EQ(engine.getHistoryMeta().cursor, 1u);
    EXPECT_TRUE(engine.canRedo());

    CommandBufferBuilder b2;
    b2.add(CommandOp::Redo);
    b2.add(CommandOp::ClearHistory);
    engine.applyCommandBuffer(b2.ptr(), b2.size());
    EXPECT_EQ(engine.getHistoryMeta().depth, 0u);
}

TEST(CommandsTest, UnknownDeviceTypeFallsBackToUnknown) {
    PaintEngine engine;
    CommandBufferBuilder b;
    auto begin = sample(1.0f, 1.0f);
    begin.deviceType = 77;
    b.add(CommandOp::BeginStroke, begin);
    b.add(CommandOp::EndStroke, sample(2.0f, 2.0f));
    engine.applyCommandBuffer(b.ptr(), b.size());
    ASSERT_EQ(engine.getVisibleStrokes().size(), 1u);
    EXPECT_EQ(engine.getVisibleStrokes()[0]->metadata.deviceType, DeviceType::Unknown);
}

TEST(CommandsTest, ApplyFromEngineScratchMemory) {
    PaintEngine engine;
    CommandBufferBuilder b;
    paint::protocol::AxisCountPayload axes{6};
    b.add(CommandOp::SetAxisCount, axes);

    const std::uintptr_t ptr = engine.allocBytes(b.size());
    ASSERT_NE(ptr, 0u);
    std::memcpy(reinterpret_cast<void*>(ptr), b.buf.data(), b.size());
    engine.applyCommandBuffer(ptr, b.size());
    engine.freeBytes(ptr);

    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
    EXPECT_EQ(engine.getSymmetryConfig().axisCount, 6);
}

TEST(CommandsTest, ClearErrorResetsLastError) {
    PaintEngine engine;
    CommandBufferBuilder badMagic(0x12345678u);
    badMagic.add(CommandOp::ResetView);
    engine.applyCommandBuffer(badMagic.ptr(), badMagic.size());
    ASSERT_EQ(engine.getLastError(), EngineError::InvalidMagic);

    engine.clearError();
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
}

TEST(CommandsTest, OversizedPayloadLengthIsTruncation) {
    CommandBufferBuilder b;
    b.add(CommandOp::SetAxisCount, paint::protocol::AxisCountPayload{4});
    const std::uint32_t huge = 0xFFFFFFF0u;
    std::memcpy(b.buf.data() + commandHeaderBytes + 8, &huge, 4);

    Ctx ctx;
    EXPECT_EQ(paint::parseCommandBuffer(b.buf.data(), b.size(), &countingCb, &ctx), EngineError::BufferTruncated);
    EXPECT_EQ(ctx.count, 0);
}

TEST(CommandsTest, RejectsNonZeroReservedWords) {
    Ctx ctx;
    CommandBufferBuilder header;
    header.add(CommandOp::Undo);
    const std::uint32_t junk = 7;
    std::memcpy(header.buf.data() + 12, &junk, 4);
    EXPECT_EQ(paint::parseCommandBuffer(header.buf.data(), header.size(), &countingCb, &ctx), EngineError::InvalidHeader);

    CommandBufferBuilder command;
    command.add(CommandOp::Undo);
    std::memcpy(command.buf.data() + commandHeaderBytes + 12, &junk, 4);
    EXPECT_EQ(paint::parseCommandBuffer(command.buf.data(), command.size(), &countingCb, &ctx), EngineError::InvalidHeader);
    EXPECT_EQ(ctx.count, 0);
}

TEST(CommandsTest, TrailingBytesRejectWholeBuffer) {
    PaintEngine engine;
    CommandBufferBuilder b;
    b.add(CommandOp::SetAxisCount, paint::protocol::AxisCountPayload{5});
    b.buf.push_back(0);
    b.buf.push_back(0);

    engine.applyCommandBuffer(b.ptr(), b.size());
    EXPECT_EQ(engine.getLastError(), EngineError::TrailingBytes);
    EXPECT_EQ(engine.getSymmetryConfig().axisCount, 8);
}

TEST(CommandsTest, TruncatedTailAppliesNothing) {
    PaintEngine engine;
    CommandBufferBuilder b;
    b.add(CommandOp::SetAxisCount, paint::protocol::AxisCountPayload{5});
    b.add(CommandOp::SetAxisCount, paint::protocol::AxisCountPayload{6});

    engine.applyCommandBuffer(b.ptr(), b.size() - 1);
    EXPECT_EQ(engine.getLastError(), EngineError::BufferTruncated);
    EXPECT_EQ(engine.getSymmetryConfig().axisCount, 8);
}
