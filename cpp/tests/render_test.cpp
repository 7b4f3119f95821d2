#include "tests/engine_test_common.h"
#include "paint/render/render.h"

#include <memory>

using namespace paint_test;

namespace {

StrokeHandle committedStroke(const std::string& id, std::vector<StrokePoint> points) {
    auto s = std::make_shared<StrokeData>();
    s->id = id;
    s->points = std::move(points);
    s->metadata.totalPoints = static_cast<std::uint32_t>(s->points.size());
    return s;
}

} // namespace

TEST(RenderTest, RenderListFlattensInHistoryOrder) {
    HistoryBuffer history;
    history.commit(committedStroke("a", {pt(600, 512)}));
    history.commit(committedStroke("b", {pt(700, 512)}));

    SymmetryConfig cfg;
    cfg.axisCount = 2;
    std::vector<StrokeData> out;
    paint::buildRenderList(history.visibleStrokes(), nullptr, cfg, out);

    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].id, "a_axis_0");
    EXPECT_EQ(out[1].id, "a_axis_1");
    EXPECT_EQ(out[2].id, "b_axis_0");
    EXPECT_EQ(out[3].id, "b_axis_1");
}

TEST(RenderTest, EmptyInProgressStrokeIsSkipped) {
    HistoryBuffer history;
    StrokeData empty;
    empty.id = "in_progress";
    SymmetryConfig cfg;
    std::vector<StrokeData> out;
    paint::buildRenderList(history.visibleStrokes(), &empty, cfg, out);
    EXPECT_TRUE(out.empty());
}

TEST(RenderTest, LineBufferUsesRenderSpaceAndAxisIndex) {
    std::vector<StrokeData> strokes(2);
    strokes[0].points = {StrokePoint{0.0, 0.0, 0.25f, 0}, StrokePoint{512.0, 512.0, 0.75f, 0}};
    strokes[1].points = {StrokePoint{1024.0, 1024.0, 1.0f, 0}};
    strokes[1].metadata.symmetryAxis = 3;

    std::vector<float> vertices;
    std::vector<paint::RenderRange> ranges;
    paint::rebuildLineBuffer(strokes, ViewTransformState{}, vertices, &ranges);

    ASSERT_EQ(vertices.size(), 12u);
    EXPECT_FLOAT_EQ(vertices[0], -1.0f);
    EXPECT_FLOAT_EQ(vertices[1], 1.0f);
    EXPECT_FLOAT_EQ(vertices[2], 0.25f);
    EXPECT_FLOAT_EQ(vertices[3], 0.0f); // source stroke draws as axis 0
    EXPECT_NEAR(vertices[4], 0.0f, 1e-6f);
    EXPECT_NEAR(vertices[5], 0.0f, 1e-6f);
    EXPECT_FLOAT_EQ(vertices[8], 1.0f);
    EXPECT_FLOAT_EQ(vertices[9], -1.0f);
    EXPECT_FLOAT_EQ(vertices[11], 3.0f);

    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0].offset, 0u);
    EXPECT_EQ(ranges[0].count, 8u);
    EXPECT_EQ(ranges[1].offset, 8u);
    EXPECT_EQ(ranges[1].count, 4u);
}

TEST(RenderTest, LineBufferAppliesViewTransform) {
    std::vector<StrokeData> strokes(1);
    strokes[0].points = {StrokePoint{768.0, 512.0, 1.0f, 0}};
    ViewTransformState view;
    view.zoom = 2.0;

    std::vector<float> vertices;
    paint::rebuildLineBuffer(strokes, view, vertices, nullptr);
    ASSERT_EQ(vertices.size(), 4u);
    // (768,512) zoomed 2x about the center lands on the right edge.
    EXPECT_NEAR(vertices[0], 1.0f, 1e-6f);
    EXPECT_NEAR(vertices[1], 0.0f, 1e-6f);
}

TEST(RenderTest, EngineLineBufferIsRebuiltLazily) {
    PaintEngine engine;
    engine.setAxisCount(4);
    drawStroke(engine, {pt(600, 512), pt(610, 512), pt(620, 512)});

    EXPECT_TRUE(PaintEngineTestAccessor::renderDirty(engine));
    const auto meta = engine.getLineBufferMeta();
    EXPECT_FALSE(PaintEngineTestAccessor::renderDirty(engine));
    EXPECT_EQ(meta.vertexCount, 12u);
    EXPECT_EQ(meta.floatCount, 48u);
    EXPECT_GE(meta.capacity, meta.vertexCount);
    EXPECT_NE(meta.ptr, 0u);
    EXPECT_EQ(meta.generation, engine.getGeneration());
    EXPECT_EQ(engine.getLineRanges().size(), 4u);

    engine.setAxisCount(4); // unchanged
    EXPECT_FALSE(PaintEngineTestAccessor::renderDirty(engine));

    engine.setRotation(0.5);
    EXPECT_TRUE(PaintEngineTestAccessor::renderDirty(engine));
    const auto rotated = engine.getLineBufferMeta();
    EXPECT_GT(rotated.generation, meta.generation);
    EXPECT_EQ(rotated.vertexCount, 12u);
}

TEST(RenderTest, RangesMetaExposesPerCopyStrips) {
    PaintEngine engine;
    engine.setAxisCount(3);
    drawStroke(engine, {pt(600, 500), pt(610, 510)});
    drawStroke(engine, {pt(700, 500), pt(710, 510), pt(720, 520)});

    const auto meta = engine.getLineRangesMeta();
    const std::vector<paint::RenderRange>& ranges = engine.getLineRanges();
    ASSERT_EQ(meta.count, 6u);
    ASSERT_EQ(ranges.size(), 6u);
    EXPECT_EQ(meta.generation, engine.getGeneration());

    const auto* exposed = reinterpret_cast<const paint::RenderRange*>(meta.ptr);
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        EXPECT_EQ(exposed[i].offset, ranges[i].offset);
        EXPECT_EQ(exposed[i].count, ranges[i].count);
    }
    // Strips are contiguous and separated per symmetry copy.
    EXPECT_EQ(exposed[0].offset, 0u);
    EXPECT_EQ(exposed[0].count, 2u * lineVertexFloats);
    EXPECT_EQ(exposed[1].offset, exposed[0].count);
    EXPECT_EQ(exposed[3].count, 3u * lineVertexFloats);
    EXPECT_EQ(exposed[5].offset + exposed[5].count, engine.getLineBufferMeta().floatCount);
}

TEST(RenderTest, LazyGettersMayPropagateAllocationFailure) {
    const PaintEngine engine;
    EXPECT_FALSE(noexcept(engine.getLineBufferMeta()));
    EXPECT_FALSE(noexcept(engine.getLineRanges()));
    EXPECT_FALSE(noexcept(engine.getLineRangesMeta()));
    EXPECT_FALSE(noexcept(engine.getStats()));
}
