#include <gtest/gtest.h>
#include "paint/geometry/coordinate_transform.h"

#include <cmath>
#include <random>

namespace {
constexpr double kPi = 3.14159265358979323846;
}

TEST(CoordinateTransformTest, RenderCornersMatchCanvasCorners) {
    const ViewTransformState identity{};
    const RenderPoint topLeft = paint::canvasToRender(CanvasPoint{0.0, 0.0}, identity);
    EXPECT_DOUBLE_EQ(topLeft.renderX, -1.0);
    EXPECT_DOUBLE_EQ(topLeft.renderY, 1.0);

    const RenderPoint bottomRight = paint::canvasToRender(CanvasPoint{1024.0, 1024.0}, identity);
    EXPECT_DOUBLE_EQ(bottomRight.renderX, 1.0);
    EXPECT_DOUBLE_EQ(bottomRight.renderY, -1.0);

    const RenderPoint center = paint::canvasToRender(CanvasPoint{512.0, 512.0}, identity);
    EXPECT_DOUBLE_EQ(center.renderX, 0.0);
    EXPECT_DOUBLE_EQ(center.renderY, 0.0);
}

TEST(CoordinateTransformTest, CanvasRenderRoundTripUnderIdentity) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> dist(0.0, 1024.0);
    const ViewTransformState identity{};

    for (int i = 0; i < 1000; ++i) {
        const CanvasPoint p{dist(rng), dist(rng)};
        const CanvasPoint back = paint::renderToCanvas(paint::canvasToRender(p, identity), identity);
        ASSERT_NEAR(back.canvasX, p.canvasX, 1e-6) << "sample " << i;
        ASSERT_NEAR(back.canvasY, p.canvasY, 1e-6) << "sample " << i;
    }
}

TEST(CoordinateTransformTest, CanvasViewRoundTripUnderZoomPanRotation) {
    ViewTransformState view;
    view.zoom = 2.5;
    view.panOffset = PanOffset{-40.0, 17.5};
    view.rotation = 1.1;

    const CanvasPoint p{300.0, 700.0};
    const CanvasPoint back = paint::viewToCanvas(paint::canvasToView(p, view), view);
    EXPECT_NEAR(back.canvasX, p.canvasX, 1e-9);
    EXPECT_NEAR(back.canvasY, p.canvasY, 1e-9);
}

TEST(CoordinateTransformTest, ZoomAndRotationPivotOnCanvasCenter) {
    ViewTransformState view;
    view.zoom = 3.0;
    view.rotation = kPi / 4.0;
    const ViewPoint c = paint::canvasToView(CanvasPoint{512.0, 512.0}, view);
    EXPECT_NEAR(c.viewX, 512.0, 1e-9);
    EXPECT_NEAR(c.viewY, 512.0, 1e-9);

    ViewTransformState zoomOnly;
    zoomOnly.zoom = 2.0;
    const ViewPoint z = paint::canvasToView(CanvasPoint{612.0, 512.0}, zoomOnly);
    EXPECT_NEAR(z.viewX, 712.0, 1e-9);
    EXPECT_NEAR(z.viewY, 512.0, 1e-9);
}

TEST(CoordinateTransformTest, PanIsAppliedAfterZoomAndRotation) {
    ViewTransformState view;
    view.zoom = 2.0;
    view.rotation = kPi / 2.0;
    view.panOffset = PanOffset{10.0, -20.0};

    // (612,512): zoom -> (712,512), rotate 90deg about center -> (512,712), pan -> (522,692)
    const ViewPoint v = paint::canvasToView(CanvasPoint{612.0, 512.0}, view);
    EXPECT_NEAR(v.viewX, 522.0, 1e-9);
    EXPECT_NEAR(v.viewY, 692.0, 1e-9);
}

TEST(CoordinateTransformTest, DeviceToCanvasScalesByBounds) {
    const CanvasBounds bounds{100.0, 50.0, 512.0, 512.0};
    const CanvasPoint c = paint::deviceToCanvas(DevicePoint{356.0, 306.0}, bounds);
    EXPECT_DOUBLE_EQ(c.canvasX, 512.0);
    EXPECT_DOUBLE_EQ(c.canvasY, 512.0);

    const DevicePoint d = paint::canvasToDevice(c, bounds);
    EXPECT_DOUBLE_EQ(d.deviceX, 356.0);
    EXPECT_DOUBLE_EQ(d.deviceY, 306.0);

    const Point2 viaMatrix = paint::deviceToCanvasMatrix(bounds).transformPoint(356.0, 306.0);
    EXPECT_NEAR(viaMatrix.x, 512.0, 1e-9);
    EXPECT_NEAR(viaMatrix.y, 512.0, 1e-9);
}

TEST(CoordinateTransformTest, ConversionsDoNotClamp) {
    const ViewTransformState identity{};
    const RenderPoint outside = paint::canvasToRender(CanvasPoint{-512.0, 2048.0}, identity);
    EXPECT_DOUBLE_EQ(outside.renderX, -2.0);
    EXPECT_DOUBLE_EQ(outside.renderY, -3.0);
    EXPECT_FALSE(paint::isValidRender(outside));

    const CanvasPoint c = paint::deviceToCanvas(DevicePoint{-10.0, -10.0}, CanvasBounds{});
    EXPECT_DOUBLE_EQ(c.canvasX, -10.0);
    EXPECT_FALSE(paint::isValidCanvas(c));
}

TEST(CoordinateTransformTest, Validators) {
    EXPECT_TRUE(paint::isValidCanvas(CanvasPoint{0.0, 1024.0}));
    EXPECT_FALSE(paint::isValidCanvas(CanvasPoint{1024.5, 0.0}));
    EXPECT_TRUE(paint::isValidRender(RenderPoint{-1.0, 1.0}));
    EXPECT_FALSE(paint::isValidRender(RenderPoint{0.0, 1.01}));
    EXPECT_TRUE(paint::isValidDevice(DevicePoint{0.0, 4000.0}));
    EXPECT_FALSE(paint::isValidDevice(DevicePoint{-0.5, 0.0}));
}

TEST(CoordinateTransformTest, InvalidBoundsThrow) {
    EXPECT_THROW(paint::deviceToCanvas(DevicePoint{1.0, 1.0}, CanvasBounds{0.0, 0.0, 0.0, 100.0}), CoordinateTransformError);
    EXPECT_THROW(paint::canvasToDevice(CanvasPoint{1.0, 1.0}, CanvasBounds{0.0, 0.0, 100.0, -1.0}), CoordinateTransformError);

    try {
        paint::deviceToCanvasMatrix(CanvasBounds{0.0, 0.0, 0.0, 0.0});
        FAIL() << "expected CoordinateTransformError";
    } catch (const CoordinateTransformError& e) {
        EXPECT_STREQ(e.transformType(), "device-to-canvas");
    }
}

TEST(CoordinateTransformTest, SingularViewCannotBeInverted) {
    ViewTransformState degenerate;
    degenerate.zoom = 0.0; // only reachable by bypassing ViewTransformManager
    EXPECT_THROW(paint::viewToCanvas(ViewPoint{1.0, 1.0}, degenerate), CoordinateTransformError);
}
