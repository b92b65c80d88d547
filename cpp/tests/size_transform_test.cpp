#include "tests/layout_test_common.h"
#include "slidelayout/transform/size_transform_engine.h"

#include <limits>

using namespace layout_test;
using slidelayout::LayoutError;
using slidelayout::MatchDimension;
using slidelayout::Side;

TEST_F(LayoutEngineTest, MatchWidthKeepsHeightAndPosition) {
    addShape("anchor", 0, 0, 120, 80);
    addShape("a", 200, 50, 30, 30);
    setAnchor("anchor");
    select({"a", "anchor"});

    ASSERT_TRUE(engine.matchSize(MatchDimension::Width).ok());
    expectBounds(object("a"), 200, 50, 120, 30);

    ASSERT_TRUE(engine.matchSize(MatchDimension::Both).ok());
    expectBounds(object("a"), 200, 50, 120, 80);
    expectBounds(object("anchor"), 0, 0, 120, 80);
}

TEST_F(LayoutEngineTest, StretchRightMovesOnlyRightEdge) {
    addShape("anchor", 0, 0, 300, 50);
    addShape("a", 100, 100, 50, 20);
    setAnchor("anchor");
    select({"anchor", "a"});

    ASSERT_TRUE(engine.stretch(Side::Right).ok());
    expectBounds(object("a"), 100, 100, 200, 20);
}

TEST_F(LayoutEngineTest, StretchLeftKeepsRightEdge) {
    addShape("anchor", 20, 0, 300, 50);
    addShape("a", 100, 100, 50, 20);
    setAnchor("anchor");
    select({"anchor", "a"});

    ASSERT_TRUE(engine.stretch(Side::Left).ok());
    expectBounds(object("a"), 20, 100, 130, 20);
}

TEST_F(LayoutEngineTest, StretchSkipsObjectsThatWouldCollapse) {
    addShape("anchor", 0, 0, 100, 50);
    addShape("beyond", 150, 0, 40, 20);
    addShape("inside", 20, 0, 40, 20);
    setAnchor("anchor");
    select({"anchor", "beyond", "inside"});

    const auto report = engine.stretch(Side::Right);
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.skipped, 1u);
    expectBounds(object("beyond"), 150, 0, 40, 20);
    expectBounds(object("inside"), 20, 0, 80, 20);
    EXPECT_EQ(object("beyond").editCount(), 0u);
}

TEST_F(LayoutEngineTest, FillLeftGrowsTowardAnchor) {
    addShape("anchor", 0, 0, 100, 50);
    addShape("a", 150, 10, 50, 20);
    setAnchor("anchor");
    select({"anchor", "a"});

    ASSERT_TRUE(engine.fillGap(Side::Left).ok());
    expectBounds(object("a"), 100, 10, 100, 20);
}

TEST_F(LayoutEngineTest, FillRightAndBottomGrowTowardAnchor) {
    addShape("anchor", 300, 300, 100, 100);
    addShape("a", 100, 0, 50, 20);
    addShape("b", 0, 100, 20, 50);
    setAnchor("anchor");
    select({"a", "b", "anchor"});

    ASSERT_TRUE(engine.fillGap(Side::Right).ok());
    expectBounds(object("a"), 100, 0, 200, 20);
    expectBounds(object("b"), 0, 100, 300, 50);

    ASSERT_TRUE(engine.fillGap(Side::Bottom).ok());
    expectBounds(object("b"), 0, 100, 300, 200);
}

TEST_F(LayoutEngineTest, FillIgnoresFlushObjects) {
    addShape("anchor", 0, 0, 100, 50);
    addShape("flush", 100, 0, 40, 20);
    setAnchor("anchor");
    select({"anchor", "flush"});

    const auto report = engine.fillGap(Side::Left);
    EXPECT_EQ(report.error, LayoutError::NoGapsFound);
    EXPECT_EQ(report.skipped, 1u);
    expectBounds(object("flush"), 100, 0, 40, 20);
    EXPECT_EQ(object("flush").editCount(), 0u);
}

TEST_F(LayoutEngineTest, MagicResizeScalesAroundTopLeft) {
    addShape("a", 10, 20, 200, 100);
    select({"a"});

    const auto report = engine.magicResize(200.0f);
    ASSERT_TRUE(report.ok()) << report.message;
    expectBounds(object("a"), 10, 20, 400, 200);
}

TEST_F(LayoutEngineTest, MagicResizeRejectsNonPositivePercentage) {
    addShape("a", 10, 20, 200, 100);
    select({"a"});

    for (const float p : {0.0f, -50.0f, std::numeric_limits<float>::quiet_NaN()}) {
        const auto report = engine.magicResize(p);
        EXPECT_EQ(report.error, LayoutError::InvalidArgument);
    }
    EXPECT_EQ(object("a").editCount(), 0u);
}

TEST_F(LayoutEngineTest, MagicResizeCountsLineAsFailure) {
    addShape("a", 0, 0, 100, 100);
    addShape("line", 0, 0, 100, 1, ObjectKind::Line);
    select({"a", "line"});

    const auto report = engine.magicResize(50.0f);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.failed, 1u);
    expectBounds(object("a"), 0, 0, 50, 50);
    expectBounds(object("line"), 0, 0, 100, 1);
}

TEST(SizeTransformEngineTest, SizeOperationsNeedTwoObjects) {
    slidelayout::model::SlideModel model;
    model.upsertObject("a", 0, 0, 10, 10);
    model.setSelection({"a"});
    const slidelayout::Selection selection = model.selectedObjects();

    slidelayout::SizeTransformEngine engine;
    EXPECT_EQ(engine.matchSize(selection, std::nullopt, MatchDimension::Both).error, LayoutError::InsufficientSelection);
    EXPECT_EQ(engine.stretch(selection, std::nullopt, Side::Left).error, LayoutError::InsufficientSelection);
    EXPECT_EQ(engine.fillGap(selection, std::nullopt, Side::Left).error, LayoutError::InsufficientSelection);
}

TEST_F(LayoutEngineTest, StretchTopKeepsBottomEdge) {
    addShape("anchor", 0, 20, 100, 300);
    addShape("a", 200, 100, 30, 50);
    setAnchor("anchor");
    select({"anchor", "a"});

    ASSERT_TRUE(engine.stretch(Side::Top).ok());
    expectBounds(object("a"), 200, 20, 30, 130);
}

TEST_F(LayoutEngineTest, StretchBottomMovesOnlyBottomEdge) {
    addShape("anchor", 0, 0, 100, 300);
    addShape("a", 200, 100, 30, 50);
    setAnchor("anchor");
    select({"anchor", "a"});

    ASSERT_TRUE(engine.stretch(Side::Bottom).ok());
    expectBounds(object("a"), 200, 100, 30, 200);
}

TEST_F(LayoutEngineTest, FillTopGrowsUpToAnchorAndSkipsFlush) {
    addShape("anchor", 0, 0, 100, 50);
    addShape("below", 200, 80, 30, 40);
    addShape("flush", 300, 50, 30, 40);
    setAnchor("anchor");
    select({"anchor", "below", "flush"});

    const auto report = engine.fillGap(Side::Top);
    ASSERT_TRUE(report.ok()) << report.message;
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.skipped, 1u);
    expectBounds(object("below"), 200, 50, 30, 70);
    expectBounds(object("flush"), 300, 50, 30, 40);
    EXPECT_EQ(object("flush").editCount(), 0u);
}

TEST_F(LayoutEngineTest, RefusedResizeLeavesObjectInPlace) {
    addShape("anchor", 0, 0, 300, 50);
    addShape("line", 100, 100, 50, 1, ObjectKind::Line);
    setAnchor("anchor");
    select({"anchor", "line"});

    const auto stretched = engine.stretch(Side::Left);
    EXPECT_EQ(stretched.succeeded, 0u);
    EXPECT_EQ(stretched.failed, 1u);
    expectBounds(object("line"), 100, 100, 50, 1);

    const auto filled = engine.fillGap(Side::Top);
    EXPECT_EQ(filled.failed, 1u);
    expectBounds(object("line"), 100, 100, 50, 1);
    EXPECT_EQ(object("line").editCount(), 0u);
}

TEST_F(LayoutEngineTest, SizeEpsilonWidensDegenerateChecks) {
    slidelayout::LayoutOptions options;
    options.sizeEpsilon = 1.0f;
    slidelayout::LayoutEngine tolerant(model, store, options);

    addShape("anchor", 0, 0, 100, 50);
    addShape("near", 100.5f, 0, 40, 20);
    addShape("far", 150, 0, 40, 20);
    setAnchor("anchor");
    select({"anchor", "near", "far"});

    const auto filled = tolerant.fillGap(Side::Left);
    ASSERT_TRUE(filled.ok()) << filled.message;
    EXPECT_EQ(filled.succeeded, 1u);
    EXPECT_EQ(filled.skipped, 1u);
    expectBounds(object("near"), 100.5f, 0, 40, 20);
    expectBounds(object("far"), 100, 0, 90, 20);

    // The default engine treats the half-unit gap as fillable.
    ASSERT_TRUE(engine.fillGap(Side::Left).ok());
    expectBounds(object("near"), 100, 0, 40.5f, 20);
}

TEST(SizeTransformEngineTest, StretchSkipsSizesWithinEpsilon) {
    slidelayout::model::SlideModel model;
    model.upsertObject("anchor", 0, 0, 100, 50);
    model.upsertObject("a", 99.5f, 0, 10, 10);
    model.setSelection({"a", "anchor"});
    const slidelayout::Selection selection = model.selectedObjects();
    const slidelayout::SlideObject& anchor = *model.getObject("anchor");

    slidelayout::SizeTransformEngine engine;
    EXPECT_EQ(engine.computeStretchPlan(selection, anchor, Side::Right).patches.size(), 1u);
    const auto plan = engine.computeStretchPlan(selection, anchor, Side::Right, 1.0f);
    EXPECT_TRUE(plan.patches.empty());
    EXPECT_EQ(plan.skipped, 1u);
}
