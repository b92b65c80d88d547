#include <gtest/gtest.h>
#include "slidelayout/core/geometry.h"
#include "slidelayout/core/report.h"
#include "slidelayout/model/slide_model.h"
#include "slidelayout/transform/geometry_patch.h"

#include <vector>

using slidelayout::Bounds;

TEST(GeometryTest, EdgesAndCenters) {
    const Bounds b{10.0f, 20.0f, 40.0f, 30.0f};
    EXPECT_FLOAT_EQ(b.right(), 50.0f);
    EXPECT_FLOAT_EQ(b.bottom(), 50.0f);
    EXPECT_FLOAT_EQ(b.centerX(), 30.0f);
    EXPECT_FLOAT_EQ(b.centerY(), 35.0f);
}

TEST(GeometryTest, ContainsPointIsHalfOpen) {
    const Bounds b{0.0f, 0.0f, 100.0f, 50.0f};
    EXPECT_TRUE(b.containsPoint(0.0f, 0.0f));
    EXPECT_TRUE(b.containsPoint(99.9f, 49.9f));
    EXPECT_FALSE(b.containsPoint(100.0f, 10.0f));
    EXPECT_FALSE(b.containsPoint(10.0f, 50.0f));
    EXPECT_FALSE(b.containsPoint(-0.1f, 10.0f));
}

TEST(GeometryTest, UnionCoversAllInputs) {
    const std::vector<Bounds> items = {
        {10.0f, 10.0f, 20.0f, 20.0f},
        {-5.0f, 40.0f, 10.0f, 10.0f},
        {100.0f, 0.0f, 5.0f, 5.0f},
    };
    const Bounds u = slidelayout::unionBounds(items);
    EXPECT_FLOAT_EQ(u.left, -5.0f);
    EXPECT_FLOAT_EQ(u.top, 0.0f);
    EXPECT_FLOAT_EQ(u.right(), 105.0f);
    EXPECT_FLOAT_EQ(u.bottom(), 50.0f);
}

TEST(GeometryTest, UnionOfNothingIsEmpty) {
    const Bounds u = slidelayout::unionBounds(std::vector<Bounds>{});
    EXPECT_EQ(u, Bounds{});
}

TEST(ReportTest, TallyCountsFailuresSeparately) {
    slidelayout::MutationTally tally;
    tally.record(slidelayout::HostStatus::Ok);
    tally.record(slidelayout::HostStatus::Rejected);
    tally.record(slidelayout::HostStatus::Unsupported);
    tally.skip();

    const slidelayout::OperationReport report = slidelayout::reportTally(tally, "Moved 1 object.");
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.partial());
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.failed, 2u);
    EXPECT_EQ(report.skipped, 1u);
    EXPECT_EQ(report.message, "Moved 1 object. 2 objects could not be changed. Skipped 1 object.");
}

TEST(ReportTest, FormatUnitsDropsTrailingZeros) {
    EXPECT_EQ(slidelayout::formatUnits(60.0f), "60");
    EXPECT_EQ(slidelayout::formatUnits(-12.5f), "-12.50");
}

TEST(GeometryPatchTest, RefusedSetterRestoresEarlierFields) {
    slidelayout::model::SlideModel model;
    slidelayout::model::ModelObject& shape = model.upsertObject("shape", 10, 20, 30, 40);

    slidelayout::GeometryPatch patch;
    patch.left = 0.0f;
    patch.width = 50.0f;
    patch.height = -1.0f;

    EXPECT_EQ(slidelayout::applyPatch(shape, patch), slidelayout::HostStatus::Rejected);
    EXPECT_EQ(shape.bounds(), (Bounds{10, 20, 30, 40}));
}

TEST(GeometryPatchTest, SizeIsWrittenBeforePosition) {
    slidelayout::model::SlideModel model;
    slidelayout::model::ModelObject& line =
        model.upsertObject("line", 10, 20, 30, 1, slidelayout::model::ObjectKind::Line);

    slidelayout::GeometryPatch patch;
    patch.left = 0.0f;
    patch.width = 40.0f;

    EXPECT_EQ(slidelayout::applyPatch(line, patch), slidelayout::HostStatus::Unsupported);
    EXPECT_EQ(line.bounds(), (Bounds{10, 20, 30, 1}));
    EXPECT_EQ(line.editCount(), 0u);
}
