#include "tests/layout_test_common.h"
#include "slidelayout/table/table_cell_locator.h"
#include "slidelayout/table/table_grid.h"
#include "slidelayout/table/table_lookup.h"

#include <stdexcept>

using namespace layout_test;
using slidelayout::CellAlignment;
using slidelayout::LayoutError;
using slidelayout::TableCellLocator;
using slidelayout::TableGrid;

namespace {
    Bounds centeredAt(float x, float y) { return Bounds{x - 5.0f, y - 5.0f, 10.0f, 10.0f}; }
}

TEST(TableGridTest, CellBoundsArePrefixSums) {
    const TableGrid grid(100, 50, {100, 50, 70}, {40, 60});
    const auto cell = grid.cellBounds(1, 2);
    EXPECT_EQ(cell.row, 1u);
    EXPECT_EQ(cell.column, 2u);
    EXPECT_EQ(cell.bounds, (Bounds{250, 90, 70, 60}));
    EXPECT_EQ(grid.cellBounds(0, 0).bounds, (Bounds{100, 50, 100, 40}));
    EXPECT_THROW(grid.cellBounds(2, 0), std::out_of_range);
}

TEST(TableCellLocatorTest, BoundaryBelongsToCellOnTheRight) {
    const TableGrid grid(0, 0, {100, 100}, {50, 50});
    const TableCellLocator locator;

    const auto onEdge = locator.locate(centeredAt(100, 25), grid);
    ASSERT_TRUE(onEdge.has_value());
    EXPECT_EQ(onEdge->row, 0u);
    EXPECT_EQ(onEdge->column, 1u);

    const auto onRowEdge = locator.locate(centeredAt(20, 50), grid);
    ASSERT_TRUE(onRowEdge.has_value());
    EXPECT_EQ(onRowEdge->row, 1u);
    EXPECT_EQ(onRowEdge->column, 0u);

    const auto origin = locator.locate(centeredAt(0, 0), grid);
    ASSERT_TRUE(origin.has_value());
    EXPECT_EQ(origin->column, 0u);

    EXPECT_FALSE(locator.locate(centeredAt(200, 25), grid).has_value());
    EXPECT_FALSE(locator.locate(centeredAt(50, 100), grid).has_value());
}

TEST(TableCellLocatorTest, StackIsCenteredVertically) {
    slidelayout::model::SlideModel model;
    ModelObject& a = model.upsertObject("a", 0, 0, 20, 10);
    ModelObject& b = model.upsertObject("b", 0, 0, 40, 30);

    slidelayout::CellGroup group{slidelayout::CellBounds{0, 0, Bounds{100, 100, 200, 100}}, {&a, &b}};
    const TableCellLocator locator;
    const auto patches = locator.computeCellAlignPatches(group, CellAlignment::Right, 8.0f, 5.0f);
    ASSERT_EQ(patches.size(), 2u);
    // Stack height 10 + 5 + 30 = 45, centered in [100, 200).
    EXPECT_NEAR(*patches[0].patch.top, 127.5f, kTolerance);
    EXPECT_NEAR(*patches[1].patch.top, 142.5f, kTolerance);
    EXPECT_NEAR(*patches[0].patch.left, 272.0f, kTolerance);
    EXPECT_NEAR(*patches[1].patch.left, 252.0f, kTolerance);

    const auto negative = locator.computeCellAlignPatches(group, CellAlignment::Left, -10.0f, 5.0f);
    EXPECT_NEAR(*negative[0].patch.left, 100.0f, kTolerance);
}

TEST_F(LayoutEngineTest, AlignInTableCellsGroupsByCell) {
    model.upsertTable("table", 0, 0, {100, 100}, {100, 100});
    addShape("a", 10, 10, 20, 20);     // center (20,20) -> cell 0,0
    addShape("b", 60, 50, 20, 20);     // center (70,60) -> cell 0,0
    addShape("c", 140, 140, 20, 20);   // center (150,150) -> cell 1,1
    addShape("out", 300, 0, 20, 20);
    select({"a", "b", "c", "out"});

    const auto report = engine.alignInTableCells(CellAlignment::Center);
    ASSERT_TRUE(report.ok()) << report.message;
    EXPECT_EQ(report.succeeded, 3u);
    EXPECT_EQ(report.skipped, 1u);
    EXPECT_NE(report.message.find("in 2 cells"), std::string::npos);

    // Stack of two 20-high objects and the default gap of 5 in cell (0,0).
    expectBounds(object("a"), 40, 27.5f, 20, 20);
    expectBounds(object("b"), 40, 52.5f, 20, 20);
    expectBounds(object("c"), 140, 140, 20, 20);
    expectBounds(object("out"), 300, 0, 20, 20);
}

TEST_F(LayoutEngineTest, AlignInTableCellsLeftUsesPadding) {
    model.upsertTable("table", 0, 0, {100}, {100});
    addShape("a", 60, 60, 20, 20);
    select({"a", "table"});

    ASSERT_TRUE(engine.alignInTableCells(CellAlignment::Left, 12.0f).ok());
    expectBounds(object("a"), 12, 40, 20, 20);
}

TEST_F(LayoutEngineTest, AlignInTableCellsNeedsSingleTable) {
    addShape("a", 10, 10, 20, 20);
    select({"a"});
    EXPECT_EQ(engine.alignInTableCells(CellAlignment::Left).error, LayoutError::NoTable);

    model.upsertTable("t1", 0, 0, {100}, {100});
    model.upsertTable("t2", 0, 200, {100}, {100});
    select({"a"});
    const auto ambiguous = engine.alignInTableCells(CellAlignment::Left);
    EXPECT_EQ(ambiguous.error, LayoutError::AmbiguousTable);
    EXPECT_EQ(object("a").editCount(), 0u);

    // Selecting one of them resolves the ambiguity.
    select({"a", "t2"});
    EXPECT_EQ(engine.alignInTableCells(CellAlignment::Left).error, LayoutError::NothingToDo);
    select({"a", "t1"});
    EXPECT_TRUE(engine.alignInTableCells(CellAlignment::Left).ok());
}

TEST_F(LayoutEngineTest, AlignInTableCellsNeedsObjects) {
    model.upsertTable("table", 0, 0, {100}, {100});
    select({"table"});
    EXPECT_EQ(engine.alignInTableCells(CellAlignment::Left).error, LayoutError::InsufficientSelection);
}
