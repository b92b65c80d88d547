#include "tests/layout_test_common.h"
#include "slidelayout/table/cell_content_swapper.h"
#include "slidelayout/table/cell_payload.h"

using namespace layout_test;
using slidelayout::ContentAlignment;
using slidelayout::LayoutError;
using slidelayout::model::ModelCell;
using slidelayout::model::ModelTable;
namespace text = slidelayout::text;

class CellContentSwapperTest : public LayoutEngineTest {
protected:
    // 3 rows x 2 columns, cell text "r<row>c<col>" (1-based).
    ModelTable& addTable(const std::string& id = "table") {
        ModelTable& table = model.upsertTable(id, 0, 0, {100, 100}, {40, 40, 40});
        for (std::uint32_t r = 0; r < table.numRows(); ++r) {
            for (std::uint32_t c = 0; c < table.numColumns(); ++c) {
                table.modelCell(r, c).setText("r" + std::to_string(r + 1) + "c" + std::to_string(c + 1));
            }
        }
        return table;
    }

    std::uint32_t totalWrites(const ModelTable& table) const {
        std::uint32_t writes = 0;
        for (std::uint32_t r = 0; r < table.numRows(); ++r) {
            for (std::uint32_t c = 0; c < table.numColumns(); ++c) writes += table.modelCell(r, c).writeCount();
        }
        return writes;
    }
};

TEST_F(CellContentSwapperTest, SwapRowsTextOnly) {
    ModelTable& table = addTable();
    table.modelCell(0, 0).setSolidFill(text::ColorSpec::rgb("#FF0000"), 1.0f);

    const auto report = engine.swapTableRows(1, 3, false);
    ASSERT_TRUE(report.ok()) << report.message;
    EXPECT_EQ(report.succeeded, 4u);
    EXPECT_EQ(table.modelCell(0, 0).getText(), "r3c1");
    EXPECT_EQ(table.modelCell(0, 1).getText(), "r3c2");
    EXPECT_EQ(table.modelCell(2, 0).getText(), "r1c1");
    EXPECT_EQ(table.modelCell(1, 0).getText(), "r2c1");
    // Fill stays with the cell.
    EXPECT_TRUE(table.modelCell(0, 0).getFill().visible);
    EXPECT_FALSE(table.modelCell(2, 0).getFill().visible);
    EXPECT_NE(report.message.find("text only"), std::string::npos);
}

TEST_F(CellContentSwapperTest, SwapColumnsTextOnly) {
    ModelTable& table = addTable();

    ASSERT_TRUE(engine.swapTableColumns(2, 1, false).ok());
    for (std::uint32_t r = 0; r < 3; ++r) {
        EXPECT_EQ(table.modelCell(r, 0).getText(), "r" + std::to_string(r + 1) + "c2");
        EXPECT_EQ(table.modelCell(r, 1).getText(), "r" + std::to_string(r + 1) + "c1");
    }
}

TEST_F(CellContentSwapperTest, KeepFormattingMovesStyleAndFill) {
    ModelTable& table = addTable();
    ModelCell& first = table.modelCell(0, 1);
    text::RunStyleSnapshot italic;
    italic.italic = true;
    first.applyRunStyle({0, 2}, italic);
    first.setSolidFill(text::ColorSpec::theme("accent2"), 0.25f);
    first.setContentAlignment(ContentAlignment::Middle);
    const slidelayout::CellPayload before = slidelayout::capturePayload(first);

    ASSERT_TRUE(engine.swapTableRows(1, 2, true).ok());
    EXPECT_EQ(slidelayout::capturePayload(table.modelCell(1, 1)), before);
    EXPECT_EQ(table.modelCell(0, 1).getText(), "r2c2");
    EXPECT_FALSE(table.modelCell(0, 1).getFill().visible);
}

TEST_F(CellContentSwapperTest, KeepFormattingSwapTwiceRestoresPayloads) {
    ModelTable& table = addTable();
    ModelCell& cell = table.modelCell(0, 0);
    cell.setText("Hello\nWorld");
    text::RunStyleSnapshot bold;
    bold.bold = true;
    bold.fontSize = 18.0f;
    cell.applyRunStyle({0, 5}, bold);
    text::ParagraphStyleSnapshot spaced;
    spaced.spaceAbove = 6.0f;
    cell.applyParagraphStyle({6, 11}, spaced);
    cell.setSolidFill(text::ColorSpec::rgb("#336699"), 0.5f);
    cell.setContentAlignment(ContentAlignment::Middle);
    table.modelCell(2, 0).setContentAlignment(ContentAlignment::Bottom);

    std::vector<slidelayout::CellPayload> before;
    for (std::uint32_t c = 0; c < 2; ++c) {
        before.push_back(slidelayout::capturePayload(table.modelCell(0, c)));
        before.push_back(slidelayout::capturePayload(table.modelCell(2, c)));
    }

    ASSERT_TRUE(engine.swapTableRows(1, 3, true).ok());
    ASSERT_TRUE(engine.swapTableRows(1, 3, true).ok());

    std::vector<slidelayout::CellPayload> after;
    for (std::uint32_t c = 0; c < 2; ++c) {
        after.push_back(slidelayout::capturePayload(table.modelCell(0, c)));
        after.push_back(slidelayout::capturePayload(table.modelCell(2, c)));
    }
    EXPECT_EQ(after, before);
}

TEST_F(CellContentSwapperTest, MergedCellsRejectWithoutWrites) {
    ModelTable& table = addTable();
    table.mergeCells(1, 0, 1, 2);
    const std::uint32_t writes = totalWrites(table);

    const auto report = engine.swapTableRows(1, 2, true);
    EXPECT_EQ(report.error, LayoutError::MergedCells);
    EXPECT_NE(report.message.find("Row 2"), std::string::npos);
    EXPECT_EQ(totalWrites(table), writes);
    EXPECT_EQ(table.modelCell(0, 0).getText(), "r1c1");

    // Columns cross the merged row too.
    EXPECT_EQ(engine.swapTableColumns(1, 2, false).error, LayoutError::MergedCells);
    EXPECT_EQ(totalWrites(table), writes);
}

TEST_F(CellContentSwapperTest, OutOfRangeIndexIsRejected) {
    ModelTable& table = addTable();
    const std::uint32_t writes = totalWrites(table);

    for (const int bad : {0, -1, 4}) {
        const auto report = engine.swapTableRows(1, bad, false);
        EXPECT_EQ(report.error, LayoutError::IndexOutOfRange) << bad;
    }
    const auto report = engine.swapTableColumns(3, 1, false);
    EXPECT_EQ(report.error, LayoutError::IndexOutOfRange);
    EXPECT_EQ(report.message, "Column 3 does not exist. The table has 2 columns.");
    EXPECT_EQ(totalWrites(table), writes);
}

TEST_F(CellContentSwapperTest, SameIndexIsNoop) {
    ModelTable& table = addTable();
    table.mergeCells(1, 0, 1, 2);
    const std::uint32_t writes = totalWrites(table);

    const auto report = engine.swapTableRows(2, 2, true);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.succeeded, 0u);
    EXPECT_EQ(totalWrites(table), writes);
}

TEST_F(CellContentSwapperTest, TableLookupFailures) {
    EXPECT_EQ(engine.swapTableRows(1, 2, false).error, LayoutError::NoTable);

    addTable("t1");
    addTable("t2");
    EXPECT_EQ(engine.swapTableRows(1, 2, false).error, LayoutError::AmbiguousTable);

    select({"t2"});
    ASSERT_TRUE(engine.swapTableRows(1, 2, false).ok());
    EXPECT_EQ(model.getTable("t2")->modelCell(0, 0).getText(), "r2c1");
    EXPECT_EQ(model.getTable("t1")->modelCell(0, 0).getText(), "r1c1");
}
