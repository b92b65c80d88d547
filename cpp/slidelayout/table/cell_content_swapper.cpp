#include "slidelayout/table/cell_content_swapper.h"
#include "slidelayout/core/logging.h"
#include "slidelayout/table/cell_payload.h"
#include "slidelayout/table/table_lookup.h"

#include <initializer_list>
#include <string>

namespace slidelayout {

namespace {
    const char* lineNoun(TableAxis axis) { return axis == TableAxis::Rows ? "Row" : "Column"; }
    const char* linesNoun(TableAxis axis) { return axis == TableAxis::Rows ? "rows" : "columns"; }

    std::uint32_t lineCount(const SlideTable& table, TableAxis axis) {
        return axis == TableAxis::Rows ? table.numRows() : table.numColumns();
    }

    std::uint32_t crossCount(const SlideTable& table, TableAxis axis) {
        return axis == TableAxis::Rows ? table.numColumns() : table.numRows();
    }

    TableCell& cellAt(SlideTable& table, TableAxis axis, std::uint32_t line, std::uint32_t cross) {
        return axis == TableAxis::Rows ? table.cell(line, cross) : table.cell(cross, line);
    }

    bool validIndex(int index, std::uint32_t count) {
        return index >= 1 && static_cast<std::uint32_t>(index) <= count;
    }
}

std::optional<std::uint32_t> CellContentSwapper::findMergedLine(SlideTable& table,
                                                                TableAxis axis,
                                                                std::uint32_t first,
                                                                std::uint32_t second) const {
    const std::uint32_t cross = crossCount(table, axis);
    for (const std::uint32_t line : {first, second}) {
        for (std::uint32_t i = 0; i < cross; ++i) {
            if (cellAt(table, axis, line, i).mergeState() != MergeState::Normal) return line;
        }
    }
    return std::nullopt;
}

OperationReport CellContentSwapper::swap(SelectionSource& source,
                                         TableAxis axis,
                                         int first,
                                         int second,
                                         bool keepFormatting) const {
    TableLookup lookup = findTargetTable(source);
    if (!lookup.found()) return lookup.failure;
    return swapInTable(*lookup.table, axis, first, second, keepFormatting);
}

OperationReport CellContentSwapper::swapInTable(SlideTable& table,
                                                TableAxis axis,
                                                int first,
                                                int second,
                                                bool keepFormatting) const {
    const std::uint32_t count = lineCount(table, axis);
    for (const int index : {first, second}) {
        if (!validIndex(index, count)) {
            return reportFailure(LayoutError::IndexOutOfRange,
                std::string(lineNoun(axis)) + " " + std::to_string(index) + " does not exist. The table has "
                + std::to_string(count) + " " + linesNoun(axis) + ".");
        }
    }
    if (first == second) {
        return reportSuccess(std::string(lineNoun(axis)) + " " + std::to_string(first)
            + " was chosen twice; nothing to swap.");
    }

    const std::uint32_t a = static_cast<std::uint32_t>(first - 1);
    const std::uint32_t b = static_cast<std::uint32_t>(second - 1);
    if (const std::optional<std::uint32_t> merged = findMergedLine(table, axis, a, b)) {
        SLIDELAYOUT_LOG_WARN("swap rejected: merged cells in %s %u of table %s",
            linesNoun(axis), *merged + 1, table.id().c_str());
        return reportFailure(LayoutError::MergedCells,
            std::string(lineNoun(axis)) + " " + std::to_string(*merged + 1)
            + " contains merged cells. Unmerge them before swapping.");
    }

    MutationTally tally;
    const std::uint32_t cross = crossCount(table, axis);
    for (std::uint32_t i = 0; i < cross; ++i) {
        TableCell& cellA = cellAt(table, axis, a, i);
        TableCell& cellB = cellAt(table, axis, b, i);

        if (keepFormatting) {
            // Both snapshots are taken before either cell is written.
            const CellPayload payloadA = capturePayload(cellA);
            const CellPayload payloadB = capturePayload(cellB);
            tally.record(applyPayload(cellA, payloadB));
            tally.record(applyPayload(cellB, payloadA));
        } else {
            const std::string textA = cellA.getText();
            const std::string textB = cellB.getText();
            tally.record(cellA.setText(textB));
            tally.record(cellB.setText(textA));
        }
    }

    SLIDELAYOUT_LOG_DEBUG("swapped %s %d and %d of table %s (%u cells)",
        linesNoun(axis), first, second, table.id().c_str(), tally.succeeded);

    OperationReport report;
    report.succeeded = tally.succeeded;
    report.failed = tally.failed;
    report.message = std::string("Swapped ") + linesNoun(axis) + " " + std::to_string(first) + " and "
        + std::to_string(second) + (keepFormatting ? " with formatting preserved." : " (text only).");
    if (tally.failed > 0) {
        report.message += " " + countNoun(tally.failed, "cell", "cells") + " could not be updated.";
    }
    return report;
}

} // namespace slidelayout
