// LayoutEngine table methods

#include "slidelayout/engine.h"
#include "slidelayout/core/logging.h"
#include "slidelayout/table/table_grid.h"
#include "slidelayout/table/table_lookup.h"

#include <cmath>
#include <string>

namespace slidelayout {

OperationReport LayoutEngine::alignInTableCells(CellAlignment alignment, float padding) {
    if (!std::isfinite(padding)) {
        return reportFailure(LayoutError::InvalidArgument, "Padding must be a number.");
    }

    const Selection objects = source_.selectedObjects();
    if (objects.empty()) {
        return reportFailure(LayoutError::InsufficientSelection,
            "Select the objects to align together with their table.");
    }

    TableLookup lookup = findTargetTable(source_);
    if (!lookup.found()) return lookup.failure;

    const TableGrid grid = TableGrid::fromTable(*lookup.table);
    const CellGrouping grouping = cellLocator_.groupByCell(objects, grid);
    if (grouping.groups.empty()) {
        return reportFailure(LayoutError::NothingToDo, "None of the selected objects is inside a table cell.");
    }

    MutationTally tally;
    for (const CellGroup& group : grouping.groups) {
        const MutationTally groupTally = cellLocator_.alignWithinCell(group, alignment, padding, options_.cellStackGap);
        tally.succeeded += groupTally.succeeded;
        tally.failed += groupTally.failed;
    }

    SLIDELAYOUT_LOG_DEBUG("alignInTableCells: %zu cells, %zu unplaced", grouping.groups.size(), grouping.unplaced.size());
    std::string summary = "Aligned " + countNoun(tally.succeeded, "object", "objects") + " in "
        + countNoun(static_cast<std::uint32_t>(grouping.groups.size()), "cell", "cells") + ".";
    OperationReport report = reportTally(tally, std::move(summary));
    if (!grouping.unplaced.empty()) {
        report.skipped = static_cast<std::uint32_t>(grouping.unplaced.size());
        report.message += " " + countNoun(report.skipped, "object is", "objects are") + " outside the table.";
    }
    return report;
}

OperationReport LayoutEngine::swapTableRows(int first, int second, bool keepFormatting) {
    OperationReport report = swapper_.swap(source_, TableAxis::Rows, first, second, keepFormatting);
    if (!report.ok()) SLIDELAYOUT_LOG_WARN("swapTableRows: %s", report.message.c_str());
    return report;
}

OperationReport LayoutEngine::swapTableColumns(int first, int second, bool keepFormatting) {
    OperationReport report = swapper_.swap(source_, TableAxis::Columns, first, second, keepFormatting);
    if (!report.ok()) SLIDELAYOUT_LOG_WARN("swapTableColumns: %s", report.message.c_str());
    return report;
}

} // namespace slidelayout
