#pragma once

#include "slidelayout/core/report.h"
#include "slidelayout/host/host_api.h"
#include "slidelayout/table/table_grid.h"
#include "slidelayout/transform/geometry_patch.h"

#include <optional>
#include <vector>

namespace slidelayout {

struct CellGroup {
    CellBounds cell;
    // Input order of the objects whose center lies in the cell.
    std::vector<SlideObject*> objects;
};

struct CellGrouping {
    std::vector<CellGroup> groups;
    // Objects whose center lies outside every cell.
    std::vector<SlideObject*> unplaced;
};

class TableCellLocator {
public:
    // First cell in row-major order whose half-open bounds contain the
    // object's center point.
    std::optional<CellBounds> locate(const Bounds& object, const TableGrid& grid) const;

    // Groups by cell bounds rather than cell index, so two lookups that
    // resolve to the same rectangle always share a group.
    CellGrouping groupByCell(const Selection& objects, const TableGrid& grid) const;

    // Stacks the group vertically, centered in the cell, with `stackGap`
    // between neighbours. Negative padding is treated as 0.
    std::vector<ObjectPatch> computeCellAlignPatches(const CellGroup& group,
                                                     CellAlignment alignment,
                                                     float padding,
                                                     float stackGap) const;

    MutationTally alignWithinCell(const CellGroup& group, CellAlignment alignment, float padding, float stackGap) const;
};

} // namespace slidelayout
