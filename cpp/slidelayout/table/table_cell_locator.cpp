#include "slidelayout/table/table_cell_locator.h"

#include <algorithm>

namespace slidelayout {

std::optional<CellBounds> TableCellLocator::locate(const Bounds& object, const TableGrid& grid) const {
    const float cx = object.centerX();
    const float cy = object.centerY();
    for (std::uint32_t row = 0; row < grid.numRows(); ++row) {
        for (std::uint32_t col = 0; col < grid.numColumns(); ++col) {
            const CellBounds cell = grid.cellBounds(row, col);
            if (cell.bounds.containsPoint(cx, cy)) return cell;
        }
    }
    return std::nullopt;
}

CellGrouping TableCellLocator::groupByCell(const Selection& objects, const TableGrid& grid) const {
    CellGrouping grouping;
    for (SlideObject* object : objects) {
        if (!object) continue;
        const std::optional<CellBounds> cell = locate(object->bounds(), grid);
        if (!cell) {
            grouping.unplaced.push_back(object);
            continue;
        }

        auto it = std::find_if(grouping.groups.begin(), grouping.groups.end(), [&cell](const CellGroup& group) {
            return group.cell.bounds == cell->bounds;
        });
        if (it == grouping.groups.end()) {
            grouping.groups.push_back(CellGroup{*cell, {}});
            it = grouping.groups.end() - 1;
        }
        it->objects.push_back(object);
    }
    return grouping;
}

std::vector<ObjectPatch> TableCellLocator::computeCellAlignPatches(const CellGroup& group,
                                                                   CellAlignment alignment,
                                                                   float padding,
                                                                   float stackGap) const {
    std::vector<ObjectPatch> patches;
    if (group.objects.empty()) return patches;

    const float pad = std::max(0.0f, padding);
    const Bounds& cell = group.cell.bounds;

    float stackHeight = 0.0f;
    for (const SlideObject* object : group.objects) stackHeight += object->getHeight();
    stackHeight += stackGap * static_cast<float>(group.objects.size() - 1);

    float cursor = cell.top + cell.height / 2.0f - stackHeight / 2.0f;
    for (SlideObject* object : group.objects) {
        const float width = object->getWidth();
        ObjectPatch item;
        item.object = object;
        switch (alignment) {
            case CellAlignment::Left:   item.patch.left = cell.left + pad; break;
            case CellAlignment::Center: item.patch.left = cell.left + cell.width / 2.0f - width / 2.0f; break;
            case CellAlignment::Right:  item.patch.left = cell.left + cell.width - width - pad; break;
        }
        item.patch.top = cursor;
        patches.push_back(item);
        cursor += object->getHeight() + stackGap;
    }
    return patches;
}

MutationTally TableCellLocator::alignWithinCell(const CellGroup& group,
                                                CellAlignment alignment,
                                                float padding,
                                                float stackGap) const {
    return applyPatches(computeCellAlignPatches(group, alignment, padding, stackGap));
}

} // namespace slidelayout
