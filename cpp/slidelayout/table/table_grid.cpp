#include "slidelayout/table/table_grid.h"

#include <stdexcept>
#include <utility>

namespace slidelayout {

TableGrid::TableGrid(float left, float top, std::vector<float> columnWidths, std::vector<float> rowHeights)
    : left_(left),
      top_(top),
      columnWidths_(std::move(columnWidths)),
      rowHeights_(std::move(rowHeights)) {
    columnLefts_.reserve(columnWidths_.size());
    float x = left_;
    for (const float width : columnWidths_) {
        columnLefts_.push_back(x);
        x += width;
    }
    rowTops_.reserve(rowHeights_.size());
    float y = top_;
    for (const float height : rowHeights_) {
        rowTops_.push_back(y);
        y += height;
    }
}

TableGrid TableGrid::fromTable(const SlideTable& table) {
    std::vector<float> widths;
    std::vector<float> heights;
    widths.reserve(table.numColumns());
    heights.reserve(table.numRows());
    for (std::uint32_t c = 0; c < table.numColumns(); ++c) widths.push_back(table.columnWidth(c));
    for (std::uint32_t r = 0; r < table.numRows(); ++r) heights.push_back(table.rowHeight(r));
    return TableGrid(table.getLeft(), table.getTop(), std::move(widths), std::move(heights));
}

CellBounds TableGrid::cellBounds(std::uint32_t row, std::uint32_t column) const {
    if (row >= numRows() || column >= numColumns()) {
        throw std::out_of_range("TableGrid::cellBounds: cell outside grid");
    }
    CellBounds cell;
    cell.row = row;
    cell.column = column;
    cell.bounds = Bounds{columnLefts_[column], rowTops_[row], columnWidths_[column], rowHeights_[row]};
    return cell;
}

} // namespace slidelayout
