#pragma once

#include "slidelayout/core/geometry.h"
#include "slidelayout/host/host_api.h"

#include <cstdint>
#include <vector>

namespace slidelayout {

struct CellBounds {
    std::uint32_t row{0};
    std::uint32_t column{0};
    Bounds bounds;
};

// Cell geometry of a positioned table. Column lefts and row tops are prefix
// sums of the supplied widths and heights, starting at the table origin.
class TableGrid {
public:
    TableGrid(float left, float top, std::vector<float> columnWidths, std::vector<float> rowHeights);

    static TableGrid fromTable(const SlideTable& table);

    std::uint32_t numRows() const { return static_cast<std::uint32_t>(rowHeights_.size()); }
    std::uint32_t numColumns() const { return static_cast<std::uint32_t>(columnWidths_.size()); }

    // Zero-based. Throws std::out_of_range outside the grid.
    CellBounds cellBounds(std::uint32_t row, std::uint32_t column) const;

private:
    float left_;
    float top_;
    std::vector<float> columnWidths_;
    std::vector<float> rowHeights_;
    std::vector<float> columnLefts_;
    std::vector<float> rowTops_;
};

} // namespace slidelayout
