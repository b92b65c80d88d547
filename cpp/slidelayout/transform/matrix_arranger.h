#pragma once

#include "slidelayout/core/report.h"
#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"
#include "slidelayout/transform/geometry_patch.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace slidelayout {

struct GridDimensions {
    std::uint32_t rows{1};
    std::uint32_t cols{1};

    bool operator==(const GridDimensions& other) const { return rows == other.rows && cols == other.cols; }
};

// Column count is kept; row count becomes ceil(count / cols), which drops
// unused rows and adds rows for overflow alike, so the requested row count
// never constrains the result. A non-positive column count gives a single row
// of `count` columns, an empty element list gives 1x1.
GridDimensions solveGridDimensions(std::size_t count, int requestedRows, int requestedCols);

struct MatrixPlan {
    GridDimensions dimensions;
    Bounds area;
    float cellWidth{0.0f};
    float cellHeight{0.0f};
    std::vector<ObjectPatch> patches;
};

// Lays elements out row-major in input order inside their own bounding box.
// Each element is pinned to its cell's top-left corner. Any element count is
// accepted; an empty list yields a 1x1 grid and no edits.
class MatrixArranger {
public:
    MatrixPlan computeMatrixPlan(const Selection& elements, int requestedRows, int requestedCols, float spacing) const;

    OperationReport arrange(const Selection& elements, int requestedRows, int requestedCols, float spacing) const;
};

} // namespace slidelayout
