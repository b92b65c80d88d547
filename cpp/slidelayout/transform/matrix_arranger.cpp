#include "slidelayout/transform/matrix_arranger.h"
#include "slidelayout/core/logging.h"

#include <cmath>
#include <string>

namespace slidelayout {

GridDimensions solveGridDimensions(std::size_t count, int /*requestedRows*/, int requestedCols) {
    GridDimensions dims;
    if (count == 0) return dims;

    if (requestedCols <= 0) {
        dims.rows = 1;
        dims.cols = static_cast<std::uint32_t>(count);
        return dims;
    }

    const std::size_t cols = static_cast<std::size_t>(requestedCols);
    dims.cols = static_cast<std::uint32_t>(cols);
    dims.rows = static_cast<std::uint32_t>((count + cols - 1) / cols);
    return dims;
}

MatrixPlan MatrixArranger::computeMatrixPlan(const Selection& elements,
                                             int requestedRows,
                                             int requestedCols,
                                             float spacing) const {
    MatrixPlan plan;
    std::vector<Bounds> boxes;
    boxes.reserve(elements.size());
    for (const SlideObject* object : elements) {
        if (object) boxes.push_back(object->bounds());
    }

    plan.dimensions = solveGridDimensions(boxes.size(), requestedRows, requestedCols);
    if (boxes.empty()) return plan;

    plan.area = unionBounds(boxes);
    const float cols = static_cast<float>(plan.dimensions.cols);
    const float rows = static_cast<float>(plan.dimensions.rows);
    plan.cellWidth = (plan.area.width - (cols - 1.0f) * spacing) / cols;
    plan.cellHeight = (plan.area.height - (rows - 1.0f) * spacing) / rows;

    std::uint32_t index = 0;
    for (SlideObject* object : elements) {
        if (!object) continue;
        const std::uint32_t row = index / plan.dimensions.cols;
        const std::uint32_t col = index % plan.dimensions.cols;
        ObjectPatch item;
        item.object = object;
        item.patch.left = plan.area.left + static_cast<float>(col) * (plan.cellWidth + spacing);
        item.patch.top = plan.area.top + static_cast<float>(row) * (plan.cellHeight + spacing);
        plan.patches.push_back(item);
        index++;
    }
    return plan;
}

OperationReport MatrixArranger::arrange(const Selection& elements,
                                        int requestedRows,
                                        int requestedCols,
                                        float spacing) const {
    if (!std::isfinite(spacing) || spacing < 0.0f) {
        return reportFailure(LayoutError::InvalidArgument,
            "Spacing must be 0 or greater.");
    }

    const MatrixPlan plan = computeMatrixPlan(elements, requestedRows, requestedCols, spacing);
    SLIDELAYOUT_LOG_DEBUG("matrix %ux%u for %zu elements (requested %dx%d)",
        plan.dimensions.rows, plan.dimensions.cols, elements.size(), requestedRows, requestedCols);

    const MutationTally tally = applyPatches(plan.patches);
    std::string summary = "Arranged " + countNoun(tally.succeeded, "object", "objects") + " in a "
        + std::to_string(plan.dimensions.rows) + "x" + std::to_string(plan.dimensions.cols) + " grid.";
    if (requestedRows > 0 && requestedCols > 0 && plan.dimensions.rows != static_cast<std::uint32_t>(requestedRows)) {
        summary += " Row count adjusted from " + std::to_string(requestedRows) + ".";
    }
    return reportTally(tally, std::move(summary));
}

} // namespace slidelayout
