// LayoutEngine geometry methods

#include "slidelayout/engine.h"
#include "slidelayout/core/logging.h"

namespace slidelayout {

namespace {
    void logReport(const char* operation, const OperationReport& report) {
        if (!report.ok()) {
            SLIDELAYOUT_LOG_WARN("%s: %s (%s)", operation, toString(report.error), report.message.c_str());
        } else {
            SLIDELAYOUT_LOG_DEBUG("%s: %u ok, %u failed, %u skipped",
                operation, report.succeeded, report.failed, report.skipped);
        }
    }
}

OperationReport LayoutEngine::align(AlignEdge edge) {
    OperationReport report = alignment_.align(source_.selectedObjects(), currentAnchorId(), edge);
    logReport("align", report);
    return report;
}

OperationReport LayoutEngine::distribute(Axis axis) {
    OperationReport report = distribution_.distribute(source_.selectedObjects(), axis);
    logReport("distribute", report);
    return report;
}

OperationReport LayoutEngine::dock(Side side) {
    OperationReport report = docking_.dock(source_.selectedObjects(), currentAnchorId(), side);
    logReport("dock", report);
    return report;
}

OperationReport LayoutEngine::matchSize(MatchDimension dimension) {
    OperationReport report = sizeTransform_.matchSize(source_.selectedObjects(), currentAnchorId(), dimension);
    logReport("matchSize", report);
    return report;
}

OperationReport LayoutEngine::stretch(Side side) {
    OperationReport report = sizeTransform_.stretch(source_.selectedObjects(), currentAnchorId(), side,
        options_.sizeEpsilon);
    logReport("stretch", report);
    return report;
}

OperationReport LayoutEngine::fillGap(Side side) {
    OperationReport report = sizeTransform_.fillGap(source_.selectedObjects(), currentAnchorId(), side,
        options_.sizeEpsilon);
    logReport("fillGap", report);
    return report;
}

OperationReport LayoutEngine::magicResize(float percentage) {
    OperationReport report = sizeTransform_.magicResize(source_.selectedObjects(), percentage);
    logReport("magicResize", report);
    return report;
}

OperationReport LayoutEngine::arrangeMatrix(int rows, int cols, float spacing) {
    const Selection selection = source_.selectedObjects();
    if (selection.size() < kMinMatrixSelection) {
        return reportFailure(LayoutError::InsufficientSelection,
            "Select at least 2 objects to arrange in a matrix.");
    }
    OperationReport report = matrix_.arrange(selection, rows, cols, spacing);
    logReport("arrangeMatrix", report);
    return report;
}

} // namespace slidelayout
