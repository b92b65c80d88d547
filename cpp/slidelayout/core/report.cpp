#include "slidelayout/core/report.h"

#include <cmath>
#include <cstdio>
#include <utility>

namespace slidelayout {

const char* toString(AlignEdge edge) {
    switch (edge) {
        case AlignEdge::Left: return "left edge";
        case AlignEdge::Right: return "right edge";
        case AlignEdge::Top: return "top edge";
        case AlignEdge::Bottom: return "bottom edge";
        case AlignEdge::CenterX: return "horizontal center";
        case AlignEdge::CenterY: return "vertical center";
    }
    return "edge";
}

const char* toString(Side side) {
    switch (side) {
        case Side::Left: return "left";
        case Side::Right: return "right";
        case Side::Top: return "top";
        case Side::Bottom: return "bottom";
    }
    return "side";
}

const char* toString(LayoutError error) {
    switch (error) {
        case LayoutError::Ok: return "Ok";
        case LayoutError::InsufficientSelection: return "InsufficientSelection";
        case LayoutError::InvalidArgument: return "InvalidArgument";
        case LayoutError::NoTable: return "NoTable";
        case LayoutError::AmbiguousTable: return "AmbiguousTable";
        case LayoutError::IndexOutOfRange: return "IndexOutOfRange";
        case LayoutError::MergedCells: return "MergedCells";
        case LayoutError::NoGapsFound: return "NoGapsFound";
        case LayoutError::NothingToDo: return "NothingToDo";
    }
    return "Unknown";
}

OperationReport reportFailure(LayoutError error, std::string message) {
    OperationReport report;
    report.error = error;
    report.message = std::move(message);
    return report;
}

OperationReport reportSuccess(std::string message) {
    OperationReport report;
    report.message = std::move(message);
    return report;
}

OperationReport reportTally(const MutationTally& tally, std::string summary) {
    OperationReport report;
    report.succeeded = tally.succeeded;
    report.failed = tally.failed;
    report.skipped = tally.skipped;
    report.message = std::move(summary);
    if (tally.failed > 0) {
        report.message += " " + countNoun(tally.failed, "object", "objects") + " could not be changed.";
    }
    if (tally.skipped > 0) {
        report.message += " Skipped " + countNoun(tally.skipped, "object", "objects") + ".";
    }
    return report;
}

std::string countNoun(std::uint32_t count, const char* singular, const char* plural) {
    return std::to_string(count) + " " + (count == 1 ? singular : plural);
}

std::string formatUnits(float value) {
    char buf[32];
    if (std::floor(value) == value && std::fabs(value) < 1e9f) {
        std::snprintf(buf, sizeof(buf), "%.0f", static_cast<double>(value));
    } else {
        std::snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(value));
    }
    return buf;
}

} // namespace slidelayout
