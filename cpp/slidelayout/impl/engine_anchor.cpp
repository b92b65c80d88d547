// LayoutEngine anchor methods

#include "slidelayout/engine.h"
#include "slidelayout/core/logging.h"

#include <string>
#include <utility>

namespace slidelayout {

LayoutEngine::LayoutEngine(SelectionSource& source, KeyValueStore& store, LayoutOptions options)
    : source_(source),
      anchorStore_(store, options.anchorStorageKey),
      options_(std::move(options)) {}

OperationReport LayoutEngine::setAnchorFromSelection() {
    const Selection selection = source_.selectedObjects();
    if (selection.empty()) {
        return reportFailure(LayoutError::InsufficientSelection, "Select one object to use as the anchor.");
    }
    if (selection.size() > 1) {
        return reportFailure(LayoutError::InvalidArgument,
            "Select only one object to use as the anchor (" + std::to_string(selection.size()) + " selected).");
    }

    const ObjectId id = selection.front()->id();
    anchorStore_.save(id);
    SLIDELAYOUT_LOG_DEBUG("anchor set to %s", id.c_str());
    OperationReport report = reportSuccess("Anchor set to " + id + ".");
    report.succeeded = 1;
    return report;
}

OperationReport LayoutEngine::clearAnchor() {
    if (!anchorStore_.clear()) {
        return reportSuccess("No anchor was set.");
    }
    SLIDELAYOUT_LOG_DEBUG("anchor cleared");
    return reportSuccess("Anchor cleared. The last selected object will be used as the anchor.");
}

OperationReport LayoutEngine::anchorStatus() {
    const std::optional<ObjectId> stored = currentAnchorId();
    const Selection selection = source_.selectedObjects();
    const SlideObject* effective = resolveAnchor(selection, stored);

    std::string message;
    if (!stored) {
        message = "No anchor set.";
    } else if (selectionContainsAnchor(selection, stored)) {
        message = "Anchor: " + *stored + " (in the current selection).";
    } else {
        message = "Anchor: " + *stored + " (not in the current selection).";
    }
    if (effective) {
        message += " Operations will use " + effective->id() + " as the anchor.";
    }
    return reportSuccess(std::move(message));
}

} // namespace slidelayout
