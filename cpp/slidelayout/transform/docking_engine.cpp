#include "slidelayout/transform/docking_engine.h"
#include "slidelayout/anchor/anchor_resolver.h"
#include "slidelayout/core/logging.h"

#include <string>

namespace slidelayout {

std::vector<ObjectPatch> DockingEngine::computeDockPatches(const Selection& selection,
                                                           const SlideObject& anchor,
                                                           Side side) const {
    const Bounds reference = anchor.bounds();
    std::vector<ObjectPatch> patches;
    patches.reserve(selection.size());

    for (SlideObject* object : selection) {
        if (!object || object == &anchor) continue;
        const Bounds current = object->bounds();

        ObjectPatch item;
        item.object = object;
        switch (side) {
            case Side::Left:   item.patch.left = reference.left - current.width; break;
            case Side::Right:  item.patch.left = reference.right(); break;
            case Side::Top:    item.patch.top = reference.top - current.height; break;
            case Side::Bottom: item.patch.top = reference.bottom(); break;
        }
        patches.push_back(item);
    }
    return patches;
}

OperationReport DockingEngine::dock(const Selection& selection,
                                    const std::optional<ObjectId>& anchorId,
                                    Side side) const {
    if (selection.size() < kMinDockSelection) {
        return reportFailure(LayoutError::InsufficientSelection,
            "Select at least 2 objects to dock.");
    }

    SlideObject* anchor = resolveAnchor(selection, anchorId);
    SLIDELAYOUT_LOG_DEBUG("dock %s of anchor %s", toString(side), anchor->id().c_str());

    const MutationTally tally = applyPatches(computeDockPatches(selection, *anchor, side));
    return reportTally(tally,
        "Docked " + countNoun(tally.succeeded, "object", "objects") + " to the " + toString(side) + " of the anchor.");
}

} // namespace slidelayout
