#include "slidelayout/transform/alignment_engine.h"
#include "slidelayout/anchor/anchor_resolver.h"
#include "slidelayout/core/logging.h"

#include <string>

namespace slidelayout {

std::vector<ObjectPatch> AlignmentEngine::computeAlignPatches(const Selection& selection,
                                                              const SlideObject& anchor,
                                                              AlignEdge edge) const {
    const Bounds reference = anchor.bounds();
    std::vector<ObjectPatch> patches;
    patches.reserve(selection.size());

    for (SlideObject* object : selection) {
        if (!object || object == &anchor) continue;
        const Bounds current = object->bounds();

        ObjectPatch item;
        item.object = object;
        switch (edge) {
            case AlignEdge::Left:    item.patch.left = reference.left; break;
            case AlignEdge::Right:   item.patch.left = reference.right() - current.width; break;
            case AlignEdge::Top:     item.patch.top = reference.top; break;
            case AlignEdge::Bottom:  item.patch.top = reference.bottom() - current.height; break;
            case AlignEdge::CenterX: item.patch.left = reference.centerX() - current.width / 2.0f; break;
            case AlignEdge::CenterY: item.patch.top = reference.centerY() - current.height / 2.0f; break;
        }
        patches.push_back(item);
    }

    return patches;
}

OperationReport AlignmentEngine::align(const Selection& selection,
                                       const std::optional<ObjectId>& anchorId,
                                       AlignEdge edge) const {
    if (selection.size() < kMinAlignSelection) {
        return reportFailure(LayoutError::InsufficientSelection,
            "Select at least 2 objects to align.");
    }

    SlideObject* anchor = resolveAnchor(selection, anchorId);
    SLIDELAYOUT_LOG_DEBUG("align %s to anchor %s", toString(edge), anchor->id().c_str());

    const MutationTally tally = applyPatches(computeAlignPatches(selection, *anchor, edge));
    return reportTally(tally,
        "Aligned " + countNoun(tally.succeeded, "object", "objects") + " to the anchor's " + toString(edge) + ".");
}

} // namespace slidelayout
