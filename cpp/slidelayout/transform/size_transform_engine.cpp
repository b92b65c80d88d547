#include "slidelayout/transform/size_transform_engine.h"
#include "slidelayout/anchor/anchor_resolver.h"
#include "slidelayout/core/logging.h"

#include <cmath>
#include <string>

namespace slidelayout {

namespace {
    const char* dimensionLabel(MatchDimension dimension) {
        switch (dimension) {
            case MatchDimension::Width: return "width";
            case MatchDimension::Height: return "height";
            case MatchDimension::Both: return "size";
        }
        return "size";
    }

    OperationReport requireSizeSelection(const char* verb) {
        return reportFailure(LayoutError::InsufficientSelection,
            std::string("Select at least 2 objects to ") + verb + ".");
    }
}

SizePlan SizeTransformEngine::computeMatchPlan(const Selection& selection,
                                               const SlideObject& anchor,
                                               MatchDimension dimension) const {
    const Bounds reference = anchor.bounds();
    SizePlan plan;
    for (SlideObject* object : selection) {
        if (!object || object == &anchor) continue;
        ObjectPatch item;
        item.object = object;
        if (dimension != MatchDimension::Height) item.patch.width = reference.width;
        if (dimension != MatchDimension::Width) item.patch.height = reference.height;
        plan.patches.push_back(item);
    }
    return plan;
}

SizePlan SizeTransformEngine::computeStretchPlan(const Selection& selection,
                                                 const SlideObject& anchor,
                                                 Side side,
                                                 float epsilon) const {
    const Bounds reference = anchor.bounds();
    SizePlan plan;
    for (SlideObject* object : selection) {
        if (!object || object == &anchor) continue;
        const Bounds current = object->bounds();

        ObjectPatch item;
        item.object = object;
        float newSize = 0.0f;
        switch (side) {
            case Side::Left:
                newSize = current.right() - reference.left;
                item.patch.left = reference.left;
                item.patch.width = newSize;
                break;
            case Side::Right:
                newSize = reference.right() - current.left;
                item.patch.width = newSize;
                break;
            case Side::Top:
                newSize = current.bottom() - reference.top;
                item.patch.top = reference.top;
                item.patch.height = newSize;
                break;
            case Side::Bottom:
                newSize = reference.bottom() - current.top;
                item.patch.height = newSize;
                break;
        }

        if (newSize <= epsilon) {
            plan.skipped++;
            continue;
        }
        plan.patches.push_back(item);
    }
    return plan;
}

SizePlan SizeTransformEngine::computeFillPlan(const Selection& selection,
                                              const SlideObject& anchor,
                                              Side side,
                                              float epsilon) const {
    const Bounds reference = anchor.bounds();
    SizePlan plan;
    for (SlideObject* object : selection) {
        if (!object || object == &anchor) continue;
        const Bounds current = object->bounds();

        // Flush objects (touching the anchor) have no gap.
        ObjectPatch item;
        item.object = object;
        bool hasGap = false;
        switch (side) {
            case Side::Left:
                hasGap = current.left > reference.right() + epsilon;
                item.patch.left = reference.right();
                item.patch.width = current.right() - reference.right();
                break;
            case Side::Right:
                hasGap = current.right() < reference.left - epsilon;
                item.patch.width = reference.left - current.left;
                break;
            case Side::Top:
                hasGap = current.top > reference.bottom() + epsilon;
                item.patch.top = reference.bottom();
                item.patch.height = current.bottom() - reference.bottom();
                break;
            case Side::Bottom:
                hasGap = current.bottom() < reference.top - epsilon;
                item.patch.height = reference.top - current.top;
                break;
        }

        if (!hasGap) {
            plan.skipped++;
            continue;
        }
        plan.patches.push_back(item);
    }
    return plan;
}

SizePlan SizeTransformEngine::computeMagicResizePlan(const Selection& selection, float percentage) const {
    SizePlan plan;
    const float factor = percentage / 100.0f;
    for (SlideObject* object : selection) {
        if (!object) continue;
        ObjectPatch item;
        item.object = object;
        item.patch.width = object->getWidth() * factor;
        item.patch.height = object->getHeight() * factor;
        plan.patches.push_back(item);
    }
    return plan;
}

OperationReport SizeTransformEngine::matchSize(const Selection& selection,
                                               const std::optional<ObjectId>& anchorId,
                                               MatchDimension dimension) const {
    if (selection.size() < kMinSizeSelection) return requireSizeSelection("match sizes");

    SlideObject* anchor = resolveAnchor(selection, anchorId);
    SLIDELAYOUT_LOG_DEBUG("match %s of anchor %s", dimensionLabel(dimension), anchor->id().c_str());

    const MutationTally tally = applyPatches(computeMatchPlan(selection, *anchor, dimension).patches);
    return reportTally(tally,
        std::string("Matched the anchor's ") + dimensionLabel(dimension) + " on "
        + countNoun(tally.succeeded, "object", "objects") + ".");
}

OperationReport SizeTransformEngine::stretch(const Selection& selection,
                                             const std::optional<ObjectId>& anchorId,
                                             Side side,
                                             float epsilon) const {
    if (selection.size() < kMinSizeSelection) return requireSizeSelection("stretch");

    SlideObject* anchor = resolveAnchor(selection, anchorId);
    const SizePlan plan = computeStretchPlan(selection, *anchor, side, epsilon);
    SLIDELAYOUT_LOG_DEBUG("stretch %s: %zu patches, %u skipped", toString(side), plan.patches.size(), plan.skipped);

    MutationTally tally = applyPatches(plan.patches);
    tally.skipped += plan.skipped;
    return reportTally(tally,
        "Stretched " + countNoun(tally.succeeded, "object", "objects") + " to the anchor's "
        + toString(side) + " edge.");
}

OperationReport SizeTransformEngine::fillGap(const Selection& selection,
                                             const std::optional<ObjectId>& anchorId,
                                             Side side,
                                             float epsilon) const {
    if (selection.size() < kMinSizeSelection) return requireSizeSelection("fill gaps");

    SlideObject* anchor = resolveAnchor(selection, anchorId);
    const SizePlan plan = computeFillPlan(selection, *anchor, side, epsilon);
    if (plan.patches.empty()) {
        OperationReport report = reportFailure(LayoutError::NoGapsFound,
            std::string("No gaps found: no object has space on its ") + toString(side) + " side up to the anchor.");
        report.skipped = plan.skipped;
        return report;
    }

    MutationTally tally = applyPatches(plan.patches);
    tally.skipped += plan.skipped;
    return reportTally(tally,
        "Filled the " + std::string(toString(side)) + " gap on " + countNoun(tally.succeeded, "object", "objects") + ".");
}

OperationReport SizeTransformEngine::magicResize(const Selection& selection, float percentage) const {
    if (!std::isfinite(percentage) || percentage <= 0.0f) {
        return reportFailure(LayoutError::InvalidArgument,
            "Enter a percentage greater than 0.");
    }
    if (selection.size() < kMinMagicResizeSelection) {
        return reportFailure(LayoutError::InsufficientSelection,
            "Select at least 1 object to resize.");
    }

    const MutationTally tally = applyPatches(computeMagicResizePlan(selection, percentage).patches);
    return reportTally(tally,
        "Resized " + countNoun(tally.succeeded, "object", "objects") + " to " + formatUnits(percentage) + "%.");
}

} // namespace slidelayout
