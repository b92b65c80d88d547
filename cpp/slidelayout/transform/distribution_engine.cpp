#include "slidelayout/transform/distribution_engine.h"
#include "slidelayout/core/logging.h"

#include <algorithm>
#include <string>

namespace slidelayout {

namespace {
    struct Item {
        SlideObject* object;
        Bounds bounds;
    };

    float leading(const Bounds& b, Axis axis) { return axis == Axis::Horizontal ? b.left : b.top; }
    float trailing(const Bounds& b, Axis axis) { return axis == Axis::Horizontal ? b.right() : b.bottom(); }
    float extent(const Bounds& b, Axis axis) { return axis == Axis::Horizontal ? b.width : b.height; }
}

DistributionPlan DistributionEngine::computeDistributePlan(const Selection& selection, Axis axis) const {
    DistributionPlan plan;
    if (selection.size() < kMinDistributeSelection) return plan;

    std::vector<Item> sorted;
    sorted.reserve(selection.size());
    for (SlideObject* object : selection) {
        if (object) sorted.push_back({object, object->bounds()});
    }
    if (sorted.size() < kMinDistributeSelection) return plan;

    std::stable_sort(sorted.begin(), sorted.end(), [axis](const Item& lhs, const Item& rhs) {
        return leading(lhs.bounds, axis) < leading(rhs.bounds, axis);
    });

    const float start = leading(sorted.front().bounds, axis);
    const float end = trailing(sorted.back().bounds, axis);

    float totalSize = 0.0f;
    for (const Item& item : sorted) totalSize += extent(item.bounds, axis);

    // Negative when the objects do not fit; they overlap evenly instead.
    plan.gap = (end - start - totalSize) / static_cast<float>(sorted.size() - 1);

    float cursor = start;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const Item& item = sorted[i];
        if (i > 0 && i + 1 < sorted.size()) {
            ObjectPatch patch;
            patch.object = item.object;
            if (axis == Axis::Horizontal) {
                patch.patch.left = cursor;
            } else {
                patch.patch.top = cursor;
            }
            plan.patches.push_back(patch);
        }
        cursor += extent(item.bounds, axis) + plan.gap;
    }

    return plan;
}

OperationReport DistributionEngine::distribute(const Selection& selection, Axis axis) const {
    if (selection.size() < kMinDistributeSelection) {
        return reportFailure(LayoutError::InsufficientSelection,
            "Select at least 3 objects to distribute.");
    }

    const DistributionPlan plan = computeDistributePlan(selection, axis);
    SLIDELAYOUT_LOG_DEBUG("distribute %zu objects, gap %f", selection.size(), static_cast<double>(plan.gap));

    const MutationTally tally = applyPatches(plan.patches);
    std::string summary = "Distributed " + countNoun(static_cast<std::uint32_t>(selection.size()), "object", "objects")
        + (axis == Axis::Horizontal ? " horizontally" : " vertically")
        + " with a gap of " + formatUnits(plan.gap) + ".";
    if (plan.gap < 0.0f) {
        summary += " The objects overlap because they do not fit.";
    }
    return reportTally(tally, std::move(summary));
}

} // namespace slidelayout
