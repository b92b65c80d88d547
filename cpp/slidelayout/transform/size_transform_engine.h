#pragma once

#include "slidelayout/core/report.h"
#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"
#include "slidelayout/transform/geometry_patch.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace slidelayout {

struct SizePlan {
    std::vector<ObjectPatch> patches;
    // Objects left untouched by policy (degenerate stretch, no gap to fill).
    std::uint32_t skipped{0};
};

class SizeTransformEngine {
public:
    SizePlan computeMatchPlan(const Selection& selection, const SlideObject& anchor, MatchDimension dimension) const;
    // Moves the object's `side` edge onto the anchor's `side` edge, opposite edge fixed.
    // Objects whose new size would be <= epsilon are skipped.
    SizePlan computeStretchPlan(const Selection& selection, const SlideObject& anchor, Side side,
                                float epsilon = 0.0f) const;
    // Grows the object's `side` edge across the empty space up to the anchor's
    // facing edge. Only objects more than epsilon beyond that edge qualify.
    SizePlan computeFillPlan(const Selection& selection, const SlideObject& anchor, Side side,
                             float epsilon = 0.0f) const;
    SizePlan computeMagicResizePlan(const Selection& selection, float percentage) const;

    OperationReport matchSize(const Selection& selection, const std::optional<ObjectId>& anchorId, MatchDimension dimension) const;
    OperationReport stretch(const Selection& selection, const std::optional<ObjectId>& anchorId, Side side,
                            float epsilon = 0.0f) const;
    OperationReport fillGap(const Selection& selection, const std::optional<ObjectId>& anchorId, Side side,
                            float epsilon = 0.0f) const;
    OperationReport magicResize(const Selection& selection, float percentage) const;
};

} // namespace slidelayout
