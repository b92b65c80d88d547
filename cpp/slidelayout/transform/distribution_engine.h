#pragma once

#include "slidelayout/core/report.h"
#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"
#include "slidelayout/transform/geometry_patch.h"

#include <vector>

namespace slidelayout {

struct DistributionPlan {
    float gap{0.0f};
    // Interior objects only; the outermost two never move.
    std::vector<ObjectPatch> patches;
};

// Equal spacing between consecutive objects along one axis. Works on a sorted
// copy of the selection, input order is ignored.
class DistributionEngine {
public:
    DistributionPlan computeDistributePlan(const Selection& selection, Axis axis) const;

    OperationReport distribute(const Selection& selection, Axis axis) const;
};

} // namespace slidelayout
