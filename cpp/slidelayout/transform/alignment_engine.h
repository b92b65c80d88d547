#pragma once

#include "slidelayout/core/report.h"
#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"
#include "slidelayout/transform/geometry_patch.h"

#include <optional>
#include <vector>

namespace slidelayout {

// Moves every non-anchor object along one axis so the chosen edge or center
// matches the anchor's. Sizes and the orthogonal coordinate are untouched.
class AlignmentEngine {
public:
    std::vector<ObjectPatch> computeAlignPatches(const Selection& selection,
                                                 const SlideObject& anchor,
                                                 AlignEdge edge) const;

    OperationReport align(const Selection& selection,
                          const std::optional<ObjectId>& anchorId,
                          AlignEdge edge) const;
};

} // namespace slidelayout
