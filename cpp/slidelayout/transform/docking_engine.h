#pragma once

#include "slidelayout/core/report.h"
#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"
#include "slidelayout/transform/geometry_patch.h"

#include <optional>
#include <vector>

namespace slidelayout {

// Zero-gap abutment against one side of the anchor. Every docked object lands
// on the same coordinate; nothing prevents them from stacking.
class DockingEngine {
public:
    std::vector<ObjectPatch> computeDockPatches(const Selection& selection,
                                                const SlideObject& anchor,
                                                Side side) const;

    OperationReport dock(const Selection& selection,
                         const std::optional<ObjectId>& anchorId,
                         Side side) const;
};

} // namespace slidelayout
