#pragma once

#include "slidelayout/core/report.h"
#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"

#include <optional>
#include <vector>

namespace slidelayout {

// Geometry edit for one object. Unset fields are not written.
struct GeometryPatch {
    std::optional<float> left;
    std::optional<float> top;
    std::optional<float> width;
    std::optional<float> height;
};

struct ObjectPatch {
    SlideObject* object{nullptr};
    GeometryPatch patch;
};

// Issues one setter per set field, sizes before positions. When the host
// refuses a setter, the fields already written are restored and the refusing
// status is returned, so a failed object keeps its previous geometry.
HostStatus applyPatch(SlideObject& object, const GeometryPatch& patch);

// Applies each patch in order; a refused patch never stops the batch.
MutationTally applyPatches(const std::vector<ObjectPatch>& patches);

} // namespace slidelayout
