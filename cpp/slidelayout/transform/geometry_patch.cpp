#include "slidelayout/transform/geometry_patch.h"
#include "slidelayout/core/logging.h"

#include <cstddef>

namespace slidelayout {

namespace {
    using Setter = HostStatus (SlideObject::*)(float);

    struct PatchStep {
        const std::optional<float>& value;
        Setter setter;
        float original;
    };
}

HostStatus applyPatch(SlideObject& object, const GeometryPatch& patch) {
    const Bounds before = object.bounds();
    const PatchStep steps[] = {
        {patch.width, &SlideObject::setWidth, before.width},
        {patch.height, &SlideObject::setHeight, before.height},
        {patch.left, &SlideObject::setLeft, before.left},
        {patch.top, &SlideObject::setTop, before.top},
    };
    constexpr std::size_t stepCount = sizeof(steps) / sizeof(steps[0]);

    for (std::size_t i = 0; i < stepCount; ++i) {
        if (!steps[i].value) continue;
        const HostStatus status = (object.*steps[i].setter)(*steps[i].value);
        if (status == HostStatus::Ok) continue;

        // Undo the fields already written so the object keeps its old geometry.
        for (std::size_t j = i; j-- > 0;) {
            if (!steps[j].value) continue;
            if ((object.*steps[j].setter)(steps[j].original) != HostStatus::Ok) {
                SLIDELAYOUT_LOG_WARN("object %s: could not restore geometry after a refused edit",
                    object.id().c_str());
            }
        }
        return status;
    }
    return HostStatus::Ok;
}

MutationTally applyPatches(const std::vector<ObjectPatch>& patches) {
    MutationTally tally;
    for (const ObjectPatch& item : patches) {
        if (!item.object) continue;
        const HostStatus status = applyPatch(*item.object, item.patch);
        if (status != HostStatus::Ok) {
            SLIDELAYOUT_LOG_WARN("object %s refused geometry edit (status %u)",
                item.object->id().c_str(), static_cast<unsigned>(status));
        }
        tally.record(status);
    }
    return tally;
}

} // namespace slidelayout
