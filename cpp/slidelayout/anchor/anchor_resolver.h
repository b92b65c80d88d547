#pragma once

#include "slidelayout/core/types.h"
#include "slidelayout/host/host_api.h"

#include <optional>
#include <string>

namespace slidelayout {

// Returns the selected object whose id equals `anchorId`, else the last
// selected object. The fallback depends on host selection order, which is
// opaque; users who care set an explicit anchor. Returns nullptr only for an
// empty selection, callers check selection size first.
SlideObject* resolveAnchor(const Selection& selection, const std::optional<ObjectId>& anchorId);

// True when the persisted anchor is part of `selection`.
bool selectionContainsAnchor(const Selection& selection, const std::optional<ObjectId>& anchorId);

// Persisted anchor reference, one scalar per document. Last writer wins.
class AnchorStore {
public:
    AnchorStore(KeyValueStore& store, std::string key);

    std::optional<ObjectId> load() const;
    void save(const ObjectId& id);
    // Returns whether an anchor was stored.
    bool clear();

private:
    KeyValueStore& store_;
    std::string key_;
};

} // namespace slidelayout
