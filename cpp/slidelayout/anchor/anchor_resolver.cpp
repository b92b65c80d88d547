#include "slidelayout/anchor/anchor_resolver.h"

#include <algorithm>
#include <utility>

namespace slidelayout {

namespace {
    Selection::const_iterator findById(const Selection& selection, const ObjectId& id) {
        return std::find_if(selection.begin(), selection.end(), [&id](const SlideObject* object) {
            return object != nullptr && object->id() == id;
        });
    }
}

SlideObject* resolveAnchor(const Selection& selection, const std::optional<ObjectId>& anchorId) {
    if (selection.empty()) return nullptr;
    if (anchorId && !anchorId->empty()) {
        const auto it = findById(selection, *anchorId);
        if (it != selection.end()) return *it;
    }
    return selection.back();
}

bool selectionContainsAnchor(const Selection& selection, const std::optional<ObjectId>& anchorId) {
    if (!anchorId || anchorId->empty()) return false;
    return findById(selection, *anchorId) != selection.end();
}

AnchorStore::AnchorStore(KeyValueStore& store, std::string key)
    : store_(store), key_(std::move(key)) {}

std::optional<ObjectId> AnchorStore::load() const {
    std::optional<std::string> value = store_.get(key_);
    if (!value || value->empty()) return std::nullopt;
    return value;
}

void AnchorStore::save(const ObjectId& id) {
    store_.set(key_, id);
}

bool AnchorStore::clear() {
    const bool had = load().has_value();
    store_.remove(key_);
    return had;
}

} // namespace slidelayout
