#include "slidelayout/model/slide_model.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace slidelayout::model {

// =============================================================================
// ModelObject
// =============================================================================

ModelObject::ModelObject(ObjectId id, ObjectKind kind, const Bounds& bounds)
    : id_(std::move(id)), kind_(kind), bounds_(bounds) {}

HostStatus ModelObject::checkMovable() const {
    return isLocked() ? HostStatus::Rejected : HostStatus::Ok;
}

HostStatus ModelObject::checkResizable() const {
    if (isLocked()) return HostStatus::Rejected;
    if (kind_ == ObjectKind::Line) return HostStatus::Unsupported;
    return HostStatus::Ok;
}

HostStatus ModelObject::setLeft(float value) {
    const HostStatus status = checkMovable();
    if (status != HostStatus::Ok) return status;
    if (!std::isfinite(value)) return HostStatus::Rejected;
    bounds_.left = value;
    editCount_++;
    return HostStatus::Ok;
}

HostStatus ModelObject::setTop(float value) {
    const HostStatus status = checkMovable();
    if (status != HostStatus::Ok) return status;
    if (!std::isfinite(value)) return HostStatus::Rejected;
    bounds_.top = value;
    editCount_++;
    return HostStatus::Ok;
}

HostStatus ModelObject::setWidth(float value) {
    const HostStatus status = checkResizable();
    if (status != HostStatus::Ok) return status;
    if (!std::isfinite(value) || value <= 0.0f) return HostStatus::Rejected;
    bounds_.width = value;
    editCount_++;
    return HostStatus::Ok;
}

HostStatus ModelObject::setHeight(float value) {
    const HostStatus status = checkResizable();
    if (status != HostStatus::Ok) return status;
    if (!std::isfinite(value) || value <= 0.0f) return HostStatus::Rejected;
    bounds_.height = value;
    editCount_++;
    return HostStatus::Ok;
}

void ModelObject::reset(ObjectKind kind, const Bounds& bounds) {
    kind_ = kind;
    bounds_ = bounds;
}

void ModelObject::setFlags(std::uint32_t mask, std::uint32_t value) {
    flags_ = (flags_ & ~mask) | (value & mask);
}

// =============================================================================
// SlideModel
// =============================================================================

void SlideModel::clear() noexcept {
    objects_.clear();
    tables_.clear();
    tableOrder_.clear();
    selection_.clear();
}

ModelObject& SlideModel::upsertObject(const ObjectId& id, float left, float top, float width, float height,
                                      ObjectKind kind) {
    if (id.empty()) throw std::invalid_argument("SlideModel::upsertObject: empty id");
    if (tables_.count(id) != 0) throw std::invalid_argument("SlideModel::upsertObject: id used by a table");

    const Bounds bounds{left, top, width, height};
    auto it = objects_.find(id);
    if (it != objects_.end()) {
        it->second->reset(kind, bounds);
        return *it->second;
    }
    auto inserted = objects_.emplace(id, std::make_unique<ModelObject>(id, kind, bounds));
    return *inserted.first->second;
}

bool SlideModel::deleteObject(const ObjectId& id) {
    if (objects_.erase(id) == 0) return false;
    pruneSelection();
    return true;
}

ModelObject* SlideModel::getObject(const ObjectId& id) {
    const auto it = objects_.find(id);
    return it == objects_.end() ? nullptr : it->second.get();
}

const ModelObject* SlideModel::getObject(const ObjectId& id) const {
    const auto it = objects_.find(id);
    return it == objects_.end() ? nullptr : it->second.get();
}

void SlideModel::setObjectFlags(const ObjectId& id, std::uint32_t mask, std::uint32_t value) {
    ModelObject* object = getObject(id);
    if (!object) throw std::out_of_range("SlideModel::setObjectFlags: unknown object " + id);
    object->setFlags(mask, value);
}

ModelTable& SlideModel::upsertTable(const ObjectId& id, float left, float top,
                                    std::vector<float> columnWidths, std::vector<float> rowHeights) {
    if (id.empty()) throw std::invalid_argument("SlideModel::upsertTable: empty id");
    if (objects_.count(id) != 0) throw std::invalid_argument("SlideModel::upsertTable: id used by an object");

    auto table = std::make_unique<ModelTable>(id, left, top, std::move(columnWidths), std::move(rowHeights));
    ModelTable& ref = *table;
    if (tables_.count(id) == 0) tableOrder_.push_back(id);
    tables_[id] = std::move(table);
    return ref;
}

bool SlideModel::deleteTable(const ObjectId& id) {
    if (tables_.erase(id) == 0) return false;
    tableOrder_.erase(std::remove(tableOrder_.begin(), tableOrder_.end(), id), tableOrder_.end());
    pruneSelection();
    return true;
}

ModelTable* SlideModel::getTable(const ObjectId& id) {
    const auto it = tables_.find(id);
    return it == tables_.end() ? nullptr : it->second.get();
}

void SlideModel::setSelection(const std::vector<ObjectId>& ids) {
    selection_.clear();
    selection_.reserve(ids.size());
    for (const ObjectId& id : ids) {
        if (objects_.count(id) == 0 && tables_.count(id) == 0) continue;
        if (std::find(selection_.begin(), selection_.end(), id) != selection_.end()) continue;
        selection_.push_back(id);
    }
}

void SlideModel::clearSelection() {
    selection_.clear();
}

void SlideModel::pruneSelection() {
    selection_.erase(
        std::remove_if(selection_.begin(), selection_.end(), [this](const ObjectId& id) {
            return objects_.count(id) == 0 && tables_.count(id) == 0;
        }),
        selection_.end());
}

Selection SlideModel::selectedObjects() {
    Selection out;
    out.reserve(selection_.size());
    for (const ObjectId& id : selection_) {
        if (ModelObject* object = getObject(id)) out.push_back(object);
    }
    return out;
}

std::vector<SlideTable*> SlideModel::selectedTables() {
    std::vector<SlideTable*> out;
    for (const ObjectId& id : selection_) {
        if (ModelTable* table = getTable(id)) out.push_back(table);
    }
    return out;
}

std::vector<SlideTable*> SlideModel::pageTables() {
    std::vector<SlideTable*> out;
    out.reserve(tableOrder_.size());
    for (const ObjectId& id : tableOrder_) {
        if (ModelTable* table = getTable(id)) out.push_back(table);
    }
    return out;
}

} // namespace slidelayout::model
