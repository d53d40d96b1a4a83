#include "pagecraft/core/ComponentMap.h"

#include <algorithm>
#include <stdexcept>

namespace pagecraft {

ComponentMap ComponentMap::fromRecords(const std::vector<ComponentRecord>& records) {
    ComponentMap map;
    for (const auto& record : records) {
        map.upsert(record);
    }
    return map;
}

bool ComponentMap::insert(ComponentRecord record) {
    if (contains(record.id)) {
        return false;
    }
    index_[record.id] = static_cast<SlotIndex>(records_.size());
    records_.push_back(std::move(record));
    return true;
}

void ComponentMap::upsert(ComponentRecord record) {
    auto it = index_.find(record.id);
    if (it != index_.end()) {
        records_[it->second] = std::move(record);
        return;
    }
    index_[record.id] = static_cast<SlotIndex>(records_.size());
    records_.push_back(std::move(record));
}

bool ComponentMap::erase(const ComponentId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuildIndex();
    return true;
}

void ComponentMap::clear() {
    records_.clear();
    index_.clear();
}

const ComponentRecord& ComponentMap::get(const ComponentId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown component id: " + id);
    }
    return records_[it->second];
}

bool ComponentMap::setParent(const ComponentId& id, const std::optional<ComponentId>& parentId) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    records_[it->second].parentId = parentId;
    return true;
}

bool ComponentMap::setOrder(const ComponentId& id, int order) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    records_[it->second].order = order;
    return true;
}

const ComponentRecord* ComponentMap::find(const ComponentId& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &records_[it->second] : nullptr;
}

bool ComponentMap::contains(const ComponentId& id) const {
    return index_.find(id) != index_.end();
}

SlotIndex ComponentMap::slotOf(const ComponentId& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? it->second : INVALID_SLOT;
}

std::vector<ComponentId> ComponentMap::ids() const {
    std::vector<ComponentId> result;
    result.reserve(records_.size());
    for (const auto& record : records_) {
        result.push_back(record.id);
    }
    return result;
}

std::vector<const ComponentRecord*> ComponentMap::childrenOf(
    const std::optional<ComponentId>& parentId) const {
    std::vector<const ComponentRecord*> children;
    for (const auto& record : records_) {
        if (record.parentId == parentId) {
            children.push_back(&record);
        }
    }
    std::stable_sort(children.begin(), children.end(),
        [](const ComponentRecord* a, const ComponentRecord* b) {
            return a->order < b->order;
        });
    return children;
}

std::vector<SlotIndex> ComponentMap::parentSlots() const {
    std::vector<SlotIndex> parents(records_.size(), INVALID_SLOT);
    for (size_t i = 0; i < records_.size(); ++i) {
        if (records_[i].parentId) {
            parents[i] = slotOf(*records_[i].parentId);
        }
    }
    return parents;
}

std::vector<std::vector<SlotIndex>> ComponentMap::childSlots() const {
    std::vector<std::vector<SlotIndex>> children(records_.size());
    auto parents = parentSlots();
    for (size_t i = 0; i < records_.size(); ++i) {
        if (parents[i] != INVALID_SLOT) {
            children[parents[i]].push_back(static_cast<SlotIndex>(i));
        }
    }
    for (auto& list : children) {
        std::stable_sort(list.begin(), list.end(), [this](SlotIndex a, SlotIndex b) {
            return records_[a].order < records_[b].order;
        });
    }
    return children;
}

void ComponentMap::rebuildIndex() {
    index_.clear();
    for (size_t i = 0; i < records_.size(); ++i) {
        index_[records_[i].id] = static_cast<SlotIndex>(i);
    }
}

}  // namespace pagecraft
