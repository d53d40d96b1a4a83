#pragma once

#include "Component.h"

#include <optional>
#include <unordered_map>
#include <vector>

namespace pagecraft {

/// Flat id → ComponentRecord map backed by a contiguous arena.
///
/// Records live in a vector in insertion order and are addressed either by
/// their string id or by SlotIndex. Slot-based views (parentSlots(),
/// childSlots()) let tree walks run over integers instead of hashing ids at
/// every step.
///
/// ComponentMap is a value type: operations in the hierarchy manager and
/// drag coordinator take a const snapshot and return a modified copy.
class ComponentMap {
public:
    ComponentMap() = default;

    /// Build from a list of records. Later duplicates of an id replace earlier ones.
    static ComponentMap fromRecords(const std::vector<ComponentRecord>& records);

    // Mutation (on this instance only)
    /// Add a record. Returns false (and leaves the map unchanged) if the id exists.
    bool insert(ComponentRecord record);

    /// Add or replace a record by id
    void upsert(ComponentRecord record);

    /// Remove a record. Slots after it shift down by one.
    bool erase(const ComponentId& id);

    void clear();

    // Record access API:
    // - get(): reference return for ids known to exist. Throws std::out_of_range otherwise.
    //   The reference is invalidated by insert/upsert/erase.
    // - find(): pointer return, nullptr if the id is unknown.
    const ComponentRecord& get(const ComponentId& id) const;
    const ComponentRecord* find(const ComponentId& id) const;
    bool contains(const ComponentId& id) const;

    // Placement edits. Ids are fixed once stored; use erase + insert to rename.
    /// @return false if id is unknown
    bool setParent(const ComponentId& id, const std::optional<ComponentId>& parentId);
    /// @return false if id is unknown
    bool setOrder(const ComponentId& id, int order);

    SlotIndex slotOf(const ComponentId& id) const;
    const ComponentRecord& atSlot(SlotIndex slot) const { return records_[slot]; }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    const std::vector<ComponentRecord>& records() const { return records_; }
    auto begin() const { return records_.begin(); }
    auto end() const { return records_.end(); }

    std::vector<ComponentId> ids() const;

    // Tree views
    /// Direct children of parentId (roots when std::nullopt), sorted by order.
    /// Ties keep insertion order.
    std::vector<const ComponentRecord*> childrenOf(const std::optional<ComponentId>& parentId) const;

    /// Parent slot per slot. INVALID_SLOT for roots and for dangling parent ids.
    std::vector<SlotIndex> parentSlots() const;

    /// Child slots per slot, each list sorted by order
    std::vector<std::vector<SlotIndex>> childSlots() const;

private:
    void rebuildIndex();

    std::vector<ComponentRecord> records_;
    std::unordered_map<ComponentId, SlotIndex> index_;
};

}  // namespace pagecraft
