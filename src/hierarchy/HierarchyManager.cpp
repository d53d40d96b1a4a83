#include "pagecraft/hierarchy/HierarchyManager.h"
#include "pagecraft/common/Errors.h"
#include "pagecraft/common/Logger.h"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace pagecraft {

const char* hierarchyOperationTypeToString(HierarchyOperationType type) {
    switch (type) {
        case HierarchyOperationType::Add:
            return "add";
        case HierarchyOperationType::Reorder:
            return "reorder";
        case HierarchyOperationType::Reparent:
            return "reparent";
    }
    return "unknown";
}

HierarchyManager::HierarchyManager(const RuleEngine& rules, size_t historyCapacity)
    : rules_(rules)
    , history_(historyCapacity) {
}

// =============================================================================
// Tree view
// =============================================================================

ComponentTree HierarchyManager::buildHierarchy(const ComponentMap& components,
                                               const ComponentId& rootId) const {
    SlotIndex rootSlot = components.slotOf(rootId);
    if (rootSlot == INVALID_SLOT) {
        throw HierarchyError("Root component with id " + rootId + " not found");
    }

    const auto childSlots = components.childSlots();
    std::vector<bool> onPath(components.size(), false);
    std::vector<HierarchyNode> nodes;
    nodes.reserve(components.size());

    std::vector<ComponentId> path;

    std::function<void(SlotIndex, int)> visit = [&](SlotIndex slot, int depth) {
        const ComponentRecord& record = components.atSlot(slot);
        if (onPath[slot]) {
            throw CircularReferenceError(record.id);
        }
        onPath[slot] = true;
        path.push_back(record.id);

        HierarchyNode node;
        node.componentId = record.id;
        node.parentId = record.parentId;
        node.depth = depth;
        node.path = path;
        for (size_t i = 0; i < path.size(); ++i) {
            if (i > 0) node.pathString += '/';
            node.pathString += path[i];
        }
        node.children.reserve(childSlots[slot].size());
        for (SlotIndex child : childSlots[slot]) {
            node.children.push_back(components.atSlot(child).id);
        }
        nodes.push_back(std::move(node));

        for (SlotIndex child : childSlots[slot]) {
            visit(child, depth + 1);
        }

        path.pop_back();
        onPath[slot] = false;
    };

    visit(rootSlot, 0);

    LOG_DEBUG("[HierarchyManager] Built tree rooted at {} with {} of {} components",
              rootId, nodes.size(), components.size());
    return ComponentTree(rootId, std::move(nodes));
}

// =============================================================================
// Validation
// =============================================================================

int HierarchyManager::chainLength(const ComponentId& id, const ComponentMap& components) {
    int length = 0;
    const int limit = static_cast<int>(components.size());
    const ComponentRecord* current = components.find(id);
    while (current && length <= limit) {
        ++length;
        current = current->parentId ? components.find(*current->parentId) : nullptr;
    }
    return length;
}

bool HierarchyManager::wouldCreateCycle(const ComponentId& componentId,
                                        const ComponentId& targetParentId,
                                        const ComponentMap& components) {
    std::unordered_set<ComponentId> seen;
    std::optional<ComponentId> current = targetParentId;
    while (current) {
        if (*current == componentId) {
            return true;
        }
        // A cycle that does not involve componentId; stop walking it
        if (!seen.insert(*current).second) {
            return false;
        }
        const ComponentRecord* record = components.find(*current);
        if (!record) {
            return false;
        }
        current = record->parentId;
    }
    return false;
}

NestingCheck HierarchyManager::validateNestingRules(const ComponentRecord& candidate,
                                                    const std::optional<ComponentId>& targetParentId,
                                                    const ComponentMap& components) const {
    if (!targetParentId) {
        if (!rules_.canBeRoot(candidate.type)) {
            return NestingCheck::fail(std::format("Component type {} cannot be a root component",
                                                  componentTypeToString(candidate.type)));
        }
        return NestingCheck::ok();
    }

    const ComponentRecord* parent = components.find(*targetParentId);
    if (!parent) {
        return NestingCheck::fail(std::format("Target parent {} does not exist", *targetParentId));
    }

    if (wouldCreateCycle(candidate.id, *targetParentId, components)) {
        return NestingCheck::fail("This operation would create a circular reference");
    }

    if (!rules_.canContain(parent->type, candidate.type)) {
        if (parent->type == ComponentType::Row) {
            return NestingCheck::fail("Row can only contain col components");
        }
        return NestingCheck::fail(std::format("Component type {} cannot be placed in {}",
                                              componentTypeToString(candidate.type),
                                              componentTypeToString(parent->type)));
    }

    const int maxDepth = rules_.limits().maxNestingDepth;
    if (chainLength(*targetParentId, components) >= maxDepth) {
        return NestingCheck::fail(std::format("Nesting depth exceeds the limit (max {} levels)", maxDepth));
    }

    return NestingCheck::ok();
}

// =============================================================================
// Mutations
// =============================================================================

int HierarchyManager::placeAmongSiblings(ComponentMap& components, const ComponentId& id,
                                         const std::optional<ComponentId>& parentId, int index) {
    std::vector<ComponentId> ordered;
    for (const ComponentRecord* sibling : components.childrenOf(parentId)) {
        if (sibling->id != id) {
            ordered.push_back(sibling->id);
        }
    }

    const int count = static_cast<int>(ordered.size());
    int position = (index < 0 || index > count) ? count : index;
    ordered.insert(ordered.begin() + position, id);

    for (size_t i = 0; i < ordered.size(); ++i) {
        components.setOrder(ordered[i], static_cast<int>(i));
    }
    return position;
}

void HierarchyManager::renumberChildren(ComponentMap& components,
                                        const std::optional<ComponentId>& parentId) {
    std::vector<ComponentId> ordered;
    for (const ComponentRecord* child : components.childrenOf(parentId)) {
        ordered.push_back(child->id);
    }
    for (size_t i = 0; i < ordered.size(); ++i) {
        components.setOrder(ordered[i], static_cast<int>(i));
    }
}

MoveResult HierarchyManager::moveComponent(const ComponentId& id,
                                           const std::optional<ComponentId>& newParentId,
                                           int newIndex,
                                           const ComponentMap& components) {
    const ComponentRecord* component = components.find(id);
    if (!component) {
        return MoveResult::fail("Component " + id + " does not exist");
    }

    NestingCheck check = validateNestingRules(*component, newParentId, components);
    if (!check.isValid) {
        LOG_DEBUG("[HierarchyManager] Move of {} rejected: {}", id, check.reason);
        return MoveResult::fail(check.reason);
    }

    const std::optional<ComponentId> oldParentId = component->parentId;
    const int oldPosition = component->order;

    ComponentMap updated = components;
    updated.setParent(id, newParentId);
    int position = placeAmongSiblings(updated, id, newParentId, newIndex);

    const bool reparented = oldParentId != newParentId;
    if (reparented) {
        renumberChildren(updated, oldParentId);
    }

    HierarchyOperation op;
    op.type = reparented ? HierarchyOperationType::Reparent : HierarchyOperationType::Reorder;
    op.componentId = id;
    op.parentId = newParentId;
    op.oldParentId = oldParentId;
    op.position = position;
    op.oldPosition = oldPosition;
    record(std::move(op));

    LOG_DEBUG("[HierarchyManager] Moved {} to {} at {}", id, newParentId.value_or("<root>"), position);
    return MoveResult::ok(std::move(updated));
}

MoveResult HierarchyManager::insertComponent(ComponentRecord record,
                                             const std::optional<ComponentId>& parentId,
                                             int index,
                                             const ComponentMap& components) {
    if (record.id.empty()) {
        return MoveResult::fail("Component id must not be empty");
    }
    if (components.contains(record.id)) {
        return MoveResult::fail("Component id " + record.id + " is already in use");
    }

    NestingCheck check = validateNestingRules(record, parentId, components);
    if (!check.isValid) {
        LOG_DEBUG("[HierarchyManager] Insert of {} rejected: {}", record.id, check.reason);
        return MoveResult::fail(check.reason);
    }

    const ComponentId id = record.id;
    record.parentId = parentId;

    ComponentMap updated = components;
    updated.insert(std::move(record));
    int position = placeAmongSiblings(updated, id, parentId, index);

    HierarchyOperation op;
    op.type = HierarchyOperationType::Add;
    op.componentId = id;
    op.parentId = parentId;
    op.position = position;
    this->record(std::move(op));

    return MoveResult::ok(std::move(updated));
}

DuplicateResult HierarchyManager::duplicateComponent(const ComponentId& id,
                                                     const ComponentMap& components,
                                                     const IdGenerator& generateId) {
    const ComponentRecord* original = components.find(id);
    if (!original) {
        return DuplicateResult::fail("Component " + id + " does not exist");
    }
    if (!generateId) {
        return DuplicateResult::fail("No id generator supplied");
    }

    DuplicateResult result;
    std::unordered_set<ComponentId> issued;

    auto nextId = [&]() -> std::optional<ComponentId> {
        ComponentId newId = generateId();
        if (newId.empty() || components.contains(newId) || !issued.insert(newId).second) {
            return std::nullopt;
        }
        return newId;
    };

    auto rootId = nextId();
    if (!rootId) {
        return DuplicateResult::fail("Id generator produced an id that is already in use");
    }

    ComponentRecord rootCopy = *original;
    rootCopy.id = *rootId;
    rootCopy.order = original->order + 1;
    rootCopy.zIndex = original->zIndex + 1;
    result.newComponents.insert(rootCopy);

    // Pre-order copy keeps the relative order of every sibling set
    std::vector<std::pair<ComponentId, ComponentId>> pending = {{id, *rootId}};
    std::unordered_set<ComponentId> copiedSources = {id};
    while (!pending.empty()) {
        auto [sourceParent, copyParent] = pending.back();
        pending.pop_back();

        auto children = components.childrenOf(sourceParent);
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            if (!copiedSources.insert((*it)->id).second) {
                LOG_WARN("[HierarchyManager] Duplicate of {} aborted: {} reached twice", id, (*it)->id);
                return DuplicateResult::fail("Circular reference detected under component " + id);
            }
            auto childId = nextId();
            if (!childId) {
                return DuplicateResult::fail("Id generator produced an id that is already in use");
            }
            ComponentRecord copy = **it;
            copy.id = *childId;
            copy.parentId = copyParent;
            result.newComponents.insert(copy);
            pending.emplace_back((*it)->id, *childId);
        }
    }

    // Later siblings shift by one so the copy slots in right after the original
    ComponentMap updated = components;
    std::vector<ComponentId> ordered;
    for (const ComponentRecord* sibling : components.childrenOf(original->parentId)) {
        ordered.push_back(sibling->id);
        if (sibling->id == id) {
            ordered.push_back(*rootId);
        }
    }
    for (const auto& copy : result.newComponents) {
        updated.insert(copy);
    }
    int position = 0;
    for (size_t i = 0; i < ordered.size(); ++i) {
        updated.setOrder(ordered[i], static_cast<int>(i));
        if (ordered[i] == *rootId) {
            position = static_cast<int>(i);
        }
    }

    HierarchyOperation op;
    op.type = HierarchyOperationType::Add;
    op.componentId = *rootId;
    op.parentId = original->parentId;
    op.position = position;
    record(std::move(op));

    LOG_DEBUG("[HierarchyManager] Duplicated {} as {} ({} components)",
              id, *rootId, result.newComponents.size());

    result.success = true;
    result.newRootId = *rootId;
    result.updatedComponents = std::move(updated);
    return result;
}

// =============================================================================
// Statistics / history
// =============================================================================

HierarchyStatistics HierarchyManager::getStatistics(const ComponentMap& components) const {
    HierarchyStatistics stats;
    stats.totalComponents = components.size();

    for (const auto& component : components) {
        stats.countsByType[component.type]++;

        int depth = chainLength(component.id, components) - 1;
        stats.maxDepth = std::max(stats.maxDepth, depth);

        if (component.parentId && !components.contains(*component.parentId)) {
            stats.orphanedComponentIds.push_back(component.id);
        }
    }
    return stats;
}

void HierarchyManager::record(HierarchyOperation operation) {
    operation.timestamp = std::chrono::system_clock::now();
    history_.push(std::move(operation));
}

}  // namespace pagecraft
