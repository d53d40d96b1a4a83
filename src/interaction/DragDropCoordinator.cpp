#include "pagecraft/interaction/DragDropCoordinator.h"
#include "pagecraft/interaction/ComponentDefaults.h"
#include "pagecraft/common/Logger.h"

#include <format>

namespace pagecraft {

namespace {
    constexpr int MAX_ID_ATTEMPTS = 16;
}

const char* dragPhaseToString(DragPhase phase) {
    switch (phase) {
        case DragPhase::Idle:
            return "idle";
        case DragPhase::Dragging:
            return "dragging";
        case DragPhase::Committing:
            return "committing";
        case DragPhase::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

DragDropCoordinator::DragDropCoordinator(const RuleEngine& rules,
                                         HierarchyManager& hierarchy,
                                         const IGeometryProvider& geometry,
                                         DragConfig config)
    : rules_(rules)
    , hierarchy_(hierarchy)
    , geometry_(geometry)
    , config_(std::move(config)) {
}

// =============================================================================
// Session
// =============================================================================

bool DragDropCoordinator::startDrag(const DragItem& item, const Point& pointer) {
    if (state_.phase != DragPhase::Idle) {
        LOG_WARN("[DragDropCoordinator] startDrag rejected: a drag is already {}",
                 dragPhaseToString(state_.phase));
        return false;
    }
    if (!item.isFromPanel && item.id.empty()) {
        LOG_WARN("[DragDropCoordinator] startDrag rejected: existing item without id");
        return false;
    }

    state_.phase = DragPhase::Dragging;
    state_.item = item;
    state_.position = pointer;
    state_.activeZoneId.reset();
    zones_.clear();

    LOG_DEBUG("[DragDropCoordinator] Drag started: {} {}",
              componentTypeToString(item.type), item.isFromPanel ? "<panel>" : item.id);
    emit(DragEventType::DragStart, DragStarted{item, pointer});
    return true;
}

void DragDropCoordinator::moveDrag(const Point& pointer, const ComponentMap& components) {
    if (!state_.isDragging()) {
        return;
    }

    Point position = config_.snapToGrid ? pointer.snapped(config_.gridSize) : pointer;
    state_.position = position;

    zones_ = computeZones(components);

    std::optional<DropZone> best;
    if (const DropZone* zone = DropZoneBuilder::selectBest(zones_, position)) {
        best = *zone;
        state_.activeZoneId = zone->id;
    } else {
        state_.activeZoneId.reset();
    }

    emit(DragEventType::DragMove, DragMoved{*state_.item, position, std::move(best)});
}

DropResult DragDropCoordinator::endDrag(const ComponentMap& components) {
    if (!state_.isDragging()) {
        return DropResult::fail("No drag in progress");
    }

    state_.phase = DragPhase::Committing;
    const DragItem item = *state_.item;

    // The map may have changed since the last pointer move
    zones_ = computeZones(components);
    const DropZone* best = DropZoneBuilder::selectBest(zones_, state_.position);

    DropResult result;
    if (!best) {
        result = DropResult::fail("No legal drop zone");
    } else if (item.isFromPanel) {
        result = dropNewComponent(*best, components);
    } else {
        result = dropExistingComponent(*best, components);
    }

    if (result.success) {
        LOG_INFO("[DragDropCoordinator] Dropped {} into {}", result.componentId, result.zone->id);
        emit(DragEventType::Drop, Dropped{item, *result.zone, result.componentId});
        resetSession();
    } else {
        LOG_DEBUG("[DragDropCoordinator] Drop failed: {}", result.error);
        state_.phase = DragPhase::Cancelled;
        emit(DragEventType::DragEnd, DragEnded{item, result.error});
        resetSession();
    }
    return result;
}

void DragDropCoordinator::cancelDrag() {
    if (!state_.isDragging()) {
        return;
    }
    state_.phase = DragPhase::Cancelled;
    emit(DragEventType::DragEnd, DragEnded{*state_.item, ""});
    resetSession();
}

void DragDropCoordinator::resetSession() {
    state_ = DragState{};
    zones_.clear();
}

// =============================================================================
// Zones
// =============================================================================

std::vector<DropZone> DragDropCoordinator::computeZones(const ComponentMap& components) const {
    const DragItem& item = *state_.item;
    std::optional<ComponentId> excludeId;
    if (!item.isFromPanel) {
        excludeId = item.id;
    }

    auto zones = DropZoneBuilder::build(components, geometry_, config_, excludeId);

    if (!config_.enableDropValidation) {
        for (auto& zone : zones) {
            zone.isLegal = true;
        }
        return zones;
    }

    ComponentRecord candidate;
    if (item.isFromPanel) {
        candidate = ComponentDefaults::create("", item.type);
    } else if (const ComponentRecord* existing = components.find(item.id)) {
        candidate = *existing;
    } else {
        for (auto& zone : zones) {
            zone.isLegal = false;
            zone.reason = "Dragged component " + item.id + " does not exist";
        }
        return zones;
    }

    for (auto& zone : zones) {
        zone.reason = checkZone(zone, candidate, components);
        zone.isLegal = zone.reason.empty();
    }
    return zones;
}

std::string DragDropCoordinator::checkZone(const DropZone& zone, const ComponentRecord& candidate,
                                           const ComponentMap& components) const {
    if (zone.kind == DropZoneKind::Canvas) {
        if (!RuleEngine::isLayoutType(candidate.type)) {
            return "Only layout components can be dropped on the canvas";
        }
        NestingCheck nesting = hierarchy_.validateNestingRules(candidate, std::nullopt, components);
        return nesting.isValid ? "" : nesting.reason;
    }

    const ComponentRecord* owner = components.find(*zone.ownerComponentId);
    if (!owner) {
        return "Zone owner " + *zone.ownerComponentId + " does not exist";
    }

    std::vector<const ComponentRecord*> siblings;
    for (const ComponentRecord* child : components.childrenOf(owner->id)) {
        if (candidate.id.empty() || child->id != candidate.id) {
            siblings.push_back(child);
        }
    }

    ValidationOutcome outcome = rules_.evaluatePlacement(candidate, owner, siblings);
    if (!outcome.isValid()) {
        return outcome.firstError();
    }

    // Also rejects dropping a component into its own subtree
    NestingCheck nesting = hierarchy_.validateNestingRules(candidate, owner->id, components);
    return nesting.isValid ? "" : nesting.reason;
}

// =============================================================================
// Commit
// =============================================================================

std::optional<ComponentId> DragDropCoordinator::nextComponentId(const ComponentMap& components) {
    for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
        ComponentId id = idGenerator_ ? idGenerator_() : std::format("component_{}", ++idCounter_);
        if (!id.empty() && !components.contains(id)) {
            return id;
        }
        if (idGenerator_) {
            break;
        }
    }
    return std::nullopt;
}

DropResult DragDropCoordinator::dropNewComponent(const DropZone& zone, const ComponentMap& components) {
    auto id = nextComponentId(components);
    if (!id) {
        return DropResult::fail("Could not generate an unused component id");
    }

    ComponentRecord record = ComponentDefaults::create(*id, state_.item->type);
    record.parentId = zone.ownerComponentId;
    record.order = zone.insertIndex;

    const ComponentRecord* owner = zone.ownerComponentId ? components.find(*zone.ownerComponentId) : nullptr;
    std::vector<const ComponentRecord*> siblings;
    if (owner) {
        siblings = components.childrenOf(owner->id);
    }

    ValidationOutcome outcome = rules_.evaluatePlacement(record, owner, siblings);
    if (!outcome.isValid()) {
        return DropResult::fail("Component validation failed: " + outcome.firstError());
    }

    MoveResult inserted = hierarchy_.insertComponent(record, zone.ownerComponentId, zone.insertIndex, components);
    if (!inserted.success) {
        return DropResult::fail(inserted.reason);
    }

    DropResult result;
    result.success = true;
    result.zone = zone;
    result.updatedComponents = std::move(inserted.updatedComponents);
    result.componentId = *id;
    return result;
}

DropResult DragDropCoordinator::dropExistingComponent(const DropZone& zone, const ComponentMap& components) {
    const ComponentId& id = state_.item->id;
    if (!components.contains(id)) {
        return DropResult::fail("Dragged component " + id + " does not exist");
    }

    MoveResult moved = hierarchy_.moveComponent(id, zone.ownerComponentId, zone.insertIndex, components);
    if (!moved.success) {
        return DropResult::fail(moved.reason);
    }

    DropResult result;
    result.success = true;
    result.zone = zone;
    result.updatedComponents = std::move(moved.updatedComponents);
    result.componentId = id;
    return result;
}

// =============================================================================
// Events
// =============================================================================

SubscriptionId DragDropCoordinator::addEventListener(DragEventType type, DragListener listener) {
    return events_.subscribe(type, std::move(listener));
}

bool DragDropCoordinator::removeEventListener(SubscriptionId id) {
    return events_.unsubscribe(id);
}

void DragDropCoordinator::emit(DragEventType type, DragEventPayload payload) const {
    DragEvent event{type, std::move(payload), std::chrono::system_clock::now()};
    events_.emit(event);
}

}  // namespace pagecraft
