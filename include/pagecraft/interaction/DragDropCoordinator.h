#pragma once

#include "DragConfig.h"
#include "DragEvent.h"
#include "DropZone.h"
#include "GeometryProvider.h"
#include "../hierarchy/HierarchyManager.h"
#include "../rules/RuleEngine.h"

#include <optional>
#include <string>
#include <vector>

namespace pagecraft {

enum class DragPhase {
    Idle,
    Dragging,
    Committing,   ///< Inside endDrag, applying the drop
    Cancelled     ///< Cancel or failed drop, before returning to Idle
};

const char* dragPhaseToString(DragPhase phase);

/// Snapshot of the current drag session
struct DragState {
    DragPhase phase = DragPhase::Idle;
    std::optional<DragItem> item;
    Point position;                            ///< Last (snapped) pointer position
    std::optional<std::string> activeZoneId;   ///< Best legal zone of the last move

    bool isDragging() const { return phase == DragPhase::Dragging; }
};

/// Result of endDrag()
struct DropResult {
    bool success = false;
    std::optional<DropZone> zone;
    std::optional<ComponentMap> updatedComponents;
    ComponentId componentId;   ///< Moved or newly created component
    std::string error;

    static DropResult fail(const std::string& error) {
        DropResult result;
        result.error = error;
        return result;
    }
};

/// Drag-and-drop state machine over a ComponentMap.
///
/// Idle -> Dragging -> {Committing -> Idle | Cancelled -> Idle}. Only one
/// drag is active at a time. Each pointer move rebuilds every drop zone from
/// the whole map, so the expected map size is tens of components.
///
/// The rule engine, hierarchy manager and geometry provider are borrowed and
/// must outlive the coordinator.
///
/// Usage:
/// @code
/// RuleEngine rules;
/// HierarchyManager hierarchy(rules);
/// StyleGeometryProvider geometry;
/// DragDropCoordinator coordinator(rules, hierarchy, geometry);
///
/// coordinator.startDrag(DragItem::fromPanel(ComponentType::Row), {0, 0});
/// coordinator.moveDrag({40, 40}, components);
/// auto result = coordinator.endDrag(components);
/// if (result.success) components = *result.updatedComponents;
/// @endcode
class DragDropCoordinator {
public:
    DragDropCoordinator(const RuleEngine& rules,
                        HierarchyManager& hierarchy,
                        const IGeometryProvider& geometry,
                        DragConfig config = DragConfig::createDefault());

    /// Begin a drag. Returns false (and changes nothing) if a drag is
    /// already active or an existing item has no id.
    bool startDrag(const DragItem& item, const Point& pointer);

    /// Snap the pointer, rebuild and validate the zones, pick the best one.
    /// Ignored when no drag is active.
    void moveDrag(const Point& pointer, const ComponentMap& components);

    /// Commit the drop into the best legal zone. Always returns to Idle.
    DropResult endDrag(const ComponentMap& components);

    /// Discard the session without touching any map
    void cancelDrag();

    SubscriptionId addEventListener(DragEventType type, DragListener listener);
    bool removeEventListener(SubscriptionId id);

    const DragState& dragState() const { return state_; }
    const std::vector<DropZone>& dropZones() const { return zones_; }

    const DragConfig& config() const { return config_; }
    void setConfig(DragConfig config) { config_ = std::move(config); }

    /// Id source for palette drops. Default: "component_<n>", skipping ids in use.
    void setIdGenerator(IdGenerator generator) { idGenerator_ = std::move(generator); }

private:
    std::vector<DropZone> computeZones(const ComponentMap& components) const;

    /// Empty string when the zone accepts the candidate, the reason otherwise
    std::string checkZone(const DropZone& zone, const ComponentRecord& candidate,
                          const ComponentMap& components) const;

    DropResult dropNewComponent(const DropZone& zone, const ComponentMap& components);
    DropResult dropExistingComponent(const DropZone& zone, const ComponentMap& components);

    std::optional<ComponentId> nextComponentId(const ComponentMap& components);

    void emit(DragEventType type, DragEventPayload payload) const;
    void resetSession();

    const RuleEngine& rules_;
    HierarchyManager& hierarchy_;
    const IGeometryProvider& geometry_;
    DragConfig config_;

    DragState state_;
    std::vector<DropZone> zones_;
    DragEventChannel events_;

    IdGenerator idGenerator_;
    uint64_t idCounter_ = 0;
};

}  // namespace pagecraft
