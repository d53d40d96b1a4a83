#include "pagecraft/interaction/DropZone.h"

#include <limits>

namespace pagecraft {

const char* dropZoneKindToString(DropZoneKind kind) {
    switch (kind) {
        case DropZoneKind::Canvas:
            return "canvas";
        case DropZoneKind::Inside:
            return "inside";
        case DropZoneKind::BetweenSiblings:
            return "between";
    }
    return "unknown";
}

std::vector<DropZone> DropZoneBuilder::build(const ComponentMap& components,
                                             const IGeometryProvider& geometry,
                                             const DragConfig& config,
                                             const std::optional<ComponentId>& excludeId) {
    auto childrenExcluding = [&](const std::optional<ComponentId>& parentId) {
        std::vector<const ComponentRecord*> result;
        for (const ComponentRecord* child : components.childrenOf(parentId)) {
            if (!excludeId || child->id != *excludeId) {
                result.push_back(child);
            }
        }
        return result;
    };

    std::vector<DropZone> zones;

    DropZone canvas;
    canvas.id = "canvas";
    canvas.kind = DropZoneKind::Canvas;
    canvas.bounds = config.canvasBounds;
    canvas.insertIndex = static_cast<int>(childrenExcluding(std::nullopt).size());
    zones.push_back(std::move(canvas));

    for (const auto& component : components) {
        if (!isLayoutComponentType(component.type)) {
            continue;
        }
        auto bounds = geometry.boundsOf(component);
        if (!bounds) {
            continue;
        }

        auto children = childrenExcluding(component.id);

        DropZone inside;
        inside.id = component.id + "-inside";
        inside.kind = DropZoneKind::Inside;
        inside.ownerComponentId = component.id;
        inside.bounds = bounds->shrunk(config.insideMargin);
        inside.insertIndex = static_cast<int>(children.size());
        zones.push_back(std::move(inside));

        for (size_t i = 0; i < children.size(); ++i) {
            auto childBounds = geometry.boundsOf(*children[i]);
            if (!childBounds) {
                continue;
            }
            DropZone between;
            between.id = component.id + "-before-" + children[i]->id;
            between.kind = DropZoneKind::BetweenSiblings;
            between.ownerComponentId = component.id;
            between.bounds = Rect{childBounds->x - config.gapWidth / 2, childBounds->y,
                                  config.gapWidth, childBounds->height};
            between.insertIndex = static_cast<int>(i);
            zones.push_back(std::move(between));
        }
    }

    return zones;
}

const DropZone* DropZoneBuilder::selectBest(const std::vector<DropZone>& zones, const Point& pointer) {
    const DropZone* best = nullptr;
    float bestDistance = std::numeric_limits<float>::max();

    for (const auto& zone : zones) {
        if (!zone.isLegal) {
            continue;
        }
        float distance = pointer.distanceTo(zone.bounds.center());
        if (distance < bestDistance) {
            bestDistance = distance;
            best = &zone;
        }
    }
    return best;
}

}  // namespace pagecraft
