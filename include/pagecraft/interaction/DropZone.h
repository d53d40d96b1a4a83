#pragma once

#include "DragConfig.h"
#include "GeometryProvider.h"
#include "../core/ComponentMap.h"

#include <optional>
#include <string>
#include <vector>

namespace pagecraft {

enum class DropZoneKind {
    Canvas,           ///< Page root
    Inside,           ///< Interior of a layout component (append)
    BetweenSiblings   ///< Gap before one child of a layout component
};

const char* dropZoneKindToString(DropZoneKind kind);

/// Candidate drop target. Recomputed on every pointer move, never persisted.
struct DropZone {
    std::string id;
    DropZoneKind kind = DropZoneKind::Canvas;
    std::optional<ComponentId> ownerComponentId;   ///< std::nullopt for the canvas
    Rect bounds;
    int insertIndex = 0;
    bool isLegal = false;
    std::string reason;                            ///< Why the zone is illegal
};

/// Pure zone geometry: no rule checks, no state.
///
/// Legality is left false; the coordinator marks it afterwards.
class DropZoneBuilder {
public:
    /**
     * @brief Build the candidate zones for the current map.
     *
     * One canvas zone, then per layout component with known geometry an
     * inside zone (bounds shrunk by the margin, appends) followed by one
     * between-siblings zone before each child.
     *
     * @param excludeId Component being dragged. It is left out of child
     *        lists so insert indices match the map after it is removed.
     */
    static std::vector<DropZone> build(const ComponentMap& components,
                                       const IGeometryProvider& geometry,
                                       const DragConfig& config,
                                       const std::optional<ComponentId>& excludeId = std::nullopt);

    /// Legal zone whose centre is nearest to the pointer.
    /// Ties keep the earlier zone. nullptr if no zone is legal.
    static const DropZone* selectBest(const std::vector<DropZone>& zones, const Point& pointer);
};

}  // namespace pagecraft
