#pragma once

/// @file pagecraft.h
/// @brief Main header for the pagecraft page-builder core
///
/// pagecraft keeps the component tree of a drag-and-drop page builder legal:
/// a rule engine decides which types may nest where, a hierarchy manager
/// performs validated tree mutations, and a drag-drop coordinator turns
/// pointer input into those mutations.
///
/// Example usage:
/// @code
/// #include <pagecraft/pagecraft.h>
///
/// pagecraft::RuleEngine rules;
/// pagecraft::HierarchyManager hierarchy(rules);
///
/// pagecraft::ComponentMap page;
/// page.insert(pagecraft::ComponentRecord::create("root", pagecraft::ComponentType::Container));
/// auto added = hierarchy.insertComponent(
///     pagecraft::ComponentRecord::create("row1", pagecraft::ComponentType::Row), "root", -1, page);
/// if (added.success) page = *added.updatedComponents;
/// @endcode

// Core module - Component records and the component map
#include "core/Types.h"
#include "core/Component.h"
#include "core/ComponentMap.h"

// Rules module - Constraint table and evaluator
#include "rules/ConstraintRule.h"
#include "rules/ValidationResult.h"
#include "rules/RuleEngine.h"

// Hierarchy module - Tree view and mutations
#include "hierarchy/HierarchyNode.h"
#include "hierarchy/HierarchyManager.h"

// Interaction module - Drag and drop
#include "interaction/DragConfig.h"
#include "interaction/GeometryProvider.h"
#include "interaction/DropZone.h"
#include "interaction/DragEvent.h"
#include "interaction/ComponentDefaults.h"
#include "interaction/DragDropCoordinator.h"

#include <string>

namespace pagecraft {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace pagecraft
