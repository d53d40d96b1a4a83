#pragma once

#include "../core/Types.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pagecraft {

/// Derived tree position of one component. Never persisted.
struct HierarchyNode {
    ComponentId componentId;
    std::optional<ComponentId> parentId;
    std::vector<ComponentId> children;   ///< Sorted by order
    int depth = 0;                       ///< Root = 0
    std::vector<ComponentId> path;       ///< Root-to-node id chain, node included
    std::string pathString;              ///< path joined with '/'
};

/// Indexed tree view built by HierarchyManager::buildHierarchy().
///
/// Nodes are stored in depth-first pre-order. Lookups by id go through an
/// index into that vector.
class ComponentTree {
public:
    ComponentTree() = default;
    ComponentTree(ComponentId rootId, std::vector<HierarchyNode> nodes);

    const ComponentId& rootId() const { return rootId_; }

    /// Nodes in depth-first pre-order (root first)
    const std::vector<HierarchyNode>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }
    bool contains(const ComponentId& id) const;

    /// @throws std::out_of_range if id is not in the tree
    const HierarchyNode& node(const ComponentId& id) const;
    const HierarchyNode* tryNode(const ComponentId& id) const;

    /// Direct children, empty for unknown ids
    std::vector<ComponentId> children(const ComponentId& id) const;

    /// All descendants in pre-order, empty for unknown ids
    std::vector<ComponentId> descendants(const ComponentId& id) const;

    /// '/'-joined root-to-node path, std::nullopt for unknown ids
    std::optional<std::string> pathOf(const ComponentId& id) const;

    /// Root-to-parent id chain, empty for the root and unknown ids
    std::vector<ComponentId> parentPath(const ComponentId& id) const;

private:
    ComponentId rootId_;
    std::vector<HierarchyNode> nodes_;
    std::unordered_map<ComponentId, size_t> index_;
};

}  // namespace pagecraft
