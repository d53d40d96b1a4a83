#include "pagecraft/hierarchy/HierarchyNode.h"

#include <stdexcept>

namespace pagecraft {

ComponentTree::ComponentTree(ComponentId rootId, std::vector<HierarchyNode> nodes)
    : rootId_(std::move(rootId))
    , nodes_(std::move(nodes)) {
    index_.reserve(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i) {
        index_[nodes_[i].componentId] = i;
    }
}

bool ComponentTree::contains(const ComponentId& id) const {
    return index_.find(id) != index_.end();
}

const HierarchyNode& ComponentTree::node(const ComponentId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw std::out_of_range("Component not in tree: " + id);
    }
    return nodes_[it->second];
}

const HierarchyNode* ComponentTree::tryNode(const ComponentId& id) const {
    auto it = index_.find(id);
    return it != index_.end() ? &nodes_[it->second] : nullptr;
}

std::vector<ComponentId> ComponentTree::children(const ComponentId& id) const {
    const HierarchyNode* n = tryNode(id);
    return n ? n->children : std::vector<ComponentId>{};
}

std::vector<ComponentId> ComponentTree::descendants(const ComponentId& id) const {
    std::vector<ComponentId> result;
    const HierarchyNode* n = tryNode(id);
    if (!n) {
        return result;
    }

    // Pre-order storage: descendants are the contiguous run after the node
    // whose depth is greater than the node's own depth.
    size_t start = index_.at(id) + 1;
    for (size_t i = start; i < nodes_.size() && nodes_[i].depth > n->depth; ++i) {
        result.push_back(nodes_[i].componentId);
    }
    return result;
}

std::optional<std::string> ComponentTree::pathOf(const ComponentId& id) const {
    const HierarchyNode* n = tryNode(id);
    if (!n) {
        return std::nullopt;
    }
    return n->pathString;
}

std::vector<ComponentId> ComponentTree::parentPath(const ComponentId& id) const {
    const HierarchyNode* n = tryNode(id);
    if (!n || n->path.size() < 2) {
        return {};
    }
    return {n->path.begin(), n->path.end() - 1};
}

}  // namespace pagecraft
