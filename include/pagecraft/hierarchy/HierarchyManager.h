#pragma once

#include "HierarchyNode.h"
#include "../core/ComponentMap.h"
#include "../core/RingBuffer.h"
#include "../rules/RuleEngine.h"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pagecraft {

/// Result of validateNestingRules()
struct NestingCheck {
    bool isValid = true;
    std::string reason;   ///< Empty when valid

    static NestingCheck ok() { return {true, ""}; }
    static NestingCheck fail(const std::string& reason) { return {false, reason}; }
};

/// Result of moveComponent() / insertComponent().
/// On failure updatedComponents is empty and the input map is untouched.
struct MoveResult {
    bool success = false;
    std::string reason;
    std::optional<ComponentMap> updatedComponents;

    static MoveResult ok(ComponentMap components) {
        return {true, "", std::move(components)};
    }

    static MoveResult fail(const std::string& reason) {
        return {false, reason, std::nullopt};
    }
};

/// Result of duplicateComponent()
struct DuplicateResult {
    bool success = false;
    std::string reason;
    ComponentId newRootId;                          ///< Id of the duplicated subtree root
    ComponentMap newComponents;                     ///< Exactly the copies
    std::optional<ComponentMap> updatedComponents;  ///< Full map with copies inserted

    static DuplicateResult fail(const std::string& reason) {
        DuplicateResult result;
        result.reason = reason;
        return result;
    }
};

struct HierarchyStatistics {
    size_t totalComponents = 0;
    int maxDepth = 0;                                ///< Root depth = 0
    std::map<ComponentType, size_t> countsByType;
    std::vector<ComponentId> orphanedComponentIds;   ///< parentId points at a missing component
};

enum class HierarchyOperationType {
    Add,        ///< New record inserted (palette drop, duplicate)
    Reorder,    ///< Moved within the same parent
    Reparent    ///< Moved to a different parent
};

const char* hierarchyOperationTypeToString(HierarchyOperationType type);

/// One entry of the bounded operation history
struct HierarchyOperation {
    HierarchyOperationType type = HierarchyOperationType::Add;
    ComponentId componentId;
    std::optional<ComponentId> parentId;
    std::optional<ComponentId> oldParentId;
    int position = 0;
    std::optional<int> oldPosition;
    std::chrono::system_clock::time_point timestamp;
};

/// Supplies ids for duplicated components
using IdGenerator = std::function<ComponentId()>;

/// Tree view, nesting validation and structural mutations over a ComponentMap.
///
/// Every mutation takes a const snapshot and returns a new map; the caller's
/// map is never edited. Type containment is delegated to the RuleEngine,
/// which must outlive the manager.
///
/// After a successful mutation:
/// - the parent relation stays acyclic
/// - every non-root parentId refers to an existing component
/// - orders among the children of each touched parent are 0..n-1
class HierarchyManager {
public:
    static constexpr size_t DEFAULT_HISTORY_CAPACITY = 100;

    explicit HierarchyManager(const RuleEngine& rules,
                              size_t historyCapacity = DEFAULT_HISTORY_CAPACITY);

    /**
     * @brief Build the indexed tree rooted at rootId.
     *
     * Depth-first walk, children sorted by order. Components not reachable
     * from the root are not part of the tree.
     *
     * @throws HierarchyError if rootId is not in the map
     * @throws CircularReferenceError if a node is reached again while on the walk path
     */
    ComponentTree buildHierarchy(const ComponentMap& components, const ComponentId& rootId) const;

    /**
     * @brief Check whether candidate may be linked under targetParentId.
     *
     * std::nullopt target means the candidate becomes a root. Rejects a
     * missing parent, a link that would close a cycle, a type pair the rule
     * engine forbids, and a parent chain at the nesting ceiling.
     */
    NestingCheck validateNestingRules(const ComponentRecord& candidate,
                                      const std::optional<ComponentId>& targetParentId,
                                      const ComponentMap& components) const;

    /**
     * @brief Move a component (and its subtree) to a new parent/position.
     *
     * @param newIndex Position among the new siblings, clamped to
     *        [0, siblingCount]. Negative appends.
     */
    MoveResult moveComponent(const ComponentId& id,
                             const std::optional<ComponentId>& newParentId,
                             int newIndex,
                             const ComponentMap& components);

    /// Insert a new record at a position. Fails if the id is already in use
    /// or the nesting rules reject it.
    MoveResult insertComponent(ComponentRecord record,
                               const std::optional<ComponentId>& parentId,
                               int index,
                               const ComponentMap& components);

    /**
     * @brief Deep-copy a component and its subtree.
     *
     * The copy is placed right after the original; later siblings shift by one.
     * Fails if id is absent or the generator returns an id already in use.
     */
    DuplicateResult duplicateComponent(const ComponentId& id,
                                       const ComponentMap& components,
                                       const IdGenerator& generateId);

    HierarchyStatistics getStatistics(const ComponentMap& components) const;

    // Operation history (oldest first)
    std::vector<HierarchyOperation> operationHistory() const { return history_.toVector(); }
    void clearHistory() { history_.clear(); }
    size_t historyCapacity() const { return history_.capacity(); }

    const RuleEngine& ruleEngine() const { return rules_; }

private:
    /// Number of components on the chain from id up to its root, id included.
    /// Bounded by the map size so a pre-existing cycle terminates.
    static int chainLength(const ComponentId& id, const ComponentMap& components);

    /// True if walking up from targetParentId reaches componentId
    static bool wouldCreateCycle(const ComponentId& componentId, const ComponentId& targetParentId,
                                 const ComponentMap& components);

    /// Put id at index among the children of parentId and renumber them 0..n-1
    static int placeAmongSiblings(ComponentMap& components, const ComponentId& id,
                                  const std::optional<ComponentId>& parentId, int index);

    /// Renumber the children of parentId 0..n-1 in their current order
    static void renumberChildren(ComponentMap& components, const std::optional<ComponentId>& parentId);

    void record(HierarchyOperation operation);

    const RuleEngine& rules_;
    RingBuffer<HierarchyOperation> history_;
};

}  // namespace pagecraft
