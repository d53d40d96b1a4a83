#pragma once

#include "../core/Component.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pagecraft {

/// Static containment/nesting rule for one component type
struct ConstraintRule {
    std::set<ComponentType> allowedChildren;   ///< Empty = no type restriction
    bool canContainLayoutTypes = true;
    bool canContainLeafTypes = true;
    int maxNestingLevel = 5;
    int maxDirectChildren = 50;

    std::optional<float> minWidth;
    std::optional<float> maxWidth;
    std::optional<float> minHeight;
    std::optional<float> maxHeight;

    /// True if a child of the given type may be linked under this type
    bool allowsChild(ComponentType childType) const;
};

/// Page-wide limits that do not belong to a single type
struct RuleLimits {
    int maxTotalComponents = 50;     ///< TOO_MANY_COMPONENTS above this
    int maxNestingDepth = 8;         ///< Hard ceiling on parent chain length
    int maxRowColumns = 12;          ///< Columns per row (12-unit grid)
    int complexityThreshold = 100;   ///< Performance warning above this score
};

/// Per-type rule table
///
/// Example:
/// @code
/// RuleTable table = RuleTable::createDefault();
/// ConstraintRule card;
/// card.allowedChildren = {ComponentType::Text, ComponentType::Image};
/// card.canContainLayoutTypes = false;
/// table.registerRule(ComponentType::Card, card);
/// @endcode
class RuleTable {
public:
    RuleTable() = default;

    /// Rules for container, row and col
    static RuleTable createDefault();

    /// Add or replace the rule for a type
    void registerRule(ComponentType type, ConstraintRule rule);

    /// @return true if a rule was removed
    bool removeRule(ComponentType type);

    /// @return Rule for the type, or nullptr if none is registered
    const ConstraintRule* find(ComponentType type) const;

    bool has(ComponentType type) const;
    size_t size() const { return rules_.size(); }
    std::vector<ComponentType> types() const;

    const std::map<ComponentType, ConstraintRule>& rules() const { return rules_; }

private:
    std::map<ComponentType, ConstraintRule> rules_;
};

/// Everything the rule engine is configured with
struct RuleConfig {
    RuleTable rules;
    RuleLimits limits;

    /// Types that may sit at the page root (no parent)
    std::set<ComponentType> rootTypes = {ComponentType::Container};

    static RuleConfig createDefault();
};

/// JSON load/save of a RuleConfig
///
/// Schema:
/// @code
/// {
///   "rules": {
///     "row": { "allowedChildren": ["col"], "canContainLayoutTypes": true,
///              "canContainLeafTypes": false, "maxNestingLevel": 3,
///              "maxDirectChildren": 12, "minWidth": 100, "maxWidth": 1200 }
///   },
///   "limits": { "maxTotalComponents": 50, "maxNestingDepth": 8,
///               "maxRowColumns": 12, "complexityThreshold": 100 },
///   "rootTypes": ["container"]
/// }
/// @endcode
/// Missing sections keep their defaults; "rules" replaces the whole table.
class RuleConfigSerializer {
public:
    static std::string toJson(const RuleConfig& config);

    /// @throws ConfigError on malformed JSON or unknown type names
    static RuleConfig fromJson(const std::string& json);
};

}  // namespace pagecraft
