#pragma once

#include "ConstraintRule.h"
#include "ValidationResult.h"
#include "../core/ComponentMap.h"

#include <optional>
#include <vector>

namespace pagecraft {

/// What a candidate placement is evaluated against.
/// Unset members skip the checks that need them.
struct PlacementContext {
    const ComponentRecord* parent = nullptr;                         ///< Target parent (nullptr = root)
    std::optional<std::vector<const ComponentRecord*>> siblings;     ///< Parent's other children
    std::optional<std::vector<const ComponentRecord*>> children;     ///< Candidate's own children
};

/// Declarative containment/nesting rule evaluator.
///
/// The engine owns a RuleConfig and never touches the component map it is
/// given. Every check result is reported through ValidationOutcome.
///
/// Example:
/// @code
/// RuleEngine engine;
/// auto row = ComponentRecord::create("r1", ComponentType::Row, "c1");
/// auto button = ComponentRecord::create("b1", ComponentType::Button, "r1");
/// PlacementContext ctx;
/// ctx.parent = &row;
/// auto outcome = engine.evaluatePlacement(button, ctx);
/// // outcome.isValid() == false, outcome.hasError(codes::INVALID_CHILD)
/// @endcode
class RuleEngine {
public:
    explicit RuleEngine(RuleConfig config = RuleConfig::createDefault());

    // =========================================================================
    // Evaluation
    // =========================================================================

    /// Evaluate one candidate placement.
    ///
    /// Checks in order: parent containment, sibling/column caps, type specific
    /// props (col span/offset, row/container gap), nesting and complexity
    /// warnings. A candidate type without a rule keeps the parent-driven checks
    /// and replaces the rest with a NO_CONSTRAINTS_DEFINED warning.
    ValidationOutcome evaluatePlacement(const ComponentRecord& candidate,
                                        const PlacementContext& context = {}) const;

    /// Convenience overload taking the parent and its other children directly
    ValidationOutcome evaluatePlacement(const ComponentRecord& candidate,
                                        const ComponentRecord* parent,
                                        const std::vector<const ComponentRecord*>& siblings) const;

    /// Evaluate every component against its actual parent/siblings/children,
    /// then the page-wide limits and a full cycle scan.
    ValidationOutcome evaluateTree(const ComponentMap& components, const ComponentId& rootId) const;

    /// True if the rule table and the row/col special case allow the pair.
    /// A parent type without a rule accepts any child.
    bool canContain(ComponentType parentType, ComponentType childType) const;

    /// True if the type may sit at the page root
    bool canBeRoot(ComponentType type) const;

    static bool isLayoutType(ComponentType type) { return isLayoutComponentType(type); }

    /// Synthetic render cost: base + type bonus + 2 per prop + 1 per style key
    static int complexityScore(const ComponentRecord& component);

    // =========================================================================
    // Rule table
    // =========================================================================

    void registerRule(ComponentType type, ConstraintRule rule);
    const ConstraintRule* rule(ComponentType type) const { return config_.rules.find(type); }
    bool hasRule(ComponentType type) const { return config_.rules.has(type); }

    const RuleConfig& config() const { return config_; }
    const RuleLimits& limits() const { return config_.limits; }
    void setConfig(RuleConfig config) { config_ = std::move(config); }

private:
    void checkParentContainment(const ComponentRecord& candidate, const ComponentRecord& parent,
                                ValidationOutcome& out) const;
    void checkSiblingLimits(const ComponentRecord& candidate, const ComponentRecord& parent,
                            const std::vector<const ComponentRecord*>& siblings,
                            ValidationOutcome& out) const;
    void checkRowChildren(const ComponentRecord& candidate,
                          const std::vector<const ComponentRecord*>& children,
                          ValidationOutcome& out) const;
    void checkColProps(const ComponentRecord& candidate, ValidationOutcome& out) const;
    void checkGapProp(const ComponentRecord& candidate, const char* propKey,
                      ValidationOutcome& out) const;
    void checkPerformance(const ComponentRecord& candidate, const ConstraintRule& rule,
                          ValidationOutcome& out) const;

    /// First component found on the active DFS path, if any
    std::optional<ComponentId> findCycle(const ComponentMap& components,
                                         const ComponentId& rootId) const;

    RuleConfig config_;
};

}  // namespace pagecraft
