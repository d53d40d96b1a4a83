#include "pagecraft/rules/RuleEngine.h"
#include "pagecraft/common/Logger.h"

#include <cmath>
#include <format>
#include <string>

namespace pagecraft {

namespace {
    constexpr int BASE_COMPLEXITY = 10;
    constexpr int GRID_COLUMNS = 12;
    constexpr int NESTING_WARNING_LEVEL = 5;

    ValidationError makeError(const char* code, std::string message, const ComponentRecord& component,
                              std::optional<ComponentId> parentId = std::nullopt,
                              std::optional<std::string> field = std::nullopt) {
        ValidationError error;
        error.code = code;
        error.message = std::move(message);
        error.componentId = component.id;
        error.parentId = std::move(parentId);
        error.field = std::move(field);
        return error;
    }

    ValidationWarning makeWarning(const char* code, std::string message, const ComponentRecord& component,
                                  WarningImpact impact, std::optional<std::string> suggestion = std::nullopt) {
        ValidationWarning warning;
        warning.code = code;
        warning.message = std::move(message);
        warning.componentId = component.id;
        warning.impact = impact;
        warning.suggestion = std::move(suggestion);
        return warning;
    }

    size_t keyCount(const nlohmann::json& payload) {
        return payload.is_object() ? payload.size() : 0;
    }
}

RuleEngine::RuleEngine(RuleConfig config)
    : config_(std::move(config)) {
}

void RuleEngine::registerRule(ComponentType type, ConstraintRule rule) {
    LOG_DEBUG("Registering rule for {}", componentTypeToString(type));
    config_.rules.registerRule(type, std::move(rule));
}

bool RuleEngine::canContain(ComponentType parentType, ComponentType childType) const {
    if (parentType == ComponentType::Row && childType != ComponentType::Col) {
        return false;
    }
    const ConstraintRule* parentRule = config_.rules.find(parentType);
    return parentRule == nullptr || parentRule->allowsChild(childType);
}

bool RuleEngine::canBeRoot(ComponentType type) const {
    return config_.rootTypes.count(type) > 0;
}

int RuleEngine::complexityScore(const ComponentRecord& component) {
    int score = BASE_COMPLEXITY;
    switch (component.type) {
        case ComponentType::Container:
            score += 20;
            break;
        case ComponentType::Row:
            score += 15;
            break;
        case ComponentType::Col:
            score += 10;
            break;
        default:
            score += 5;
            break;
    }
    score += static_cast<int>(keyCount(component.props)) * 2;
    score += static_cast<int>(keyCount(component.style));
    return score;
}

// =============================================================================
// Single placement
// =============================================================================

ValidationOutcome RuleEngine::evaluatePlacement(const ComponentRecord& candidate,
                                                const ComponentRecord* parent,
                                                const std::vector<const ComponentRecord*>& siblings) const {
    PlacementContext context;
    context.parent = parent;
    context.siblings = siblings;
    return evaluatePlacement(candidate, context);
}

ValidationOutcome RuleEngine::evaluatePlacement(const ComponentRecord& candidate,
                                                const PlacementContext& context) const {
    ValidationOutcome out;

    // Parent-driven checks run even when the candidate type has no rule of its own
    if (context.parent) {
        checkParentContainment(candidate, *context.parent, out);
        if (context.siblings) {
            checkSiblingLimits(candidate, *context.parent, *context.siblings, out);
        }
    }

    const ConstraintRule* rule = config_.rules.find(candidate.type);
    if (!rule) {
        out.warnings.push_back(makeWarning(codes::NO_CONSTRAINTS_DEFINED,
            std::format("No constraint rule defined for component type \"{}\"",
                        componentTypeToString(candidate.type)),
            candidate, WarningImpact::Maintainability,
            "Register a rule for this type to get full validation"));
        LOG_DEBUG("{} ({}) has no rule: {}", candidate.id,
                  componentTypeToString(candidate.type), out.isValid() ? "valid" : "invalid");
        return out;
    }

    if (candidate.type == ComponentType::Row && context.children) {
        checkRowChildren(candidate, *context.children, out);
    }

    switch (candidate.type) {
        case ComponentType::Col:
            checkColProps(candidate, out);
            if (candidate.isRoot() && context.parent == nullptr) {
                out.warnings.push_back(makeWarning(codes::COL_WITHOUT_PARENT,
                    "Col should be placed inside a parent (usually a row)",
                    candidate, WarningImpact::Usability,
                    "Move the col into a row or another layout component"));
            }
            break;
        case ComponentType::Row:
            checkGapProp(candidate, "row", out);
            break;
        case ComponentType::Container:
            checkGapProp(candidate, "container", out);
            break;
        default:
            break;
    }

    checkPerformance(candidate, *rule, out);

    LOG_DEBUG("Evaluated {} ({}): {} errors, {} warnings", candidate.id,
              componentTypeToString(candidate.type), out.errors.size(), out.warnings.size());
    return out;
}

void RuleEngine::checkParentContainment(const ComponentRecord& candidate, const ComponentRecord& parent,
                                        ValidationOutcome& out) const {
    bool tableRejected = false;
    const ConstraintRule* parentRule = config_.rules.find(parent.type);
    if (parentRule && !parentRule->allowsChild(candidate.type)) {
        tableRejected = true;
        out.errors.push_back(makeError(codes::INVALID_CHILD,
            std::format("Component type \"{}\" cannot be placed in \"{}\"",
                        componentTypeToString(candidate.type), componentTypeToString(parent.type)),
            candidate, parent.id, "type"));
    }

    if (!tableRejected && parent.type == ComponentType::Row && candidate.type != ComponentType::Col) {
        out.errors.push_back(makeError(codes::INVALID_CHILD,
            "Row can only contain col components", candidate, parent.id, "type"));
    }
}

void RuleEngine::checkSiblingLimits(const ComponentRecord& candidate, const ComponentRecord& parent,
                                    const std::vector<const ComponentRecord*>& siblings,
                                    ValidationOutcome& out) const {
    const ConstraintRule* parentRule = config_.rules.find(parent.type);
    const int childCount = static_cast<int>(siblings.size()) + 1;

    if (parentRule && childCount > parentRule->maxDirectChildren) {
        out.errors.push_back(makeError(codes::MAX_CHILDREN_EXCEEDED,
            std::format("Direct child count ({}) exceeds the limit ({}) of \"{}\"",
                        childCount, parentRule->maxDirectChildren, componentTypeToString(parent.type)),
            candidate, parent.id));
    }

    if (parent.type != ComponentType::Row) {
        return;
    }

    int colCount = candidate.type == ComponentType::Col ? 1 : 0;
    for (const ComponentRecord* sibling : siblings) {
        if (sibling && sibling->type == ComponentType::Col) {
            ++colCount;
        }
    }

    const int maxColumns = config_.limits.maxRowColumns;
    if (colCount > maxColumns) {
        out.errors.push_back(makeError(codes::GRID_OVERFLOW,
            std::format("Column count in row ({}) exceeds the limit ({})", colCount, maxColumns),
            candidate, parent.id));

        ValidationSuggestion suggestion;
        suggestion.type = SuggestionType::Modify;
        suggestion.target = parent.id;
        suggestion.description = "Use several rows to hold more columns";
        suggestion.action = "split_row_into_multiple";
        suggestion.priority = SuggestionPriority::Medium;
        out.suggestions.push_back(std::move(suggestion));
    }

    if (colCount == 0) {
        ValidationWarning warning = makeWarning(codes::ROW_WITHOUT_COLS,
            "Row should contain at least one col", parent, WarningImpact::Usability,
            "Add a col or remove the empty row");
        out.warnings.push_back(std::move(warning));
    }
}

void RuleEngine::checkRowChildren(const ComponentRecord& candidate,
                                  const std::vector<const ComponentRecord*>& children,
                                  ValidationOutcome& out) const {
    for (const ComponentRecord* child : children) {
        if (child && child->type == ComponentType::Col) {
            return;
        }
    }
    out.warnings.push_back(makeWarning(codes::ROW_WITHOUT_COLS,
        "Row should contain at least one col", candidate, WarningImpact::Usability,
        "Add a col or remove the empty row"));
}

void RuleEngine::checkColProps(const ComponentRecord& candidate, ValidationOutcome& out) const {
    if (!candidate.props.is_object() || !candidate.props.contains("col")) {
        return;
    }
    const auto& colProps = candidate.props["col"];
    if (!colProps.is_object()) {
        return;
    }

    auto readNumber = [&colProps](const char* key, double fallback) {
        if (colProps.contains(key) && colProps[key].is_number()) {
            return colProps[key].get<double>();
        }
        return fallback;
    };
    auto isWhole = [](double v) { return std::floor(v) == v; };

    const double span = readNumber("span", GRID_COLUMNS);
    const double offset = readNumber("offset", 0);

    if (!isWhole(span) || span < 1 || span > GRID_COLUMNS) {
        out.errors.push_back(makeError(codes::INVALID_GRID_SPAN,
            std::format("Col span ({}) must be an integer between 1 and {}", span, GRID_COLUMNS),
            candidate, candidate.parentId, "props.col.span"));
    }

    if (!isWhole(offset) || offset < 0 || offset > GRID_COLUMNS - 1) {
        out.errors.push_back(makeError(codes::INVALID_GRID_SPAN,
            std::format("Col offset ({}) must be an integer between 0 and {}", offset, GRID_COLUMNS - 1),
            candidate, candidate.parentId, "props.col.offset"));
    }

    // Warning only, never blocks placement
    if (span + offset > GRID_COLUMNS) {
        out.warnings.push_back(makeWarning(codes::GRID_OVERFLOW,
            std::format("Col span ({}) + offset ({}) exceeds {}", span, offset, GRID_COLUMNS),
            candidate, WarningImpact::Usability,
            "Adjust span or offset so their sum stays within 12"));
    }
}

void RuleEngine::checkGapProp(const ComponentRecord& candidate, const char* propKey,
                              ValidationOutcome& out) const {
    if (!candidate.props.is_object() || !candidate.props.contains(propKey)) {
        return;
    }
    const auto& section = candidate.props[propKey];
    if (!section.is_object() || !section.contains("gap") || !section["gap"].is_number()) {
        return;
    }
    if (section["gap"].get<double>() < 0) {
        out.errors.push_back(makeError(codes::INVALID_CHILD,
            std::format("{} gap must not be negative", componentTypeToString(candidate.type)),
            candidate, candidate.parentId, std::string("props.") + propKey + ".gap"));
    }
}

void RuleEngine::checkPerformance(const ComponentRecord& candidate, const ConstraintRule& rule,
                                  ValidationOutcome& out) const {
    if (rule.maxNestingLevel > NESTING_WARNING_LEVEL) {
        out.warnings.push_back(makeWarning(codes::DEEP_NESTING,
            std::format("Maximum nesting level ({}) of \"{}\" may hurt performance",
                        rule.maxNestingLevel, componentTypeToString(candidate.type)),
            candidate, WarningImpact::Performance,
            "Simplify the layout to reduce nesting"));
    }

    const int score = complexityScore(candidate);
    if (score > config_.limits.complexityThreshold) {
        out.warnings.push_back(makeWarning(codes::DEEP_NESTING,
            std::format("Component complexity ({}) is high and may slow rendering", score),
            candidate, WarningImpact::Performance,
            "Simplify the component or split it into several components"));
    }
}

// =============================================================================
// Whole tree
// =============================================================================

ValidationOutcome RuleEngine::evaluateTree(const ComponentMap& components,
                                           const ComponentId& rootId) const {
    ValidationOutcome out;

    const int total = static_cast<int>(components.size());
    if (total > config_.limits.maxTotalComponents) {
        ValidationError error;
        error.code = codes::TOO_MANY_COMPONENTS;
        error.message = std::format("Page component count ({}) exceeds the limit ({})",
                                    total, config_.limits.maxTotalComponents);
        error.componentId = rootId;
        out.errors.push_back(std::move(error));
    }

    const auto parents = components.parentSlots();

    for (SlotIndex slot = 0; slot < components.size(); ++slot) {
        const ComponentRecord& component = components.atSlot(slot);

        PlacementContext context;
        context.children = components.childrenOf(component.id);

        if (component.parentId) {
            const ComponentRecord* parent = components.find(*component.parentId);
            if (!parent) {
                out.errors.push_back(makeError(codes::INVALID_PARENT,
                    std::format("Parent \"{}\" does not exist", *component.parentId),
                    component, component.parentId, "parentId"));
            } else {
                context.parent = parent;
                std::vector<const ComponentRecord*> siblings;
                for (const ComponentRecord* sibling : components.childrenOf(component.parentId)) {
                    if (sibling->id != component.id) {
                        siblings.push_back(sibling);
                    }
                }
                context.siblings = std::move(siblings);
            }
        }

        out.merge(evaluatePlacement(component, context));

        // Parent chain length, bounded so a cycle cannot spin forever
        int depth = 0;
        SlotIndex cursor = parents[slot];
        while (cursor != INVALID_SLOT && depth <= total) {
            ++depth;
            cursor = parents[cursor];
        }
        if (depth >= config_.limits.maxNestingDepth && depth <= total) {
            out.errors.push_back(makeError(codes::MAX_DEPTH_EXCEEDED,
                std::format("Nesting depth ({}) reaches the limit ({})",
                            depth, config_.limits.maxNestingDepth),
                component, component.parentId));
        }
    }

    if (auto cycleId = findCycle(components, rootId)) {
        ValidationError error;
        error.code = codes::CIRCULAR_REFERENCE;
        error.message = "Circular reference detected; the tree cannot be walked";
        error.componentId = *cycleId;
        out.errors.push_back(std::move(error));
    }

    LOG_DEBUG("Evaluated tree rooted at {}: {} components, {} errors, {} warnings",
              rootId, total, out.errors.size(), out.warnings.size());
    return out;
}

std::optional<ComponentId> RuleEngine::findCycle(const ComponentMap& components,
                                                 const ComponentId& rootId) const {
    enum class Mark : uint8_t { Unvisited, OnStack, Done };

    const auto children = components.childSlots();
    std::vector<Mark> marks(components.size(), Mark::Unvisited);

    // Iterative DFS: (slot, next child position)
    auto dfs = [&](SlotIndex start) -> std::optional<SlotIndex> {
        std::vector<std::pair<SlotIndex, size_t>> stack;
        stack.emplace_back(start, 0);
        marks[start] = Mark::OnStack;

        while (!stack.empty()) {
            auto& [slot, next] = stack.back();
            if (next < children[slot].size()) {
                SlotIndex child = children[slot][next++];
                if (marks[child] == Mark::OnStack) {
                    return child;
                }
                if (marks[child] == Mark::Unvisited) {
                    marks[child] = Mark::OnStack;
                    stack.emplace_back(child, 0);
                }
            } else {
                marks[slot] = Mark::Done;
                stack.pop_back();
            }
        }
        return std::nullopt;
    };

    SlotIndex rootSlot = components.slotOf(rootId);
    if (rootSlot != INVALID_SLOT) {
        if (auto hit = dfs(rootSlot)) {
            return components.atSlot(*hit).id;
        }
    }

    // Cycles detached from the root have no root of their own
    for (SlotIndex slot = 0; slot < components.size(); ++slot) {
        if (marks[slot] == Mark::Unvisited) {
            if (auto hit = dfs(slot)) {
                return components.atSlot(*hit).id;
            }
        }
    }
    return std::nullopt;
}

}  // namespace pagecraft
