#pragma once

#include "../core/Types.h"

#include <optional>
#include <string>
#include <vector>

namespace pagecraft {

/// Stable codes carried by ValidationError / ValidationWarning
namespace codes {
    inline constexpr const char* INVALID_PARENT = "INVALID_PARENT";
    inline constexpr const char* INVALID_CHILD = "INVALID_CHILD";
    inline constexpr const char* MAX_DEPTH_EXCEEDED = "MAX_DEPTH_EXCEEDED";
    inline constexpr const char* MAX_CHILDREN_EXCEEDED = "MAX_CHILDREN_EXCEEDED";
    inline constexpr const char* CIRCULAR_REFERENCE = "CIRCULAR_REFERENCE";
    inline constexpr const char* ROW_WITHOUT_COLS = "ROW_WITHOUT_COLS";
    inline constexpr const char* COL_WITHOUT_PARENT = "COL_WITHOUT_PARENT";
    inline constexpr const char* TOO_MANY_COMPONENTS = "TOO_MANY_COMPONENTS";
    inline constexpr const char* DEEP_NESTING = "DEEP_NESTING";
    inline constexpr const char* INVALID_GRID_SPAN = "INVALID_GRID_SPAN";
    inline constexpr const char* GRID_OVERFLOW = "GRID_OVERFLOW";
    inline constexpr const char* NO_CONSTRAINTS_DEFINED = "NO_CONSTRAINTS_DEFINED";
}  // namespace codes

enum class WarningImpact {
    Performance,
    Accessibility,
    Usability,
    Maintainability
};

enum class SuggestionType {
    Add,
    Remove,
    Modify,
    Restructure
};

enum class SuggestionPriority {
    Low,
    Medium,
    High
};

const char* warningImpactToString(WarningImpact impact);
const char* suggestionTypeToString(SuggestionType type);
const char* suggestionPriorityToString(SuggestionPriority priority);

/// Blocking problem. Any error makes the outcome invalid.
struct ValidationError {
    std::string code;
    std::string message;
    ComponentId componentId;
    std::optional<ComponentId> parentId;
    std::optional<std::string> field;   ///< e.g. "type", "props.col.span"

    std::string toString() const;
};

/// Non-blocking advice attached to a component
struct ValidationWarning {
    std::string code;
    std::string message;
    ComponentId componentId;
    WarningImpact impact = WarningImpact::Usability;
    std::optional<std::string> suggestion;

    std::string toString() const;
};

struct ValidationSuggestion {
    SuggestionType type = SuggestionType::Modify;
    ComponentId target;
    std::string description;
    std::string action;    ///< Machine-readable hint, e.g. "split_row_into_multiple"
    SuggestionPriority priority = SuggestionPriority::Medium;
};

/// Result of evaluating one placement or a whole tree.
/// Validation problems are reported here and never thrown.
struct ValidationOutcome {
    std::vector<ValidationError> errors;
    std::vector<ValidationWarning> warnings;
    std::vector<ValidationSuggestion> suggestions;

    /// Only errors affect validity
    bool isValid() const { return errors.empty(); }

    bool hasError(const std::string& code) const;
    bool hasWarning(const std::string& code) const;

    /// Append everything from other
    void merge(const ValidationOutcome& other);

    /// First error message, or empty when valid
    std::string firstError() const;

    std::string toString() const;
};

}  // namespace pagecraft
