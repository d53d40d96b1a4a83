#include "pagecraft/rules/ValidationResult.h"

#include <algorithm>
#include <sstream>

namespace pagecraft {

const char* warningImpactToString(WarningImpact impact) {
    switch (impact) {
        case WarningImpact::Performance:
            return "performance";
        case WarningImpact::Accessibility:
            return "accessibility";
        case WarningImpact::Usability:
            return "usability";
        case WarningImpact::Maintainability:
            return "maintainability";
    }
    return "unknown";
}

const char* suggestionTypeToString(SuggestionType type) {
    switch (type) {
        case SuggestionType::Add:
            return "add";
        case SuggestionType::Remove:
            return "remove";
        case SuggestionType::Modify:
            return "modify";
        case SuggestionType::Restructure:
            return "restructure";
    }
    return "unknown";
}

const char* suggestionPriorityToString(SuggestionPriority priority) {
    switch (priority) {
        case SuggestionPriority::Low:
            return "low";
        case SuggestionPriority::Medium:
            return "medium";
        case SuggestionPriority::High:
            return "high";
    }
    return "unknown";
}

std::string ValidationError::toString() const {
    std::ostringstream oss;
    oss << "[" << code << "] " << componentId;
    if (parentId.has_value()) {
        oss << " in " << parentId.value();
    }
    if (field.has_value()) {
        oss << " (" << field.value() << ")";
    }
    if (!message.empty()) {
        oss << ": " << message;
    }
    return oss.str();
}

std::string ValidationWarning::toString() const {
    std::ostringstream oss;
    oss << "[" << code << "/" << warningImpactToString(impact) << "] " << componentId;
    if (!message.empty()) {
        oss << ": " << message;
    }
    if (suggestion.has_value()) {
        oss << " (" << suggestion.value() << ")";
    }
    return oss.str();
}

bool ValidationOutcome::hasError(const std::string& code) const {
    return std::any_of(errors.begin(), errors.end(),
        [&code](const ValidationError& e) { return e.code == code; });
}

bool ValidationOutcome::hasWarning(const std::string& code) const {
    return std::any_of(warnings.begin(), warnings.end(),
        [&code](const ValidationWarning& w) { return w.code == code; });
}

void ValidationOutcome::merge(const ValidationOutcome& other) {
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    suggestions.insert(suggestions.end(), other.suggestions.begin(), other.suggestions.end());
}

std::string ValidationOutcome::firstError() const {
    return errors.empty() ? std::string() : errors.front().message;
}

std::string ValidationOutcome::toString() const {
    std::ostringstream oss;
    oss << (isValid() ? "valid" : "invalid")
        << " (" << errors.size() << " errors, " << warnings.size() << " warnings)";
    for (const auto& e : errors) {
        oss << "\n  error   " << e.toString();
    }
    for (const auto& w : warnings) {
        oss << "\n  warning " << w.toString();
    }
    return oss.str();
}

}  // namespace pagecraft
