#pragma once

#include <stdexcept>
#include <string>

namespace pagecraft {

/// Configuration (rule table, drag config) could not be parsed or is inconsistent
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The component map cannot be walked as a tree (missing root, corrupted links)
class HierarchyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A component was reached again while still on the active walk path
class CircularReferenceError : public HierarchyError {
public:
    explicit CircularReferenceError(const std::string& componentId)
        : HierarchyError("Circular reference detected for component " + componentId)
        , componentId_(componentId) {}

    const std::string& componentId() const { return componentId_; }

private:
    std::string componentId_;
};

}  // namespace pagecraft
