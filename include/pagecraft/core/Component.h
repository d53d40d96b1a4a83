#pragma once

#include "Types.h"

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace pagecraft {

/// Component catalogue of the page builder
enum class ComponentType {
    // Basic
    Button,
    Input,
    Text,
    Image,
    Link,
    Heading,
    Paragraph,
    Divider,
    Spacer,

    // Layout
    Container,
    Row,
    Col,

    // Form
    Form,
    Textarea,
    Select,
    Checkbox,
    Radio,

    // Navigation
    Navbar,
    Sidebar,
    Breadcrumb,
    Tabs,

    // List
    List,
    Table,
    Card,
    Grid
};

/// All component types, in declaration order
inline constexpr std::array<ComponentType, 25> ALL_COMPONENT_TYPES = {
    ComponentType::Button, ComponentType::Input, ComponentType::Text,
    ComponentType::Image, ComponentType::Link, ComponentType::Heading,
    ComponentType::Paragraph, ComponentType::Divider, ComponentType::Spacer,
    ComponentType::Container, ComponentType::Row, ComponentType::Col,
    ComponentType::Form, ComponentType::Textarea, ComponentType::Select,
    ComponentType::Checkbox, ComponentType::Radio, ComponentType::Navbar,
    ComponentType::Sidebar, ComponentType::Breadcrumb, ComponentType::Tabs,
    ComponentType::List, ComponentType::Table, ComponentType::Card,
    ComponentType::Grid
};

/// Lowercase wire name ("button", "row", ...)
const char* componentTypeToString(ComponentType type);

/// Parse a wire name. Returns std::nullopt for unknown names.
std::optional<ComponentType> componentTypeFromString(std::string_view name);

/// Layout types (container, row, col) may own children and be dropped on the canvas
constexpr bool isLayoutComponentType(ComponentType type) {
    return type == ComponentType::Container ||
           type == ComponentType::Row ||
           type == ComponentType::Col;
}

/// One placeable component in the page tree.
///
/// props/style are opaque payloads owned by the property editors; the core
/// only reads the grid props of rows/cols and counts keys for complexity.
struct ComponentRecord {
    ComponentId id;
    ComponentType type = ComponentType::Container;
    std::optional<ComponentId> parentId;   ///< std::nullopt = root
    int order = 0;                         ///< Position among siblings
    int zIndex = 0;
    nlohmann::json props = nlohmann::json::object();
    nlohmann::json style = nlohmann::json::object();

    bool isRoot() const { return !parentId.has_value(); }

    static ComponentRecord create(ComponentId id, ComponentType type,
                                  std::optional<ComponentId> parentId = std::nullopt,
                                  int order = 0) {
        ComponentRecord record;
        record.id = std::move(id);
        record.type = type;
        record.parentId = std::move(parentId);
        record.order = order;
        return record;
    }
};

}  // namespace pagecraft
