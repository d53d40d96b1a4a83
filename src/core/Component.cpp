#include "pagecraft/core/Component.h"

namespace pagecraft {

const char* componentTypeToString(ComponentType type) {
    switch (type) {
        case ComponentType::Button: return "button";
        case ComponentType::Input: return "input";
        case ComponentType::Text: return "text";
        case ComponentType::Image: return "image";
        case ComponentType::Link: return "link";
        case ComponentType::Heading: return "heading";
        case ComponentType::Paragraph: return "paragraph";
        case ComponentType::Divider: return "divider";
        case ComponentType::Spacer: return "spacer";
        case ComponentType::Container: return "container";
        case ComponentType::Row: return "row";
        case ComponentType::Col: return "col";
        case ComponentType::Form: return "form";
        case ComponentType::Textarea: return "textarea";
        case ComponentType::Select: return "select";
        case ComponentType::Checkbox: return "checkbox";
        case ComponentType::Radio: return "radio";
        case ComponentType::Navbar: return "navbar";
        case ComponentType::Sidebar: return "sidebar";
        case ComponentType::Breadcrumb: return "breadcrumb";
        case ComponentType::Tabs: return "tabs";
        case ComponentType::List: return "list";
        case ComponentType::Table: return "table";
        case ComponentType::Card: return "card";
        case ComponentType::Grid: return "grid";
    }
    return "unknown";
}

std::optional<ComponentType> componentTypeFromString(std::string_view name) {
    for (ComponentType type : ALL_COMPONENT_TYPES) {
        if (name == componentTypeToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

}  // namespace pagecraft
