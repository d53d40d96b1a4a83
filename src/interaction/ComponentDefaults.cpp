#include "pagecraft/interaction/ComponentDefaults.h"

using json = nlohmann::json;

namespace pagecraft {

json ComponentDefaults::props(ComponentType type) {
    switch (type) {
        case ComponentType::Container:
            return {
                {"container", {
                    {"direction", "column"},
                    {"gap", 0},
                    {"padding", {{"x", 16}, {"y", 16}}}
                }}
            };
        case ComponentType::Row:
            return {
                {"row", {
                    {"gap", 16},
                    {"justify", "start"},
                    {"align", "start"}
                }}
            };
        case ComponentType::Col:
            return {
                {"col", {
                    {"span", 12},
                    {"padding", {{"x", 8}, {"y", 8}}}
                }}
            };
        default:
            return json::object();
    }
}

json ComponentDefaults::style(ComponentType type) {
    switch (type) {
        case ComponentType::Container:
            return {{"width", "100%"}, {"minHeight", "100px"}};
        case ComponentType::Row:
            return {{"width", "100%"}, {"minHeight", "50px"}};
        case ComponentType::Col:
            return {{"minHeight", "50px"}};
        default:
            return json::object();
    }
}

ComponentRecord ComponentDefaults::create(const ComponentId& id, ComponentType type) {
    ComponentRecord record = ComponentRecord::create(id, type);
    record.zIndex = 1;
    record.props = props(type);
    record.style = style(type);
    return record;
}

}  // namespace pagecraft
