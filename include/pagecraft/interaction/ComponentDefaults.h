#pragma once

#include "../core/Component.h"

#include <nlohmann/json.hpp>

namespace pagecraft {

/// Initial payloads for components dropped from the palette
struct ComponentDefaults {
    static nlohmann::json props(ComponentType type);
    static nlohmann::json style(ComponentType type);

    /// New record with default props/style, z-index 1 and no parent
    static ComponentRecord create(const ComponentId& id, ComponentType type);
};

}  // namespace pagecraft
