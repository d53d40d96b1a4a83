#include "pagecraft/interaction/GeometryProvider.h"

namespace pagecraft {

std::optional<Rect> StaticGeometryProvider::boundsOf(const ComponentRecord& component) const {
    auto it = bounds_.find(component.id);
    if (it == bounds_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Rect> StyleGeometryProvider::boundsOf(const ComponentRecord& component) const {
    auto read = [&component](const char* key, float fallback) {
        if (component.style.is_object() && component.style.contains(key) &&
            component.style[key].is_number()) {
            return component.style[key].get<float>();
        }
        return fallback;
    };

    return Rect{read("left", 0.0f), read("top", 0.0f),
                read("width", DEFAULT_WIDTH), read("height", DEFAULT_HEIGHT)};
}

}  // namespace pagecraft
