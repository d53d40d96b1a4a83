#pragma once

#include "../core/Component.h"

#include <optional>
#include <unordered_map>

namespace pagecraft {

/// Source of on-screen bounds per component.
///
/// The core never computes layout; the host supplies whatever geometry its
/// renderer produced. Components without geometry get no drop zones.
class IGeometryProvider {
public:
    virtual ~IGeometryProvider() = default;

    /// @return Screen rect of the component, or std::nullopt if unknown
    virtual std::optional<Rect> boundsOf(const ComponentRecord& component) const = 0;
};

/// Bounds registered explicitly per component id
class StaticGeometryProvider : public IGeometryProvider {
public:
    StaticGeometryProvider() = default;

    void setBounds(const ComponentId& id, const Rect& bounds) { bounds_[id] = bounds; }
    bool removeBounds(const ComponentId& id) { return bounds_.erase(id) > 0; }
    void clear() { bounds_.clear(); }
    size_t size() const { return bounds_.size(); }

    std::optional<Rect> boundsOf(const ComponentRecord& component) const override;

private:
    std::unordered_map<ComponentId, Rect> bounds_;
};

/// Bounds read from numeric left/top/width/height style keys.
/// Missing or non-numeric keys fall back to 0/0/200/100.
class StyleGeometryProvider : public IGeometryProvider {
public:
    static constexpr float DEFAULT_WIDTH = 200.0f;
    static constexpr float DEFAULT_HEIGHT = 100.0f;

    std::optional<Rect> boundsOf(const ComponentRecord& component) const override;
};

}  // namespace pagecraft
