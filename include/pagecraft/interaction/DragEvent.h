#pragma once

#include "DropZone.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pagecraft {

/// What is being dragged
struct DragItem {
    ComponentType type = ComponentType::Container;
    ComponentId id;              ///< Existing component id; empty for palette items
    bool isFromPanel = false;    ///< Not yet part of the tree

    static DragItem fromPanel(ComponentType type) { return {type, "", true}; }
    static DragItem existing(const ComponentRecord& component) {
        return {component.type, component.id, false};
    }
};

enum class DragEventType {
    DragStart,
    DragMove,
    DragEnd,    ///< Cancelled or failed drop
    Drop        ///< Successful drop
};

const char* dragEventTypeToString(DragEventType type);

// Event payloads
struct DragStarted {
    DragItem item;
    Point position;
};

struct DragMoved {
    DragItem item;
    Point position;                     ///< After grid snapping
    std::optional<DropZone> zone;       ///< Best legal zone, if any
};

struct DragEnded {
    DragItem item;
    std::string reason;                 ///< Empty for a plain cancel
};

struct Dropped {
    DragItem item;
    DropZone zone;
    ComponentId componentId;            ///< Moved or newly created component
};

using DragEventPayload = std::variant<DragStarted, DragMoved, DragEnded, Dropped>;

/// Tagged drag notification
struct DragEvent {
    DragEventType type;
    DragEventPayload payload;
    std::chrono::system_clock::time_point timestamp;

    const DragItem& item() const;
};

using SubscriptionId = uint64_t;
using DragListener = std::function<void(const DragEvent&)>;

/// Synchronous, per-type listener registry.
///
/// A listener that throws is logged and skipped; the remaining listeners
/// still run and the exception never reaches the emitter.
class DragEventChannel {
public:
    SubscriptionId subscribe(DragEventType type, DragListener listener);

    /// @return true if the subscription existed
    bool unsubscribe(SubscriptionId id);

    void emit(const DragEvent& event) const;

    size_t listenerCount(DragEventType type) const;
    void clear() { listeners_.clear(); }

private:
    struct Entry {
        SubscriptionId id;
        DragEventType type;
        DragListener listener;
    };

    std::vector<Entry> listeners_;
    SubscriptionId nextId_ = 1;
};

}  // namespace pagecraft
