#include "pagecraft/interaction/DragEvent.h"
#include "pagecraft/common/Logger.h"

#include <algorithm>
#include <exception>

namespace pagecraft {

const char* dragEventTypeToString(DragEventType type) {
    switch (type) {
        case DragEventType::DragStart:
            return "drag_start";
        case DragEventType::DragMove:
            return "drag_move";
        case DragEventType::DragEnd:
            return "drag_end";
        case DragEventType::Drop:
            return "drop";
    }
    return "unknown";
}

const DragItem& DragEvent::item() const {
    return std::visit([](const auto& p) -> const DragItem& { return p.item; }, payload);
}

SubscriptionId DragEventChannel::subscribe(DragEventType type, DragListener listener) {
    SubscriptionId id = nextId_++;
    listeners_.push_back({id, type, std::move(listener)});
    return id;
}

bool DragEventChannel::unsubscribe(SubscriptionId id) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
        [id](const Entry& e) { return e.id == id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

void DragEventChannel::emit(const DragEvent& event) const {
    // Snapshot so a listener may (un)subscribe during dispatch
    std::vector<Entry> targets;
    for (const auto& entry : listeners_) {
        if (entry.type == event.type && entry.listener) {
            targets.push_back(entry);
        }
    }

    for (const auto& entry : targets) {
        try {
            entry.listener(event);
        } catch (const std::exception& e) {
            LOG_ERROR("[DragEventChannel] Listener {} for {} threw: {}",
                      entry.id, dragEventTypeToString(event.type), e.what());
        } catch (...) {
            LOG_ERROR("[DragEventChannel] Listener {} for {} threw an unknown exception",
                      entry.id, dragEventTypeToString(event.type));
        }
    }
}

size_t DragEventChannel::listenerCount(DragEventType type) const {
    return static_cast<size_t>(std::count_if(listeners_.begin(), listeners_.end(),
        [type](const Entry& e) { return e.type == type; }));
}

}  // namespace pagecraft
