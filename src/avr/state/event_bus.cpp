#include "avr/state/event_bus.h"
#include <algorithm>

namespace avr {
namespace state {

ListenerHandle EventBus::subscribe(EventListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ListenerHandle handle = m_nextHandle++;
    m_listeners.push_back({handle, std::move(listener), AvatarEventType::MovementUpdated, false});
    return handle;
}

ListenerHandle EventBus::subscribe(AvatarEventType type, EventListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ListenerHandle handle = m_nextHandle++;
    m_listeners.push_back({handle, std::move(listener), type, true});
    return handle;
}

void EventBus::unsubscribe(ListenerHandle handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listeners.erase(
        std::remove_if(m_listeners.begin(), m_listeners.end(),
            [handle](const ListenerEntry& entry) {
                return entry.handle == handle;
            }),
        m_listeners.end()
    );
}

void EventBus::publish(const AvatarEvent& event) {
    // Copy under lock so a listener may subscribe/unsubscribe re-entrantly
    std::vector<EventListener> listenersToCall;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_listeners) {
            if (!entry.hasFilter || entry.filterType == event.type) {
                listenersToCall.push_back(entry.listener);
            }
        }
    }

    for (const auto& listener : listenersToCall) {
        listener(event);
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listeners.clear();
}

size_t EventBus::listenerCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_listeners.size();
}

} // namespace state
} // namespace avr
