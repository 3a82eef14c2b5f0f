#pragma once

#include <functional>
#include <vector>
#include <variant>
#include <string>
#include <cstdint>
#include <mutex>
#include <glm/glm.hpp>

#include "avr/common/avatar_error.h"
#include "avr/state/movement_state.h"

namespace avr {
namespace state {

// Event types enum
enum class AvatarEventType {
    // Movement / input
    MovementUpdated,
    KeyStateChanged,

    // Animation
    AnimationChanged,
    ClipsStripped,

    // Scene
    TransformSnapshot,
    ContainerCreated,

    // Lifecycle
    InstanceStatusChanged,
    SetupFailed,
};

// Event data structures

struct MovementUpdatedData {
    std::string avatarId;
    MovementState state;
};

struct KeyStateChangedData {
    bool down;
    std::string code;
    std::vector<std::string> keys;  // pressed set after the change
};

struct AnimationChangedData {
    std::string avatarId;
    std::string clip;
    std::string previousClip;  // empty on the first selection
    bool moving;
};

struct ClipsStrippedData {
    std::string avatarId;
    std::vector<std::string> clips;
    uint32_t originalPositionTrackCount;
    uint32_t strippedPositionTrackCount;
};

struct TransformSnapshotData {
    std::string avatarId;
    double clock;               // seconds since the synchronizer started
    glm::vec3 localPosition;
    glm::vec3 worldPosition;
    Velocity velocity;
    bool isMoving;
    float avatarHeight;         // negative when unknown
};

struct ContainerCreatedData {
    std::string avatarId;
    float height;
    glm::vec3 bboxMin;
    glm::vec3 bboxMax;
    glm::vec3 containerScale;
    glm::vec3 pivotLocal;
};

enum class InstanceStatus {
    PrimaryRegistered,
    DuplicateBlocked,
    PrimaryUnregistered,
};

inline const char* instanceStatusName(InstanceStatus status) {
    switch (status) {
        case InstanceStatus::PrimaryRegistered:   return "primary_registered";
        case InstanceStatus::DuplicateBlocked:    return "duplicate_blocked";
        case InstanceStatus::PrimaryUnregistered: return "primary_unregistered";
    }
    return "unknown";
}

struct InstanceStatusChangedData {
    std::string avatarId;
    InstanceStatus status;
    std::string instanceId;
    std::string existingInstanceId;  // set for DuplicateBlocked
};

struct SetupFailedData {
    std::string avatarId;
    AvatarError error;
    std::string reason;
};

// Variant type for all event data
using EventData = std::variant<
    MovementUpdatedData,
    KeyStateChangedData,
    AnimationChangedData,
    ClipsStrippedData,
    TransformSnapshotData,
    ContainerCreatedData,
    InstanceStatusChangedData,
    SetupFailedData
>;

// Avatar event combining type and data
struct AvatarEvent {
    AvatarEventType type;
    EventData data;

    template<typename T>
    AvatarEvent(AvatarEventType t, T&& d) : type(t), data(std::forward<T>(d)) {}
};

// Event listener callback type
using EventListener = std::function<void(const AvatarEvent&)>;

// Listener handle for unsubscription
using ListenerHandle = size_t;

/**
 * EventBus - Typed structured-event channel for the avatar pipeline.
 *
 * Producers (integrator bridge, selector, synchronizer, controller) publish
 * AvatarEvents; observability sinks subscribe. Listeners run synchronously
 * on the publishing thread, outside the internal lock.
 *
 * Usage:
 *   EventBus bus;
 *   auto handle = bus.subscribe(AvatarEventType::AnimationChanged,
 *       [](const AvatarEvent& event) {
 *           auto& data = std::get<AnimationChangedData>(event.data);
 *       });
 *   bus.unsubscribe(handle);
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    EventBus(EventBus&&) = delete;
    EventBus& operator=(EventBus&&) = delete;

    // Subscribe to all events
    ListenerHandle subscribe(EventListener listener);

    // Subscribe to a single event type
    ListenerHandle subscribe(AvatarEventType type, EventListener listener);

    void unsubscribe(ListenerHandle handle);

    void publish(const AvatarEvent& event);

    template<typename T>
    void publish(AvatarEventType type, T&& data) {
        publish(AvatarEvent(type, std::forward<T>(data)));
    }

    void clear();

    size_t listenerCount() const;

private:
    struct ListenerEntry {
        ListenerHandle handle;
        EventListener listener;
        AvatarEventType filterType;
        bool hasFilter;
    };

    mutable std::mutex m_mutex;
    std::vector<ListenerEntry> m_listeners;
    ListenerHandle m_nextHandle = 1;
};

} // namespace state
} // namespace avr
