#include "avr/avatar/instance_registry.h"
#include "avr/common/logging.h"
#include "avr/state/event_bus.h"

namespace avr {
namespace avatar {

InstanceRegistry::InstanceRegistry(state::EventBus* eventBus)
    : m_eventBus(eventBus)
{
}

bool InstanceRegistry::acquire(const std::string& avatarId, const std::string& instanceId) {
    auto it = m_owners.find(avatarId);
    if (it != m_owners.end()) {
        if (it->second == instanceId) {
            return true;
        }

        LOG_WARN(MOD_INSTANCE, "Blocking duplicate instance '{}' of '{}', owned by '{}'",
            instanceId, avatarId, it->second);
        if (m_eventBus) {
            m_eventBus->publish(state::AvatarEventType::InstanceStatusChanged,
                state::InstanceStatusChangedData{avatarId, state::InstanceStatus::DuplicateBlocked,
                                                 instanceId, it->second});
        }
        return false;
    }

    m_owners.emplace(avatarId, instanceId);
    LOG_INFO(MOD_INSTANCE, "'{}' registered as owner of '{}'", instanceId, avatarId);
    if (m_eventBus) {
        m_eventBus->publish(state::AvatarEventType::InstanceStatusChanged,
            state::InstanceStatusChangedData{avatarId, state::InstanceStatus::PrimaryRegistered,
                                             instanceId, std::string()});
    }
    return true;
}

bool InstanceRegistry::release(const std::string& avatarId, const std::string& instanceId) {
    auto it = m_owners.find(avatarId);
    if (it == m_owners.end() || it->second != instanceId) {
        return false;
    }

    m_owners.erase(it);
    LOG_INFO(MOD_INSTANCE, "'{}' released '{}'", instanceId, avatarId);
    if (m_eventBus) {
        m_eventBus->publish(state::AvatarEventType::InstanceStatusChanged,
            state::InstanceStatusChangedData{avatarId, state::InstanceStatus::PrimaryUnregistered,
                                             instanceId, std::string()});
    }
    return true;
}

bool InstanceRegistry::isOwned(const std::string& avatarId) const {
    return m_owners.find(avatarId) != m_owners.end();
}

std::string InstanceRegistry::ownerOf(const std::string& avatarId) const {
    auto it = m_owners.find(avatarId);
    return it != m_owners.end() ? it->second : std::string();
}

} // namespace avatar
} // namespace avr
