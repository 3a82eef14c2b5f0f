#pragma once

#include <map>
#include <string>

namespace avr {
namespace state { class EventBus; }

namespace avatar {

/**
 * InstanceRegistry - At most one live owner per avatar identity.
 *
 * Injected into every controller that may create scene resources for an
 * avatar. The first acquire() for an avatar id wins; later callers are
 * rejected until the owner releases. Re-acquiring by the current owner is
 * accepted. release() by anyone but the owner, or for a free id, is a no-op.
 *
 * Not thread-safe: acquire/release run on the frame thread.
 */
class InstanceRegistry {
public:
    explicit InstanceRegistry(state::EventBus* eventBus = nullptr);

    InstanceRegistry(const InstanceRegistry&) = delete;
    InstanceRegistry& operator=(const InstanceRegistry&) = delete;

    bool acquire(const std::string& avatarId, const std::string& instanceId);

    // Returns true when the slot was freed by this call
    bool release(const std::string& avatarId, const std::string& instanceId);

    bool isOwned(const std::string& avatarId) const;
    // Empty when the slot is free
    std::string ownerOf(const std::string& avatarId) const;
    size_t ownedCount() const { return m_owners.size(); }

private:
    state::EventBus* m_eventBus;
    std::map<std::string, std::string> m_owners;  // avatarId -> instanceId
};

} // namespace avatar
} // namespace avr
