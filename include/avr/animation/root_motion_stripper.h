#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "avr/animation/animation_clip.h"

namespace avr {
namespace state { class EventBus; }

namespace animation {

// Clip set derived for one avatar, translation tracks removed
struct StrippedClipSet {
    std::string avatarId;
    ClipList clips;
    uint32_t originalPositionTrackCount = 0;
    uint32_t strippedPositionTrackCount = 0;
};

/**
 * RootMotionStripper - Removes authored translation from animation clips.
 *
 * Every ".position" track on every node is dropped, non-root bones
 * included. Rotation, scale and other tracks are carried over as the same
 * shared track objects, and the clip name and duration are preserved. The
 * input clips are never modified.
 */
class RootMotionStripper {
public:
    explicit RootMotionStripper(state::EventBus* eventBus = nullptr);

    static ClipPtr stripClip(const ClipPtr& clip);
    static ClipList strip(const ClipList& clips);
    static uint32_t countTracks(const ClipList& clips, TrackProperty property);

    // Strips once per avatar id and reuses the result afterwards.
    // Publishes ClipsStripped when a new set is built.
    const StrippedClipSet& stripForAvatar(const std::string& avatarId, const ClipList& clips);

    bool hasCached(const std::string& avatarId) const;
    void evict(const std::string& avatarId);
    void clear() { cache_.clear(); }
    size_t cacheSize() const { return cache_.size(); }

private:
    state::EventBus* eventBus_;
    std::map<std::string, StrippedClipSet> cache_;
};

} // namespace animation
} // namespace avr
