#include "avr/animation/root_motion_stripper.h"
#include "avr/common/logging.h"
#include "avr/state/event_bus.h"

namespace avr {
namespace animation {

RootMotionStripper::RootMotionStripper(state::EventBus* eventBus)
    : eventBus_(eventBus)
{
}

ClipPtr RootMotionStripper::stripClip(const ClipPtr& clip) {
    if (!clip) {
        return nullptr;
    }

    auto stripped = std::make_shared<AnimationClip>();
    stripped->name = clip->name;
    stripped->duration = clip->duration;
    stripped->tracks.reserve(clip->tracks.size());
    for (const auto& track : clip->tracks) {
        if (track && track->property() != TrackProperty::Translation) {
            stripped->tracks.push_back(track);
        }
    }
    return stripped;
}

ClipList RootMotionStripper::strip(const ClipList& clips) {
    ClipList result;
    result.reserve(clips.size());
    for (const auto& clip : clips) {
        if (auto stripped = stripClip(clip)) {
            result.push_back(std::move(stripped));
        }
    }
    return result;
}

uint32_t RootMotionStripper::countTracks(const ClipList& clips, TrackProperty property) {
    uint32_t count = 0;
    for (const auto& clip : clips) {
        if (clip) {
            count += static_cast<uint32_t>(clip->countTracks(property));
        }
    }
    return count;
}

const StrippedClipSet& RootMotionStripper::stripForAvatar(const std::string& avatarId, const ClipList& clips) {
    auto it = cache_.find(avatarId);
    if (it != cache_.end()) {
        return it->second;
    }

    StrippedClipSet set;
    set.avatarId = avatarId;
    set.clips = strip(clips);
    set.originalPositionTrackCount = countTracks(clips, TrackProperty::Translation);
    set.strippedPositionTrackCount = countTracks(set.clips, TrackProperty::Translation);

    LOG_DEBUG(MOD_ANIMATION, "Stripped {} clips for '{}': position tracks {} -> {}",
        set.clips.size(), avatarId, set.originalPositionTrackCount, set.strippedPositionTrackCount);

    auto inserted = cache_.emplace(avatarId, std::move(set));
    const StrippedClipSet& stored = inserted.first->second;

    if (eventBus_) {
        state::ClipsStrippedData data;
        data.avatarId = avatarId;
        for (const auto& clip : stored.clips) {
            data.clips.push_back(clip->name);
        }
        data.originalPositionTrackCount = stored.originalPositionTrackCount;
        data.strippedPositionTrackCount = stored.strippedPositionTrackCount;
        eventBus_->publish(state::AvatarEventType::ClipsStripped, std::move(data));
    }

    return stored;
}

bool RootMotionStripper::hasCached(const std::string& avatarId) const {
    return cache_.find(avatarId) != cache_.end();
}

void RootMotionStripper::evict(const std::string& avatarId) {
    cache_.erase(avatarId);
}

} // namespace animation
} // namespace avr
