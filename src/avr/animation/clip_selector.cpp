#include "avr/animation/clip_selector.h"
#include "avr/animation/animation_mixer.h"
#include "avr/common/logging.h"
#include "avr/common/util/strings.h"
#include "avr/state/event_bus.h"
#include "avr/state/movement_state.h"

namespace avr {
namespace animation {

// =============================================================================
// ClipResolver
// =============================================================================

ClipResolver::ClipResolver(ClipSelectionTable table)
    : table_(std::move(table))
{
}

ClipPtr ClipResolver::findByTags(const ClipList& clips, const std::vector<std::string>& tags) {
    for (const auto& tag : tags) {
        if (tag.empty()) {
            continue;
        }
        for (const auto& clip : clips) {
            if (clip && Strings::ContainsLower(clip->name, tag)) {
                return clip;
            }
        }
    }
    return nullptr;
}

ClipResolution ClipResolver::resolve(const ClipList& clips, bool moving, bool running) const {
    ClipResolution result;
    if (clips.empty()) {
        return result;
    }

    if (moving) {
        ClipPtr hit;
        if (running) {
            hit = findByTags(clips, table_.running);
        }
        if (!hit) {
            hit = findByTags(clips, table_.moving);
        }
        if (hit) {
            result.clip = hit->name;
            return result;
        }

        for (const auto& clip : clips) {
            if (clip && !Strings::ContainsAnyLower(clip->name, table_.idleLike)) {
                result.clip = clip->name;
                result.error = AvatarError::ClipNotFound;
                return result;
            }
        }

        result = resolveStationary(clips);
        result.error = AvatarError::ClipNotFound;
        return result;
    }

    return resolveStationary(clips);
}

ClipResolution ClipResolver::resolveStationary(const ClipList& clips) const {
    ClipResolution result;

    ClipPtr hit;
    if (!table_.preferredIdle.empty()) {
        hit = findByTags(clips, {table_.preferredIdle});
    }
    if (!hit) {
        hit = findByTags(clips, table_.idle);
    }
    if (hit) {
        result.clip = hit->name;
        return result;
    }

    for (const auto& clip : clips) {
        if (clip) {
            result.clip = clip->name;
            result.error = AvatarError::ClipNotFound;
            break;
        }
    }
    return result;
}

// =============================================================================
// AnimationSelector
// =============================================================================

AnimationSelector::AnimationSelector(std::string avatarId,
                                     ClipResolver resolver,
                                     float crossfadeSeconds,
                                     state::EventBus* eventBus)
    : avatarId_(std::move(avatarId))
    , resolver_(std::move(resolver))
    , crossfadeSeconds_(crossfadeSeconds)
    , eventBus_(eventBus)
{
}

void AnimationSelector::setClips(ClipList clips) {
    clips_ = std::move(clips);
}

void AnimationSelector::reset() {
    currentClip_.clear();
    locomotion_ = false;
    transitionCount_ = 0;
}

ClipPtr AnimationSelector::findClip(const std::string& clipName) const {
    for (const auto& clip : clips_) {
        if (clip && clip->name == clipName) {
            return clip;
        }
    }
    return nullptr;
}

bool AnimationSelector::playInitial(AnimationMixer& mixer) {
    ClipResolution resolution = resolver_.resolve(clips_, false, false);
    if (resolution.clip.empty()) {
        LOG_DEBUG(MOD_ANIMATION, "'{}' has no clips, staying in rest pose", avatarId_);
        return false;
    }

    ClipPtr clip = findClip(resolution.clip);
    AnimationAction* action = mixer.clipAction(clip);
    if (!action) {
        return false;
    }
    action->reset().setLoop(LoopMode::Repeat, -1).play();

    std::string previous = currentClip_;
    currentClip_ = resolution.clip;
    locomotion_ = false;
    ++transitionCount_;

    LOG_INFO(MOD_ANIMATION, "'{}' initial clip '{}'", avatarId_, currentClip_);
    if (eventBus_) {
        eventBus_->publish(state::AvatarEventType::AnimationChanged,
            state::AnimationChangedData{avatarId_, currentClip_, previous, false});
    }
    return true;
}

bool AnimationSelector::update(const state::MovementState& movement, AnimationMixer& mixer) {
    if (clips_.empty()) {
        return false;
    }

    ClipResolution resolution = resolver_.resolve(clips_, movement.isMoving, movement.isRunning);
    if (resolution.clip.empty() || resolution.clip == currentClip_) {
        return false;
    }

    if (resolution.error == AvatarError::ClipNotFound) {
        LOG_DEBUG(MOD_ANIMATION, "'{}' has no clip for the {} tags, falling back to '{}'",
            avatarId_, movement.isMoving ? "moving" : "idle", resolution.clip);
    }

    return playByName(resolution.clip, movement.isMoving, mixer);
}

bool AnimationSelector::playByName(const std::string& clipName, bool moving, AnimationMixer& mixer) {
    if (clipName == currentClip_) {
        return false;
    }

    ClipPtr clip = findClip(clipName);
    if (!clip) {
        LOG_WARN(MOD_ANIMATION, "'{}' has no clip named '{}'", avatarId_, clipName);
        return false;
    }

    if (AnimationAction* previous = mixer.existingAction(currentClip_)) {
        previous->fadeOut(crossfadeSeconds_);
    }

    AnimationAction* next = mixer.clipAction(clip);
    next->reset()
        .fadeIn(crossfadeSeconds_)
        .setLoop(LoopMode::Repeat, -1)
        .play();

    std::string previousName = currentClip_;
    currentClip_ = clipName;
    locomotion_ = moving;
    ++transitionCount_;

    LOG_DEBUG(MOD_ANIMATION, "'{}' {} -> {} (moving={})",
        avatarId_, previousName.empty() ? "<none>" : previousName, currentClip_, moving);

    if (eventBus_) {
        eventBus_->publish(state::AvatarEventType::AnimationChanged,
            state::AnimationChangedData{avatarId_, currentClip_, previousName, moving});
    }
    return true;
}

} // namespace animation
} // namespace avr
