#pragma once

#include <string>
#include <vector>

#include "avr/animation/animation_clip.h"
#include "avr/common/avatar_error.h"

namespace avr {
namespace state {
class EventBus;
struct MovementState;
}

namespace animation {

class AnimationMixer;

/**
 * ClipSelectionTable - Ordered candidate tags per movement state.
 *
 * Tags match clip names as case-insensitive substrings. For each tag in
 * order the first clip (in clip-list order) containing it wins.
 */
struct ClipSelectionTable {
    std::vector<std::string> running = {"run"};
    std::vector<std::string> moving = {"walk", "move", "locomotion", "forward"};
    std::vector<std::string> idle = {"idle", "stand", "tpose"};
    std::string preferredIdle;  // checked before idle when set
    std::vector<std::string> idleLike = {"idle", "stand", "tpose"};
};

struct ClipResolution {
    std::string clip;  // empty when the clip list is empty
    AvatarError error = AvatarError::None;
};

/**
 * ClipResolver - Pure name resolution from (moving, running) to a clip name.
 *
 * Moving:     running tags (only when running), moving tags, then the first
 *             clip that is not idle-like.
 * Stationary: preferred idle tag, idle tags, then the first clip.
 *
 * Moving with no locomotion clip at all falls through to the stationary rule.
 * Any fallback past the tag lists reports ClipNotFound.
 */
class ClipResolver {
public:
    explicit ClipResolver(ClipSelectionTable table = ClipSelectionTable());

    ClipResolution resolve(const ClipList& clips, bool moving, bool running) const;

    const ClipSelectionTable& table() const { return table_; }

    static ClipPtr findByTags(const ClipList& clips, const std::vector<std::string>& tags);

private:
    ClipResolution resolveStationary(const ClipList& clips) const;

    ClipSelectionTable table_;
};

/**
 * AnimationSelector - Drives the mixer from movement state.
 *
 * Two states, STATIONARY and LOCOMOTION. On every tick the wanted clip is
 * resolved and, only if its name differs from the current one, the old
 * action fades out and the new one is reset, faded in and looped forever.
 * An empty clip set makes every call a no-op.
 */
class AnimationSelector {
public:
    AnimationSelector(std::string avatarId,
                      ClipResolver resolver,
                      float crossfadeSeconds = 0.2f,
                      state::EventBus* eventBus = nullptr);

    void setClips(ClipList clips);
    const ClipList& clips() const { return clips_; }

    // Starts the stationary clip immediately, without a fade
    bool playInitial(AnimationMixer& mixer);

    // Returns true when a transition was issued
    bool update(const state::MovementState& movement, AnimationMixer& mixer);

    // Crossfades to the named clip unless it is already current
    bool playByName(const std::string& clipName, bool moving, AnimationMixer& mixer);

    const std::string& currentClip() const { return currentClip_; }
    bool isLocomotion() const { return locomotion_; }
    size_t transitionCount() const { return transitionCount_; }
    float crossfadeSeconds() const { return crossfadeSeconds_; }

    void reset();

private:
    ClipPtr findClip(const std::string& clipName) const;

    std::string avatarId_;
    ClipResolver resolver_;
    float crossfadeSeconds_;
    state::EventBus* eventBus_;

    ClipList clips_;
    std::string currentClip_;
    bool locomotion_ = false;
    size_t transitionCount_ = 0;
};

} // namespace animation
} // namespace avr
