#pragma once

#include <map>
#include <memory>
#include <string>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include "avr/animation/animation_clip.h"

namespace avr {
namespace animation {

enum class LoopMode {
    Once,
    Repeat
};

// Weighted transform contributions for one node. A weight of 0 means the
// component is not animated and the node keeps its rest value.
struct NodePose {
    glm::vec3 translation{0.0f};
    float translationWeight = 0.0f;
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    float rotationWeight = 0.0f;
    glm::vec3 scale{0.0f};
    float scaleWeight = 0.0f;
};

using Pose = std::map<std::string, NodePose>;

/**
 * AnimationAction - Playback state of one clip on a mixer.
 *
 * Mirrors the usual action API: play/stop/reset, timed weight fades, loop
 * mode with repetition count (-1 repeats forever). A fade-out that reaches
 * zero stops the action.
 */
class AnimationAction {
public:
    explicit AnimationAction(ClipPtr clip);

    AnimationAction& play();
    AnimationAction& stop();
    AnimationAction& reset();
    AnimationAction& fadeIn(float duration);
    AnimationAction& fadeOut(float duration);
    AnimationAction& setLoop(LoopMode mode, int repetitions);
    AnimationAction& setEffectiveWeight(float weight);

    void advance(float deltaSeconds);

    bool isPlaying() const { return playing_; }
    bool isFading() const { return fading_; }
    float time() const { return time_; }
    float weight() const { return weight_; }
    LoopMode loopMode() const { return loopMode_; }
    int repetitions() const { return repetitions_; }
    const ClipPtr& clip() const { return clip_; }

private:
    void startFade(float from, float to, float duration);

    ClipPtr clip_;
    bool playing_ = false;
    float time_ = 0.0f;
    float weight_ = 1.0f;
    LoopMode loopMode_ = LoopMode::Repeat;
    int repetitions_ = -1;
    int loopCount_ = 0;

    bool fading_ = false;
    float fadeFrom_ = 0.0f;
    float fadeTo_ = 0.0f;
    float fadeDuration_ = 0.0f;
    float fadeElapsed_ = 0.0f;
};

/**
 * AnimationMixer - Owns the actions of one avatar and blends them into a Pose.
 *
 * One action per clip name; clipAction() returns the cached action on
 * repeat calls. Pointers stay valid for the mixer's lifetime.
 */
class AnimationMixer {
public:
    AnimationMixer() = default;

    AnimationMixer(const AnimationMixer&) = delete;
    AnimationMixer& operator=(const AnimationMixer&) = delete;

    AnimationAction* clipAction(const ClipPtr& clip);
    AnimationAction* existingAction(const std::string& clipName) const;

    void update(float deltaSeconds);
    void stopAllAction();

    // Blend every playing action with non-zero weight at its current time
    Pose evaluate() const;

    float time() const { return time_; }
    size_t actionCount() const { return actions_.size(); }
    size_t playingActionCount() const;

private:
    std::map<std::string, std::unique_ptr<AnimationAction>> actions_;
    float time_ = 0.0f;
};

} // namespace animation
} // namespace avr
