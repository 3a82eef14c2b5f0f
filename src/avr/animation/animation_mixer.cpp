#include "avr/animation/animation_mixer.h"
#include "avr/common/logging.h"

#include <algorithm>
#include <cmath>

namespace avr {
namespace animation {

// =============================================================================
// AnimationAction
// =============================================================================

AnimationAction::AnimationAction(ClipPtr clip)
    : clip_(std::move(clip))
{
}

AnimationAction& AnimationAction::play() {
    playing_ = true;
    return *this;
}

AnimationAction& AnimationAction::stop() {
    playing_ = false;
    fading_ = false;
    time_ = 0.0f;
    loopCount_ = 0;
    return *this;
}

AnimationAction& AnimationAction::reset() {
    fading_ = false;
    time_ = 0.0f;
    loopCount_ = 0;
    weight_ = 1.0f;
    return *this;
}

AnimationAction& AnimationAction::fadeIn(float duration) {
    startFade(0.0f, 1.0f, duration);
    return *this;
}

AnimationAction& AnimationAction::fadeOut(float duration) {
    startFade(weight_, 0.0f, duration);
    return *this;
}

AnimationAction& AnimationAction::setLoop(LoopMode mode, int repetitions) {
    loopMode_ = mode;
    repetitions_ = repetitions;
    return *this;
}

AnimationAction& AnimationAction::setEffectiveWeight(float weight) {
    fading_ = false;
    weight_ = std::max(0.0f, std::min(1.0f, weight));
    return *this;
}

void AnimationAction::startFade(float from, float to, float duration) {
    if (duration <= 0.0f) {
        fading_ = false;
        weight_ = to;
        if (to <= 0.0f) {
            playing_ = false;
        }
        return;
    }
    fading_ = true;
    fadeFrom_ = from;
    fadeTo_ = to;
    fadeDuration_ = duration;
    fadeElapsed_ = 0.0f;
    weight_ = from;
}

void AnimationAction::advance(float deltaSeconds) {
    if (!playing_ || !clip_) {
        return;
    }

    if (fading_) {
        fadeElapsed_ += deltaSeconds;
        float t = std::min(1.0f, fadeElapsed_ / fadeDuration_);
        weight_ = fadeFrom_ + (fadeTo_ - fadeFrom_) * t;
        if (t >= 1.0f) {
            fading_ = false;
            if (fadeTo_ <= 0.0f) {
                stop();
                return;
            }
        }
    }

    const float duration = clip_->duration;
    if (duration <= 0.0f) {
        time_ = 0.0f;
        return;
    }

    time_ += deltaSeconds;
    if (time_ < duration) {
        return;
    }

    if (loopMode_ == LoopMode::Once) {
        // Hold the last frame
        time_ = duration;
        return;
    }

    int wraps = static_cast<int>(std::floor(time_ / duration));
    loopCount_ += wraps;
    if (repetitions_ >= 0 && loopCount_ >= repetitions_) {
        time_ = duration;
        playing_ = false;
        return;
    }
    time_ = std::fmod(time_, duration);
}

// =============================================================================
// AnimationMixer
// =============================================================================

AnimationAction* AnimationMixer::clipAction(const ClipPtr& clip) {
    if (!clip) {
        return nullptr;
    }

    auto it = actions_.find(clip->name);
    if (it != actions_.end()) {
        return it->second.get();
    }

    auto action = std::make_unique<AnimationAction>(clip);
    AnimationAction* raw = action.get();
    actions_.emplace(clip->name, std::move(action));
    LOG_TRACE(MOD_ANIMATION, "Created action for clip '{}' ({:.3f}s, {} tracks)",
        clip->name, clip->duration, clip->tracks.size());
    return raw;
}

AnimationAction* AnimationMixer::existingAction(const std::string& clipName) const {
    auto it = actions_.find(clipName);
    return it != actions_.end() ? it->second.get() : nullptr;
}

void AnimationMixer::update(float deltaSeconds) {
    if (!std::isfinite(deltaSeconds) || deltaSeconds < 0.0f) {
        return;
    }
    time_ += deltaSeconds;
    for (auto& entry : actions_) {
        entry.second->advance(deltaSeconds);
    }
}

void AnimationMixer::stopAllAction() {
    for (auto& entry : actions_) {
        entry.second->stop();
    }
}

size_t AnimationMixer::playingActionCount() const {
    return static_cast<size_t>(std::count_if(actions_.begin(), actions_.end(),
        [](const std::pair<const std::string, std::unique_ptr<AnimationAction>>& entry) {
            return entry.second->isPlaying();
        }));
}

namespace {

void accumulate(glm::vec3& value, float& accumulated, const glm::vec3& sample, float weight) {
    value += sample * weight;
    accumulated += weight;
}

void accumulate(glm::quat& value, float& accumulated, const glm::quat& sample, float weight) {
    // Incremental slerp gives each contribution its share of the total weight
    if (accumulated <= 0.0f) {
        value = sample;
    } else {
        value = glm::normalize(glm::slerp(value, sample, weight / (accumulated + weight)));
    }
    accumulated += weight;
}

} // namespace

Pose AnimationMixer::evaluate() const {
    Pose pose;
    for (const auto& entry : actions_) {
        const AnimationAction& action = *entry.second;
        const float weight = action.weight();
        if (!action.isPlaying() || weight <= 0.0f || !action.clip()) {
            continue;
        }

        for (const auto& track : action.clip()->tracks) {
            if (!track) {
                continue;
            }
            NodePose& node = pose[track->nodeName()];
            switch (track->property()) {
                case TrackProperty::Translation:
                    accumulate(node.translation, node.translationWeight, track->sampleVec3(action.time()), weight);
                    break;
                case TrackProperty::Rotation:
                    accumulate(node.rotation, node.rotationWeight, track->sampleQuat(action.time()), weight);
                    break;
                case TrackProperty::Scale:
                    accumulate(node.scale, node.scaleWeight, track->sampleVec3(action.time()), weight);
                    break;
                case TrackProperty::Other:
                    break;
            }
        }
    }

    // Vector sums become weighted averages; the total weight is kept so the
    // applier can blend toward the rest pose when it is below one.
    for (auto& entry : pose) {
        NodePose& node = entry.second;
        if (node.translationWeight > 0.0f) {
            node.translation /= node.translationWeight;
        }
        if (node.scaleWeight > 0.0f) {
            node.scale /= node.scaleWeight;
        }
    }
    return pose;
}

} // namespace animation
} // namespace avr
