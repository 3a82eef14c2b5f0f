#include "avr/animation/animation_clip.h"
#include "avr/common/util/strings.h"

#include <algorithm>

namespace avr {
namespace animation {

KeyframeTrack::KeyframeTrack(std::string name, std::vector<float> times, std::vector<float> values)
    : name_(std::move(name))
    , property_(propertyFromName(name_))
    , times_(std::move(times))
    , values_(std::move(values))
{
    size_t dot = name_.rfind('.');
    nodeName_ = (dot == std::string::npos) ? name_ : name_.substr(0, dot);
}

TrackProperty KeyframeTrack::propertyFromName(const std::string& name) {
    if (Strings::EndsWith(name, ".position")) {
        return TrackProperty::Translation;
    }
    if (Strings::EndsWith(name, ".quaternion")) {
        return TrackProperty::Rotation;
    }
    if (Strings::EndsWith(name, ".scale")) {
        return TrackProperty::Scale;
    }
    return TrackProperty::Other;
}

size_t KeyframeTrack::valueSize() const {
    switch (property_) {
        case TrackProperty::Translation:
        case TrackProperty::Scale:
            return 3;
        case TrackProperty::Rotation:
            return 4;
        case TrackProperty::Other:
            break;
    }
    return times_.empty() ? 0 : values_.size() / times_.size();
}

void KeyframeTrack::locate(float time, size_t& index0, size_t& index1, float& t) const {
    index0 = 0;
    index1 = 0;
    t = 0.0f;
    if (times_.size() < 2 || time <= times_.front()) {
        return;
    }
    if (time >= times_.back()) {
        index0 = index1 = times_.size() - 1;
        return;
    }

    auto it = std::upper_bound(times_.begin(), times_.end(), time);
    index1 = static_cast<size_t>(it - times_.begin());
    index0 = index1 - 1;

    float span = times_[index1] - times_[index0];
    t = span > 0.0f ? (time - times_[index0]) / span : 0.0f;
}

glm::vec3 KeyframeTrack::sampleVec3(float time) const {
    if (times_.empty() || values_.size() < times_.size() * 3) {
        return property_ == TrackProperty::Scale ? glm::vec3(1.0f) : glm::vec3(0.0f);
    }

    size_t i0, i1;
    float t;
    locate(time, i0, i1, t);

    glm::vec3 a(values_[i0 * 3], values_[i0 * 3 + 1], values_[i0 * 3 + 2]);
    glm::vec3 b(values_[i1 * 3], values_[i1 * 3 + 1], values_[i1 * 3 + 2]);
    return glm::mix(a, b, t);
}

glm::quat KeyframeTrack::sampleQuat(float time) const {
    if (times_.empty() || values_.size() < times_.size() * 4) {
        return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    }

    size_t i0, i1;
    float t;
    locate(time, i0, i1, t);

    // Stored x, y, z, w; glm takes w first
    glm::quat a(values_[i0 * 4 + 3], values_[i0 * 4], values_[i0 * 4 + 1], values_[i0 * 4 + 2]);
    glm::quat b(values_[i1 * 4 + 3], values_[i1 * 4], values_[i1 * 4 + 1], values_[i1 * 4 + 2]);
    return glm::normalize(glm::slerp(a, b, t));
}

size_t AnimationClip::countTracks(TrackProperty property) const {
    return static_cast<size_t>(std::count_if(tracks.begin(), tracks.end(),
        [property](const TrackPtr& track) {
            return track && track->property() == property;
        }));
}

float AnimationClip::computeDuration(const std::vector<TrackPtr>& tracks) {
    float duration = 0.0f;
    for (const auto& track : tracks) {
        if (track) {
            duration = std::max(duration, track->endTime());
        }
    }
    return duration;
}

} // namespace animation
} // namespace avr
