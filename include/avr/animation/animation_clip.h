#pragma once

#include <memory>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace avr {
namespace animation {

// Property a track animates, derived from the ".<property>" suffix of its name
enum class TrackProperty {
    Translation,  // .position
    Rotation,     // .quaternion (x, y, z, w)
    Scale,        // .scale
    Other
};

/**
 * KeyframeTrack - One animated property of one node.
 *
 * name is "<node>.<property>". values holds valueSize() floats per key,
 * times are seconds in ascending order. Tracks are immutable once built and
 * are shared between a clip and its stripped copy.
 */
class KeyframeTrack {
public:
    KeyframeTrack(std::string name, std::vector<float> times, std::vector<float> values);

    const std::string& name() const { return name_; }
    const std::string& nodeName() const { return nodeName_; }
    TrackProperty property() const { return property_; }
    const std::vector<float>& times() const { return times_; }
    const std::vector<float>& values() const { return values_; }

    size_t keyCount() const { return times_.size(); }
    size_t valueSize() const;
    float endTime() const { return times_.empty() ? 0.0f : times_.back(); }

    // Clamped sampling with linear (vector) or spherical (quaternion) blending
    glm::vec3 sampleVec3(float time) const;
    glm::quat sampleQuat(float time) const;

    static TrackProperty propertyFromName(const std::string& name);

private:
    // Finds the key pair bracketing time, t in [0,1] between them
    void locate(float time, size_t& index0, size_t& index1, float& t) const;

    std::string name_;
    std::string nodeName_;
    TrackProperty property_;
    std::vector<float> times_;
    std::vector<float> values_;
};

using TrackPtr = std::shared_ptr<const KeyframeTrack>;

struct AnimationClip {
    std::string name;
    float duration = 0.0f;
    std::vector<TrackPtr> tracks;

    size_t countTracks(TrackProperty property) const;

    // Longest track end time, used when a clip is authored without a duration
    static float computeDuration(const std::vector<TrackPtr>& tracks);
};

using ClipPtr = std::shared_ptr<const AnimationClip>;
using ClipList = std::vector<ClipPtr>;

} // namespace animation
} // namespace avr
