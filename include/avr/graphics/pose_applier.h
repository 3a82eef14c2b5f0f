#ifndef AVR_GRAPHICS_POSE_APPLIER_H
#define AVR_GRAPHICS_POSE_APPLIER_H

#include <irrlicht.h>
#include <map>
#include <string>
#include <vector>

#include "avr/animation/animation_mixer.h"

namespace avr {
namespace graphics {

/**
 * PoseApplier - Writes mixer output onto named nodes of an avatar hierarchy.
 *
 * bind() indexes every named node under the root, switching skinned meshes
 * to joint control so their bones are addressable, and captures each node's
 * rest transform. apply() blends the rest transform toward the pose by the
 * accumulated weight (clamped to 1). Nodes absent from the pose are left
 * untouched.
 */
class PoseApplier {
public:
    PoseApplier() = default;
    ~PoseApplier() { unbind(); }

    PoseApplier(const PoseApplier&) = delete;
    PoseApplier& operator=(const PoseApplier&) = delete;

    size_t bind(irr::scene::ISceneNode* root);
    void unbind();

    // Returns the number of nodes written
    size_t apply(const animation::Pose& pose);

    bool isBound(const std::string& nodeName) const { return targets_.count(nodeName) > 0; }
    size_t boundCount() const { return targets_.size(); }

private:
    struct Target {
        irr::scene::ISceneNode* node = nullptr;
        irr::core::vector3df restPosition;
        irr::core::quaternion restRotation;
        irr::core::vector3df restScale;
    };

    void index(irr::scene::ISceneNode* node);
    void addTarget(irr::scene::ISceneNode* node, const std::string& name);

    std::map<std::string, Target> targets_;
    std::vector<irr::scene::IAnimatedMeshSceneNode*> skinnedNodes_;
};

} // namespace graphics
} // namespace avr

#endif // AVR_GRAPHICS_POSE_APPLIER_H
