#include "avr/graphics/pose_applier.h"
#include "avr/common/logging.h"

#include <algorithm>

namespace avr {
namespace graphics {

size_t PoseApplier::bind(irr::scene::ISceneNode* root) {
    unbind();
    if (root) {
        index(root);
    }
    LOG_DEBUG(MOD_ANIMATION, "PoseApplier bound {} nodes ({} skinned meshes)",
        targets_.size(), skinnedNodes_.size());
    return targets_.size();
}

void PoseApplier::unbind() {
    for (auto* node : skinnedNodes_) {
        node->setJointMode(irr::scene::EJUOR_NONE);
        node->drop();
    }
    skinnedNodes_.clear();
    targets_.clear();
}

void PoseApplier::addTarget(irr::scene::ISceneNode* node, const std::string& name) {
    if (name.empty() || targets_.count(name) > 0) {
        return;
    }
    Target target;
    target.node = node;
    target.restPosition = node->getPosition();
    target.restRotation = irr::core::quaternion(node->getRotation() * irr::core::DEGTORAD);
    target.restScale = node->getScale();
    targets_.emplace(name, target);
}

void PoseApplier::index(irr::scene::ISceneNode* node) {
    if (node->getType() == irr::scene::ESNT_ANIMATED_MESH) {
        auto* animated = static_cast<irr::scene::IAnimatedMeshSceneNode*>(node);
        irr::scene::IAnimatedMesh* mesh = animated->getMesh();
        if (mesh && mesh->getMeshType() == irr::scene::EAMT_SKINNED && animated->getJointCount() > 0) {
            animated->setJointMode(irr::scene::EJUOR_CONTROL);
            animated->grab();
            skinnedNodes_.push_back(animated);
            for (irr::u32 i = 0; i < animated->getJointCount(); ++i) {
                irr::scene::IBoneSceneNode* joint = animated->getJointNode(i);
                if (joint && joint->getBoneName()) {
                    addTarget(joint, joint->getBoneName());
                }
            }
        }
    }

    const char* name = node->getName();
    if (name && name[0]) {
        addTarget(node, name);
    }

    const irr::core::list<irr::scene::ISceneNode*>& children = node->getChildren();
    // Joint children come back here too; addTarget keeps the first entry per name
    for (auto it = children.begin(); it != children.end(); ++it) {
        index(*it);
    }
}

size_t PoseApplier::apply(const animation::Pose& pose) {
    size_t written = 0;
    for (const auto& entry : pose) {
        auto it = targets_.find(entry.first);
        if (it == targets_.end()) {
            continue;
        }
        Target& target = it->second;
        const animation::NodePose& nodePose = entry.second;

        if (nodePose.translationWeight > 0.0f) {
            float w = std::min(1.0f, nodePose.translationWeight);
            irr::core::vector3df posed(nodePose.translation.x, nodePose.translation.y, nodePose.translation.z);
            target.node->setPosition(target.restPosition.getInterpolated(posed, 1.0f - w));
        }

        if (nodePose.rotationWeight > 0.0f) {
            float w = std::min(1.0f, nodePose.rotationWeight);
            irr::core::quaternion posed(nodePose.rotation.x, nodePose.rotation.y,
                                        nodePose.rotation.z, nodePose.rotation.w);
            irr::core::quaternion blended;
            blended.slerp(target.restRotation, posed, w);
            irr::core::vector3df euler;
            blended.toEuler(euler);
            target.node->setRotation(euler * irr::core::RADTODEG);
        }

        if (nodePose.scaleWeight > 0.0f) {
            float w = std::min(1.0f, nodePose.scaleWeight);
            irr::core::vector3df posed(nodePose.scale.x, nodePose.scale.y, nodePose.scale.z);
            target.node->setScale(target.restScale.getInterpolated(posed, 1.0f - w));
        }
        ++written;
    }
    return written;
}

} // namespace graphics
} // namespace avr
