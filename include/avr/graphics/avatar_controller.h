#ifndef AVR_GRAPHICS_AVATAR_CONTROLLER_H
#define AVR_GRAPHICS_AVATAR_CONTROLLER_H

#include <irrlicht.h>
#include <string>

#include "avr/animation/animation_mixer.h"
#include "avr/animation/clip_selector.h"
#include "avr/avatar/avatar_config.h"
#include "avr/common/avatar_error.h"
#include "avr/graphics/avatar_loader.h"
#include "avr/graphics/pose_applier.h"
#include "avr/graphics/transform_synchronizer.h"
#include "avr/input/key_input_target.h"
#include "avr/movement/movement_integrator.h"

namespace avr {
namespace animation { class RootMotionStripper; }
namespace avatar { class InstanceRegistry; }
namespace state { class EventBus; }

namespace graphics {

class ModelNormalizer;

// Shared collaborators injected into every controller
struct ControllerContext {
    irr::scene::ISceneManager* smgr = nullptr;
    avatar::InstanceRegistry* registry = nullptr;
    ModelNormalizer* normalizer = nullptr;
    animation::RootMotionStripper* stripper = nullptr;
    state::EventBus* eventBus = nullptr;          // optional
};

enum class ControllerState {
    Unattached,
    Attached,
    TornDown
};

const char* controllerStateName(ControllerState state);

/**
 * AvatarController - Lifecycle and per-frame pipeline for one avatar instance.
 *
 *   construct   acquires the instance slot; no scene access. The asset may
 *               be null and supplied later through setAsset(). A rejected
 *               instance stays inert for its whole life.
 *   attach      clones the template model under the given node, normalizes
 *               it, strips root motion and starts the idle clip. Returns
 *               false (and may be called again) while the node or model is
 *               missing.
 *   tick        integrate -> notify -> select clip -> mix -> pose -> sync.
 *               Never throws; collaborator failures yield a neutral state.
 *   teardown    release slot, stop actions, remove cloned nodes. Idempotent,
 *               also run by the destructor.
 */
class AvatarController : public input::KeyInputTarget {
public:
    AvatarController(const std::string& avatarId,
                     AvatarAssetPtr asset,
                     const avatar::AvatarConfig& config,
                     const ControllerContext& context);
    ~AvatarController() override;

    AvatarController(const AvatarController&) = delete;
    AvatarController& operator=(const AvatarController&) = delete;

    bool attach(irr::scene::ISceneNode* sceneNode);

    // Supplies a model that was missing at construction; attach() may then be retried
    void setAsset(AvatarAssetPtr asset);

    bool onKeyDown(const std::string& code) override;
    bool onKeyUp(const std::string& code) override;
    void clearKeys() override;

    state::MovementState tick(float deltaSeconds);

    void teardown();

    bool isOwner() const { return owner_; }
    ControllerState getState() const { return state_; }
    AvatarError lastError() const { return lastError_; }
    const std::string& instanceId() const { return instanceId_; }
    const std::string& avatarId() const { return avatarId_; }

    const state::MovementState& movementState() const { return integrator_.currentState(); }
    irr::scene::ISceneNode* container() const { return container_; }
    const animation::AnimationSelector& selector() const { return selector_; }
    const animation::AnimationMixer& mixer() const { return mixer_; }
    const TransformSynchronizer& synchronizer() const { return synchronizer_; }

private:
    void publishKeys(bool down, const std::string& code);
    void publishSetupFailure(AvatarError error, const std::string& reason);
    state::MovementState neutralState() const;

    AvatarAssetPtr asset_;
    avatar::AvatarConfig config_;
    ControllerContext context_;
    std::string avatarId_;
    std::string instanceId_;

    bool owner_ = false;
    ControllerState state_ = ControllerState::Unattached;
    AvatarError lastError_ = AvatarError::None;

    movement::MovementIntegrator integrator_;
    animation::AnimationMixer mixer_;
    animation::AnimationSelector selector_;
    PoseApplier poseApplier_;
    TransformSynchronizer synchronizer_;

    irr::scene::ISceneNode* container_ = nullptr;
    bool hasPublishedState_ = false;
    state::MovementState lastPublished_;
};

} // namespace graphics
} // namespace avr

#endif // AVR_GRAPHICS_AVATAR_CONTROLLER_H
