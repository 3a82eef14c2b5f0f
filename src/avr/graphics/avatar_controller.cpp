#include "avr/graphics/avatar_controller.h"
#include "avr/animation/root_motion_stripper.h"
#include "avr/avatar/instance_registry.h"
#include "avr/common/logging.h"
#include "avr/graphics/model_normalizer.h"
#include "avr/state/event_bus.h"

#include <cmath>
#include <cstdint>
#include <exception>
#include <vector>
#include <fmt/format.h>

namespace avr {
namespace graphics {

namespace {
uint64_t s_nextInstance = 1;
}

const char* controllerStateName(ControllerState state) {
    switch (state) {
        case ControllerState::Unattached: return "unattached";
        case ControllerState::Attached:   return "attached";
        case ControllerState::TornDown:   return "torn_down";
    }
    return "unknown";
}

AvatarController::AvatarController(const std::string& avatarId,
                                   AvatarAssetPtr asset,
                                   const avatar::AvatarConfig& config,
                                   const ControllerContext& context)
    : asset_(std::move(asset))
    , config_(config)
    , context_(context)
    , avatarId_(avatarId)
    , instanceId_(fmt::format("{}#{}", avatarId, s_nextInstance++))
    , integrator_(config.keys, config.movementParams(), config.initialPosition)
    , selector_(avatarId, animation::ClipResolver(config.clipSelection),
                config.crossfadeSeconds, context.eventBus)
    , synchronizer_(avatarId, config.diagnosticIntervalSeconds, context.eventBus)
{
    if (context_.registry) {
        owner_ = context_.registry->acquire(avatarId_, instanceId_);
    } else {
        LOG_WARN(MOD_INSTANCE, "No instance registry for '{}', ownership is not enforced", instanceId_);
        owner_ = true;
    }

    if (!owner_) {
        lastError_ = AvatarError::DuplicateInstance;
        LOG_WARN(MOD_MAIN, "'{}' is a duplicate of '{}' and will stay inert", instanceId_, avatarId_);
    }
}

AvatarController::~AvatarController() {
    teardown();
}

void AvatarController::setAsset(AvatarAssetPtr asset) {
    if (state_ != ControllerState::Unattached) {
        LOG_DEBUG(MOD_MAIN, "'{}' ignoring asset change while {}", instanceId_, controllerStateName(state_));
        return;
    }
    asset_ = std::move(asset);
}

void AvatarController::publishSetupFailure(AvatarError error, const std::string& reason) {
    lastError_ = error;
    LOG_WARN(MOD_MAIN, "'{}' setup failed: {} ({})", instanceId_, reason, avatarErrorName(error));
    if (context_.eventBus) {
        context_.eventBus->publish(state::AvatarEventType::SetupFailed,
            state::SetupFailedData{avatarId_, error, reason});
    }
}

bool AvatarController::attach(irr::scene::ISceneNode* sceneNode) {
    if (!owner_ || state_ == ControllerState::TornDown) {
        return false;
    }

    if (state_ == ControllerState::Attached) {
        if (sceneNode && container_ && container_->getParent() != sceneNode) {
            LOG_DEBUG(MOD_MAIN, "'{}' moving container to a new scene node", instanceId_);
            container_->setParent(sceneNode);
        }
        return true;
    }

    if (!sceneNode) {
        lastError_ = AvatarError::MissingSceneNode;
        LOG_DEBUG(MOD_MAIN, "'{}' attach without scene node, retry later", instanceId_);
        return false;
    }

    if (!context_.smgr || !context_.normalizer) {
        LOG_ERROR(MOD_MAIN, "'{}' attach without scene manager or normalizer", instanceId_);
        return false;
    }

    if (!asset_ || !asset_->model) {
        publishSetupFailure(AvatarError::MissingModel, "no_avatar_model");
        return false;
    }

    irr::scene::ISceneNode* clone = asset_->model->clone(sceneNode, context_.smgr);
    if (!clone) {
        publishSetupFailure(AvatarError::MissingModel, "clone_failed");
        return false;
    }
    clone->setVisible(true);

    NormalizeOptions options;
    options.targetHeight = config_.targetHeight;
    options.centerToGround = config_.centerToGround;

    const NormalizedContainer* normalized = context_.normalizer->normalize(avatarId_, clone, options, sceneNode);
    if (!normalized) {
        clone->remove();
        publishSetupFailure(AvatarError::MissingModel, "normalize_failed");
        return false;
    }

    container_ = normalized->container;
    container_->setScale(irr::core::vector3df(normalized->scaleFactor * config_.worldScale));
    lastError_ = normalized->warning;

    animation::ClipList clips;
    if (context_.stripper) {
        clips = context_.stripper->stripForAvatar(avatarId_, asset_->clips).clips;
    } else {
        clips = animation::RootMotionStripper::strip(asset_->clips);
    }
    selector_.setClips(clips);
    poseApplier_.bind(container_);
    selector_.playInitial(mixer_);

    synchronizer_.setTarget(container_);
    synchronizer_.setAvatarHeight(normalized->analysis.size.Y);
    synchronizer_.sync(integrator_.currentState());

    state_ = ControllerState::Attached;
    LOG_INFO(MOD_MAIN, "'{}' attached: scale={:.4f} clips={}", instanceId_,
        normalized->scaleFactor * config_.worldScale, clips.size());
    return true;
}

void AvatarController::publishKeys(bool down, const std::string& code) {
    if (!context_.eventBus) {
        return;
    }
    const auto& pressed = integrator_.pressedKeys();
    context_.eventBus->publish(state::AvatarEventType::KeyStateChanged,
        state::KeyStateChangedData{down, code, std::vector<std::string>(pressed.begin(), pressed.end())});
}

bool AvatarController::onKeyDown(const std::string& code) {
    if (!owner_ || state_ == ControllerState::TornDown) {
        return false;
    }
    bool changed = integrator_.onKeyDown(code);
    if (changed) {
        publishKeys(true, code);
    }
    return changed;
}

bool AvatarController::onKeyUp(const std::string& code) {
    if (!owner_ || state_ == ControllerState::TornDown) {
        return false;
    }
    bool changed = integrator_.onKeyUp(code);
    if (changed) {
        publishKeys(false, code);
    }
    return changed;
}

void AvatarController::clearKeys() {
    integrator_.clearKeys();
}

state::MovementState AvatarController::neutralState() const {
    state::MovementState neutral;
    neutral.position = integrator_.currentState().position;
    neutral.rotation = integrator_.currentState().rotation;
    return neutral;
}

state::MovementState AvatarController::tick(float deltaSeconds) {
    if (!owner_ || state_ == ControllerState::TornDown) {
        return neutralState();
    }

    float mixerDelta = deltaSeconds;
    if (!std::isfinite(mixerDelta) || mixerDelta < 0.0f) {
        mixerDelta = config_.defaultDeltaTime;
    }

    try {
        state::MovementState current = integrator_.update(deltaSeconds);

        if (!hasPublishedState_ || !current.sameAs(lastPublished_)) {
            hasPublishedState_ = true;
            lastPublished_ = current;
            if (context_.eventBus) {
                context_.eventBus->publish(state::AvatarEventType::MovementUpdated,
                    state::MovementUpdatedData{avatarId_, current});
            }
        }

        if (state_ == ControllerState::Attached) {
            selector_.update(current, mixer_);
            mixer_.update(mixerDelta);
            poseApplier_.apply(mixer_.evaluate());
        }

        synchronizer_.sync(current);
        return current;
    } catch (const std::exception& e) {
        LOG_ERROR(MOD_MAIN, "'{}' tick failed, using neutral state: {}", instanceId_, e.what());
        return neutralState();
    }
}

void AvatarController::teardown() {
    if (state_ == ControllerState::TornDown) {
        return;
    }

    if (owner_ && context_.registry) {
        context_.registry->release(avatarId_, instanceId_);
    }

    mixer_.stopAllAction();
    poseApplier_.unbind();
    synchronizer_.clearTarget();

    if (container_) {
        container_->remove();
        container_ = nullptr;
    }
    if (owner_ && context_.normalizer) {
        context_.normalizer->evict(avatarId_);
    }
    if (owner_ && context_.stripper) {
        context_.stripper->evict(avatarId_);
    }

    integrator_.clearKeys();
    selector_.reset();
    state_ = ControllerState::TornDown;
    LOG_INFO(MOD_MAIN, "'{}' torn down", instanceId_);
}

} // namespace graphics
} // namespace avr
