#include "avr/graphics/transform_synchronizer.h"
#include "avr/common/logging.h"
#include "avr/graphics/conversions.h"
#include "avr/state/event_bus.h"

namespace avr {
namespace graphics {

TransformSynchronizer::TransformSynchronizer(std::string avatarId,
                                             float diagnosticIntervalSeconds,
                                             state::EventBus* eventBus)
    : avatarId_(std::move(avatarId))
    , interval_(diagnosticIntervalSeconds)
    , eventBus_(eventBus)
{
}

void TransformSynchronizer::setTarget(irr::scene::ISceneNode* target) {
    target_ = target;
}

void TransformSynchronizer::clearTarget() {
    target_ = nullptr;
    retryPending_ = false;
}

SyncResult TransformSynchronizer::sync(const state::MovementState& movement) {
    return sync(movement, Clock::now());
}

SyncResult TransformSynchronizer::sync(const state::MovementState& movement, Clock::time_point now) {
    if (!clockStarted_) {
        clockStarted_ = true;
        startTime_ = now;
    }

    if (!target_) {
        if (!retryPending_) {
            LOG_DEBUG(MOD_SYNC, "'{}' has no scene node yet, retrying next tick", avatarId_);
        }
        retryPending_ = true;
        return SyncResult::Deferred;
    }
    retryPending_ = false;

    target_->setPosition(toIrr(movement.position));
    target_->setRotation(toIrr(movement.rotation) * irr::core::RADTODEG);
    target_->updateAbsolutePosition();
    ++appliedCount_;

    if (!snapshotTaken_ || now - lastSnapshot_ > interval_) {
        publishSnapshot(movement, now);
    }
    return SyncResult::Applied;
}

void TransformSynchronizer::publishSnapshot(const state::MovementState& movement, Clock::time_point now) {
    snapshotTaken_ = true;
    lastSnapshot_ = now;
    ++snapshotCount_;

    const irr::core::vector3df local = target_->getPosition();
    const irr::core::vector3df world = target_->getAbsolutePosition();
    LOG_TRACE(MOD_SYNC, "'{}' local=({:.3f}, {:.3f}, {:.3f}) world=({:.3f}, {:.3f}, {:.3f})",
        avatarId_, local.X, local.Y, local.Z, world.X, world.Y, world.Z);

    if (!eventBus_) {
        return;
    }

    state::TransformSnapshotData data;
    data.avatarId = avatarId_;
    data.clock = std::chrono::duration<double>(now - startTime_).count();
    data.localPosition = toGlm(local);
    data.worldPosition = toGlm(world);
    data.velocity = movement.velocity;
    data.isMoving = movement.isMoving;
    data.avatarHeight = avatarHeight_;
    eventBus_->publish(state::AvatarEventType::TransformSnapshot, std::move(data));
}

} // namespace graphics
} // namespace avr
