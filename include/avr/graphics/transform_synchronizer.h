#ifndef AVR_GRAPHICS_TRANSFORM_SYNCHRONIZER_H
#define AVR_GRAPHICS_TRANSFORM_SYNCHRONIZER_H

#include <irrlicht.h>
#include <chrono>
#include <string>

#include "avr/state/movement_state.h"

namespace avr {
namespace state { class EventBus; }

namespace graphics {

enum class SyncResult {
    Applied,
    Deferred   // no target node yet; the next tick tries again
};

/**
 * TransformSynchronizer - Sole writer of the avatar container's transform.
 *
 * Every sync() overwrites the target's position with MovementState.position
 * and its rotation with MovementState.rotation (radians converted to
 * Irrlicht degrees). Without a target the call does nothing and reports
 * Deferred; the retry is simply the next tick's call.
 *
 * A TransformSnapshot event is published at most once per diagnostic
 * interval of wall-clock time.
 */
class TransformSynchronizer {
public:
    using Clock = std::chrono::steady_clock;

    TransformSynchronizer(std::string avatarId,
                          float diagnosticIntervalSeconds = 0.1f,
                          state::EventBus* eventBus = nullptr);

    void setTarget(irr::scene::ISceneNode* target);
    void clearTarget();
    irr::scene::ISceneNode* target() const { return target_; }

    SyncResult sync(const state::MovementState& movement);
    SyncResult sync(const state::MovementState& movement, Clock::time_point now);

    bool retryPending() const { return retryPending_; }
    size_t appliedCount() const { return appliedCount_; }
    size_t snapshotCount() const { return snapshotCount_; }

    // Raw model height reported alongside snapshots (negative = unknown)
    void setAvatarHeight(float height) { avatarHeight_ = height; }

private:
    void publishSnapshot(const state::MovementState& movement, Clock::time_point now);

    std::string avatarId_;
    std::chrono::duration<double> interval_;
    state::EventBus* eventBus_;
    irr::scene::ISceneNode* target_ = nullptr;

    bool retryPending_ = false;
    size_t appliedCount_ = 0;
    size_t snapshotCount_ = 0;
    float avatarHeight_ = -1.0f;

    bool clockStarted_ = false;
    Clock::time_point startTime_;
    bool snapshotTaken_ = false;
    Clock::time_point lastSnapshot_;
};

} // namespace graphics
} // namespace avr

#endif // AVR_GRAPHICS_TRANSFORM_SYNCHRONIZER_H
