#pragma once

#include <set>
#include <string>
#include <glm/glm.hpp>

#include "avr/input/key_bindings.h"
#include "avr/state/movement_state.h"

namespace avr {
namespace movement {

struct MovementParams {
    float baseSpeed = 0.2f;          // units per reference tick
    float runMultiplier = 1.8f;
    float defaultDeltaTime = 0.016f; // used when no usable delta is supplied
    float referenceTickRate = 60.0f;
};

/**
 * MovementIntegrator - Turns the pressed-key set plus elapsed time into
 * kinematic movement on the XZ plane.
 *
 * Per tick:
 *   move      = sum of active direction units (forward -Z, backward +Z,
 *               left -X, right +X)
 *   frameSpeed = baseSpeed * (runMultiplier if running) * (dt * referenceTickRate)
 *   position += normalize(move) * frameSpeed
 *   yaw       = atan2(-move.x, -move.z)
 *
 * isMoving is true while any direction group is held. Opposing keys
 * cancel; when the net move vector is zero the position is kept and the
 * yaw is the facing of the last active group (forward, backward, left,
 * right scan order).
 */
class MovementIntegrator {
public:
    explicit MovementIntegrator(const input::KeyBindings& bindings = input::KeyBindings::defaults(),
                                const MovementParams& params = MovementParams(),
                                const glm::vec3& initialPosition = glm::vec3(0.0f));

    // Returns true when the pressed set changed. Unbound codes and key
    // repeats return false.
    bool onKeyDown(const std::string& code);
    bool onKeyUp(const std::string& code);

    // Releases every key (focus loss, teardown)
    void clearKeys();

    // Integrate one tick. Non-finite or negative deltas use the default delta.
    state::MovementState update(float deltaTime);
    state::MovementState update();

    // Re-seed position, zero the yaw and release all keys
    void reset(const glm::vec3& position);

    const state::MovementState& currentState() const { return m_state; }
    const std::set<std::string>& pressedKeys() const { return m_pressed; }
    const input::KeyBindings& bindings() const { return m_bindings; }
    const MovementParams& params() const { return m_params; }

    bool isGroupActive(input::KeyGroup group) const;

private:
    input::KeyBindings m_bindings;
    MovementParams m_params;
    std::set<std::string> m_pressed;
    state::MovementState m_state;
};

} // namespace movement
} // namespace avr
