#pragma once

#include <set>
#include <string>
#include <glm/glm.hpp>

namespace avr {
namespace state {

// Planar velocity for one tick: displacement along X/Z and its magnitude.
struct Velocity {
    float x = 0.0f;
    float z = 0.0f;
    float speed = 0.0f;
};

/**
 * MovementState - Result of one integration tick.
 *
 * rotation is Euler radians; only rotation.y (yaw) is driven. Yaw 0 faces -Z.
 * activeKeys holds the pressed key codes that belong to a binding group.
 */
struct MovementState {
    glm::vec3 position{0.0f};
    glm::vec3 rotation{0.0f};
    bool isMoving = false;
    bool isRunning = false;
    Velocity velocity;
    std::set<std::string> activeKeys;

    // Exact comparison, used to suppress redundant change notifications
    bool sameAs(const MovementState& other) const {
        return position == other.position &&
               rotation == other.rotation &&
               isMoving == other.isMoving &&
               isRunning == other.isRunning &&
               velocity.x == other.velocity.x &&
               velocity.z == other.velocity.z &&
               velocity.speed == other.velocity.speed &&
               activeKeys == other.activeKeys;
    }
};

} // namespace state
} // namespace avr
