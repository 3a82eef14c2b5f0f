#include "avr/movement/movement_integrator.h"
#include "avr/common/logging.h"

#include <glm/gtc/constants.hpp>

#include <cmath>

namespace avr {
namespace movement {

MovementIntegrator::MovementIntegrator(const input::KeyBindings& bindings,
                                       const MovementParams& params,
                                       const glm::vec3& initialPosition)
    : m_bindings(bindings)
    , m_params(params)
{
    m_state.position = initialPosition;
}

bool MovementIntegrator::onKeyDown(const std::string& code) {
    if (!m_bindings.isBound(code)) {
        LOG_TRACE(MOD_INPUT, "Ignoring unbound key down '{}'", code);
        return false;
    }
    return m_pressed.insert(code).second;
}

bool MovementIntegrator::onKeyUp(const std::string& code) {
    if (!m_bindings.isBound(code)) {
        return false;
    }
    return m_pressed.erase(code) > 0;
}

void MovementIntegrator::clearKeys() {
    if (!m_pressed.empty()) {
        LOG_DEBUG(MOD_INPUT, "Clearing {} pressed keys", m_pressed.size());
    }
    m_pressed.clear();
}

bool MovementIntegrator::isGroupActive(input::KeyGroup group) const {
    for (const auto& code : m_bindings.codes(group)) {
        if (m_pressed.count(code) > 0) {
            return true;
        }
    }
    return false;
}

state::MovementState MovementIntegrator::update() {
    return update(m_params.defaultDeltaTime);
}

state::MovementState MovementIntegrator::update(float deltaTime) {
    float dt = deltaTime;
    if (!std::isfinite(dt) || dt < 0.0f) {
        LOG_DEBUG(MOD_MOVEMENT, "Unusable delta {}, using default {}", deltaTime, m_params.defaultDeltaTime);
        dt = m_params.defaultDeltaTime;
    }

    // Groups are scanned in this order; the last active one sets the facing
    // used when the combined vector cancels out.
    static const struct { input::KeyGroup group; float dx; float dz; float yaw; } kDirections[] = {
        {input::KeyGroup::Forward,   0.0f, -1.0f, 0.0f},
        {input::KeyGroup::Backward,  0.0f,  1.0f, glm::pi<float>()},
        {input::KeyGroup::Left,     -1.0f,  0.0f, glm::half_pi<float>()},
        {input::KeyGroup::Right,     1.0f,  0.0f, -glm::half_pi<float>()},
    };

    float moveX = 0.0f;
    float moveZ = 0.0f;
    bool anyDirection = false;
    float groupYaw = m_state.rotation.y;
    for (const auto& dir : kDirections) {
        if (isGroupActive(dir.group)) {
            anyDirection = true;
            moveX += dir.dx;
            moveZ += dir.dz;
            groupYaw = dir.yaw;
        }
    }

    const bool running = isGroupActive(input::KeyGroup::Run);
    const float multiplier = running ? m_params.runMultiplier : 1.0f;
    const float frameSpeed = m_params.baseSpeed * multiplier * (dt * m_params.referenceTickRate);

    state::MovementState next;
    next.position = m_state.position;
    next.rotation = m_state.rotation;
    next.isRunning = running;
    next.isMoving = anyDirection;
    next.activeKeys = m_pressed;

    if (!anyDirection) {
        m_state = next;
        return next;
    }

    const float length = std::sqrt(moveX * moveX + moveZ * moveZ);
    if (length > 0.0f) {
        // Diagonals share the single-axis speed
        const float stepX = moveX / length * frameSpeed;
        const float stepZ = moveZ / length * frameSpeed;

        next.position.x += stepX;
        next.position.z += stepZ;
        next.rotation.y = std::atan2(-moveX, -moveZ);
        next.velocity.x = stepX;
        next.velocity.z = stepZ;
        next.velocity.speed = std::sqrt(stepX * stepX + stepZ * stepZ);

        LOG_TRACE(MOD_MOVEMENT, "dt={:.4f} step=({:.4f}, {:.4f}) pos=({:.3f}, {:.3f}, {:.3f}) yaw={:.3f}",
            dt, stepX, stepZ, next.position.x, next.position.y, next.position.z, next.rotation.y);
    } else {
        // Opposing groups cancel: stay in place, face the last active group
        next.rotation.y = groupYaw;
        LOG_TRACE(MOD_MOVEMENT, "Opposing keys cancel, yaw={:.3f}", groupYaw);
    }

    m_state = next;
    return next;
}

void MovementIntegrator::reset(const glm::vec3& position) {
    m_pressed.clear();
    m_state = state::MovementState();
    m_state.position = position;
    LOG_DEBUG(MOD_MOVEMENT, "Reset to ({:.3f}, {:.3f}, {:.3f})", position.x, position.y, position.z);
}

} // namespace movement
} // namespace avr
