#pragma once

#include <string>
#include <vector>

namespace avr {
namespace input {

// Semantic key groups consumed by the movement integrator
enum class KeyGroup {
    Forward,
    Backward,
    Left,
    Right,
    Run,
    None
};

const char* keyGroupName(KeyGroup group);

/**
 * KeyBindings - Maps key codes (KeyboardEvent.code vocabulary, e.g. "KeyW",
 * "ArrowUp", "ShiftLeft") onto movement groups.
 *
 * A code may belong to more than one group.
 */
struct KeyBindings {
    std::vector<std::string> forward;
    std::vector<std::string> backward;
    std::vector<std::string> left;
    std::vector<std::string> right;
    std::vector<std::string> run;

    // WASD + arrows, either shift to run
    static KeyBindings defaults();

    const std::vector<std::string>& codes(KeyGroup group) const;

    // True when the code belongs to at least one group
    bool isBound(const std::string& code) const;
    bool inGroup(KeyGroup group, const std::string& code) const;
};

} // namespace input
} // namespace avr
