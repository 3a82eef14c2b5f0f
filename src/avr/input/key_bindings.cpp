#include "avr/input/key_bindings.h"

#include <algorithm>

namespace avr {
namespace input {

const char* keyGroupName(KeyGroup group) {
    switch (group) {
        case KeyGroup::Forward:  return "forward";
        case KeyGroup::Backward: return "backward";
        case KeyGroup::Left:     return "left";
        case KeyGroup::Right:    return "right";
        case KeyGroup::Run:      return "run";
        case KeyGroup::None:     return "none";
    }
    return "none";
}

KeyBindings KeyBindings::defaults() {
    KeyBindings bindings;
    bindings.forward  = {"KeyW", "ArrowUp"};
    bindings.backward = {"KeyS", "ArrowDown"};
    bindings.left     = {"KeyA", "ArrowLeft"};
    bindings.right    = {"KeyD", "ArrowRight"};
    bindings.run      = {"ShiftLeft", "ShiftRight"};
    return bindings;
}

const std::vector<std::string>& KeyBindings::codes(KeyGroup group) const {
    static const std::vector<std::string> empty;
    switch (group) {
        case KeyGroup::Forward:  return forward;
        case KeyGroup::Backward: return backward;
        case KeyGroup::Left:     return left;
        case KeyGroup::Right:    return right;
        case KeyGroup::Run:      return run;
        case KeyGroup::None:     break;
    }
    return empty;
}

bool KeyBindings::inGroup(KeyGroup group, const std::string& code) const {
    const auto& list = codes(group);
    return std::find(list.begin(), list.end(), code) != list.end();
}

bool KeyBindings::isBound(const std::string& code) const {
    return inGroup(KeyGroup::Forward, code) ||
           inGroup(KeyGroup::Backward, code) ||
           inGroup(KeyGroup::Left, code) ||
           inGroup(KeyGroup::Right, code) ||
           inGroup(KeyGroup::Run, code);
}

} // namespace input
} // namespace avr
