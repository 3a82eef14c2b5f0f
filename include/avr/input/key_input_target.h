#pragma once

#include <string>

namespace avr {
namespace input {

// Receiver of translated key codes (KeyboardEvent.code vocabulary)
class KeyInputTarget {
public:
    virtual ~KeyInputTarget() = default;

    // Return true when the key changed the target's pressed set
    virtual bool onKeyDown(const std::string& code) = 0;
    virtual bool onKeyUp(const std::string& code) = 0;

    // Release everything (focus loss)
    virtual void clearKeys() = 0;
};

} // namespace input
} // namespace avr
