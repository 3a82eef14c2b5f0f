#include "avr/graphics/keyboard_event_receiver.h"
#include "avr/common/logging.h"

namespace avr {
namespace graphics {

KeyboardEventReceiver::KeyboardEventReceiver(input::KeyInputTarget* target)
    : target_(target)
{
}

std::string KeyboardEventReceiver::keyCodeName(irr::EKEY_CODE key) {
    if (key >= irr::KEY_KEY_A && key <= irr::KEY_KEY_Z) {
        return std::string("Key") + static_cast<char>('A' + (key - irr::KEY_KEY_A));
    }
    if (key >= irr::KEY_KEY_0 && key <= irr::KEY_KEY_9) {
        return std::string("Digit") + static_cast<char>('0' + (key - irr::KEY_KEY_0));
    }

    switch (key) {
        case irr::KEY_UP:      return "ArrowUp";
        case irr::KEY_DOWN:    return "ArrowDown";
        case irr::KEY_LEFT:    return "ArrowLeft";
        case irr::KEY_RIGHT:   return "ArrowRight";
        // Some platforms report the generic shift code only
        case irr::KEY_SHIFT:
        case irr::KEY_LSHIFT:  return "ShiftLeft";
        case irr::KEY_RSHIFT:  return "ShiftRight";
        case irr::KEY_CONTROL:
        case irr::KEY_LCONTROL: return "ControlLeft";
        case irr::KEY_RCONTROL: return "ControlRight";
        case irr::KEY_SPACE:   return "Space";
        case irr::KEY_RETURN:  return "Enter";
        case irr::KEY_ESCAPE:  return "Escape";
        case irr::KEY_TAB:     return "Tab";
        default:               return "";
    }
}

bool KeyboardEventReceiver::OnEvent(const irr::SEvent& event) {
    if (event.EventType != irr::EET_KEY_INPUT_EVENT) {
        return false;
    }

    if (event.KeyInput.Key == irr::KEY_ESCAPE) {
        if (event.KeyInput.PressedDown) {
            quitRequested_ = true;
        }
        return true;
    }

    std::string code = keyCodeName(event.KeyInput.Key);
    if (code.empty() || !target_) {
        return false;
    }

    // Key repeat arrives as repeated downs; the target treats them as no-ops
    bool changed = event.KeyInput.PressedDown ? target_->onKeyDown(code) : target_->onKeyUp(code);
    LOG_DEBUG_IF(MOD_INPUT, changed, "Key {} {}", code, event.KeyInput.PressedDown ? "down" : "up");
    return changed;
}

void KeyboardEventReceiver::updateFocus(bool windowActive) {
    if (windowActive_ && !windowActive && target_) {
        LOG_DEBUG(MOD_INPUT, "Window lost focus, releasing keys");
        target_->clearKeys();
    }
    windowActive_ = windowActive;
}

} // namespace graphics
} // namespace avr
