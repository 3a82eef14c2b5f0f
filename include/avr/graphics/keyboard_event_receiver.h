#ifndef AVR_GRAPHICS_KEYBOARD_EVENT_RECEIVER_H
#define AVR_GRAPHICS_KEYBOARD_EVENT_RECEIVER_H

#include <irrlicht.h>
#include <string>

#include "avr/input/key_input_target.h"

namespace avr {
namespace graphics {

/**
 * KeyboardEventReceiver - Irrlicht key events to key-code strings.
 *
 * Translates irr::EKEY_CODE into the KeyboardEvent.code vocabulary
 * ("KeyW", "ArrowUp", "ShiftLeft", ...) and forwards down/up to the target.
 * Escape requests quit. Unmapped keys are not consumed.
 */
class KeyboardEventReceiver : public irr::IEventReceiver {
public:
    explicit KeyboardEventReceiver(input::KeyInputTarget* target = nullptr);

    virtual bool OnEvent(const irr::SEvent& event) override;

    void setTarget(input::KeyInputTarget* target) { target_ = target; }

    // Empty string for keys without a code
    static std::string keyCodeName(irr::EKEY_CODE key);

    bool quitRequested() const { return quitRequested_; }
    void setQuitRequested(bool quit) { quitRequested_ = quit; }

    // Call once per frame with the window focus state; releases keys on focus loss
    void updateFocus(bool windowActive);

private:
    input::KeyInputTarget* target_;
    bool quitRequested_ = false;
    bool windowActive_ = true;
};

} // namespace graphics
} // namespace avr

#endif // AVR_GRAPHICS_KEYBOARD_EVENT_RECEIVER_H
