#include <gtest/gtest.h>
#include <irrlicht.h>

#include "avr/graphics/keyboard_event_receiver.h"
#include "avr/movement/movement_integrator.h"

using avr::graphics::KeyboardEventReceiver;

namespace {

// Forwards into a real integrator so change reporting matches production
class IntegratorTarget : public avr::input::KeyInputTarget {
public:
    bool onKeyDown(const std::string& code) override { return integrator.onKeyDown(code); }
    bool onKeyUp(const std::string& code) override { return integrator.onKeyUp(code); }
    void clearKeys() override {
        ++clears;
        integrator.clearKeys();
    }

    avr::movement::MovementIntegrator integrator;
    int clears = 0;
};

irr::SEvent keyEvent(irr::EKEY_CODE key, bool down) {
    irr::SEvent event;
    event.EventType = irr::EET_KEY_INPUT_EVENT;
    event.KeyInput.Key = key;
    event.KeyInput.PressedDown = down;
    event.KeyInput.Char = 0;
    event.KeyInput.Shift = false;
    event.KeyInput.Control = false;
    return event;
}

} // namespace

class KeyboardEventReceiverTest : public ::testing::Test {
protected:
    IntegratorTarget target;
    KeyboardEventReceiver receiver{&target};
};

TEST_F(KeyboardEventReceiverTest, KeyCodeNames) {
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_KEY_W), "KeyW");
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_KEY_A), "KeyA");
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_KEY_Z), "KeyZ");
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_KEY_5), "Digit5");
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_UP), "ArrowUp");
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_RIGHT), "ArrowRight");
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_SHIFT), "ShiftLeft");
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_LSHIFT), "ShiftLeft");
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_RSHIFT), "ShiftRight");
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_SPACE), "Space");
    EXPECT_EQ(KeyboardEventReceiver::keyCodeName(irr::KEY_F1), "");
}

TEST_F(KeyboardEventReceiverTest, KeyDownUp_ReachTarget) {
    EXPECT_TRUE(receiver.OnEvent(keyEvent(irr::KEY_KEY_W, true)));
    EXPECT_EQ(target.integrator.pressedKeys().count("KeyW"), 1u);

    // repeat is not a change
    EXPECT_FALSE(receiver.OnEvent(keyEvent(irr::KEY_KEY_W, true)));

    EXPECT_TRUE(receiver.OnEvent(keyEvent(irr::KEY_KEY_W, false)));
    EXPECT_TRUE(target.integrator.pressedKeys().empty());
}

TEST_F(KeyboardEventReceiverTest, UnboundAndUnmappedKeys) {
    EXPECT_FALSE(receiver.OnEvent(keyEvent(irr::KEY_KEY_Q, true)));
    EXPECT_FALSE(receiver.OnEvent(keyEvent(irr::KEY_F5, true)));
    EXPECT_TRUE(target.integrator.pressedKeys().empty());
}

TEST_F(KeyboardEventReceiverTest, Escape_RequestsQuit) {
    EXPECT_FALSE(receiver.quitRequested());
    EXPECT_TRUE(receiver.OnEvent(keyEvent(irr::KEY_ESCAPE, true)));
    EXPECT_TRUE(receiver.quitRequested());
}

TEST_F(KeyboardEventReceiverTest, NonKeyEvents_AreIgnored) {
    irr::SEvent event;
    event.EventType = irr::EET_MOUSE_INPUT_EVENT;
    event.MouseInput.Event = irr::EMIE_LMOUSE_PRESSED_DOWN;
    event.MouseInput.X = 0;
    event.MouseInput.Y = 0;
    event.MouseInput.Wheel = 0.0f;
    event.MouseInput.ButtonStates = 0;
    EXPECT_FALSE(receiver.OnEvent(event));
}

TEST_F(KeyboardEventReceiverTest, FocusLoss_ReleasesKeysOnce) {
    receiver.OnEvent(keyEvent(irr::KEY_KEY_D, true));
    receiver.OnEvent(keyEvent(irr::KEY_LSHIFT, true));

    receiver.updateFocus(true);
    EXPECT_EQ(target.clears, 0);

    receiver.updateFocus(false);
    receiver.updateFocus(false);
    EXPECT_EQ(target.clears, 1);
    EXPECT_TRUE(target.integrator.pressedKeys().empty());

    avr::state::MovementState state = target.integrator.update(0.016f);
    EXPECT_FALSE(state.isMoving);
}

TEST_F(KeyboardEventReceiverTest, NoTarget) {
    KeyboardEventReceiver detached;
    EXPECT_FALSE(detached.OnEvent(keyEvent(irr::KEY_KEY_W, true)));
    detached.updateFocus(false);
}
