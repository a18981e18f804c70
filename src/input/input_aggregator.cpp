#include "roamcam/input/input_aggregator.hpp"
#include <iostream>

namespace roamcam {

InputAggregator::InputAggregator(InputEvents& events,
                                 std::shared_ptr<GamepadProvider> gamepadProvider,
                                 std::shared_ptr<VirtualJoystick> joystick,
                                 TouchCapability touchCapability,
                                 InputConfig config)
    : desktop_(events, std::move(config.desktop))
    , gamepad_(events, std::move(gamepadProvider), config.gamepad)
    , touch_(std::move(joystick), touchCapability, config.touch)
{
    std::cerr << "[InputAggregator] Touch detected: " << (touchCapability.detected() ? "yes" : "no")
              << ", joystick: " << (touch_.hasJoystick() ? "yes" : "no")
              << ", touch mode: " << (touchMode() ? "on" : "off") << "\n";
}

void InputAggregator::setConfig(const InputConfig& config) {
    desktop_.setConfig(config.desktop);
    gamepad_.setConfig(config.gamepad);
    touch_.setConfig(config.touch);
}

bool InputAggregator::isActive() const {
    return touchMode() || desktop_.engaged() || gamepad_.engaged();
}

InputFrame InputAggregator::sample(float dt) {
    // Every device is sampled each tick so pads stay polled and stale
    // mouse motion never piles up while inactive
    InputFrame pad = gamepad_.sample(dt);
    InputFrame desk = desktop_.sample(dt);

    if (!isActive()) {
        return InputFrame::idle();
    }

    InputFrame frame;
    frame.active = true;
    frame.look = pad.look;
    frame.look += desk.look;

    if (touchMode()) {
        InputFrame touch = touch_.sample(dt);
        frame.look += touch.look;
        frame.move = touch.move;
        frame.speedScale = touch.speedScale;
        return frame;
    }

    frame.move.forward = desk.move.forward + pad.move.forward;
    frame.move.right = desk.move.right + pad.move.right;
    bool padMoving = !pad.move.isZero();
    frame.speedScale = padMoving ? pad.speedScale : 1.0f;
    frame.keyboardMotion = desk.keyboardMotion && !padMoving;
    return frame;
}

void InputAggregator::reset() {
    desktop_.reset();
    gamepad_.reset();
    touch_.reset();
}

}  // namespace roamcam
