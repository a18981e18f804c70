#pragma once

/**
 * @file input_aggregator.hpp
 * @brief Combines every input device into one InputFrame per tick
 *
 * Touch mode is selected when a virtual joystick is supplied and touch
 * hardware is detected; it then owns movement. Otherwise keyboard and the
 * gamepad left stick add together. Look contributions from the mouse, the
 * gamepad right stick and (in touch mode) the look joystick always add.
 *
 * Nothing happens unless some device is engaged: touch mode, pointer
 * capture, or a connected gamepad.
 */

#include "roamcam/input/desktop_input.hpp"
#include "roamcam/input/gamepad_input.hpp"
#include "roamcam/input/touch_input.hpp"

namespace roamcam {

struct InputConfig {
    DesktopInputConfig desktop;
    GamepadConfig gamepad;
    TouchConfig touch;
};

class InputAggregator {
public:
    InputAggregator(InputEvents& events,
                    std::shared_ptr<GamepadProvider> gamepadProvider = nullptr,
                    std::shared_ptr<VirtualJoystick> joystick = nullptr,
                    TouchCapability touchCapability = {},
                    InputConfig config = {});

    InputAggregator(const InputAggregator&) = delete;
    InputAggregator& operator=(const InputAggregator&) = delete;

    /// Poll and combine all devices for a frame of length dt
    InputFrame sample(float dt);

    [[nodiscard]] bool touchMode() const { return touch_.engaged(); }
    [[nodiscard]] bool isActive() const;

    void setConfig(const InputConfig& config);
    void setJoystick(std::shared_ptr<VirtualJoystick> joystick) { touch_.setJoystick(std::move(joystick)); }
    void setTouchCapability(const TouchCapability& capability) { touch_.setCapability(capability); }

    /// Release held keys and axes on every device
    void reset();

    [[nodiscard]] DesktopInput& desktop() { return desktop_; }
    [[nodiscard]] GamepadInput& gamepad() { return gamepad_; }
    [[nodiscard]] TouchInput& touch() { return touch_; }
    [[nodiscard]] const DesktopInput& desktop() const { return desktop_; }
    [[nodiscard]] const GamepadInput& gamepad() const { return gamepad_; }
    [[nodiscard]] const TouchInput& touch() const { return touch_; }

private:
    DesktopInput desktop_;
    GamepadInput gamepad_;
    TouchInput touch_;
};

}  // namespace roamcam
