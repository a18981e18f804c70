#include "roamcam/input/touch_input.hpp"
#include <array>
#include <cmath>

namespace roamcam {

bool looksLikeMobilePlatform(std::string_view userAgent) {
    static constexpr std::array<std::string_view, 8> markers = {
        "Android", "webOS", "iPhone", "iPad", "iPod", "BlackBerry", "IEMobile", "Opera Mini"
    };
    for (auto marker : markers) {
        if (userAgent.find(marker) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

TouchInput::TouchInput(std::shared_ptr<VirtualJoystick> joystick, TouchCapability capability, TouchConfig config)
    : joystick_(std::move(joystick))
    , capability_(capability)
    , config_(config)
{
}

bool TouchInput::engaged() const {
    return joystick_ && capability_.detected();
}

InputFrame TouchInput::sample(float dt) {
    InputFrame frame;
    frame.active = engaged();
    if (!frame.active) {
        return frame;
    }

    Vec2 look = joystick_->lookVector();
    float lookMag = std::sqrt(look.x * look.x + look.y * look.y);
    if (lookMag > config_.lookThreshold) {
        float curved = std::pow(lookMag, config_.lookCurve);
        frame.look.yaw = -(look.x / lookMag) * curved * config_.lookSpeed * dt;
        frame.look.pitch = -(look.y / lookMag) * curved * config_.lookSpeed * dt;
    }

    Vec2 move = joystick_->moveVector();
    float moveMag = std::sqrt(move.x * move.x + move.y * move.y);
    if (moveMag > config_.moveThreshold) {
        float curved = std::pow(moveMag, config_.moveCurve);
        frame.move.forward = -move.y;
        frame.move.right = move.x;
        frame.speedScale = config_.moveSensitivity * curved;
    }
    return frame;
}

}  // namespace roamcam
