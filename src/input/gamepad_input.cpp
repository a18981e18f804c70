#include "roamcam/input/gamepad_input.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace roamcam {

float applyDeadZone(float value, float deadZone) {
    float magnitude = std::abs(value);
    if (magnitude < deadZone || deadZone >= 1.0f) {
        return 0.0f;
    }
    float remapped = std::min((magnitude - deadZone) / (1.0f - deadZone), 1.0f);
    return value > 0.0f ? remapped : -remapped;
}

float applyResponseCurve(float value, float exponent) {
    if (value == 0.0f) return 0.0f;
    float curved = std::pow(std::abs(value), exponent);
    return value > 0.0f ? curved : -curved;
}

GamepadInput::GamepadInput(InputEvents& events, std::shared_ptr<GamepadProvider> provider, GamepadConfig config)
    : provider_(std::move(provider))
    , config_(config)
{
    connectionSub_ = events.subscribe<GamepadConnection>([this](const GamepadConnection& e) { onConnection(e); });

    // Pick up a pad that was connected before we started listening
    if (provider_) {
        auto pads = provider_->connectedPads();
        if (!pads.empty()) {
            padIndex_ = pads.front();
            std::cerr << "[GamepadInput] Found existing gamepad " << *padIndex_ << "\n";
        }
    }
}

void GamepadInput::onConnection(const GamepadConnection& event) {
    if (event.connected) {
        std::cerr << "[GamepadInput] Gamepad connected: " << event.index << "\n";
        padIndex_ = event.index;
        return;
    }

    std::cerr << "[GamepadInput] Gamepad disconnected: " << event.index << "\n";
    if (padIndex_ && *padIndex_ == event.index) {
        padIndex_.reset();
        look_ = Vec2(0.0f);
        move_ = Vec2(0.0f);
    }
}

void GamepadInput::poll() {
    if (!padIndex_ || !provider_) {
        return;
    }
    auto raw = provider_->axes(*padIndex_);
    if (!raw) {
        std::cerr << "[GamepadInput] Gamepad " << *padIndex_ << " no longer available\n";
        padIndex_.reset();
        look_ = Vec2(0.0f);
        move_ = Vec2(0.0f);
        return;
    }

    look_.x = applyDeadZone((*raw)[AXIS_RIGHT_X], config_.lookDeadZoneX);
    look_.y = applyDeadZone((*raw)[AXIS_RIGHT_Y], config_.lookDeadZoneY);
    move_.x = applyDeadZone((*raw)[AXIS_LEFT_X], config_.moveDeadZone);
    move_.y = applyDeadZone((*raw)[AXIS_LEFT_Y], config_.moveDeadZone);
}

bool GamepadInput::hasMoveInput() const {
    return padIndex_ && (std::abs(move_.x) > AXIS_ACTIVITY_EPSILON || std::abs(move_.y) > AXIS_ACTIVITY_EPSILON);
}

bool GamepadInput::hasInput() const {
    return hasMoveInput() ||
           (padIndex_ && (std::abs(look_.x) > AXIS_ACTIVITY_EPSILON || std::abs(look_.y) > AXIS_ACTIVITY_EPSILON));
}

InputFrame GamepadInput::sample(float dt) {
    poll();

    InputFrame frame;
    frame.active = padIndex_.has_value();
    if (!frame.active) {
        return frame;
    }

    if (std::abs(look_.x) > AXIS_ACTIVITY_EPSILON || std::abs(look_.y) > AXIS_ACTIVITY_EPSILON) {
        frame.look.yaw = -applyResponseCurve(look_.x, config_.responseCurve) * config_.lookSpeed * dt;
        frame.look.pitch = -applyResponseCurve(look_.y, config_.responseCurve) * config_.lookSpeed * dt;
    }

    if (hasMoveInput()) {
        frame.move.forward = -move_.y;
        frame.move.right = move_.x;
        frame.speedScale = config_.moveSensitivity;
    }
    return frame;
}

void GamepadInput::reset() {
    look_ = Vec2(0.0f);
    move_ = Vec2(0.0f);
}

}  // namespace roamcam
