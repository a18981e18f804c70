#include "roamcam/head_bob.hpp"
#include <cmath>

namespace roamcam {

void HeadBob::setConfig(const HeadBobConfig& config) {
    config_ = config;
    if (!config_.enabled) {
        reset();
    }
}

void HeadBob::reset() {
    pose_ = BobPose{};
    phase_ = 0.0f;
}

const BobPose& HeadBob::update(float dt, bool moving, int strafe) {
    if (!config_.enabled || !moving) {
        // Stopping is instant; the next step starts from a clean phase
        reset();
        return pose_;
    }

    phase_ += dt * config_.frequency;

    float targetY = std::sin(phase_) * config_.verticalAmplitude;
    float targetX = std::sin(phase_ * 0.5f) * config_.horizontalAmplitude;
    float targetRoll = static_cast<float>((strafe > 0) - (strafe < 0)) * config_.tiltAmount;

    pose_.offset.y += (targetY - pose_.offset.y) * config_.lerp;
    pose_.offset.x += (targetX - pose_.offset.x) * config_.lerp;
    pose_.roll += (targetRoll - pose_.roll) * config_.tiltLerp;
    return pose_;
}

}  // namespace roamcam
