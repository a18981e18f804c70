#pragma once

/**
 * @file head_bob.hpp
 * @brief Cosmetic camera bobbing while walking
 *
 * Produces a local offset and roll for the viewpoint node only. It never
 * touches the player root, so it cannot affect collision.
 */

#include "roamcam/geometry.hpp"

namespace roamcam {

struct HeadBobConfig {
    bool enabled = false;
    float verticalAmplitude = 0.065f;
    float horizontalAmplitude = 0.0325f;
    float frequency = 10.0f;          // Phase advance per second
    float lerp = 0.2f;                // Smoothing toward the target offset
    float tiltAmount = 0.04f;         // Roll in radians while strafing
    float tiltLerp = 0.1f;
};

struct BobPose {
    Vec3 offset{0.0f};
    float roll = 0.0f;
};

class HeadBob {
public:
    HeadBob() = default;
    explicit HeadBob(HeadBobConfig config) : config_(config) {}

    void setConfig(const HeadBobConfig& config);
    [[nodiscard]] const HeadBobConfig& config() const { return config_; }

    /// Advance one frame.
    /// @param moving Walking this frame (keyboard motion only)
    /// @param strafe -1 left, 0 none, +1 right
    const BobPose& update(float dt, bool moving, int strafe);

    /// Snap back to neutral and restart the phase
    void reset();

    [[nodiscard]] const BobPose& pose() const { return pose_; }
    [[nodiscard]] float phase() const { return phase_; }

private:
    HeadBobConfig config_;
    BobPose pose_;
    float phase_ = 0.0f;
};

}  // namespace roamcam
