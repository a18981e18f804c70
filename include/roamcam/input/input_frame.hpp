#pragma once

/**
 * @file input_frame.hpp
 * @brief Device-neutral per-frame input
 */

namespace roamcam {

/// Rotation to add this frame, in radians
struct LookDelta {
    float yaw = 0.0f;
    float pitch = 0.0f;

    [[nodiscard]] bool isZero() const { return yaw == 0.0f && pitch == 0.0f; }

    LookDelta& operator+=(const LookDelta& other) {
        yaw += other.yaw;
        pitch += other.pitch;
        return *this;
    }
};

/// Requested movement on the walking axes. A single fully deflected axis has
/// magnitude 1; the integrator normalizes the combined direction.
struct MoveVector {
    float forward = 0.0f;
    float right = 0.0f;

    [[nodiscard]] bool isZero() const { return forward == 0.0f && right == 0.0f; }
};

struct InputFrame {
    LookDelta look;
    MoveVector move;
    float speedScale = 1.0f;        // Device sensitivity multiplier on moveSpeed
    bool keyboardMotion = false;    // Motion came from keys (drives head bobbing)
    bool active = false;            // Some device is engaged

    [[nodiscard]] bool moving() const { return active && !move.isZero(); }

    /// Nothing engaged: no movement, no rotation
    [[nodiscard]] static InputFrame idle() { return InputFrame{}; }
};

}  // namespace roamcam
