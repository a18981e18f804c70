#pragma once

/**
 * @file touch_input.hpp
 * @brief Virtual on-screen joysticks
 *
 * Both sticks report vectors in [-1, 1] with y negative when pushed up.
 * Look is rate-based like the gamepad; move speed grows with a curved
 * stick magnitude.
 */

#include "roamcam/geometry.hpp"
#include "roamcam/input/input_source.hpp"
#include <memory>
#include <string_view>

namespace roamcam {

/// On-screen joystick pair supplied by the host UI
class VirtualJoystick {
public:
    virtual ~VirtualJoystick() = default;
    [[nodiscard]] virtual Vec2 moveVector() const = 0;
    [[nodiscard]] virtual Vec2 lookVector() const = 0;
};

/// Feature test results for touch hardware. Viewport size is not a touch
/// signal and is never consulted.
struct TouchCapability {
    bool touchEvents = false;
    int maxTouchPoints = 0;
    bool coarsePointer = false;
    bool mobilePlatform = false;

    [[nodiscard]] bool detected() const {
        return touchEvents || maxTouchPoints > 0 || coarsePointer || mobilePlatform;
    }
};

/// Platform hint from a user-agent style string (Android, iPhone, ...)
[[nodiscard]] bool looksLikeMobilePlatform(std::string_view userAgent);

struct TouchConfig {
    float lookThreshold = 0.05f;
    float lookCurve = 1.5f;
    float lookSpeed = 2.5f;          // Radians per second at full deflection
    float moveThreshold = 0.08f;
    float moveCurve = 1.5f;
    float moveSensitivity = 1.8f;
};

class TouchInput : public InputSource {
public:
    TouchInput(std::shared_ptr<VirtualJoystick> joystick, TouchCapability capability, TouchConfig config = {});

    [[nodiscard]] const char* name() const override { return "touch"; }

    /// Joystick supplied and touch hardware detected
    [[nodiscard]] bool engaged() const override;

    InputFrame sample(float dt) override;
    void reset() override {}

    void setJoystick(std::shared_ptr<VirtualJoystick> joystick) { joystick_ = std::move(joystick); }
    [[nodiscard]] bool hasJoystick() const { return joystick_ != nullptr; }

    void setCapability(const TouchCapability& capability) { capability_ = capability; }
    [[nodiscard]] const TouchCapability& capability() const { return capability_; }

    void setConfig(const TouchConfig& config) { config_ = config; }
    [[nodiscard]] const TouchConfig& config() const { return config_; }

private:
    std::shared_ptr<VirtualJoystick> joystick_;
    TouchCapability capability_;
    TouchConfig config_;
};

}  // namespace roamcam
