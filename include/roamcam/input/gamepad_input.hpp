#pragma once

/**
 * @file gamepad_input.hpp
 * @brief Polled gamepad input with dead zones and rate-based look
 *
 * Standard mapping: axes 0/1 are the left stick (move), 2/3 the right stick
 * (look). Stick Y is positive when pushed down/back.
 *
 * Look is a rate, not a delta: holding the stick at full deflection turns at
 * lookSpeed radians per second regardless of frame rate.
 */

#include "roamcam/geometry.hpp"
#include "roamcam/input/input_events.hpp"
#include "roamcam/input/input_source.hpp"
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace roamcam {

/// Raw axis values in [-1, 1]
using GamepadAxes = std::array<float, 4>;

constexpr int AXIS_LEFT_X = 0;
constexpr int AXIS_LEFT_Y = 1;
constexpr int AXIS_RIGHT_X = 2;
constexpr int AXIS_RIGHT_Y = 3;

/// Axis magnitudes at or below this count as released
constexpr float AXIS_ACTIVITY_EPSILON = 0.001f;

/// Platform access to connected pads (GLFW joystick API, SDL, a test double)
class GamepadProvider {
public:
    virtual ~GamepadProvider() = default;

    /// Indices of currently connected pads, in slot order
    [[nodiscard]] virtual std::vector<int> connectedPads() const = 0;

    /// Current axes of a pad, or nullopt if it is not available
    [[nodiscard]] virtual std::optional<GamepadAxes> axes(int index) const = 0;
};

struct GamepadConfig {
    float lookDeadZoneX = 0.08f;
    float lookDeadZoneY = 0.18f;     // Higher: filters noise when clicking the stick
    float moveDeadZone = 0.10f;
    float responseCurve = 1.2f;      // Exponent applied to look magnitude
    float lookSpeed = 2.5f;          // Radians per second at full deflection
    float moveSensitivity = 1.0f;
};

/// Zero inside the dead zone, then remap [deadZone, 1] onto [0, 1]
[[nodiscard]] float applyDeadZone(float value, float deadZone);

/// sign(v) * |v|^exponent
[[nodiscard]] float applyResponseCurve(float value, float exponent);

class GamepadInput : public InputSource {
public:
    GamepadInput(InputEvents& events, std::shared_ptr<GamepadProvider> provider, GamepadConfig config = {});

    [[nodiscard]] const char* name() const override { return "gamepad"; }
    [[nodiscard]] bool engaged() const override { return padIndex_.has_value(); }
    InputFrame sample(float dt) override;
    void reset() override;

    void setConfig(const GamepadConfig& config) { config_ = config; }
    [[nodiscard]] const GamepadConfig& config() const { return config_; }

    /// Read the provider and refresh the filtered axes
    void poll();

    [[nodiscard]] std::optional<int> padIndex() const { return padIndex_; }

    /// Filtered stick values (dead zones applied), x right / y down
    [[nodiscard]] const Vec2& look() const { return look_; }
    [[nodiscard]] const Vec2& move() const { return move_; }

    /// Any stick outside its dead zone
    [[nodiscard]] bool hasInput() const;
    [[nodiscard]] bool hasMoveInput() const;

    void onConnection(const GamepadConnection& event);

private:
    std::shared_ptr<GamepadProvider> provider_;
    GamepadConfig config_;
    std::optional<int> padIndex_;
    Vec2 look_{0.0f};
    Vec2 move_{0.0f};
    Subscription connectionSub_;
};

}  // namespace roamcam
