#pragma once

/**
 * @file desktop_input.hpp
 * @brief Keyboard and mouse input
 *
 * Mouse deltas count only while pointer capture is engaged. Key state is
 * tracked regardless so that keys held while capturing the pointer take
 * effect immediately.
 */

#include "roamcam/input/input_events.hpp"
#include "roamcam/input/input_source.hpp"
#include "roamcam/input/key_bindings.hpp"
#include <unordered_set>

namespace roamcam {

/// Radians of rotation per pixel of mouse motion
constexpr float DEFAULT_MOUSE_SENSITIVITY = 0.002f;

struct DesktopInputConfig {
    float mouseSensitivity = DEFAULT_MOUSE_SENSITIVITY;
    std::vector<KeyBinding> bindings = getDefaultKeyBindings();
};

class DesktopInput : public InputSource {
public:
    explicit DesktopInput(InputEvents& events, DesktopInputConfig config = {});

    [[nodiscard]] const char* name() const override { return "desktop"; }
    [[nodiscard]] bool engaged() const override { return pointerLocked_; }
    InputFrame sample(float dt) override;
    void reset() override;

    void setConfig(DesktopInputConfig config) { config_ = std::move(config); }
    [[nodiscard]] const DesktopInputConfig& config() const { return config_; }

    [[nodiscard]] bool pointerLocked() const { return pointerLocked_; }
    [[nodiscard]] bool isHeld(MoveAction action) const;

    /// Keyboard-only movement for the current key state
    [[nodiscard]] MoveVector keyboardMove() const;

    // Event handlers (also callable directly)
    void onPointerLock(const PointerLockChanged& event);
    void onKey(const KeyEvent& event);
    void onMouseMove(const MouseMoved& event);

private:
    DesktopInputConfig config_;
    bool pointerLocked_ = false;
    std::unordered_set<int> keysDown_;
    LookDelta pendingLook_;

    Subscription lockSub_;
    Subscription keySub_;
    Subscription mouseSub_;
};

}  // namespace roamcam
