#include "roamcam/input/desktop_input.hpp"

namespace roamcam {

DesktopInput::DesktopInput(InputEvents& events, DesktopInputConfig config)
    : config_(std::move(config))
{
    lockSub_ = events.subscribe<PointerLockChanged>([this](const PointerLockChanged& e) { onPointerLock(e); });
    keySub_ = events.subscribe<KeyEvent>([this](const KeyEvent& e) { onKey(e); });
    mouseSub_ = events.subscribe<MouseMoved>([this](const MouseMoved& e) { onMouseMove(e); });
}

void DesktopInput::onPointerLock(const PointerLockChanged& event) {
    pointerLocked_ = event.locked;
    if (!pointerLocked_) {
        pendingLook_ = LookDelta{};
    }
}

void DesktopInput::onKey(const KeyEvent& event) {
    if (event.pressed) {
        // Only bound keys are tracked
        if (!findMoveAction(config_.bindings, event.keyCode)) return;
        keysDown_.insert(event.keyCode);
    } else {
        keysDown_.erase(event.keyCode);
    }
}

void DesktopInput::onMouseMove(const MouseMoved& event) {
    if (!pointerLocked_) return;
    pendingLook_.yaw -= event.dx * config_.mouseSensitivity;
    pendingLook_.pitch -= event.dy * config_.mouseSensitivity;
}

bool DesktopInput::isHeld(MoveAction action) const {
    for (const auto& binding : config_.bindings) {
        if (binding.move == action && keysDown_.count(binding.keyCode)) {
            return true;
        }
    }
    return false;
}

MoveVector DesktopInput::keyboardMove() const {
    MoveVector move;
    if (isHeld(MoveAction::Forward)) move.forward += 1.0f;
    if (isHeld(MoveAction::Back))    move.forward -= 1.0f;
    if (isHeld(MoveAction::Right))   move.right += 1.0f;
    if (isHeld(MoveAction::Left))    move.right -= 1.0f;
    return move;
}

InputFrame DesktopInput::sample(float /*dt*/) {
    InputFrame frame;
    frame.active = pointerLocked_;
    frame.look = pendingLook_;
    pendingLook_ = LookDelta{};

    frame.move = keyboardMove();
    frame.keyboardMotion = !frame.move.isZero();
    return frame;
}

void DesktopInput::reset() {
    keysDown_.clear();
    pendingLook_ = LookDelta{};
}

}  // namespace roamcam
