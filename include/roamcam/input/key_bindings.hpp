#pragma once

/**
 * @file key_bindings.hpp
 * @brief Movement key bindings
 *
 * Maps action names to key codes. Key codes are GLFW key codes
 * (platform-neutral integers); the library never includes GLFW, so the
 * constants are stored as raw ints.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace roamcam {

class ConfigDocument;

enum class MoveAction : uint8_t {
    Forward,
    Back,
    Left,
    Right
};

/// A single key binding: action name -> key code
struct KeyBinding {
    std::string action;   ///< "forward", "alt_forward", ...
    MoveAction move;
    int keyCode;          ///< GLFW key code (e.g., 87 = GLFW_KEY_W)
};

/// Default bindings: WASD plus arrow keys as alternates
std::vector<KeyBinding> getDefaultKeyBindings();

/// Defaults overridden by any input.bind.<action> entries in doc
std::vector<KeyBinding> loadKeyBindings(const ConfigDocument& doc);

/// Config key for an action (e.g., "forward" -> "input.bind.forward")
std::string bindingConfigKey(const std::string& action);

/// Action bound to a key code, if any
std::optional<MoveAction> findMoveAction(const std::vector<KeyBinding>& bindings, int keyCode);

}  // namespace roamcam
