#include "roamcam/input/key_bindings.hpp"
#include "roamcam/config_parser.hpp"

namespace roamcam {

// GLFW key code constants (stable across versions)
static constexpr int KEY_W = 87;
static constexpr int KEY_S = 83;
static constexpr int KEY_A = 65;
static constexpr int KEY_D = 68;
static constexpr int KEY_RIGHT = 262;
static constexpr int KEY_LEFT = 263;
static constexpr int KEY_DOWN = 264;
static constexpr int KEY_UP = 265;

std::vector<KeyBinding> getDefaultKeyBindings() {
    return {
        {"forward",     MoveAction::Forward, KEY_W},
        {"back",        MoveAction::Back,    KEY_S},
        {"left",        MoveAction::Left,    KEY_A},
        {"right",       MoveAction::Right,   KEY_D},
        {"alt_forward", MoveAction::Forward, KEY_UP},
        {"alt_back",    MoveAction::Back,    KEY_DOWN},
        {"alt_left",    MoveAction::Left,    KEY_LEFT},
        {"alt_right",   MoveAction::Right,   KEY_RIGHT},
    };
}

std::string bindingConfigKey(const std::string& action) {
    return "input.bind." + action;
}

std::vector<KeyBinding> loadKeyBindings(const ConfigDocument& doc) {
    auto bindings = getDefaultKeyBindings();
    for (auto& binding : bindings) {
        if (doc.get(bindingConfigKey(binding.action))) {
            binding.keyCode = doc.getInt(bindingConfigKey(binding.action), binding.keyCode);
        }
    }
    return bindings;
}

std::optional<MoveAction> findMoveAction(const std::vector<KeyBinding>& bindings, int keyCode) {
    for (const auto& binding : bindings) {
        if (binding.keyCode == keyCode) {
            return binding.move;
        }
    }
    return std::nullopt;
}

}  // namespace roamcam
