#pragma once

/**
 * @file controller_config.hpp
 * @brief Maps configuration documents onto controller options
 *
 * Example file:
 * ```
 * # Small apartment, scaled model
 * player.radius: 0.25
 * player.height: 1.7
 * player.eye_height: 1.55
 * spawn: 0 0 4
 * spawn.yaw: 3.14159
 * boundary: -6 6 -5 5
 * # Z on AZERTY keyboards
 * input.bind.forward: 90
 * bob.enabled: true
 * debug.penetration: on
 * ```
 *
 * Unknown keys and malformed values are reported and ignored; whatever was
 * recognized still applies.
 */

#include "roamcam/config_parser.hpp"
#include "roamcam/player_controller.hpp"
#include <optional>
#include <string>

namespace roamcam {

struct ControllerSettings {
    PlayerConfig player;
    std::optional<Vec3> spawn;
    std::optional<float> spawnYaw;
    std::optional<BoundaryLimits> boundary;
    InputConfig input;
    PenetrationConfig penetration;
    GroundConfig ground;
    WallClampConfig wallClamp;
    bool wallClampEnabled = true;
    SweepConfig sweep;
    HeadBobConfig headBob;
    DebugFlags debug;

    /// Number of entries that produced a warning while loading
    int warnings = 0;

    /// Copy everything into options (spawn only if one was given)
    void applyTo(ControllerOptions& options) const;
};

/// Read every recognized key from doc on top of the defaults
[[nodiscard]] ControllerSettings loadControllerSettings(const ConfigDocument& doc);

/// Parse path and load it; nullopt if the file cannot be read
[[nodiscard]] std::optional<ControllerSettings> loadControllerSettingsFile(const std::string& path);

}  // namespace roamcam
