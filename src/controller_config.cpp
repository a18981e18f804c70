#include "roamcam/controller_config.hpp"
#include <functional>
#include <iostream>
#include <unordered_map>

namespace roamcam {

namespace {

const std::string BIND_PREFIX = "input.bind.";

void warnAt(const ConfigEntry& entry, const std::string& message, ControllerSettings& settings) {
    std::cerr << "[ControllerConfig] " << (entry.source.empty() ? std::string("<config>") : entry.source)
              << ":" << entry.line << ": " << message << "\n";
    ++settings.warnings;
}

using Handler = std::function<void(const ConfigEntry&, ControllerSettings&)>;

// Field setters that validate the value type before assigning
template<typename Getter>
Handler floatKey(Getter field) {
    return [field](const ConfigEntry& entry, ControllerSettings& s) {
        if (!entry.value.isNumber()) {
            warnAt(entry, "'" + entry.key + "' expects a number", s);
            return;
        }
        field(s) = entry.value.asFloat();
    };
}

template<typename Getter>
Handler intKey(Getter field) {
    return [field](const ConfigEntry& entry, ControllerSettings& s) {
        if (!entry.value.isNumber()) {
            warnAt(entry, "'" + entry.key + "' expects an integer", s);
            return;
        }
        field(s) = entry.value.asInt();
    };
}

template<typename Getter>
Handler boolKey(Getter field) {
    return [field](const ConfigEntry& entry, ControllerSettings& s) {
        if (!entry.value.isBool()) {
            warnAt(entry, "'" + entry.key + "' expects true/false", s);
            return;
        }
        field(s) = entry.value.asBool();
    };
}

template<typename Getter>
Handler fractionListKey(Getter field) {
    return [field](const ConfigEntry& entry, ControllerSettings& s) {
        auto values = entry.value.empty() && entry.hasData() ? entry.dataLines.front()
                                                              : entry.value.asFloatList();
        if (values.empty()) {
            warnAt(entry, "'" + entry.key + "' expects a list of numbers", s);
            return;
        }
        field(s) = std::move(values);
    };
}

const std::unordered_map<std::string, Handler>& handlers() {
    static const std::unordered_map<std::string, Handler> table = {
        // Player
        {"player.radius",        floatKey([](ControllerSettings& s) -> float& { return s.player.radius; })},
        {"player.height",        floatKey([](ControllerSettings& s) -> float& { return s.player.height; })},
        {"player.eye_height",    floatKey([](ControllerSettings& s) -> float& { return s.player.eyeHeight; })},
        {"player.move_speed",    floatKey([](ControllerSettings& s) -> float& { return s.player.moveSpeed; })},
        {"player.disable_gravity", boolKey([](ControllerSettings& s) -> bool& { return s.player.disableGravity; })},

        // Spawn and bounds
        {"spawn", [](const ConfigEntry& entry, ControllerSettings& s) {
            auto v = entry.value.asFloatList();
            if (v.size() != 3) {
                warnAt(entry, "'spawn' expects three numbers: x y z", s);
                return;
            }
            s.spawn = Vec3(v[0], v[1], v[2]);
        }},
        {"spawn.yaw", [](const ConfigEntry& entry, ControllerSettings& s) {
            if (!entry.value.isNumber()) {
                warnAt(entry, "'spawn.yaw' expects a number", s);
                return;
            }
            s.spawnYaw = entry.value.asFloat();
        }},
        {"boundary", [](const ConfigEntry& entry, ControllerSettings& s) {
            auto v = entry.value.asFloatList();
            if (v.size() != 4) {
                warnAt(entry, "'boundary' expects four numbers: minX maxX minZ maxZ", s);
                return;
            }
            s.boundary = BoundaryLimits{v[0], v[1], v[2], v[3]};
        }},

        // Input devices
        {"input.mouse_sensitivity",       floatKey([](ControllerSettings& s) -> float& { return s.input.desktop.mouseSensitivity; })},
        {"input.gamepad.look_speed",      floatKey([](ControllerSettings& s) -> float& { return s.input.gamepad.lookSpeed; })},
        {"input.gamepad.dead_zone_x",     floatKey([](ControllerSettings& s) -> float& { return s.input.gamepad.lookDeadZoneX; })},
        {"input.gamepad.dead_zone_y",     floatKey([](ControllerSettings& s) -> float& { return s.input.gamepad.lookDeadZoneY; })},
        {"input.gamepad.move_dead_zone",  floatKey([](ControllerSettings& s) -> float& { return s.input.gamepad.moveDeadZone; })},
        {"input.gamepad.response_curve",  floatKey([](ControllerSettings& s) -> float& { return s.input.gamepad.responseCurve; })},
        {"input.gamepad.move_sensitivity", floatKey([](ControllerSettings& s) -> float& { return s.input.gamepad.moveSensitivity; })},
        {"input.touch.look_speed",        floatKey([](ControllerSettings& s) -> float& { return s.input.touch.lookSpeed; })},
        {"input.touch.look_threshold",    floatKey([](ControllerSettings& s) -> float& { return s.input.touch.lookThreshold; })},
        {"input.touch.move_threshold",    floatKey([](ControllerSettings& s) -> float& { return s.input.touch.moveThreshold; })},
        {"input.touch.response_curve", [](const ConfigEntry& entry, ControllerSettings& s) {
            if (!entry.value.isNumber()) {
                warnAt(entry, "'input.touch.response_curve' expects a number", s);
                return;
            }
            s.input.touch.lookCurve = entry.value.asFloat();
            s.input.touch.moveCurve = entry.value.asFloat();
        }},
        {"input.touch.move_sensitivity",  floatKey([](ControllerSettings& s) -> float& { return s.input.touch.moveSensitivity; })},

        // Penetration tracker
        {"penetration.epsilon",           floatKey([](ControllerSettings& s) -> float& { return s.penetration.epsilon; })},
        {"penetration.max_frames",        intKey([](ControllerSettings& s) -> int& { return s.penetration.maxFramesBeforeSnap; })},
        {"penetration.skip_frames",       intKey([](ControllerSettings& s) -> int& { return s.penetration.skipFrames; })},
        {"penetration.snap_min_delta",    floatKey([](ControllerSettings& s) -> float& { return s.penetration.snapMinDelta; })},
        {"penetration.snap_lerp",         floatKey([](ControllerSettings& s) -> float& { return s.penetration.snapLerp; })},
        {"penetration.settle_delta",      floatKey([](ControllerSettings& s) -> float& { return s.penetration.settleDelta; })},
        {"penetration.permissive_offset", floatKey([](ControllerSettings& s) -> float& { return s.penetration.permissiveOffset; })},
        {"penetration.sample_heights",    fractionListKey([](ControllerSettings& s) -> std::vector<float>& { return s.penetration.sampleHeightFractions; })},

        // Ground
        {"ground.max_step_fraction",      floatKey([](ControllerSettings& s) -> float& { return s.ground.maxStepFraction; })},
        {"ground.ray_length",             floatKey([](ControllerSettings& s) -> float& { return s.ground.rayLength; })},
        {"ground.lerp",                   floatKey([](ControllerSettings& s) -> float& { return s.ground.lerp; })},

        // Camera clamp and movement sweep
        {"camera.wall_clamp",             boolKey([](ControllerSettings& s) -> bool& { return s.wallClampEnabled; })},
        {"camera.min_wall_distance",      floatKey([](ControllerSettings& s) -> float& { return s.wallClamp.minDistanceFromWall; })},
        {"camera.collision_radius_fraction", floatKey([](ControllerSettings& s) -> float& { return s.player.cameraCollisionFraction; })},
        {"sweep.enabled",                 boolKey([](ControllerSettings& s) -> bool& { return s.sweep.enabled; })},
        {"sweep.skin",                    floatKey([](ControllerSettings& s) -> float& { return s.sweep.skin; })},
        {"sweep.heights",                 fractionListKey([](ControllerSettings& s) -> std::vector<float>& { return s.sweep.heightFractions; })},

        // Head bob
        {"bob.enabled",                   boolKey([](ControllerSettings& s) -> bool& { return s.headBob.enabled; })},
        {"bob.vertical_amplitude",        floatKey([](ControllerSettings& s) -> float& { return s.headBob.verticalAmplitude; })},
        {"bob.horizontal_amplitude",      floatKey([](ControllerSettings& s) -> float& { return s.headBob.horizontalAmplitude; })},
        {"bob.frequency",                 floatKey([](ControllerSettings& s) -> float& { return s.headBob.frequency; })},

        // Diagnostics
        {"debug.sphere_cast",             boolKey([](ControllerSettings& s) -> bool& { return s.debug.sphereCast; })},
        {"debug.penetration",             boolKey([](ControllerSettings& s) -> bool& { return s.debug.penetration; })},
        {"debug.filtering",               boolKey([](ControllerSettings& s) -> bool& { return s.debug.filtering; })},
        {"debug.proximity",               boolKey([](ControllerSettings& s) -> bool& { return s.debug.proximity; })},
        {"debug.collider_quality",        boolKey([](ControllerSettings& s) -> bool& { return s.debug.colliderQuality; })},
        {"debug.ground",                  boolKey([](ControllerSettings& s) -> bool& { return s.debug.ground; })},
    };
    return table;
}

void checkBinding(const ConfigEntry& entry, ControllerSettings& settings) {
    std::string action = entry.key.substr(BIND_PREFIX.size());
    for (const auto& binding : getDefaultKeyBindings()) {
        if (binding.action != action) continue;
        if (!entry.value.isNumber()) {
            warnAt(entry, "'" + entry.key + "' expects a key code", settings);
        }
        return;
    }
    warnAt(entry, "Unknown binding action '" + action + "'", settings);
}

}  // namespace

ControllerSettings loadControllerSettings(const ConfigDocument& doc) {
    ControllerSettings settings;
    const auto& table = handlers();

    // Entries are applied in order so later lines override earlier ones
    for (const ConfigEntry& entry : doc) {
        if (entry.key.compare(0, BIND_PREFIX.size(), BIND_PREFIX) == 0) {
            checkBinding(entry, settings);
            continue;
        }
        auto it = table.find(entry.key);
        if (it == table.end()) {
            warnAt(entry, "Unknown key '" + entry.key + "'", settings);
            continue;
        }
        it->second(entry, settings);
    }

    settings.input.desktop.bindings = loadKeyBindings(doc);
    return settings;
}

std::optional<ControllerSettings> loadControllerSettingsFile(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        std::cerr << "[ControllerConfig] Cannot read '" << path << "'\n";
        return std::nullopt;
    }
    return loadControllerSettings(*doc);
}

void ControllerSettings::applyTo(ControllerOptions& options) const {
    options.player = player;
    if (spawn) options.initialPosition = *spawn;
    if (spawnYaw) options.initialYaw = *spawnYaw;
    if (boundary) options.boundary = boundary;
    options.input = input;
    options.penetration = penetration;
    options.ground = ground;
    options.wallClamp = wallClamp;
    options.wallClampEnabled = wallClampEnabled;
    options.sweep = sweep;
    options.headBob = headBob;
    options.debug = debug;
}

}  // namespace roamcam
