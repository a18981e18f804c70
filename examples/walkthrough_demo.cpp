/**
 * @file walkthrough_demo.cpp
 * @brief Headless walkthrough of a small furnished room
 *
 * Demonstrates:
 * - Injecting the controller above an application-owned camera node
 * - Keyboard and mouse input delivered as events
 * - Gamepad input through a polled provider
 * - Wall sliding, a climbable step and a table that blocks
 * - Loading tuning from a config file
 *
 * Command line:
 *   walkthrough_demo [room.conf]
 *
 * Prints the player position every few frames so the trajectory can be
 * checked without a renderer.
 */

#include "roamcam/controller_config.hpp"
#include "roamcam/player_controller.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace roamcam;

namespace {

// GLFW key codes
constexpr int KEY_W = 87;
constexpr int KEY_D = 68;

constexpr float FRAME_DT = 1.0f / 60.0f;

// Single scripted pad standing in for the platform joystick API
class ScriptedGamepad : public GamepadProvider {
public:
    std::vector<int> connectedPads() const override {
        return plugged_ ? std::vector<int>{0} : std::vector<int>{};
    }

    std::optional<GamepadAxes> axes(int index) const override {
        if (!plugged_ || index != 0) return std::nullopt;
        return axes_;
    }

    void plug(bool plugged) { plugged_ = plugged; }
    void setAxes(const GamepadAxes& axes) { axes_ = axes; }

private:
    bool plugged_ = false;
    GamepadAxes axes_{0.0f, 0.0f, 0.0f, 0.0f};
};

std::shared_ptr<TriangleMesh> makeMesh(TriangleMesh mesh, bool ground) {
    auto ptr = std::make_shared<TriangleMesh>(std::move(mesh));
    if (ground) {
        ptr->setMetadata({{"ground", true}});
    }
    return ptr;
}

// 8 x 8 room centred on the origin with a step and a table along the north wall
MeshList buildRoom() {
    MeshList room;
    room.push_back(makeMesh(TriangleMesh::floorQuad("Floor", -4.0f, 4.0f, -4.0f, 4.0f, 0.0f), true));
    room.push_back(makeMesh(TriangleMesh::box("WallNorth", AABB(-4.2f, 0.0f, -4.2f, 4.2f, 2.6f, -4.0f)), false));
    room.push_back(makeMesh(TriangleMesh::box("WallSouth", AABB(-4.2f, 0.0f, 4.0f, 4.2f, 2.6f, 4.2f)), false));
    room.push_back(makeMesh(TriangleMesh::box("WallWest", AABB(-4.2f, 0.0f, -4.0f, -4.0f, 2.6f, 4.0f)), false));
    room.push_back(makeMesh(TriangleMesh::box("WallEast", AABB(4.0f, 0.0f, -4.0f, 4.2f, 2.6f, 4.0f)), false));
    room.push_back(makeMesh(TriangleMesh::box("Step", AABB(-1.3f, 0.0f, -2.7f, 1.1f, 0.25f, -1.6f)), true));
    room.push_back(makeMesh(TriangleMesh::box("Table", AABB(1.7f, 0.0f, -3.4f, 3.3f, 0.75f, -2.1f)), true));
    return room;
}

void printState(const char* phase, const PlayerState& state) {
    std::cout << std::fixed << std::setprecision(3)
              << std::setw(5) << state.frameIndex << "  " << std::setw(10) << phase
              << "  pos (" << state.position.x << ", " << state.position.y << ", " << state.position.z << ")"
              << "  yaw " << state.yaw
              << (state.onGround ? "  ground" : "")
              << (state.penetrationPhase != PenetrationPhase::Clear
                      ? std::string("  ") + penetrationPhaseName(state.penetrationPhase) : std::string())
              << "\n";
}

void run(PlayerController& controller, const char* phase, int frames) {
    for (int i = 0; i < frames; ++i) {
        PlayerState state = controller.tick(FRAME_DT);
        if (i % 15 == 0 || i == frames - 1) {
            printState(phase, state);
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto scene = SceneNode::create("Scene");
    auto camera = SceneNode::create("Camera");
    scene->addChild(camera);

    InputEvents events;
    auto pad = std::make_shared<ScriptedGamepad>();

    ControllerOptions options;
    options.collisionObjects = buildRoom();
    options.gamepadProvider = pad;
    options.initialPosition = Vec3(0.0f, 0.5f, 2.5f);
    options.boundary = BoundaryLimits{-4.0f, 4.0f, -4.0f, 4.0f};
    options.headBob.enabled = true;

    if (argc > 1) {
        auto settings = loadControllerSettingsFile(argv[1]);
        if (!settings) {
            return 1;
        }
        if (settings->warnings > 0) {
            std::cout << settings->warnings << " config warning(s), see log\n";
        }
        settings->applyTo(options);
    }

    PlayerController controller(scene, camera, events, options);

    std::cout << "Room: " << controller.classifier().collidable().size() << " collidable, "
              << controller.classifier().ground().size() << " ground meshes\n";

    // Nothing engaged yet: settle onto the floor
    run(controller, "settle", 60);

    // Capture the pointer and walk north over the step
    events.emit(PointerLockChanged{true});
    events.emit(KeyEvent{KEY_W, true});
    run(controller, "north", 120);

    // Turn right and keep walking into the table
    events.emit(MouseMoved{-180.0f, 0.0f});
    run(controller, "table", 90);
    events.emit(KeyEvent{KEY_W, false});

    // Strafe along the north wall
    events.emit(MouseMoved{180.0f, 0.0f});
    events.emit(KeyEvent{KEY_D, true});
    run(controller, "strafe", 90);
    events.emit(KeyEvent{KEY_D, false});
    events.emit(PointerLockChanged{false});

    // Hand over to the gamepad: back toward the middle while turning left
    pad->plug(true);
    events.emit(GamepadConnection{0, true});
    pad->setAxes({-0.4f, 0.8f, -0.5f, 0.0f});
    run(controller, "gamepad", 120);
    pad->setAxes({0.0f, 0.0f, 0.0f, 0.0f});
    run(controller, "idle", 30);

    const PlayerState& last = controller.state();
    Vec3 eye = controller.eyePosition();
    std::cout << "Final eye position (" << eye.x << ", " << eye.y << ", " << eye.z << "), "
              << "yaw " << last.yaw << ", pitch " << last.pitch << "\n";

    controller.teardown();
    std::cout << "Camera returned to '" << (camera->parent() ? camera->parent()->name() : "none") << "'\n";
    return 0;
}
