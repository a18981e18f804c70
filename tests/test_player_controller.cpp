#include <gtest/gtest.h>
#include "roamcam/player_controller.hpp"
#include <cmath>

using namespace roamcam;

class PlayerControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scene = SceneNode::create("scene");
        camera = SceneNode::create("camera");
        scene->addChild(camera);

        floor = std::make_shared<TriangleMesh>(
            TriangleMesh::floorQuad("floor", -10.0f, 12.0f, -9.0f, 10.0f, 0.0f));
        floor->setMetadata({{"ground", true}});
    }

    ControllerOptions roomOptions(const MeshList& extra = {}) {
        ControllerOptions options;
        options.collisionObjects = {floor};
        options.collisionObjects.insert(options.collisionObjects.end(), extra.begin(), extra.end());
        options.initialPosition = Vec3(0.3f, 0.0f, 0.7f);
        return options;
    }

    static std::shared_ptr<TriangleMesh> groundBox(const std::string& name, const AABB& bounds) {
        auto mesh = std::make_shared<TriangleMesh>(TriangleMesh::box(name, bounds));
        mesh->setMetadata({{"ground", true}});
        return mesh;
    }

    static InputFrame walk(float forward, float right, float speedScale = 1.0f) {
        InputFrame frame;
        frame.active = true;
        frame.move.forward = forward;
        frame.move.right = right;
        frame.speedScale = speedScale;
        frame.keyboardMotion = true;
        return frame;
    }

    static InputFrame look(float yaw, float pitch) {
        InputFrame frame;
        frame.active = true;
        frame.look.yaw = yaw;
        frame.look.pitch = pitch;
        return frame;
    }

    static InputFrame still() {
        InputFrame frame;
        frame.active = true;
        return frame;
    }

    InputEvents events;
    SceneNode::Ptr scene;
    SceneNode::Ptr camera;
    std::shared_ptr<TriangleMesh> floor;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(PlayerControllerTest, ConstructionBuildsHierarchy) {
    PlayerController controller(scene, camera, events, roomOptions());

    EXPECT_EQ(camera->parent(), controller.hierarchy().pitchRig());
    EXPECT_EQ(controller.state().position, Vec3(0.3f, 0.0f, 0.7f));
    EXPECT_FLOAT_EQ(controller.hierarchy().eyeHeight(), 1.6f);
    EXPECT_TRUE(controller.groundSkipPending());
    EXPECT_FALSE(controller.isLocked());
}

TEST_F(PlayerControllerTest, NullViewpointThrows) {
    EXPECT_THROW(PlayerController(scene, nullptr, events, roomOptions()), std::invalid_argument);
}

TEST_F(PlayerControllerTest, InvalidPlayerConfigFallsBack) {
    PlayerConfig config;
    config.radius = -1.0f;
    config.moveSpeed = std::nanf("");
    config.eyeHeight = 3.0f;

    PlayerConfig clean = config.sanitized();
    EXPECT_FLOAT_EQ(clean.radius, 0.3f);
    EXPECT_FLOAT_EQ(clean.moveSpeed, 5.0f);
    EXPECT_FLOAT_EQ(clean.eyeHeight, 1.8f);
    EXPECT_FLOAT_EQ(clean.cameraCollisionRadius, 0.15f);
}

// ============================================================================
// Spawn and ground
// ============================================================================

TEST_F(PlayerControllerTest, FirstTickAfterSpawnKeepsHeight) {
    auto options = roomOptions();
    options.initialPosition = Vec3(0.3f, 1.0f, 0.7f);
    PlayerController controller(scene, camera, events, options);

    PlayerState state = controller.tick(1.0f / 60.0f, still());
    EXPECT_FLOAT_EQ(state.position.y, 1.0f);
    EXPECT_FALSE(controller.groundSkipPending());

    // Then 10% of the way down per frame
    state = controller.tick(1.0f / 60.0f, still());
    EXPECT_NEAR(state.position.y, 0.9f, 1e-5f);
}

TEST_F(PlayerControllerTest, SettlesOnFloor) {
    auto options = roomOptions();
    options.initialPosition = Vec3(0.3f, 1.0f, 0.7f);
    PlayerController controller(scene, camera, events, options);

    PlayerState state;
    for (int i = 0; i < 120; ++i) {
        state = controller.tick(1.0f / 60.0f, still());
    }
    EXPECT_NEAR(state.position.y, 0.0f, 1e-3f);
    EXPECT_TRUE(state.onGround);
}

TEST_F(PlayerControllerTest, GravityOffNeverFalls) {
    auto options = roomOptions();
    options.initialPosition = Vec3(0.3f, 1.0f, 0.7f);
    options.player.disableGravity = true;
    PlayerController controller(scene, camera, events, options);

    PlayerState state;
    for (int i = 0; i < 30; ++i) {
        state = controller.tick(1.0f / 60.0f, still());
    }
    EXPECT_FLOAT_EQ(state.position.y, 1.0f);
    EXPECT_FALSE(state.onGround);
}

TEST_F(PlayerControllerTest, GravityOffStandsStillOnFloor) {
    auto options = roomOptions();
    options.player.disableGravity = true;
    PlayerController controller(scene, camera, events, options);

    PlayerState state;
    for (int i = 0; i < 30; ++i) {
        state = controller.tick(1.0f / 60.0f, still());
    }
    EXPECT_EQ(controller.groundDetector().rejectionCount(), 0u);
    EXPECT_FLOAT_EQ(state.position.y, 0.0f);
    EXPECT_TRUE(state.onGround);
}

TEST_F(PlayerControllerTest, RespawnResetsState) {
    PlayerController controller(scene, camera, events, roomOptions());
    controller.tick(0.1f, walk(1.0f, 0.0f));

    controller.respawn(Vec3(2.0f, 0.5f, -3.0f), PI * 0.5f);
    EXPECT_TRUE(controller.groundSkipPending());
    EXPECT_EQ(controller.state().position, Vec3(2.0f, 0.5f, -3.0f));
    EXPECT_NEAR(controller.yaw(), PI * 0.5f, 1e-6f);
    EXPECT_EQ(controller.penetration().frameCount(), 0u);

    PlayerState state = controller.tick(1.0f / 60.0f, still());
    EXPECT_FLOAT_EQ(state.position.y, 0.5f);
}

// ============================================================================
// Movement
// ============================================================================

TEST_F(PlayerControllerTest, ForwardIsMinusZAtZeroYaw) {
    PlayerController controller(scene, camera, events, roomOptions());

    // 5 m/s for 0.1 s
    PlayerState state = controller.tick(0.1f, walk(1.0f, 0.0f));
    EXPECT_NEAR(state.position.x, 0.3f, 1e-5f);
    EXPECT_NEAR(state.position.z, 0.2f, 1e-5f);
    EXPECT_TRUE(state.isMoving);
    EXPECT_NEAR(glm::length(state.velocity), 0.5f, 1e-5f);
}

TEST_F(PlayerControllerTest, DiagonalIsNotFaster) {
    PlayerController controller(scene, camera, events, roomOptions());

    Vec3 before = controller.state().position;
    PlayerState state = controller.tick(0.1f, walk(1.0f, 1.0f));
    Vec3 step = state.position - before;
    EXPECT_NEAR(glm::length(step), 0.5f, 1e-5f);
    EXPECT_GT(step.x, 0.0f);
    EXPECT_LT(step.z, 0.0f);
}

TEST_F(PlayerControllerTest, SpeedScaleMultipliesSpeed) {
    PlayerController controller(scene, camera, events, roomOptions());
    PlayerState state = controller.tick(0.1f, walk(1.0f, 0.0f, 1.8f));
    EXPECT_NEAR(state.position.z, 0.7f - 0.9f, 1e-5f);
}

TEST_F(PlayerControllerTest, YawTurnsWalkingAxes) {
    auto options = roomOptions();
    options.initialYaw = PI * 0.5f;
    PlayerController controller(scene, camera, events, options);

    // Facing -X after a quarter turn left
    PlayerState state = controller.tick(0.1f, walk(1.0f, 0.0f));
    EXPECT_NEAR(state.position.x, -0.2f, 1e-5f);
    EXPECT_NEAR(state.position.z, 0.7f, 1e-5f);
}

TEST_F(PlayerControllerTest, InactiveFrameDoesNothing) {
    PlayerController controller(scene, camera, events, roomOptions());

    InputFrame frame = walk(1.0f, 0.0f);
    frame.active = false;
    frame.look.yaw = 1.0f;
    PlayerState state = controller.tick(0.1f, frame);

    EXPECT_EQ(state.position, Vec3(0.3f, 0.0f, 0.7f));
    EXPECT_FLOAT_EQ(state.yaw, 0.0f);
    EXPECT_FALSE(state.isMoving);
}

TEST_F(PlayerControllerTest, InvalidDtIsTreatedAsZero) {
    PlayerController controller(scene, camera, events, roomOptions());

    PlayerState state = controller.tick(std::nanf(""), walk(1.0f, 0.0f));
    EXPECT_TRUE(isFinite(state.position));
    EXPECT_FALSE(state.isMoving);

    state = controller.tick(-1.0f, walk(1.0f, 0.0f));
    EXPECT_FALSE(state.isMoving);
}

TEST_F(PlayerControllerTest, MovesWithoutCollisionObjects) {
    ControllerOptions options;
    options.initialPosition = Vec3(0.3f, 0.0f, 0.7f);
    PlayerController controller(scene, camera, events, options);

    PlayerState state;
    for (int i = 0; i < 60; ++i) {
        state = controller.tick(0.01f, walk(1.0f, 0.0f));
    }
    // 60 frames at 0.05 each
    EXPECT_NEAR(state.position.z, 0.7f - 3.0f, 1e-4f);
    EXPECT_FLOAT_EQ(state.position.y, 0.0f);
}

// ============================================================================
// Look
// ============================================================================

TEST_F(PlayerControllerTest, PitchIsClamped) {
    PlayerController controller(scene, camera, events, roomOptions());

    controller.tick(0.016f, look(0.0f, 5.0f));
    EXPECT_FLOAT_EQ(controller.pitch(), MAX_PITCH);

    controller.tick(0.016f, look(0.0f, -10.0f));
    EXPECT_FLOAT_EQ(controller.pitch(), -MAX_PITCH);
    EXPECT_FLOAT_EQ(controller.hierarchy().pitchRig()->rotation().x, -MAX_PITCH);
}

TEST_F(PlayerControllerTest, YawWraps) {
    PlayerController controller(scene, camera, events, roomOptions());
    for (int i = 0; i < 10; ++i) {
        controller.tick(0.016f, look(1.0f, 0.0f));
    }
    EXPECT_NEAR(controller.yaw(), wrapAngle(10.0f), 1e-4f);
    EXPECT_GT(controller.yaw(), -PI);
    EXPECT_LE(controller.yaw(), PI);
}

TEST_F(PlayerControllerTest, PitchDoesNotTiltWalking) {
    PlayerController controller(scene, camera, events, roomOptions());
    controller.tick(0.016f, look(0.0f, -1.0f));

    PlayerState state = controller.tick(0.1f, walk(1.0f, 0.0f));
    EXPECT_NEAR(state.position.z, 0.2f, 1e-5f);
    EXPECT_NEAR(state.position.y, 0.0f, 1e-5f);
}

// ============================================================================
// Collision
// ============================================================================

TEST_F(PlayerControllerTest, WallStopsMovement) {
    auto wall = std::make_shared<TriangleMesh>(
        TriangleMesh::box("wall", AABB(-5.0f, 0.0f, -1.2f, 7.0f, 3.0f, -1.0f)));
    PlayerController controller(scene, camera, events, roomOptions({wall}));

    PlayerState state;
    for (int i = 0; i < 10; ++i) {
        state = controller.tick(0.1f, walk(1.0f, 0.0f));
    }
    // Radius 0.3 plus 0.01 skin from the face at z = -1
    EXPECT_NEAR(state.position.z, -0.69f, 1e-3f);
    EXPECT_NEAR(state.position.x, 0.3f, 1e-4f);
}

TEST_F(PlayerControllerTest, SlidesAlongWall) {
    auto wall = std::make_shared<TriangleMesh>(
        TriangleMesh::box("wall", AABB(-5.0f, 0.0f, -1.2f, 7.0f, 3.0f, -1.0f)));
    PlayerController controller(scene, camera, events, roomOptions({wall}));

    for (int i = 0; i < 10; ++i) {
        controller.tick(0.1f, walk(1.0f, 0.0f));
    }
    PlayerState state;
    for (int i = 0; i < 4; ++i) {
        state = controller.tick(0.1f, walk(1.0f, 1.0f));
    }
    EXPECT_GT(state.position.x, 1.0f);
    EXPECT_GT(state.position.z, -0.7f);
}

TEST_F(PlayerControllerTest, TableIsNotClimbed) {
    auto table = groundBox("table", AABB(-5.0f, 0.0f, -4.0f, 7.0f, 0.7f, -1.0f));
    PlayerController controller(scene, camera, events, roomOptions({table}));

    PlayerState state;
    for (int i = 0; i < 20; ++i) {
        state = controller.tick(0.1f, walk(1.0f, 0.0f));
    }
    EXPECT_NEAR(state.position.y, 0.0f, 1e-5f);
    EXPECT_NEAR(state.position.z, -0.69f, 1e-3f);
}

TEST_F(PlayerControllerTest, StepIsClimbed) {
    auto step = groundBox("step", AABB(-5.0f, 0.0f, -4.0f, 7.0f, 0.3f, -1.0f));
    PlayerController controller(scene, camera, events, roomOptions({step}));

    PlayerState state;
    for (int i = 0; i < 12; ++i) {
        state = controller.tick(0.05f, walk(1.0f, 0.0f));
    }
    EXPECT_LT(state.position.z, -1.0f);

    for (int i = 0; i < 60; ++i) {
        state = controller.tick(1.0f / 60.0f, still());
    }
    EXPECT_NEAR(state.position.y, 0.3f, 0.01f);
    EXPECT_TRUE(state.onGround);
}

TEST_F(PlayerControllerTest, CameraKeptOffWall) {
    // Low radius keeps the body sweep out of the way; the eye still clamps
    auto wall = std::make_shared<TriangleMesh>(
        TriangleMesh::box("wall", AABB(0.35f, 0.0f, -6.0f, 0.6f, 3.0f, 7.0f)));
    auto options = roomOptions({wall});
    options.sweep.enabled = false;
    PlayerController controller(scene, camera, events, options);

    // Eye radius is 0.15; the wall face is 0.05 away
    PlayerState state = controller.tick(1.0f / 60.0f, still());
    EXPECT_NEAR(state.position.x, 0.3f - 0.11f, 1e-3f);
}

TEST_F(PlayerControllerTest, ReplacingCollisionObjects) {
    PlayerController controller(scene, camera, events, roomOptions());
    auto wall = std::make_shared<TriangleMesh>(
        TriangleMesh::box("wall", AABB(-5.0f, 0.0f, -1.2f, 7.0f, 3.0f, -1.0f)));
    controller.setCollisionObjects({floor, wall});

    PlayerState state;
    for (int i = 0; i < 10; ++i) {
        state = controller.tick(0.1f, walk(1.0f, 0.0f));
    }
    EXPECT_NEAR(state.position.z, -0.69f, 1e-3f);
}

// ============================================================================
// Boundary
// ============================================================================

TEST_F(PlayerControllerTest, BoundaryKeepsRadiusInside) {
    auto options = roomOptions();
    options.boundary = BoundaryLimits{-1.0f, 1.0f, -2.0f, 2.0f};
    PlayerController controller(scene, camera, events, options);

    PlayerState state;
    for (int i = 0; i < 20; ++i) {
        state = controller.tick(0.1f, walk(1.0f, 1.0f));
    }
    EXPECT_NEAR(state.position.x, 0.7f, 1e-5f);
    EXPECT_NEAR(state.position.z, -1.7f, 1e-5f);
}

TEST_F(PlayerControllerTest, BoundarySidesAreIndependent) {
    auto options = roomOptions();
    BoundaryLimits limits;
    limits.maxX = 1.0f;
    options.boundary = limits;
    PlayerController controller(scene, camera, events, options);

    PlayerState state;
    for (int i = 0; i < 20; ++i) {
        state = controller.tick(0.1f, walk(1.0f, 1.0f));
    }
    EXPECT_NEAR(state.position.x, 0.7f, 1e-5f);
    EXPECT_LT(state.position.z, -2.0f);
}

// ============================================================================
// Head bob
// ============================================================================

TEST_F(PlayerControllerTest, HeadBobMovesViewpointOnly) {
    auto options = roomOptions();
    options.headBob.enabled = true;
    PlayerController controller(scene, camera, events, options);

    PlayerState state;
    for (int i = 0; i < 10; ++i) {
        state = controller.tick(1.0f / 60.0f, walk(1.0f, 0.0f));
    }
    EXPECT_NE(camera->position(), Vec3(0.0f));
    EXPECT_NEAR(state.position.y, 0.0f, 1e-5f);

    // Pad motion does not bob
    InputFrame pad = walk(1.0f, 0.0f);
    pad.keyboardMotion = false;
    controller.tick(1.0f / 60.0f, pad);
    EXPECT_EQ(camera->position(), Vec3(0.0f));
}

// ============================================================================
// Live input and scale
// ============================================================================

TEST_F(PlayerControllerTest, EventsDriveTick) {
    PlayerController controller(scene, camera, events, roomOptions());

    events.emit(KeyEvent{87, true});  // W
    PlayerState state = controller.tick(0.1f);
    EXPECT_EQ(state.position, Vec3(0.3f, 0.0f, 0.7f));

    events.emit(PointerLockChanged{true});
    EXPECT_TRUE(controller.isLocked());
    state = controller.tick(0.1f);
    EXPECT_NEAR(state.position.z, 0.2f, 1e-5f);
}

TEST_F(PlayerControllerTest, EyeHeightSetterClampsToHeight) {
    PlayerController controller(scene, camera, events, roomOptions());

    controller.setEyeHeight(1.2f);
    EXPECT_FLOAT_EQ(controller.hierarchy().eyeHeight(), 1.2f);
    EXPECT_NEAR(controller.eyePosition().y, 1.2f, 1e-5f);

    controller.setEyeHeight(5.0f);
    EXPECT_FLOAT_EQ(controller.playerConfig().eyeHeight, 1.8f);

    controller.setCollisionRadius(0.4f);
    EXPECT_FLOAT_EQ(controller.playerConfig().cameraCollisionRadius, 0.2f);

    controller.setDisableGravity(true);
    EXPECT_TRUE(controller.groundDetector().config().disableGravity);
}

// ============================================================================
// Teardown
// ============================================================================

TEST_F(PlayerControllerTest, TeardownRestoresViewpoint) {
    PlayerController controller(scene, camera, events, roomOptions());
    controller.tick(0.1f, walk(1.0f, 0.0f));

    controller.teardown();
    EXPECT_TRUE(controller.tornDown());
    EXPECT_EQ(camera->parent(), scene);
    EXPECT_EQ(scene->findChild("PlayerRoot"), nullptr);
    EXPECT_EQ(controller.input(), nullptr);
    EXPECT_FALSE(controller.isLocked());
    EXPECT_EQ(events.handlerCount<KeyEvent>(), 0u);
    EXPECT_EQ(floor.use_count(), 1);

    Vec3 before = controller.state().position;
    PlayerState state = controller.tick(0.1f, walk(1.0f, 0.0f));
    EXPECT_EQ(state.position, before);

    controller.teardown();
}

TEST_F(PlayerControllerTest, ControllersAreIndependent) {
    auto otherCamera = SceneNode::create("otherCamera");
    scene->addChild(otherCamera);
    InputEvents otherEvents;

    PlayerController a(scene, camera, events, roomOptions());
    PlayerController b(scene, otherCamera, otherEvents, roomOptions());

    a.tick(0.1f, walk(1.0f, 0.0f));
    EXPECT_NEAR(a.state().position.z, 0.2f, 1e-5f);
    EXPECT_EQ(b.state().position, Vec3(0.3f, 0.0f, 0.7f));
    EXPECT_EQ(b.state().frameIndex, 0u);
}
