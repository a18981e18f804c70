#pragma once

/**
 * @file player_controller.hpp
 * @brief First-person walking controller with collision against static meshes
 *
 * The controller owns the node chain injected above the renderer's
 * viewpoint and drives it once per frame through tick(). Each tick:
 *
 *   1. sample input (idle frame if no device is engaged)
 *   2. update yaw/pitch
 *   3. build a velocity on the yaw-only walking axes
 *   4. penetration check, then horizontal move (swept against walls)
 *   5. ground follow and camera wall clamp
 *   6. boundary clamp
 *   7. head bob on the viewpoint
 *
 * Single-threaded: construct, tick and tear down on the render thread.
 */

#include "roamcam/ground_detector.hpp"
#include "roamcam/head_bob.hpp"
#include "roamcam/input/input_aggregator.hpp"
#include "roamcam/mesh_classifier.hpp"
#include "roamcam/penetration_tracker.hpp"
#include "roamcam/transform_hierarchy.hpp"
#include "roamcam/wall_clamp.hpp"
#include <memory>
#include <optional>

namespace roamcam {

/// Pitch limit in radians (80 degrees)
constexpr float MAX_PITCH = 80.0f * PI / 180.0f;

/// Frames between "moving without colliders" warnings
constexpr uint64_t NO_COLLIDER_WARNING_INTERVAL = 60;

/// Root within this distance of the ground counts as standing on it
constexpr float ON_GROUND_TOLERANCE = 0.05f;

// ============================================================================
// Configuration
// ============================================================================

struct PlayerConfig {
    float radius = 0.3f;
    float height = 1.8f;
    float eyeHeight = 1.6f;
    float moveSpeed = 5.0f;
    bool disableGravity = false;

    float cameraCollisionFraction = 0.5f;   // Camera radius as a fraction of radius
    float cameraCollisionRadius = 0.15f;    // Derived

    /// Recompute derived fields
    void derive() { cameraCollisionRadius = radius * cameraCollisionFraction; }

    /// Copy with invalid values replaced by defaults (each one warned about)
    /// and derived fields recomputed
    [[nodiscard]] PlayerConfig sanitized() const;
};

/// Optional walkable rectangle; each side may be absent
struct BoundaryLimits {
    std::optional<float> minX;
    std::optional<float> maxX;
    std::optional<float> minZ;
    std::optional<float> maxZ;
};

/// Sphere-cast guard applied to horizontal motion
struct SweepConfig {
    bool enabled = true;
    /// Cast heights as fractions of player height. The lowest ring of the
    /// lowest cast stays above the step limit so steps remain climbable.
    std::vector<float> heightFractions = {0.44f, 0.62f, 0.8f};
    float radiusFraction = 0.5f;     // Cast disc radius as a fraction of radius
    float skin = 0.01f;              // Gap kept between the body and a wall
};

struct ControllerOptions {
    MeshList collisionObjects;
    std::optional<MeshList> groundObjects;
    std::shared_ptr<VirtualJoystick> virtualJoystick;
    TouchCapability touchCapability;
    std::shared_ptr<GamepadProvider> gamepadProvider;
    std::optional<BoundaryLimits> boundary;

    Vec3 initialPosition{0.0f, 0.0f, 5.0f};
    float initialYaw = 0.0f;

    PlayerConfig player;             // eyeHeight, radius, height, moveSpeed, disableGravity
    InputConfig input;
    PenetrationConfig penetration;
    GroundConfig ground;
    WallClampConfig wallClamp;
    bool wallClampEnabled = true;
    SweepConfig sweep;
    HeadBobConfig headBob;
    DebugFlags debug;
};

// ============================================================================
// State
// ============================================================================

struct PlayerState {
    Vec3 position{0.0f};              // Root translation (feet)
    float yaw = 0.0f;                 // Wrapped into (-pi, pi]
    float pitch = 0.0f;               // Clamped to +-MAX_PITCH
    Vec3 velocity{0.0f};              // This frame's requested displacement
    bool isMoving = false;
    bool onGround = false;
    PenetrationPhase penetrationPhase = PenetrationPhase::Clear;
    uint64_t frameIndex = 0;
};

// ============================================================================
// PlayerController
// ============================================================================

class PlayerController {
public:
    /// @throws std::invalid_argument if scene or viewpoint is null
    PlayerController(SceneNode::Ptr scene, SceneNode::Ptr viewpoint, InputEvents& events,
                     ControllerOptions options = {});
    ~PlayerController();

    PlayerController(const PlayerController&) = delete;
    PlayerController& operator=(const PlayerController&) = delete;

    // ========================================================================
    // Update
    // ========================================================================

    /// Process one frame using the attached input devices
    PlayerState tick(float dt);

    /// Process one frame with caller-supplied input
    PlayerState tick(float dt, const InputFrame& input);

    // ========================================================================
    // Output
    // ========================================================================

    /// Some input device is engaged (pointer captured, pad, touch mode)
    [[nodiscard]] bool isLocked() const;

    [[nodiscard]] const PlayerState& state() const { return state_; }
    [[nodiscard]] float yaw() const { return state_.yaw; }
    [[nodiscard]] float pitch() const { return state_.pitch; }
    [[nodiscard]] Vec3 forward() const { return TransformHierarchy::forward(state_.yaw); }
    [[nodiscard]] Vec3 right() const { return TransformHierarchy::right(state_.yaw); }
    [[nodiscard]] Vec3 eyePosition() const;

    // ========================================================================
    // World geometry
    // ========================================================================

    void setCollisionObjects(MeshList meshes);
    void setGroundObjects(std::optional<MeshList> meshes);
    void setBoundary(std::optional<BoundaryLimits> boundary) { boundary_ = std::move(boundary); }
    [[nodiscard]] const std::optional<BoundaryLimits>& boundary() const { return boundary_; }

    // ========================================================================
    // Spawn and scale
    // ========================================================================

    /// Move the root, re-apply eye height, forget penetration history and
    /// skip ground detection on the next tick
    void respawn(const Vec3& position, std::optional<float> yaw = std::nullopt);

    /// Face a new direction (does not move the player)
    void setInitialYaw(float yaw);

    void setPlayerConfig(const PlayerConfig& config);
    [[nodiscard]] const PlayerConfig& playerConfig() const { return player_; }

    void setEyeHeight(float eyeHeight);
    void setCollisionRadius(float radius);
    void setPlayerHeight(float height);
    void setMoveSpeed(float speed);
    void setDisableGravity(bool disable);

    // ========================================================================
    // Tuning
    // ========================================================================

    void setDebugFlags(const DebugFlags& flags);
    [[nodiscard]] const DebugFlags& debugFlags() const { return debug_; }

    void setPenetrationConfig(PenetrationConfig config) { penetration_.setConfig(std::move(config)); }
    void setGroundConfig(const GroundConfig& config);
    void setWallClamp(bool enabled, const WallClampConfig& config);
    void setSweepConfig(SweepConfig config) { sweep_ = std::move(config); }
    void setHeadBobConfig(const HeadBobConfig& config) { headBob_.setConfig(config); }
    void setInputConfig(const InputConfig& config);
    void setVirtualJoystick(std::shared_ptr<VirtualJoystick> joystick);

    // ========================================================================
    // Components
    // ========================================================================

    [[nodiscard]] TransformHierarchy& hierarchy() { return hierarchy_; }
    [[nodiscard]] MeshClassifier& classifier() { return classifier_; }
    [[nodiscard]] const PenetrationTracker& penetration() const { return penetration_; }
    [[nodiscard]] const GroundDetector& groundDetector() const { return ground_; }
    [[nodiscard]] const HeadBob& headBob() const { return headBob_; }

    /// Input devices, or nullptr after teardown
    [[nodiscard]] InputAggregator* input() { return input_.get(); }

    /// Skip ground detection on the next tick
    [[nodiscard]] bool groundSkipPending() const { return skipGroundOnce_; }

    // ========================================================================
    // Teardown
    // ========================================================================

    /// Hand the viewpoint back, drop event subscriptions and geometry.
    /// Later ticks do nothing. Safe to call twice.
    void teardown();
    [[nodiscard]] bool tornDown() const { return tornDown_; }

private:
    void applyConfig();
    void moveHorizontally(const CollisionDetector& detector, const Vec3& displacement);
    [[nodiscard]] float sweepAllowed(const CollisionDetector& detector, const Vec3& root,
                                     const Vec3& direction, float distance, Vec3* hitNormal) const;
    void followGround(float rootY);
    void clampCamera(const CollisionDetector& detector);
    void clampToBoundary();

    PlayerConfig player_;
    DebugFlags debug_;
    TransformHierarchy hierarchy_;
    std::unique_ptr<InputAggregator> input_;
    MeshClassifier classifier_;
    PenetrationTracker penetration_;
    GroundDetector ground_;
    WallClamp wallClamp_;
    bool wallClampEnabled_ = true;
    SweepConfig sweep_;
    HeadBob headBob_;
    std::optional<BoundaryLimits> boundary_;

    PlayerState state_;
    bool skipGroundOnce_ = true;
    bool tornDown_ = false;
};

}  // namespace roamcam
