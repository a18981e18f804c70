#include "roamcam/player_controller.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace roamcam {

// ============================================================================
// PlayerConfig
// ============================================================================

namespace {

// Grazing hits are treated as if the wall faced the motion at this cosine
constexpr float MIN_SWEEP_FACING = 0.25f;

void replaceIfNotPositive(float& value, float fallback, const char* name) {
    if (std::isfinite(value) && value > 0.0f) {
        return;
    }
    std::cerr << "[PlayerController] Warning: invalid " << name << " (" << value
              << "), using " << fallback << "\n";
    value = fallback;
}

}  // namespace

PlayerConfig PlayerConfig::sanitized() const {
    const PlayerConfig defaults;
    PlayerConfig c = *this;

    replaceIfNotPositive(c.radius, defaults.radius, "radius");
    replaceIfNotPositive(c.height, defaults.height, "height");
    replaceIfNotPositive(c.moveSpeed, defaults.moveSpeed, "move speed");
    replaceIfNotPositive(c.eyeHeight, std::min(defaults.eyeHeight, c.height), "eye height");
    replaceIfNotPositive(c.cameraCollisionFraction, defaults.cameraCollisionFraction,
                         "camera collision fraction");

    if (c.eyeHeight > c.height) {
        std::cerr << "[PlayerController] Warning: eye height " << c.eyeHeight
                  << " above player height " << c.height << ", clamping\n";
        c.eyeHeight = c.height;
    }

    c.derive();
    return c;
}

// ============================================================================
// Construction and teardown
// ============================================================================

PlayerController::PlayerController(SceneNode::Ptr scene, SceneNode::Ptr viewpoint, InputEvents& events,
                                   ControllerOptions options)
    : player_(options.player.sanitized())
    , debug_(options.debug)
    , hierarchy_(std::move(scene), std::move(viewpoint), player_.eyeHeight)
    , input_(std::make_unique<InputAggregator>(events, options.gamepadProvider, options.virtualJoystick,
                                               options.touchCapability, options.input))
    , penetration_(options.penetration)
    , ground_(options.ground)
    , wallClamp_(options.wallClamp)
    , wallClampEnabled_(options.wallClampEnabled)
    , sweep_(options.sweep)
    , headBob_(options.headBob)
    , boundary_(options.boundary)
{
    setDebugFlags(debug_);
    classifier_.setCollisionObjects(std::move(options.collisionObjects));
    classifier_.setGroundObjects(std::move(options.groundObjects));
    applyConfig();
    respawn(options.initialPosition, options.initialYaw);
}

PlayerController::~PlayerController() {
    teardown();
}

void PlayerController::teardown() {
    if (tornDown_) {
        return;
    }
    tornDown_ = true;
    hierarchy_.teardown();
    input_.reset();
    classifier_.clear();
}

// ============================================================================
// Update
// ============================================================================

PlayerState PlayerController::tick(float dt) {
    if (tornDown_) {
        return state_;
    }
    InputFrame frame = input_->sample(dt);
    return tick(dt, frame);
}

PlayerState PlayerController::tick(float dt, const InputFrame& input) {
    if (tornDown_) {
        return state_;
    }
    if (!std::isfinite(dt) || dt < 0.0f) {
        dt = 0.0f;
    }

    ++state_.frameIndex;
    const InputFrame in = input.active ? input : InputFrame::idle();

    // Rotation: yaw and pitch on their own nodes
    state_.yaw = wrapAngle(state_.yaw + in.look.yaw);
    state_.pitch = std::clamp(state_.pitch + in.look.pitch, -MAX_PITCH, MAX_PITCH);
    hierarchy_.applyRotation(state_.yaw, state_.pitch);

    // Velocity on the yaw-only walking plane; diagonals never exceed speed
    Vec3 velocity(0.0f);
    if (!in.move.isZero()) {
        Vec3 dir = safeNormalize(forward() * in.move.forward + right() * in.move.right);
        velocity = dir * (player_.moveSpeed * in.speedScale * dt);
    }
    state_.velocity = velocity;
    state_.isMoving = glm::dot(velocity, velocity) > 0.0f;

    auto collidable = classifier_.collidable();
    CollisionDetector detector(collidable);
    detector.setDebugFlags(debug_);

    if (state_.isMoving) {
        Vec3 horizontal(velocity.x, 0.0f, velocity.z);
        if (!collidable.empty()) {
            auto result = penetration_.update(detector, hierarchy_.rootPosition(),
                                              player_.radius, player_.height);
            if (result.snapDelta) {
                hierarchy_.applyTranslation(Vec3(0.0f, *result.snapDelta, 0.0f));
            }
            if (!result.effectivelyPenetrating) {
                moveHorizontally(detector, horizontal);
            }
        } else {
            if (state_.frameIndex % NO_COLLIDER_WARNING_INTERVAL == 0) {
                std::cerr << "[PlayerController] Warning: moving with no collision objects; "
                             "collisions are disabled\n";
            }
            hierarchy_.applyTranslation(horizontal);
        }
    }
    state_.penetrationPhase = penetration_.phase();

    if (skipGroundOnce_) {
        skipGroundOnce_ = false;
        std::cerr << "[PlayerController] Skipping ground detection on first frame after spawn\n";
    } else {
        followGround(hierarchy_.rootPosition().y);
    }

    if (wallClampEnabled_ && !collidable.empty()) {
        clampCamera(detector);
    }

    clampToBoundary();

    int strafe = 0;
    if (in.keyboardMotion) {
        strafe = (in.move.right > 0.0f) - (in.move.right < 0.0f);
    }
    const BobPose& pose = headBob_.update(dt, state_.isMoving && in.keyboardMotion, strafe);
    hierarchy_.setViewpointOffset(pose.offset, pose.roll);

    state_.position = hierarchy_.rootPosition();
    return state_;
}

// ============================================================================
// Movement helpers
// ============================================================================

float PlayerController::sweepAllowed(const CollisionDetector& detector, const Vec3& root,
                                     const Vec3& direction, float distance, Vec3* hitNormal) const {
    const float castRadius = player_.radius * sweep_.radiusFraction;
    const float reach = distance + player_.radius + sweep_.skin - castRadius;
    float allowed = distance;

    for (float fraction : sweep_.heightFractions) {
        Vec3 center = root + Vec3(0.0f, fraction * player_.height, 0.0f);
        auto hit = detector.sphereCast(center, castRadius, direction, reach);
        if (!hit) continue;

        // Keep radius + skin measured along the wall normal, not along the ray
        float facing = std::max(-glm::dot(direction, hit->sample.normal), MIN_SWEEP_FACING);
        float travel = std::max(0.0f, hit->sample.distance - (player_.radius + sweep_.skin) / facing);
        if (travel < allowed) {
            allowed = travel;
            if (hitNormal) {
                *hitNormal = hit->sample.normal;
            }
        }
    }
    return allowed;
}

void PlayerController::moveHorizontally(const CollisionDetector& detector, const Vec3& displacement) {
    float distance = glm::length(displacement);
    if (distance <= 0.0f) {
        return;
    }
    if (!sweep_.enabled) {
        hierarchy_.applyTranslation(displacement);
        return;
    }

    Vec3 dir = displacement / distance;
    Vec3 normal(0.0f);
    float allowed = sweepAllowed(detector, hierarchy_.rootPosition(), dir, distance, &normal);
    hierarchy_.applyTranslation(dir * allowed);

    if (allowed >= distance) {
        return;
    }

    // Slide the blocked remainder along the wall, once
    Vec3 remaining = dir * (distance - allowed);
    Vec3 wallNormal = safeNormalize(Vec3(normal.x, 0.0f, normal.z));
    Vec3 slide = remaining - wallNormal * glm::dot(remaining, wallNormal);
    float slideLength = glm::length(slide);

    if (debug_.sphereCast) {
        std::cerr << "[PlayerController] Blocked after " << allowed << " of " << distance
                  << ", sliding " << slideLength << "\n";
    }

    if (slideLength <= 1e-5f) {
        return;
    }
    Vec3 slideDir = slide / slideLength;
    float slideAllowed = sweepAllowed(detector, hierarchy_.rootPosition(), slideDir, slideLength, nullptr);
    hierarchy_.applyTranslation(slideDir * slideAllowed);
}

void PlayerController::followGround(float rootY) {
    Vec3 root = hierarchy_.rootPosition();
    Vec3 eye = root + Vec3(0.0f, player_.eyeHeight, 0.0f);
    GroundProbe probe = ground_.probe(classifier_.ground(), eye, rootY, player_.height);

    if (probe.targetY) {
        root.y = ground_.smooth(root.y, *probe.targetY);
        hierarchy_.setRootPosition(root);
    }
    state_.onGround = probe.groundY.has_value() && probe.outcome != GroundOutcome::TooHigh &&
                      std::abs(root.y - *probe.groundY) <= ON_GROUND_TOLERANCE;
}

void PlayerController::clampCamera(const CollisionDetector& detector) {
    Vec3 eye = hierarchy_.eyePosition();
    WallClampResult result = wallClamp_.clamp(detector, eye, player_.cameraCollisionRadius);
    if (!result.corrected()) {
        return;
    }
    Vec3 offset = result.offset(eye);
    hierarchy_.applyTranslation(Vec3(offset.x, 0.0f, offset.z));
}

void PlayerController::clampToBoundary() {
    if (!boundary_) {
        return;
    }
    const float margin = player_.radius;
    Vec3 root = hierarchy_.rootPosition();
    if (boundary_->minX) root.x = std::max(*boundary_->minX + margin, root.x);
    if (boundary_->maxX) root.x = std::min(*boundary_->maxX - margin, root.x);
    if (boundary_->minZ) root.z = std::max(*boundary_->minZ + margin, root.z);
    if (boundary_->maxZ) root.z = std::min(*boundary_->maxZ - margin, root.z);
    hierarchy_.setRootPosition(root);
}

// ============================================================================
// Queries
// ============================================================================

bool PlayerController::isLocked() const {
    return input_ && input_->isActive();
}

Vec3 PlayerController::eyePosition() const {
    return hierarchy_.rootPosition() + Vec3(0.0f, player_.eyeHeight, 0.0f);
}

// ============================================================================
// Geometry, spawn and configuration
// ============================================================================

void PlayerController::setCollisionObjects(MeshList meshes) {
    std::cerr << "[PlayerController] Collision objects updated: " << meshes.size() << "\n";
    classifier_.setCollisionObjects(std::move(meshes));
}

void PlayerController::setGroundObjects(std::optional<MeshList> meshes) {
    classifier_.setGroundObjects(std::move(meshes));
}

void PlayerController::respawn(const Vec3& position, std::optional<float> yaw) {
    hierarchy_.setRootPosition(position);
    hierarchy_.setEyeHeight(player_.eyeHeight);
    headBob_.reset();
    hierarchy_.setViewpointOffset(Vec3(0.0f), 0.0f);
    penetration_.reset();
    skipGroundOnce_ = true;
    if (yaw) {
        setInitialYaw(*yaw);
    }
    state_.position = position;
    state_.velocity = Vec3(0.0f);
    state_.isMoving = false;
    state_.penetrationPhase = PenetrationPhase::Clear;

    std::cerr << "[PlayerController] Spawn at (" << position.x << ", " << position.y << ", "
              << position.z << "), eye height " << player_.eyeHeight << "\n";
}

void PlayerController::setInitialYaw(float yaw) {
    state_.yaw = wrapAngle(yaw);
    hierarchy_.applyRotation(state_.yaw, state_.pitch);
}

void PlayerController::setPlayerConfig(const PlayerConfig& config) {
    player_ = config.sanitized();
    applyConfig();
}

void PlayerController::applyConfig() {
    hierarchy_.setEyeHeight(player_.eyeHeight);

    GroundConfig ground = ground_.config();
    ground.disableGravity = player_.disableGravity;
    ground_.setConfig(ground);
}

void PlayerController::setEyeHeight(float eyeHeight) {
    PlayerConfig c = player_;
    c.eyeHeight = eyeHeight;
    setPlayerConfig(c);
}

void PlayerController::setCollisionRadius(float radius) {
    PlayerConfig c = player_;
    c.radius = radius;
    setPlayerConfig(c);
}

void PlayerController::setPlayerHeight(float height) {
    PlayerConfig c = player_;
    c.height = height;
    setPlayerConfig(c);
}

void PlayerController::setMoveSpeed(float speed) {
    PlayerConfig c = player_;
    c.moveSpeed = speed;
    setPlayerConfig(c);
}

void PlayerController::setDisableGravity(bool disable) {
    PlayerConfig c = player_;
    c.disableGravity = disable;
    setPlayerConfig(c);
}

void PlayerController::setDebugFlags(const DebugFlags& flags) {
    debug_ = flags;
    classifier_.setDebugFlags(flags);
    penetration_.setDebugFlags(flags);
    ground_.setDebugFlags(flags);
    wallClamp_.setDebugFlags(flags);
}

void PlayerController::setGroundConfig(const GroundConfig& config) {
    GroundConfig c = config;
    c.disableGravity = player_.disableGravity;
    ground_.setConfig(c);
}

void PlayerController::setWallClamp(bool enabled, const WallClampConfig& config) {
    wallClampEnabled_ = enabled;
    wallClamp_.setConfig(config);
}

void PlayerController::setInputConfig(const InputConfig& config) {
    if (input_) {
        input_->setConfig(config);
    }
}

void PlayerController::setVirtualJoystick(std::shared_ptr<VirtualJoystick> joystick) {
    if (input_) {
        input_->setJoystick(std::move(joystick));
    }
}

}  // namespace roamcam
