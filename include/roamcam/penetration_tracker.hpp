#pragma once

/**
 * @file penetration_tracker.hpp
 * @brief Cross-frame penetration counter and corrective vertical snap
 *
 * State machine: Clear -> Penetrating -> Snapping -> Clear.
 *
 * Every call samples downward rays from several heights above the root.
 * If the closest hit (minus a small tolerance) is nearer than the player
 * radius the frame counts as penetrating. After enough consecutive
 * penetrating frames the tracker looks for the ground from above and
 * proposes a partial vertical correction each frame until the remaining
 * offset is negligible.
 *
 * All counters belong to the instance; several controllers never share
 * penetration state.
 */

#include "roamcam/collision_detector.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace roamcam {

enum class PenetrationPhase : uint8_t {
    Clear,
    Penetrating,
    Snapping
};

[[nodiscard]] const char* penetrationPhaseName(PenetrationPhase phase);

/// Tunable thresholds. The defaults are the values the controller was
/// tuned with; none of them is load-bearing on its own.
struct PenetrationConfig {
    float epsilon = 0.02f;              // Subtracted from the closest distance
    int maxFramesBeforeSnap = 6;        // Consecutive penetrating frames before snapping
    int skipFrames = 10;                // Calls after spawn forced non-penetrating
    float snapMinDelta = 0.05f;         // Ignore corrections smaller than this
    float snapLerp = 0.2f;              // Fraction of the correction applied per frame
    float settleDelta = 0.01f;          // Below this the snap is finished
    float permissiveOffset = 0.0f;      // Added to the threshold (negative = more permissive)

    // Sample heights above the root, as fractions of player height
    std::vector<float> sampleHeightFractions = {0.0556f, 0.2778f, 0.5556f, 0.8333f};

    float probeExtra = 2.0f;            // Sample ray length beyond the radius
    float minHitDistance = 0.01f;       // Hits closer than this are numerical noise
    float groundFilterFraction = 0.0833f;  // Below this sample height, downward ground hits are ignored
    float snapRayLift = 2.0f;           // Snap ray starts this far above the root
    float snapRayLength = 10.0f;
};

/// Outcome of one tracker update
struct PenetrationResult {
    bool penetrating = false;              // Raw test this frame
    bool effectivelyPenetrating = false;   // After the spawn grace period
    float minDistance = 0.0f;              // Closest sample distance (9999 if none)
    float minDistanceAdjusted = 0.0f;      // minDistance - epsilon
    float threshold = 0.0f;
    std::optional<float> snapDelta;        // Vertical correction to apply to the root
    PenetrationPhase phase = PenetrationPhase::Clear;
    std::vector<const TriangleMesh*> colliders;  // Meshes that produced samples
};

class PenetrationTracker {
public:
    PenetrationTracker() = default;
    explicit PenetrationTracker(PenetrationConfig config) : config_(std::move(config)) {}

    void setConfig(PenetrationConfig config) { config_ = std::move(config); }
    [[nodiscard]] const PenetrationConfig& config() const { return config_; }

    void setDebugFlags(const DebugFlags& flags) { debug_ = flags; }

    /// Run one frame of sampling.
    /// @param detector Collidable set
    /// @param rootPosition Player feet position (root translation)
    /// @param radius Player radius (the penetration threshold)
    /// @param height Player height (scales the sample heights)
    PenetrationResult update(const CollisionDetector& detector, const Vec3& rootPosition,
                             float radius, float height);

    /// Forget all history (respawn)
    void reset();

    [[nodiscard]] int penetratingFrames() const { return penetratingFrames_; }
    [[nodiscard]] uint64_t frameCount() const { return frameCount_; }
    [[nodiscard]] PenetrationPhase phase() const { return phase_; }

    /// Raw penetration test: minDistance - epsilon < threshold
    [[nodiscard]] bool isPenetrating(float minDistance, float threshold) const {
        return minDistance - config_.epsilon < threshold;
    }

private:
    std::optional<float> trySnap(const CollisionDetector& detector, const Vec3& rootPosition);

    PenetrationConfig config_;
    DebugFlags debug_;
    int penetratingFrames_ = 0;
    uint64_t frameCount_ = 0;
    PenetrationPhase phase_ = PenetrationPhase::Clear;
};

}  // namespace roamcam
