#pragma once

/**
 * @file ground_detector.hpp
 * @brief Vertical ground probe with step-height limiting
 *
 * A single ray is cast straight down from the eye against the ground subset.
 * A hit far above the feet is a wall top or a ceiling seen from below and is
 * rejected, so the player never teleports onto furniture or roofs.
 */

#include "roamcam/collision_detector.hpp"
#include <cstdint>
#include <optional>
#include <span>

namespace roamcam {

/// Rises within this of zero count as level ground
constexpr float GROUND_LEVEL_TOLERANCE = 1e-4f;

struct GroundConfig {
    float maxStepFraction = 0.35f;   // Max step-up as a fraction of player height
    float rayLength = 50.0f;
    float lerp = 0.1f;               // Per-frame smoothing of root Y toward the ground
    bool disableGravity = false;     // Only step up, never fall
};

/// Why a ground probe produced (or did not produce) a target height
enum class GroundOutcome : uint8_t {
    NoGround,       // Empty ground subset or nothing below
    TooHigh,        // Rise exceeds the step limit
    StepUp,         // Tolerance < rise <= step limit
    Descend,        // Surface at or below the feet (within tolerance)
    GravityOff      // Surface at or below the feet, but gravity is disabled
};

struct GroundProbe {
    GroundOutcome outcome = GroundOutcome::NoGround;
    std::optional<float> groundY;       // Surface height that was hit
    std::optional<float> targetY;       // Accepted root height, if any
};

class GroundDetector {
public:
    GroundDetector() = default;
    explicit GroundDetector(GroundConfig config) : config_(config) {}

    void setConfig(const GroundConfig& config) { config_ = config; }
    [[nodiscard]] const GroundConfig& config() const { return config_; }

    void setDebugFlags(const DebugFlags& flags) { debug_ = flags; }

    /// Maximum accepted rise for a player of the given height
    [[nodiscard]] float maxStep(float playerHeight) const { return config_.maxStepFraction * playerHeight; }

    /// Target root height, or nullopt if no acceptable ground exists
    [[nodiscard]] std::optional<float> detect(std::span<const TriangleMesh* const> ground,
                                              const Vec3& eyePosition, float rootY,
                                              float playerHeight);

    /// Same as detect() with the reason attached. A surface rejected as too
    /// high is logged once when the rejection starts.
    [[nodiscard]] GroundProbe probe(std::span<const TriangleMesh* const> ground,
                                    const Vec3& eyePosition, float rootY, float playerHeight);

    /// Times a too-high surface started blocking the player
    [[nodiscard]] uint64_t rejectionCount() const { return rejectionCount_; }

    /// Move current toward target by the configured lerp factor
    [[nodiscard]] float smooth(float current, float target) const {
        return current + (target - current) * config_.lerp;
    }

private:
    GroundConfig config_;
    DebugFlags debug_;
    bool rejecting_ = false;
    uint64_t rejectionCount_ = 0;
};

}  // namespace roamcam
