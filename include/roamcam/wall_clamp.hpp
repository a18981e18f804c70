#pragma once

/**
 * @file wall_clamp.hpp
 * @brief Keeps the eye position a minimum distance away from walls
 *
 * Probes a ring of horizontal directions around the eye. Anything inside the
 * camera radius is pushed out immediately; surfaces just outside it
 * contribute an averaged soft correction so the camera does not jitter
 * between two nearby walls.
 */

#include "roamcam/collision_detector.hpp"

namespace roamcam {

struct WallClampConfig {
    int directionCount = 16;
    float minDistanceFromWall = 0.01f;
};

struct WallClampResult {
    Vec3 position{0.0f};          // Corrected eye position
    int criticalHits = 0;         // Directions closer than the radius
    int softHits = 0;             // Directions within radius + margin
    Vec3 softCorrection{0.0f};    // Averaged soft push (already in position)

    [[nodiscard]] bool corrected() const { return criticalHits > 0 || softHits > 0; }
    [[nodiscard]] Vec3 offset(const Vec3& original) const { return position - original; }
};

class WallClamp {
public:
    WallClamp() : WallClamp(WallClampConfig{}) {}
    explicit WallClamp(WallClampConfig config);

    void setConfig(WallClampConfig config);
    [[nodiscard]] const WallClampConfig& config() const { return config_; }

    void setDebugFlags(const DebugFlags& flags) { debug_ = flags; }

    [[nodiscard]] WallClampResult clamp(const CollisionDetector& detector, const Vec3& position,
                                        float radius) const;

private:
    WallClampConfig config_;
    std::vector<Vec3> directions_;
    DebugFlags debug_;
};

}  // namespace roamcam
