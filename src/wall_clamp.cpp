#include "roamcam/wall_clamp.hpp"
#include <iostream>

namespace roamcam {

WallClamp::WallClamp(WallClampConfig config) {
    setConfig(config);
}

void WallClamp::setConfig(WallClampConfig config) {
    if (config.directionCount < 1) {
        config.directionCount = WallClampConfig{}.directionCount;
    }
    config_ = config;
    directions_ = horizontalDirections(config_.directionCount);
}

WallClampResult WallClamp::clamp(const CollisionDetector& detector, const Vec3& position,
                                 float radius) const {
    WallClampResult result;
    result.position = position;
    if (detector.empty() || radius <= 0.0f) {
        return result;
    }

    const float margin = config_.minDistanceFromWall;
    const float reach = radius + margin;
    Vec3 softSum(0.0f);

    // Probes start from the already-corrected position so a push out of
    // one wall is visible to the directions that follow
    for (const Vec3& dir : directions_) {
        auto hit = detector.probe(result.position, dir, reach);
        if (!hit) continue;

        float d = hit->distance;
        if (d < radius) {
            result.position -= dir * (radius - d + margin);
            ++result.criticalHits;
        } else if (d < reach) {
            softSum -= dir * (reach - d);
            ++result.softHits;
        }
    }

    if (result.softHits > 0) {
        result.softCorrection = softSum / static_cast<float>(result.softHits);
        result.position += result.softCorrection;
    }

    if (debug_.proximity && result.corrected()) {
        std::cerr << "[WallClamp] critical " << result.criticalHits << " soft " << result.softHits
                  << " offset (" << result.position.x - position.x << ", "
                  << result.position.z - position.z << ")\n";
    }

    return result;
}

}  // namespace roamcam
