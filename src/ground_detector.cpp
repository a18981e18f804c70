#include "roamcam/ground_detector.hpp"
#include <iostream>

namespace roamcam {

GroundProbe GroundDetector::probe(std::span<const TriangleMesh* const> ground,
                                  const Vec3& eyePosition, float rootY, float playerHeight) {
    GroundProbe result;
    if (ground.empty()) {
        rejecting_ = false;
        return result;
    }

    auto hit = CollisionDetector::probe(ground, eyePosition, Vec3(0.0f, -1.0f, 0.0f), config_.rayLength);
    if (!hit) {
        if (debug_.ground) {
            std::cerr << "[GroundDetector] No ground below (" << eyePosition.x << ", "
                      << eyePosition.z << ")\n";
        }
        rejecting_ = false;
        return result;
    }

    float groundY = hit->point.y;
    float rise = groundY - rootY;
    float limit = maxStep(playerHeight);
    result.groundY = groundY;

    if (rise > limit) {
        result.outcome = GroundOutcome::TooHigh;
        if (!rejecting_ || debug_.ground) {
            std::cerr << "[GroundDetector] Ignoring surface '"
                      << (hit->mesh ? hit->mesh->name() : std::string("?")) << "' rise " << rise
                      << " > max step " << limit << "\n";
        }
        if (!rejecting_) {
            rejecting_ = true;
            ++rejectionCount_;
        }
        return result;
    }
    rejecting_ = false;

    if (rise > GROUND_LEVEL_TOLERANCE) {
        result.outcome = GroundOutcome::StepUp;
        result.targetY = groundY;
        return result;
    }

    if (config_.disableGravity) {
        result.outcome = GroundOutcome::GravityOff;
        return result;
    }

    result.outcome = GroundOutcome::Descend;
    result.targetY = groundY;
    return result;
}

std::optional<float> GroundDetector::detect(std::span<const TriangleMesh* const> ground,
                                            const Vec3& eyePosition, float rootY,
                                            float playerHeight) {
    return probe(ground, eyePosition, rootY, playerHeight).targetY;
}

}  // namespace roamcam
