#include "roamcam/penetration_tracker.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace roamcam {

// Distance reported when no sample hit anything
static constexpr float NO_HIT_DISTANCE = 9999.0f;

const char* penetrationPhaseName(PenetrationPhase phase) {
    switch (phase) {
        case PenetrationPhase::Clear:       return "clear";
        case PenetrationPhase::Penetrating: return "penetrating";
        case PenetrationPhase::Snapping:    return "snapping";
    }
    return "unknown";
}

void PenetrationTracker::reset() {
    penetratingFrames_ = 0;
    frameCount_ = 0;
    phase_ = PenetrationPhase::Clear;
}

PenetrationResult PenetrationTracker::update(const CollisionDetector& detector, const Vec3& rootPosition,
                                             float radius, float height) {
    ++frameCount_;

    PenetrationResult result;
    result.threshold = radius + config_.permissiveOffset;

    const Vec3 down(0.0f, -1.0f, 0.0f);
    const float rayLength = radius + config_.probeExtra;
    const float groundFilterHeight = config_.groundFilterFraction * height;
    float minDistance = NO_HIT_DISTANCE;

    for (float fraction : config_.sampleHeightFractions) {
        float sampleHeight = fraction * height;
        Vec3 origin = rootPosition + Vec3(0.0f, sampleHeight, 0.0f);

        for (const CollisionSample& hit : detector.probeAll(origin, down, rayLength)) {
            if (hit.distance < config_.minHitDistance) {
                continue;
            }
            // The floor directly under the feet is not a penetration
            bool downward = safeNormalize(origin - hit.point).y > 0.7f;
            if (hit.mesh && MeshFlags::isTrue(hit.mesh->flags().ground) &&
                sampleHeight < groundFilterHeight && downward) {
                if (debug_.filtering) {
                    std::cerr << "[PenetrationTracker] Ignoring ground hit on '" << hit.mesh->name()
                              << "' from sample height " << sampleHeight << "\n";
                }
                continue;
            }

            result.colliders.push_back(hit.mesh);
            minDistance = std::min(minDistance, hit.distance);
            break;  // probeAll is sorted; the first surviving hit is the closest
        }
    }

    result.minDistance = minDistance;
    result.minDistanceAdjusted = minDistance - config_.epsilon;
    result.penetrating = isPenetrating(minDistance, result.threshold);
    result.effectivelyPenetrating = result.penetrating &&
                                    frameCount_ > static_cast<uint64_t>(std::max(config_.skipFrames, 0));

    if (result.effectivelyPenetrating) {
        ++penetratingFrames_;
    } else {
        penetratingFrames_ = 0;
    }

    if (penetratingFrames_ >= config_.maxFramesBeforeSnap && penetratingFrames_ > 0) {
        result.snapDelta = trySnap(detector, rootPosition);
    }

    if (penetratingFrames_ == 0) {
        phase_ = PenetrationPhase::Clear;
    } else if (penetratingFrames_ < config_.maxFramesBeforeSnap) {
        phase_ = PenetrationPhase::Penetrating;
    } else {
        phase_ = PenetrationPhase::Snapping;
    }
    result.phase = phase_;

    if (debug_.penetration) {
        std::cerr << "[PenetrationTracker] frame " << frameCount_
                  << " minDist " << (minDistance >= NO_HIT_DISTANCE ? -1.0f : minDistance)
                  << " threshold " << result.threshold
                  << " penetrating " << result.penetrating
                  << " effective " << result.effectivelyPenetrating
                  << " phase " << penetrationPhaseName(phase_) << "\n";
    }

    return result;
}

std::optional<float> PenetrationTracker::trySnap(const CollisionDetector& detector, const Vec3& rootPosition) {
    Vec3 origin = rootPosition + Vec3(0.0f, config_.snapRayLift, 0.0f);
    auto hit = detector.probe(origin, Vec3(0.0f, -1.0f, 0.0f), config_.snapRayLength);
    if (!hit) {
        return std::nullopt;
    }

    float delta = hit->point.y - rootPosition.y;
    std::optional<float> applied;

    if (std::abs(delta) > config_.snapMinDelta) {
        applied = delta * config_.snapLerp;
        std::cerr << "[PenetrationTracker] Snap root toward ground, applying " << *applied << "\n";
    }

    if (std::abs(delta) < config_.settleDelta) {
        penetratingFrames_ = 0;
    }

    return applied;
}

}  // namespace roamcam
