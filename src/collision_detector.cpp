#include "roamcam/collision_detector.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace roamcam {

std::vector<Vec3> horizontalDirections(int count) {
    std::vector<Vec3> dirs;
    if (count <= 0) {
        return dirs;
    }
    dirs.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        float angle = TWO_PI * static_cast<float>(i) / static_cast<float>(count);
        dirs.emplace_back(std::cos(angle), 0.0f, std::sin(angle));
    }
    return dirs;
}

const std::vector<Vec3>& radialSphereDirections() {
    static const std::vector<Vec3> dirs = []() {
        std::vector<Vec3> result = horizontalDirections(RADIAL_HORIZONTAL_DIRECTIONS);
        result.emplace_back(0.0f, 1.0f, 0.0f);
        result.emplace_back(0.0f, -1.0f, 0.0f);

        const float e = 0.707106781f;  // 1/sqrt(2)
        for (int i = 0; i < RADIAL_DIAGONAL_DIRECTIONS; ++i) {
            float angle = TWO_PI * static_cast<float>(i) / static_cast<float>(RADIAL_DIAGONAL_DIRECTIONS);
            result.emplace_back(std::cos(angle) * e, e, std::sin(angle) * e);
            result.emplace_back(std::cos(angle) * e, -e, std::sin(angle) * e);
        }
        return result;
    }();
    return dirs;
}

// ============================================================================
// Primitive
// ============================================================================

std::optional<CollisionSample> CollisionDetector::probe(std::span<const TriangleMesh* const> meshes,
                                                        const Vec3& origin, const Vec3& direction,
                                                        float maxDistance) {
    Vec3 dir = safeNormalize(direction);
    if (dir == Vec3(0.0f) || maxDistance <= 0.0f) {
        return std::nullopt;
    }

    std::optional<CollisionSample> best;
    float bestDistance = maxDistance;

    for (const TriangleMesh* mesh : meshes) {
        if (!mesh) continue;
        auto hit = mesh->raycast(origin, dir, bestDistance);
        // Strictly closer wins, so earlier meshes keep ties
        if (hit && (!best || hit->distance < bestDistance)) {
            bestDistance = hit->distance;
            best = CollisionSample{hit->point, hit->distance, hit->normal, mesh};
        }
    }
    return best;
}

std::optional<CollisionSample> CollisionDetector::probe(const Vec3& origin, const Vec3& direction,
                                                        float maxDistance) const {
    return probe(candidates_, origin, direction, maxDistance);
}

std::vector<CollisionSample> CollisionDetector::probeAll(const Vec3& origin, const Vec3& direction,
                                                         float maxDistance) const {
    std::vector<CollisionSample> hits;
    Vec3 dir = safeNormalize(direction);
    if (dir == Vec3(0.0f) || maxDistance <= 0.0f) {
        return hits;
    }

    for (const TriangleMesh* mesh : candidates_) {
        if (!mesh) continue;
        if (auto hit = mesh->raycast(origin, dir, maxDistance)) {
            hits.push_back(CollisionSample{hit->point, hit->distance, hit->normal, mesh});
        }
    }

    std::stable_sort(hits.begin(), hits.end(), [](const CollisionSample& a, const CollisionSample& b) {
        return a.distance < b.distance;
    });
    return hits;
}

// ============================================================================
// Sphere-cast approximation
// ============================================================================

std::optional<SphereCastHit> CollisionDetector::sphereCast(const Vec3& center, float radius,
                                                           const Vec3& direction, float distance) const {
    Vec3 dir = safeNormalize(direction);
    if (dir == Vec3(0.0f)) {
        return radialSphereCast(center, distance);
    }

    // Basis spanning the disc that faces the direction of travel
    Vec3 perpX = glm::cross(dir, Vec3(0.0f, 1.0f, 0.0f));
    if (glm::dot(perpX, perpX) < 1e-4f) {
        perpX = Vec3(1.0f, 0.0f, 0.0f);
    }
    perpX = glm::normalize(perpX);
    Vec3 perpY = glm::normalize(glm::cross(dir, perpX));

    const float rayLength = distance + radius;
    std::optional<SphereCastHit> best;
    int sampleIndex = 0;
    int hitCount = 0;

    for (float fraction : SPHERE_CAST_RING_FRACTIONS) {
        float ringRadius = radius * fraction;
        int angles = (ringRadius > 0.0f) ? SPHERE_CAST_ANGLES : 1;

        for (int a = 0; a < angles; ++a) {
            float angle = TWO_PI * static_cast<float>(a) / static_cast<float>(SPHERE_CAST_ANGLES);
            Vec3 origin = center + perpX * (std::cos(angle) * ringRadius)
                                 + perpY * (std::sin(angle) * ringRadius);

            auto hit = probe(origin, dir, rayLength);
            if (hit) {
                ++hitCount;
                if (!best || hit->distance < best->sample.distance) {
                    SphereCastHit result;
                    result.sample = *hit;
                    result.rayOrigin = origin;
                    result.rayDirection = dir;
                    result.sampleIndex = sampleIndex;
                    best = result;
                }
            }
            ++sampleIndex;
        }
    }

    if (best) {
        best->hitCount = hitCount;
        best->rayCount = sampleIndex;
        if (debug_.sphereCast) {
            std::cerr << "[CollisionDetector] sphere-cast hits " << hitCount << "/" << sampleIndex
                      << " minDist " << best->sample.distance << " mesh '"
                      << (best->sample.mesh ? best->sample.mesh->name() : std::string("?")) << "'\n";
        }
    }
    return best;
}

std::optional<SphereCastHit> CollisionDetector::radialSphereCast(const Vec3& center, float distance) const {
    const auto& dirs = radialSphereDirections();
    std::optional<SphereCastHit> best;
    int hitCount = 0;

    for (size_t i = 0; i < dirs.size(); ++i) {
        auto hit = probe(center, dirs[i], distance);
        if (!hit) continue;
        ++hitCount;
        if (!best || hit->distance < best->sample.distance) {
            SphereCastHit result;
            result.sample = *hit;
            result.rayOrigin = center;
            result.rayDirection = dirs[i];
            result.sampleIndex = static_cast<int>(i);
            best = result;
        }
    }

    if (best) {
        best->hitCount = hitCount;
        best->rayCount = static_cast<int>(dirs.size());
    }
    return best;
}

// ============================================================================
// Radial probe
// ============================================================================

std::vector<RadialHit> CollisionDetector::radialProbe(const Vec3& origin, float maxDistance,
                                                      std::span<const Vec3> directions) const {
    std::vector<RadialHit> hits;
    for (size_t i = 0; i < directions.size(); ++i) {
        auto hit = probe(origin, directions[i], maxDistance);
        if (hit) {
            hits.push_back(RadialHit{*hit, safeNormalize(directions[i]), static_cast<int>(i)});
        }
    }
    return hits;
}

}  // namespace roamcam
