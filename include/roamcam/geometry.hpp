#pragma once

/**
 * @file geometry.hpp
 * @brief Vector aliases, axis-aligned boxes and ray helpers
 *
 * Shared math for the collision layer. All distances are in scene units.
 */

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace roamcam {

// ============================================================================
// GLM type aliases for convenience
// ============================================================================

using Vec3 = glm::vec3;
using Vec2 = glm::vec2;
using Mat4 = glm::mat4;

constexpr float PI = glm::pi<float>();
constexpr float TWO_PI = glm::two_pi<float>();

// Below this squared length a direction is treated as zero
constexpr float DIRECTION_EPSILON_SQ = 1e-8f;

// Normalize, or return zero for a (near) zero vector instead of NaN
[[nodiscard]] inline Vec3 safeNormalize(const Vec3& v) {
    float lenSq = glm::dot(v, v);
    if (lenSq <= DIRECTION_EPSILON_SQ) {
        return Vec3(0.0f);
    }
    return v / std::sqrt(lenSq);
}

[[nodiscard]] inline bool isFinite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

[[nodiscard]] inline float degreesToRadians(float deg) {
    return deg * PI / 180.0f;
}

// Wrap an angle into (-pi, pi]
[[nodiscard]] inline float wrapAngle(float radians) {
    float wrapped = std::remainder(radians, TWO_PI);
    if (wrapped <= -PI) {
        wrapped += TWO_PI;
    }
    return wrapped;
}

// ============================================================================
// AABB - Axis-Aligned Bounding Box
// ============================================================================

struct AABB {
    Vec3 min{0.0f};
    Vec3 max{0.0f};

    AABB() = default;
    AABB(const Vec3& min_, const Vec3& max_) : min(min_), max(max_) {}
    AABB(float minX, float minY, float minZ, float maxX, float maxY, float maxZ)
        : min(minX, minY, minZ), max(maxX, maxY, maxZ) {}

    // Inverted box that any point will grow
    [[nodiscard]] static AABB empty() {
        constexpr float inf = std::numeric_limits<float>::infinity();
        return AABB(Vec3(inf), Vec3(-inf));
    }

    [[nodiscard]] Vec3 center() const { return (min + max) * 0.5f; }
    [[nodiscard]] Vec3 size() const { return max - min; }

    [[nodiscard]] float minDimension() const {
        Vec3 s = size();
        return std::min({s.x, s.y, s.z});
    }

    [[nodiscard]] float maxDimension() const {
        Vec3 s = size();
        return std::max({s.x, s.y, s.z});
    }

    [[nodiscard]] bool contains(const Vec3& point) const {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y &&
               point.z >= min.z && point.z <= max.z;
    }

    // Grow to include a point
    void extend(const Vec3& point) {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    [[nodiscard]] AABB expanded(float amount) const {
        return AABB(min - Vec3(amount), max + Vec3(amount));
    }

    // Bounds of this box after an affine transform (all 8 corners)
    [[nodiscard]] AABB transformed(const Mat4& m) const;

    // Slab test. Returns true if the ray (origin + t*direction, t in [0, maxT])
    // touches the box; tEntry is the clamped entry parameter.
    [[nodiscard]] bool rayIntersect(const Vec3& origin, const Vec3& direction,
                                    float maxT, float* tEntry = nullptr) const;

    [[nodiscard]] bool isValid() const {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    bool operator==(const AABB& other) const {
        return min == other.min && max == other.max;
    }
};

// ============================================================================
// Triangle intersection
// ============================================================================

// Two-sided Moller-Trumbore test. direction need not be normalized; outT is
// the ray parameter, so with a unit direction it is the distance.
[[nodiscard]] bool rayIntersectTriangle(const Vec3& origin, const Vec3& direction,
                                        const Vec3& v0, const Vec3& v1, const Vec3& v2,
                                        float& outT);

}  // namespace roamcam
