#include "roamcam/geometry.hpp"

namespace roamcam {

// Threshold for treating a ray as parallel to a triangle plane
static constexpr float PARALLEL_EPSILON = 1e-9f;

// ============================================================================
// AABB implementation
// ============================================================================

AABB AABB::transformed(const Mat4& m) const {
    Vec3 corners[8] = {
        {min.x, min.y, min.z},
        {max.x, min.y, min.z},
        {min.x, max.y, min.z},
        {max.x, max.y, min.z},
        {min.x, min.y, max.z},
        {max.x, min.y, max.z},
        {min.x, max.y, max.z},
        {max.x, max.y, max.z}
    };

    AABB result = AABB::empty();
    for (const auto& corner : corners) {
        result.extend(Vec3(m * glm::vec4(corner, 1.0f)));
    }
    return result;
}

bool AABB::rayIntersect(const Vec3& origin, const Vec3& direction,
                        float maxT, float* tEntry) const {
    float tMin = 0.0f;
    float tMax = maxT;

    for (int axis = 0; axis < 3; ++axis) {
        if (std::abs(direction[axis]) < PARALLEL_EPSILON) {
            // Parallel to this slab: must already be inside it
            if (origin[axis] < min[axis] || origin[axis] > max[axis]) {
                return false;
            }
            continue;
        }

        float invD = 1.0f / direction[axis];
        float t0 = (min[axis] - origin[axis]) * invD;
        float t1 = (max[axis] - origin[axis]) * invD;
        if (t0 > t1) std::swap(t0, t1);

        tMin = std::max(tMin, t0);
        tMax = std::min(tMax, t1);
        if (tMin > tMax) {
            return false;
        }
    }

    if (tEntry) {
        *tEntry = tMin;
    }
    return true;
}

// ============================================================================
// Triangle intersection
// ============================================================================

bool rayIntersectTriangle(const Vec3& origin, const Vec3& direction,
                          const Vec3& v0, const Vec3& v1, const Vec3& v2,
                          float& outT) {
    Vec3 edge1 = v1 - v0;
    Vec3 edge2 = v2 - v0;

    Vec3 p = glm::cross(direction, edge2);
    float det = glm::dot(edge1, p);

    // Parallel or degenerate triangle
    if (std::abs(det) < PARALLEL_EPSILON) {
        return false;
    }

    float invDet = 1.0f / det;
    Vec3 s = origin - v0;
    float u = glm::dot(s, p) * invDet;
    if (u < 0.0f || u > 1.0f) {
        return false;
    }

    Vec3 q = glm::cross(s, edge1);
    float v = glm::dot(direction, q) * invDet;
    if (v < 0.0f || u + v > 1.0f) {
        return false;
    }

    float t = glm::dot(edge2, q) * invDet;
    if (t < 0.0f) {
        return false;
    }

    outT = t;
    return true;
}

}  // namespace roamcam
