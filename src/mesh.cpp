#include "roamcam/mesh.hpp"

namespace roamcam {

// ============================================================================
// MeshFlags
// ============================================================================

MeshFlags MeshFlags::fromMetadata(const MeshMetadata& metadata) {
    MeshFlags flags;
    auto read = [&metadata](const char* key) -> std::optional<bool> {
        auto it = metadata.find(key);
        if (it == metadata.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    flags.trigger = read("trigger");
    flags.particle = read("particle");
    flags.light = read("light");
    flags.decorative = read("decorative");
    flags.noCollision = read("noCollision");
    flags.solid = read("solid");
    flags.collidable = read("collidable");
    flags.ground = read("ground");
    return flags;
}

// ============================================================================
// TriangleMesh
// ============================================================================

TriangleMesh::TriangleMesh(std::string name, std::vector<Vec3> vertices, std::vector<uint32_t> indices)
    : name_(std::move(name)), vertices_(std::move(vertices)), indices_(std::move(indices)) {
    // Drop a trailing partial triangle rather than reading past the end
    indices_.resize(indices_.size() - indices_.size() % 3);
}

TriangleMesh TriangleMesh::box(std::string name, const AABB& b) {
    std::vector<Vec3> v = {
        {b.min.x, b.min.y, b.min.z},  // 0
        {b.max.x, b.min.y, b.min.z},  // 1
        {b.max.x, b.max.y, b.min.z},  // 2
        {b.min.x, b.max.y, b.min.z},  // 3
        {b.min.x, b.min.y, b.max.z},  // 4
        {b.max.x, b.min.y, b.max.z},  // 5
        {b.max.x, b.max.y, b.max.z},  // 6
        {b.min.x, b.max.y, b.max.z}   // 7
    };
    std::vector<uint32_t> idx = {
        0, 2, 1,  0, 3, 2,   // -Z
        4, 5, 6,  4, 6, 7,   // +Z
        0, 4, 7,  0, 7, 3,   // -X
        1, 2, 6,  1, 6, 5,   // +X
        0, 1, 5,  0, 5, 4,   // -Y
        3, 7, 6,  3, 6, 2    // +Y
    };
    TriangleMesh mesh(std::move(name), std::move(v), std::move(idx));
    mesh.setBounds(b);
    return mesh;
}

TriangleMesh TriangleMesh::floorQuad(std::string name, float minX, float maxX,
                                     float minZ, float maxZ, float y) {
    std::vector<Vec3> v = {
        {minX, y, minZ},
        {maxX, y, minZ},
        {maxX, y, maxZ},
        {minX, y, maxZ}
    };
    std::vector<uint32_t> idx = {0, 2, 1, 0, 3, 2};
    TriangleMesh mesh(std::move(name), std::move(v), std::move(idx));
    mesh.setBounds(AABB(minX, y, minZ, maxX, y, maxZ));
    mesh.setNormals({Vec3(0, 1, 0), Vec3(0, 1, 0), Vec3(0, 1, 0), Vec3(0, 1, 0)});
    return mesh;
}

void TriangleMesh::setTransform(const Mat4& transform) {
    transform_ = transform;
    inverseTransform_ = glm::inverse(transform);
    identityTransform_ = (transform == Mat4(1.0f));
    worldBoundsValid_ = false;
}

void TriangleMesh::computeBounds() {
    AABB b = AABB::empty();
    for (const auto& v : vertices_) {
        b.extend(v);
    }
    if (vertices_.empty()) {
        b = AABB();
    }
    bounds_ = b;
    worldBoundsValid_ = false;
}

void TriangleMesh::computeNormals() {
    normals_.assign(vertices_.size(), Vec3(0.0f));

    // Area-weighted face normals accumulated per vertex
    for (size_t i = 0; i + 2 < indices_.size(); i += 3) {
        uint32_t a = indices_[i], b = indices_[i + 1], c = indices_[i + 2];
        if (a >= vertices_.size() || b >= vertices_.size() || c >= vertices_.size()) {
            continue;
        }
        Vec3 faceNormal = glm::cross(vertices_[b] - vertices_[a], vertices_[c] - vertices_[a]);
        normals_[a] += faceNormal;
        normals_[b] += faceNormal;
        normals_[c] += faceNormal;
    }

    for (auto& n : normals_) {
        n = safeNormalize(n);
        if (n == Vec3(0.0f)) {
            n = Vec3(0.0f, 1.0f, 0.0f);
        }
    }
}

AABB TriangleMesh::worldBounds() {
    if (!bounds_) {
        computeBounds();
    }
    return static_cast<const TriangleMesh&>(*this).worldBounds();
}

AABB TriangleMesh::worldBounds() const {
    if (worldBoundsValid_) {
        return worldBounds_;
    }

    AABB local;
    if (bounds_) {
        local = *bounds_;
    } else {
        local = AABB::empty();
        for (const auto& v : vertices_) {
            local.extend(v);
        }
    }

    worldBounds_ = identityTransform_ ? local : local.transformed(transform_);
    worldBoundsValid_ = true;
    return worldBounds_;
}

std::optional<TriangleMesh::RayHit> TriangleMesh::raycast(const Vec3& origin, const Vec3& direction,
                                                          float maxDistance) const {
    if (indices_.empty() || maxDistance <= 0.0f) {
        return std::nullopt;
    }

    // Broadphase against world bounds
    if (!worldBounds().expanded(1e-4f).rayIntersect(origin, direction, maxDistance)) {
        return std::nullopt;
    }

    // Test in local space. The direction keeps its scale, so the ray
    // parameter is still the world-space distance along the unit direction.
    Vec3 localOrigin = origin;
    Vec3 localDir = direction;
    if (!identityTransform_) {
        localOrigin = Vec3(inverseTransform_ * glm::vec4(origin, 1.0f));
        localDir = Vec3(inverseTransform_ * glm::vec4(direction, 0.0f));
    }

    std::optional<RayHit> best;
    float bestT = maxDistance;

    for (size_t i = 0; i + 2 < indices_.size(); i += 3) {
        uint32_t a = indices_[i], b = indices_[i + 1], c = indices_[i + 2];
        if (a >= vertices_.size() || b >= vertices_.size() || c >= vertices_.size()) {
            continue;
        }

        float t = 0.0f;
        if (!rayIntersectTriangle(localOrigin, localDir, vertices_[a], vertices_[b], vertices_[c], t)) {
            continue;
        }
        if (t > bestT) {
            continue;
        }

        bestT = t;
        RayHit hit;
        hit.distance = t;
        hit.point = origin + direction * t;
        hit.triangle = static_cast<uint32_t>(i / 3);

        Vec3 n = glm::cross(vertices_[b] - vertices_[a], vertices_[c] - vertices_[a]);
        if (!identityTransform_) {
            n = Vec3(glm::transpose(inverseTransform_) * glm::vec4(n, 0.0f));
        }
        n = safeNormalize(n);
        if (glm::dot(n, direction) > 0.0f) {
            n = -n;
        }
        hit.normal = n;
        best = hit;
    }

    return best;
}

}  // namespace roamcam
