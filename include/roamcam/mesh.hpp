#pragma once

/**
 * @file mesh.hpp
 * @brief Static triangle geometry and the classification flags attached to it
 *
 * Meshes are produced and tagged by the scene loader. The controller only
 * reads their triangles and flags, and lazily fills in bounds and normals
 * that the loader left out.
 */

#include "roamcam/geometry.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace roamcam {

/// Generic per-object metadata bag as delivered by the scene loader
using MeshMetadata = std::unordered_map<std::string, bool>;

// ============================================================================
// MeshFlags - Tri-state classification flags
// ============================================================================

/**
 * @brief Classification flags for a mesh
 *
 * Every flag is tri-state: unset, true or false. Only an explicit value
 * changes behaviour, so an untagged mesh is a collision candidate.
 */
struct MeshFlags {
    std::optional<bool> trigger;
    std::optional<bool> particle;
    std::optional<bool> light;
    std::optional<bool> decorative;
    std::optional<bool> noCollision;
    std::optional<bool> solid;
    std::optional<bool> collidable;
    std::optional<bool> ground;

    /// Read the recognized keys from a metadata bag; other keys are ignored
    [[nodiscard]] static MeshFlags fromMetadata(const MeshMetadata& metadata);

    [[nodiscard]] static bool isTrue(const std::optional<bool>& flag) {
        return flag.has_value() && *flag;
    }
    [[nodiscard]] static bool isFalse(const std::optional<bool>& flag) {
        return flag.has_value() && !*flag;
    }
};

// ============================================================================
// TriangleMesh - Indexed triangle geometry with a world transform
// ============================================================================

class TriangleMesh {
public:
    TriangleMesh() = default;
    TriangleMesh(std::string name, std::vector<Vec3> vertices, std::vector<uint32_t> indices);

    // ========================================================================
    // Standard shapes (world-space, identity transform)
    // ========================================================================

    /// Closed axis-aligned box
    [[nodiscard]] static TriangleMesh box(std::string name, const AABB& bounds);

    /// Horizontal rectangle at height y, facing up
    [[nodiscard]] static TriangleMesh floorQuad(std::string name, float minX, float maxX,
                                                float minZ, float maxZ, float y);

    // ========================================================================
    // Identity and flags
    // ========================================================================

    [[nodiscard]] const std::string& name() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    [[nodiscard]] const MeshFlags& flags() const { return flags_; }
    void setFlags(const MeshFlags& flags) { flags_ = flags; }
    void setMetadata(const MeshMetadata& metadata) { flags_ = MeshFlags::fromMetadata(metadata); }

    // ========================================================================
    // Geometry
    // ========================================================================

    [[nodiscard]] const std::vector<Vec3>& vertices() const { return vertices_; }
    [[nodiscard]] const std::vector<uint32_t>& indices() const { return indices_; }
    [[nodiscard]] size_t triangleCount() const { return indices_.size() / 3; }

    [[nodiscard]] const Mat4& transform() const { return transform_; }
    void setTransform(const Mat4& transform);

    /// Local-space bounds, if computed or supplied
    [[nodiscard]] const std::optional<AABB>& bounds() const { return bounds_; }
    [[nodiscard]] bool hasBounds() const { return bounds_.has_value(); }
    void setBounds(const AABB& bounds) { bounds_ = bounds; worldBoundsValid_ = false; }
    void computeBounds();

    /// Per-vertex normals, if computed or supplied
    [[nodiscard]] const std::vector<Vec3>& normals() const { return normals_; }
    [[nodiscard]] bool hasNormals() const { return !vertices_.empty() && normals_.size() == vertices_.size(); }
    void setNormals(std::vector<Vec3> normals) { normals_ = std::move(normals); }
    void computeNormals();

    /// World-space bounds. Computes local bounds first if they are missing.
    [[nodiscard]] AABB worldBounds();

    /// World-space bounds of an already-prepared mesh (no lazy work)
    [[nodiscard]] AABB worldBounds() const;

    // ========================================================================
    // Queries
    // ========================================================================

    struct RayHit {
        float distance = 0.0f;
        Vec3 point{0.0f};
        Vec3 normal{0.0f, 1.0f, 0.0f};  // Face normal, facing the ray origin
        uint32_t triangle = 0;
    };

    /// Closest two-sided triangle hit along a unit-length ray within maxDistance
    [[nodiscard]] std::optional<RayHit> raycast(const Vec3& origin, const Vec3& direction,
                                                float maxDistance) const;

private:
    std::string name_;
    MeshFlags flags_;
    std::vector<Vec3> vertices_;
    std::vector<uint32_t> indices_;
    std::vector<Vec3> normals_;
    std::optional<AABB> bounds_;

    Mat4 transform_{1.0f};
    Mat4 inverseTransform_{1.0f};
    bool identityTransform_ = true;

    mutable AABB worldBounds_;
    mutable bool worldBoundsValid_ = false;
};

// ============================================================================
// CollisionSample - Result of a single probe against the mesh set
// ============================================================================

struct CollisionSample {
    Vec3 point{0.0f};
    float distance = 0.0f;
    Vec3 normal{0.0f, 1.0f, 0.0f};
    const TriangleMesh* mesh = nullptr;
};

}  // namespace roamcam
