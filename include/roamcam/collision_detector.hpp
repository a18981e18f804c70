#pragma once

/**
 * @file collision_detector.hpp
 * @brief Ray probes, approximate sphere-casts and radial probes
 *
 * There is no swept-volume query. A moving sphere is approximated by a
 * bundle of parallel rays leaving a disc that faces the direction of travel,
 * which bounds the cost per query. Thin geometry between two samples can
 * still be missed; callers sample several heights to catch furniture.
 *
 * The detector holds no state of its own beyond the candidate span it was
 * built with, so it is rebuilt (cheaply) whenever the mesh set changes.
 */

#include "roamcam/mesh.hpp"
#include "roamcam/debug_flags.hpp"
#include <array>
#include <optional>
#include <span>
#include <vector>

namespace roamcam {

/// Fractions of the radius at which sphere-cast rings are sampled
constexpr std::array<float, 4> SPHERE_CAST_RING_FRACTIONS = {0.0f, 0.33f, 0.66f, 1.0f};

/// Angular samples per ring (the centre ring collapses to one sample)
constexpr int SPHERE_CAST_ANGLES = 8;

/// Directions used by the radial (direction-less) sphere-cast
constexpr int RADIAL_HORIZONTAL_DIRECTIONS = 16;
constexpr int RADIAL_DIAGONAL_DIRECTIONS = 8;

/// A sphere-cast hit plus the sample that produced it
struct SphereCastHit {
    CollisionSample sample;
    Vec3 rayOrigin{0.0f};
    Vec3 rayDirection{0.0f};
    int sampleIndex = 0;
    int hitCount = 0;     // Samples that hit anything
    int rayCount = 0;     // Samples cast
};

/// One hit of a radial probe
struct RadialHit {
    CollisionSample sample;
    Vec3 direction{0.0f};
    int directionIndex = 0;
};

/// n evenly spaced unit vectors in the XZ plane, starting at +X
[[nodiscard]] std::vector<Vec3> horizontalDirections(int count);

/// Horizontal, vertical and diagonal directions for the radial sphere-cast
[[nodiscard]] const std::vector<Vec3>& radialSphereDirections();

class CollisionDetector {
public:
    CollisionDetector() = default;
    explicit CollisionDetector(std::span<const TriangleMesh* const> candidates)
        : candidates_(candidates) {}

    void setCandidates(std::span<const TriangleMesh* const> candidates) { candidates_ = candidates; }
    [[nodiscard]] std::span<const TriangleMesh* const> candidates() const { return candidates_; }
    [[nodiscard]] bool empty() const { return candidates_.empty(); }

    void setDebugFlags(const DebugFlags& flags) { debug_ = flags; }

    // ========================================================================
    // Primitive
    // ========================================================================

    /// Nearest hit along a ray within maxDistance. direction must be non-zero;
    /// it is normalized here.
    [[nodiscard]] std::optional<CollisionSample> probe(const Vec3& origin, const Vec3& direction,
                                                       float maxDistance) const;

    /// Same as probe() but against an explicit candidate set
    [[nodiscard]] static std::optional<CollisionSample> probe(std::span<const TriangleMesh* const> meshes,
                                                              const Vec3& origin, const Vec3& direction,
                                                              float maxDistance);

    /// Every hit along a ray, at most one per mesh, sorted nearest first
    [[nodiscard]] std::vector<CollisionSample> probeAll(const Vec3& origin, const Vec3& direction,
                                                        float maxDistance) const;

    // ========================================================================
    // Sphere-cast approximation
    // ========================================================================

    /// Cast a sphere of the given radius from center along direction.
    /// Rays start on a disc through center facing the direction and travel
    /// distance + radius. A zero direction falls back to radialSphereCast().
    [[nodiscard]] std::optional<SphereCastHit> sphereCast(const Vec3& center, float radius,
                                                          const Vec3& direction, float distance) const;

    /// Probe outward from center in all radialSphereDirections()
    [[nodiscard]] std::optional<SphereCastHit> radialSphereCast(const Vec3& center, float distance) const;

    // ========================================================================
    // Radial probe
    // ========================================================================

    /// Probe each direction and return every hit, in direction order
    [[nodiscard]] std::vector<RadialHit> radialProbe(const Vec3& origin, float maxDistance,
                                                     std::span<const Vec3> directions) const;

private:
    std::span<const TriangleMesh* const> candidates_;
    DebugFlags debug_;
};

}  // namespace roamcam
