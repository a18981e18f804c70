#pragma once

/**
 * @file mesh_classifier.hpp
 * @brief Builds the collidable and ground working sets from tagged meshes
 *
 * The scene loader owns the meshes and may replace the lists between frames
 * (room change). The classifier keeps one MeshRecord per mesh for as long as
 * the mesh stays in a list, so quality diagnostics are emitted once per mesh.
 */

#include "roamcam/mesh.hpp"
#include "roamcam/debug_flags.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace roamcam {

using MeshList = std::vector<std::shared_ptr<TriangleMesh>>;

// Bounding boxes thinner than this on any axis may let rays slip through
constexpr float SUSPICIOUS_THIN_DIMENSION = 0.01f;

// Bounding boxes larger than this are probably mis-scaled
constexpr float SUSPICIOUS_LARGE_DIMENSION = 1000.0f;

// ============================================================================
// FilterReason - Why a mesh is not a collision candidate
// ============================================================================

enum class FilterReason : uint8_t {
    None,
    Trigger,
    Particle,
    Light,
    Decorative,
    NoCollision,
    NotSolid,
    NotCollidable,
    Anomalous
};

[[nodiscard]] std::string_view filterReasonName(FilterReason reason);

/// Exclusion decision for a set of flags
struct FilterDecision {
    FilterReason reason = FilterReason::None;
    bool anomalous = false;

    [[nodiscard]] bool excluded() const { return reason != FilterReason::None; }
};

/// Apply the exclusion rules to a set of flags (pure)
[[nodiscard]] FilterDecision classifyFlags(const MeshFlags& flags);

// ============================================================================
// MeshRecord - Per-mesh classification and "already processed" marker
// ============================================================================

struct MeshRecord {
    FilterDecision decision;
    bool inCollisionList = false;
    bool inGroundList = false;

    bool processed = false;        // Quality pass done and logged
    bool boundsComputed = false;   // Bounds were missing and computed here
    bool normalsComputed = false;  // Normals were missing and computed here
    bool suspiciousThin = false;
    bool suspiciousLarge = false;
};

// ============================================================================
// MeshClassifier
// ============================================================================

class MeshClassifier {
public:
    MeshClassifier() = default;

    MeshClassifier(const MeshClassifier&) = delete;
    MeshClassifier& operator=(const MeshClassifier&) = delete;

    /// Replace the collision list. Records of meshes no longer referenced
    /// by either list are dropped immediately.
    void setCollisionObjects(MeshList meshes);

    /// Replace the explicit ground list (nullopt: only ground-flagged
    /// collision meshes are used for ground detection)
    void setGroundObjects(std::optional<MeshList> meshes);

    /// Release both lists and every record
    void clear();

    void setDebugFlags(const DebugFlags& flags) { debug_ = flags; }

    /// Rebuild derived sets if the lists changed. Idempotent.
    void refresh();

    /// Collidable subset (refreshes lazily)
    [[nodiscard]] std::span<const TriangleMesh* const> collidable();

    /// Ground subset (refreshes lazily)
    [[nodiscard]] std::span<const TriangleMesh* const> ground();

    [[nodiscard]] bool hasCollisionObjects() const { return !collisionObjects_.empty(); }
    [[nodiscard]] size_t collisionObjectCount() const { return collisionObjects_.size(); }

    /// Record for a mesh, or nullptr if it is not in either list
    [[nodiscard]] const MeshRecord* record(const TriangleMesh* mesh) const;

    /// Incremented every time a list is replaced
    [[nodiscard]] uint64_t generation() const { return generation_; }

private:
    MeshRecord& recordFor(TriangleMesh& mesh);
    void dropStaleRecords();
    void inspectQuality(TriangleMesh& mesh, MeshRecord& record);

    MeshList collisionObjects_;
    std::optional<MeshList> groundObjects_;

    std::unordered_map<const TriangleMesh*, MeshRecord> records_;
    std::vector<const TriangleMesh*> collidable_;
    std::vector<const TriangleMesh*> ground_;

    DebugFlags debug_;
    uint64_t generation_ = 0;
    uint64_t builtGeneration_ = UINT64_MAX;
};

}  // namespace roamcam
