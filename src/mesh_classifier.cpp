#include "roamcam/mesh_classifier.hpp"
#include <iomanip>
#include <iostream>
#include <unordered_set>

namespace roamcam {

std::string_view filterReasonName(FilterReason reason) {
    switch (reason) {
        case FilterReason::None:          return "none";
        case FilterReason::Trigger:       return "trigger=true";
        case FilterReason::Particle:      return "particle=true";
        case FilterReason::Light:         return "light=true";
        case FilterReason::Decorative:    return "decorative=true";
        case FilterReason::NoCollision:   return "noCollision=true";
        case FilterReason::NotSolid:      return "solid=false";
        case FilterReason::NotCollidable: return "collidable=false";
        case FilterReason::Anomalous:     return "anomalous flags";
    }
    return "unknown";
}

FilterDecision classifyFlags(const MeshFlags& flags) {
    FilterDecision decision;

    decision.anomalous =
        (MeshFlags::isTrue(flags.solid) && MeshFlags::isTrue(flags.noCollision)) ||
        (MeshFlags::isTrue(flags.collidable) && MeshFlags::isTrue(flags.noCollision));

    if (MeshFlags::isTrue(flags.trigger)) {
        decision.reason = FilterReason::Trigger;
    } else if (MeshFlags::isTrue(flags.particle)) {
        decision.reason = FilterReason::Particle;
    } else if (MeshFlags::isTrue(flags.light)) {
        decision.reason = FilterReason::Light;
    } else if (MeshFlags::isTrue(flags.decorative)) {
        decision.reason = FilterReason::Decorative;
    } else if (decision.anomalous) {
        decision.reason = FilterReason::Anomalous;
    } else if (MeshFlags::isTrue(flags.noCollision)) {
        decision.reason = FilterReason::NoCollision;
    } else if (MeshFlags::isFalse(flags.solid)) {
        decision.reason = FilterReason::NotSolid;
    } else if (MeshFlags::isFalse(flags.collidable)) {
        decision.reason = FilterReason::NotCollidable;
    }

    return decision;
}

// ============================================================================
// MeshClassifier
// ============================================================================

void MeshClassifier::setCollisionObjects(MeshList meshes) {
    collisionObjects_ = std::move(meshes);
    dropStaleRecords();
    ++generation_;
}

void MeshClassifier::setGroundObjects(std::optional<MeshList> meshes) {
    groundObjects_ = std::move(meshes);
    dropStaleRecords();
    ++generation_;
}

void MeshClassifier::dropStaleRecords() {
    // A released mesh's address can be reused by the next allocation, so its
    // record must go before the caller can allocate again
    std::unordered_set<const TriangleMesh*> listed;
    for (const auto& ref : collisionObjects_) {
        listed.insert(ref.get());
    }
    if (groundObjects_) {
        for (const auto& ref : *groundObjects_) {
            listed.insert(ref.get());
        }
    }
    for (auto it = records_.begin(); it != records_.end();) {
        if (listed.count(it->first) == 0) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }
}

void MeshClassifier::clear() {
    collisionObjects_.clear();
    groundObjects_.reset();
    records_.clear();
    collidable_.clear();
    ground_.clear();
    ++generation_;
    builtGeneration_ = generation_;
}

std::span<const TriangleMesh* const> MeshClassifier::collidable() {
    refresh();
    return collidable_;
}

std::span<const TriangleMesh* const> MeshClassifier::ground() {
    refresh();
    return ground_;
}

const MeshRecord* MeshClassifier::record(const TriangleMesh* mesh) const {
    auto it = records_.find(mesh);
    return it == records_.end() ? nullptr : &it->second;
}

MeshRecord& MeshClassifier::recordFor(TriangleMesh& mesh) {
    auto [it, inserted] = records_.try_emplace(&mesh);
    MeshRecord& record = it->second;
    // Flags may have been re-tagged by the loader; the decision is cheap
    record.decision = classifyFlags(mesh.flags());
    return record;
}

void MeshClassifier::refresh() {
    if (builtGeneration_ == generation_) {
        return;
    }

    collidable_.clear();
    ground_.clear();
    std::unordered_set<const TriangleMesh*> live;
    std::unordered_set<const TriangleMesh*> inGround;

    auto admit = [&](TriangleMesh& mesh, bool fromGroundList) {
        MeshRecord& record = recordFor(mesh);
        live.insert(&mesh);
        if (fromGroundList) {
            record.inGroundList = true;
        } else {
            record.inCollisionList = true;
        }

        if (record.decision.excluded()) {
            if (!record.processed) {
                record.processed = true;
                if (record.decision.anomalous) {
                    std::cerr << "[MeshClassifier] Warning: anomalous flags on '" << mesh.name()
                              << "' (solid/collidable with noCollision); excluding\n";
                } else if (debug_.filtering) {
                    std::cerr << "[MeshClassifier] Excluding '" << mesh.name()
                              << "' reason: " << filterReasonName(record.decision.reason) << "\n";
                }
            }
            return false;
        }

        inspectQuality(mesh, record);
        return true;
    };

    for (auto& ref : collisionObjects_) {
        if (!ref) continue;
        MeshRecord& record = recordFor(*ref);
        record.inCollisionList = false;
        record.inGroundList = false;
    }
    if (groundObjects_) {
        for (auto& ref : *groundObjects_) {
            if (!ref) continue;
            MeshRecord& record = recordFor(*ref);
            record.inCollisionList = false;
            record.inGroundList = false;
        }
    }

    for (auto& ref : collisionObjects_) {
        if (!ref || live.count(ref.get())) continue;
        if (admit(*ref, false)) {
            collidable_.push_back(ref.get());
            if (MeshFlags::isTrue(ref->flags().ground) && inGround.insert(ref.get()).second) {
                ground_.push_back(ref.get());
            }
        }
    }

    if (groundObjects_) {
        for (auto& ref : *groundObjects_) {
            if (!ref) continue;
            if (live.count(ref.get())) {
                // Already classified through the collision list
                MeshRecord& record = records_[ref.get()];
                record.inGroundList = true;
                if (!record.decision.excluded() && inGround.insert(ref.get()).second) {
                    ground_.push_back(ref.get());
                }
                continue;
            }
            if (admit(*ref, true) && inGround.insert(ref.get()).second) {
                ground_.push_back(ref.get());
            }
        }
    }

    // Records live exactly as long as their mesh is in a list
    for (auto it = records_.begin(); it != records_.end();) {
        if (live.count(it->first) == 0) {
            it = records_.erase(it);
        } else {
            ++it;
        }
    }

    builtGeneration_ = generation_;
}

void MeshClassifier::inspectQuality(TriangleMesh& mesh, MeshRecord& record) {
    if (record.processed) {
        return;
    }
    record.processed = true;

    const std::string& name = mesh.name().empty() ? std::string("unnamed") : mesh.name();

    if (!mesh.hasBounds()) {
        mesh.computeBounds();
        record.boundsComputed = true;
        if (debug_.colliderQuality) {
            std::cerr << "[MeshClassifier] '" << name << "' had no bounding box; computed\n";
        }
    }

    if (!mesh.hasNormals()) {
        mesh.computeNormals();
        record.normalsComputed = true;
        if (debug_.colliderQuality) {
            std::cerr << "[MeshClassifier] Warning: '" << name
                      << "' has no normals; computed vertex normals\n";
        }
    }

    AABB bounds = mesh.worldBounds();
    if (!mesh.vertices().empty() && bounds.isValid()) {
        float minDim = bounds.minDimension();
        float maxDim = bounds.maxDimension();
        record.suspiciousThin = minDim < SUSPICIOUS_THIN_DIMENSION;
        record.suspiciousLarge = maxDim > SUSPICIOUS_LARGE_DIMENSION;

        if (debug_.colliderQuality && record.suspiciousThin) {
            std::cerr << "[MeshClassifier] Warning: '" << name << "' has very thin dimension ("
                      << std::fixed << std::setprecision(4) << minDim << std::defaultfloat
                      << "); may cause tunnelling\n";
        }
        if (debug_.colliderQuality && record.suspiciousLarge) {
            std::cerr << "[MeshClassifier] Warning: '" << name << "' has very large dimension ("
                      << std::fixed << std::setprecision(2) << maxDim << std::defaultfloat
                      << "); may be incorrectly scaled\n";
        }
    }
}

}  // namespace roamcam
