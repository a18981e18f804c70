#pragma once

/**
 * @file transform_hierarchy.hpp
 * @brief Root -> YawNode -> PitchRig -> viewpoint node chain
 *
 * Translation, yaw and pitch live on separate nodes so that walking axes
 * depend on yaw only and looking up or down never tilts the movement plane.
 *
 *   Root      translation (feet position)
 *   YawNode   rotation (0, yaw, 0)
 *   PitchRig  rotation (pitch, 0, 0), local Y = eye height
 *   viewpoint local offset and tilt used for head bobbing only
 *
 * Only this class mutates the three injected nodes. The viewpoint node is
 * supplied by the renderer and handed back on teardown.
 */

#include "roamcam/scene_node.hpp"

namespace roamcam {

class TransformHierarchy {
public:
    /// Build the chain under scene and reparent viewpoint beneath it.
    /// @throws std::invalid_argument if scene or viewpoint is null
    TransformHierarchy(SceneNode::Ptr scene, SceneNode::Ptr viewpoint, float eyeHeight);
    ~TransformHierarchy();

    TransformHierarchy(const TransformHierarchy&) = delete;
    TransformHierarchy& operator=(const TransformHierarchy&) = delete;

    /// Set yaw on YawNode and pitch on PitchRig, independently
    void applyRotation(float yaw, float pitch);

    /// Move Root by delta
    void applyTranslation(const Vec3& delta);

    void setRootPosition(const Vec3& position);
    [[nodiscard]] Vec3 rootPosition() const;

    void setEyeHeight(float eyeHeight);
    [[nodiscard]] float eyeHeight() const;

    /// Cosmetic offset and tilt on the viewpoint (head bobbing)
    void setViewpointOffset(const Vec3& offset, float roll = 0.0f);

    /// World-space eye position (PitchRig origin, bobbing excluded)
    [[nodiscard]] Vec3 eyePosition() const;

    /// Horizontal walking axes derived from yaw only
    [[nodiscard]] static Vec3 forward(float yaw);
    [[nodiscard]] static Vec3 right(float yaw);

    /// Restore the viewpoint to its original parent (or the scene) and
    /// remove the chain from the scene. Safe to call twice.
    void teardown();
    [[nodiscard]] bool attached() const { return attached_; }

    [[nodiscard]] const SceneNode::Ptr& root() const { return root_; }
    [[nodiscard]] const SceneNode::Ptr& yawNode() const { return yawNode_; }
    [[nodiscard]] const SceneNode::Ptr& pitchRig() const { return pitchRig_; }
    [[nodiscard]] const SceneNode::Ptr& viewpoint() const { return viewpoint_; }

private:
    SceneNode::Ptr scene_;
    SceneNode::Ptr viewpoint_;
    std::weak_ptr<SceneNode> originalParent_;
    SceneNode::Ptr root_;
    SceneNode::Ptr yawNode_;
    SceneNode::Ptr pitchRig_;
    bool attached_ = false;
};

}  // namespace roamcam
