#pragma once

/**
 * @file scene_node.hpp
 * @brief Minimal transform node shared with the renderer
 *
 * Each node has a local translation and an Euler rotation (radians, applied
 * X then Y then Z) relative to its parent. Parents own their children; a
 * child only observes its parent.
 */

#include "roamcam/geometry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace roamcam {

class SceneNode : public std::enable_shared_from_this<SceneNode> {
public:
    using Ptr = std::shared_ptr<SceneNode>;

    [[nodiscard]] static Ptr create(std::string name = "");

    explicit SceneNode(std::string name = "") : name_(std::move(name)) {}

    SceneNode(const SceneNode&) = delete;
    SceneNode& operator=(const SceneNode&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    // ========================================================================
    // Local transform
    // ========================================================================

    [[nodiscard]] const Vec3& position() const { return position_; }
    void setPosition(const Vec3& position) { position_ = position; }
    void translate(const Vec3& delta) { position_ += delta; }

    [[nodiscard]] const Vec3& rotation() const { return rotation_; }
    void setRotation(const Vec3& eulerRadians) { rotation_ = eulerRadians; }

    /// Reset translation and rotation to identity
    void resetTransform();

    [[nodiscard]] Mat4 localMatrix() const;
    [[nodiscard]] Mat4 worldMatrix() const;
    [[nodiscard]] Vec3 worldPosition() const;

    // ========================================================================
    // Hierarchy
    // ========================================================================

    /// Attach child, detaching it from any previous parent. The local
    /// transform is kept as is.
    void addChild(const Ptr& child);

    /// Detach a direct child; returns false if it was not one
    bool removeChild(const Ptr& child);

    /// Detach from the current parent, if any
    void removeFromParent();

    [[nodiscard]] Ptr parent() const { return parent_.lock(); }
    [[nodiscard]] const std::vector<Ptr>& children() const { return children_; }
    [[nodiscard]] bool hasChild(const SceneNode* node) const;

    /// Depth-first search by name through this node's subtree
    [[nodiscard]] Ptr findChild(const std::string& name) const;

private:
    std::string name_;
    Vec3 position_{0.0f};
    Vec3 rotation_{0.0f};
    std::weak_ptr<SceneNode> parent_;
    std::vector<Ptr> children_;
};

}  // namespace roamcam
