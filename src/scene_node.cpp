#include "roamcam/scene_node.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>

namespace roamcam {

SceneNode::Ptr SceneNode::create(std::string name) {
    return std::make_shared<SceneNode>(std::move(name));
}

void SceneNode::resetTransform() {
    position_ = Vec3(0.0f);
    rotation_ = Vec3(0.0f);
}

Mat4 SceneNode::localMatrix() const {
    Mat4 m = glm::translate(Mat4(1.0f), position_);
    m = glm::rotate(m, rotation_.x, Vec3(1.0f, 0.0f, 0.0f));
    m = glm::rotate(m, rotation_.y, Vec3(0.0f, 1.0f, 0.0f));
    m = glm::rotate(m, rotation_.z, Vec3(0.0f, 0.0f, 1.0f));
    return m;
}

Mat4 SceneNode::worldMatrix() const {
    Mat4 m = localMatrix();
    for (Ptr p = parent(); p; p = p->parent()) {
        m = p->localMatrix() * m;
    }
    return m;
}

Vec3 SceneNode::worldPosition() const {
    return Vec3(worldMatrix()[3]);
}

void SceneNode::addChild(const Ptr& child) {
    if (!child || child.get() == this) {
        return;
    }
    child->removeFromParent();
    child->parent_ = weak_from_this();
    children_.push_back(child);
}

bool SceneNode::removeChild(const Ptr& child) {
    auto it = std::find(children_.begin(), children_.end(), child);
    if (it == children_.end()) {
        return false;
    }
    (*it)->parent_.reset();
    children_.erase(it);
    return true;
}

void SceneNode::removeFromParent() {
    if (Ptr p = parent()) {
        p->removeChild(shared_from_this());
    }
    parent_.reset();
}

bool SceneNode::hasChild(const SceneNode* node) const {
    return std::any_of(children_.begin(), children_.end(),
                       [node](const Ptr& c) { return c.get() == node; });
}

SceneNode::Ptr SceneNode::findChild(const std::string& name) const {
    for (const auto& child : children_) {
        if (child->name() == name) {
            return child;
        }
        if (auto found = child->findChild(name)) {
            return found;
        }
    }
    return nullptr;
}

}  // namespace roamcam
