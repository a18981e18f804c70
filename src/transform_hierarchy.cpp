#include "roamcam/transform_hierarchy.hpp"
#include <cmath>
#include <stdexcept>

namespace roamcam {

TransformHierarchy::TransformHierarchy(SceneNode::Ptr scene, SceneNode::Ptr viewpoint, float eyeHeight)
    : scene_(std::move(scene))
    , viewpoint_(std::move(viewpoint))
{
    if (!scene_) {
        throw std::invalid_argument("TransformHierarchy requires a scene node");
    }
    if (!viewpoint_) {
        throw std::invalid_argument("TransformHierarchy requires a viewpoint node");
    }
    if (viewpoint_ == scene_) {
        throw std::invalid_argument("Viewpoint cannot be the scene node");
    }

    root_ = SceneNode::create("PlayerRoot");
    yawNode_ = SceneNode::create("YawNode");
    pitchRig_ = SceneNode::create("PitchRig");

    root_->addChild(yawNode_);
    yawNode_->addChild(pitchRig_);

    originalParent_ = viewpoint_->parent();
    pitchRig_->addChild(viewpoint_);
    viewpoint_->resetTransform();
    pitchRig_->setPosition(Vec3(0.0f, eyeHeight, 0.0f));

    scene_->addChild(root_);
    attached_ = true;
}

TransformHierarchy::~TransformHierarchy() {
    teardown();
}

void TransformHierarchy::applyRotation(float yaw, float pitch) {
    yawNode_->setRotation(Vec3(0.0f, yaw, 0.0f));
    pitchRig_->setRotation(Vec3(pitch, 0.0f, 0.0f));
}

void TransformHierarchy::applyTranslation(const Vec3& delta) {
    root_->translate(delta);
}

void TransformHierarchy::setRootPosition(const Vec3& position) {
    root_->setPosition(position);
}

Vec3 TransformHierarchy::rootPosition() const {
    return root_->position();
}

void TransformHierarchy::setEyeHeight(float eyeHeight) {
    Vec3 p = pitchRig_->position();
    p.y = eyeHeight;
    pitchRig_->setPosition(p);
}

float TransformHierarchy::eyeHeight() const {
    return pitchRig_->position().y;
}

void TransformHierarchy::setViewpointOffset(const Vec3& offset, float roll) {
    if (!attached_) return;
    viewpoint_->setPosition(offset);
    viewpoint_->setRotation(Vec3(0.0f, 0.0f, roll));
}

Vec3 TransformHierarchy::eyePosition() const {
    return pitchRig_->worldPosition();
}

Vec3 TransformHierarchy::forward(float yaw) {
    return Vec3(-std::sin(yaw), 0.0f, -std::cos(yaw));
}

Vec3 TransformHierarchy::right(float yaw) {
    return Vec3(std::cos(yaw), 0.0f, -std::sin(yaw));
}

void TransformHierarchy::teardown() {
    if (!attached_) {
        return;
    }
    attached_ = false;

    if (pitchRig_->hasChild(viewpoint_.get())) {
        SceneNode::Ptr parent = originalParent_.lock();
        if (!parent) {
            parent = scene_;
        }
        parent->addChild(viewpoint_);
    }
    root_->removeFromParent();
}

}  // namespace roamcam
