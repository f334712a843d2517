#include "dag.hpp"

namespace rigcx::core::dag {

void snapFirstToLast(SceneGraph& scene, NodeRef first, NodeRef last) {
    scene.setWorldTransform(first, scene.worldTransform(last));
}

NodeRef addParentGroup(SceneGraph& scene, NodeRef node, const std::string& suffix) {
    NodeRef group = scene.createNode(scene::NodeKind::Transform, scene.nodeName(node) + "_" + suffix);
    snapFirstToLast(scene, group, node);
    NodeRef parent = scene.parentOf(node);
    if (parent != scene::kInvalidNode) {
        scene.reparent(group, parent);
    }
    scene.reparent(node, group);
    return group;
}

void matrixConstraint(SceneGraph& scene, NodeRef driver, NodeRef driven, bool maintainOffset) {
    scene.constrainRigid(driver, driven, maintainOffset);
}

void resetNode(SceneGraph& scene, NodeRef node) {
    scene.resetLocalTransform(node);
}

void lockTransformChannels(SceneGraph& scene, NodeRef node) {
    for (const char* channel : {"translate", "rotate", "scale"}) {
        for (auto axis : scene::kAllAxes) {
            scene.lockAttr(scene::Plug{node, std::string(channel) + scene::axisLetter(axis)});
        }
    }
}

} // namespace rigcx::core::dag
