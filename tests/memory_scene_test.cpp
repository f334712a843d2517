#include "../core/dag.hpp"
#include "../core/errors.hpp"
#include "../core/scene/memory_scene.hpp"

#include <cassert>
#include <cmath>
#include <numbers>

using rigcx::core::SceneError;
using rigcx::core::math::Mat4;
using rigcx::core::math::Vec3;
using rigcx::core::scene::AttrSpec;
using rigcx::core::scene::Axis;
using rigcx::core::scene::kInvalidNode;
using rigcx::core::scene::MemoryScene;
using rigcx::core::scene::NodeKind;
using rigcx::core::scene::Plug;
using rigcx::core::scene::SceneOpKind;

namespace {

template <typename E, typename F>
bool throwsAs(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

void testUniqueNames() {
    MemoryScene scene;
    auto a = scene.createNode(NodeKind::Joint, "arm");
    auto b = scene.createNode(NodeKind::Joint, "arm");
    auto c = scene.createNode(NodeKind::Joint, "arm1");
    assert(scene.nodeName(a) == "arm");
    assert(scene.nodeName(b) == "arm1");
    assert(scene.nodeName(c) == "arm2");
    assert(scene.findNode("arm1") == b);
    assert(scene.findNode("missing") == kInvalidNode);
    assert(scene.counters().creations == 3);
}

void testReparentKeepsWorld() {
    MemoryScene scene;
    auto parent = scene.createNode(NodeKind::Transform, "parent");
    auto child = scene.createNode(NodeKind::Transform, "child");
    scene.setWorldTransform(parent, Mat4::translation(1.0f, 2.0f, 3.0f));
    scene.setWorldTransform(child, Mat4::translation(5.0f, 0.0f, 0.0f));

    scene.reparent(child, parent);
    assert(scene.parentOf(child) == parent);
    assert(rigcx::core::math::nearlyEqual(scene.worldTransform(child).translationPart(), Vec3{5.0f, 0.0f, 0.0f}));
    assert(rigcx::core::math::nearlyEqual(scene.localTransform(child).translationPart(), Vec3{4.0f, -2.0f, -3.0f}));

    scene.setLocalTranslation(child, Axis::X, 1.0f);
    assert(std::fabs(scene.worldTransform(child).translationPart().x - 2.0f) < 1e-5f);
    assert(std::fabs(scene.readAttr(Plug{child, "translateX"}) - 1.0f) < 1e-6f);

    assert(throwsAs<SceneError>([&] { scene.reparent(parent, child); }));

    scene.reparent(child, kInvalidNode);
    assert(scene.parentOf(child) == kInvalidNode);
    assert(std::fabs(scene.worldTransform(child).translationPart().x - 2.0f) < 1e-5f);
}

void testDeleteTakesDescendantsAndWiring() {
    MemoryScene scene;
    auto root = scene.createNode(NodeKind::Joint, "root");
    auto mid = scene.createNode(NodeKind::Joint, "mid");
    auto leaf = scene.createNode(NodeKind::Joint, "leaf");
    auto other = scene.createNode(NodeKind::Locator, "other");
    scene.reparent(mid, root);
    scene.reparent(leaf, mid);
    scene.connect(Plug{other, "translate"}, Plug{leaf, "translate"});
    scene.constrainRigid(other, mid, false);

    scene.deleteNodes({mid});
    assert(scene.exists(root));
    assert(!scene.exists(mid));
    assert(!scene.exists(leaf));
    assert(scene.childrenOf(root).empty());
    assert(scene.connectionList().empty());
    assert(scene.constraintList().empty());
    assert(scene.counters().deletions == 2);
    assert(throwsAs<SceneError>([&] { scene.deleteNodes({leaf}); }));
}

void testAttributes() {
    MemoryScene scene;
    auto ctl = scene.createNode(NodeKind::Control, "ctl");
    AttrSpec spec;
    spec.minValue = 0.0f;
    spec.maxValue = 1.0f;
    spec.defaultValue = 0.5f;
    scene.addCustomAttr(ctl, "blend", spec);
    assert(scene.hasAttr(ctl, "blend"));
    assert(std::fabs(scene.readAttr(Plug{ctl, "blend"}) - 0.5f) < 1e-6f);
    assert(throwsAs<SceneError>([&] { scene.addCustomAttr(ctl, "blend", spec); }));
    assert(throwsAs<SceneError>([&] { scene.setAttr(Plug{ctl, "blend"}, 2.0f); }));
    assert(throwsAs<SceneError>([&] { (void)scene.readAttr(Plug{ctl, "nothing"}); }));

    rigcx::core::dag::lockTransformChannels(scene, ctl);
    assert(scene.isLocked(Plug{ctl, "rotateY"}));
    assert(throwsAs<SceneError>([&] { scene.setAttr(Plug{ctl, "translateX"}, 1.0f); }));

    auto src = scene.createNode(NodeKind::Locator, "src");
    scene.connect(Plug{src, "translateX"}, Plug{ctl, "blend"});
    assert(scene.sourceOf(Plug{ctl, "blend"})->node == src);
    assert(throwsAs<SceneError>([&] { scene.connect(Plug{src, "translateY"}, Plug{ctl, "blend"}); }));
}

void testConstraints() {
    MemoryScene scene;
    auto driver = scene.createNode(NodeKind::Joint, "driver");
    auto driven = scene.createNode(NodeKind::Locator, "driven");
    auto follower = scene.createNode(NodeKind::Transform, "follower");
    scene.setWorldTransform(driven, Mat4::translation(1.0f, 0.0f, 0.0f));
    scene.constrainRigid(driver, driven, true);
    scene.constrainPoint(driver, follower);

    const float quarter = std::numbers::pi_v<float> / 2.0f;
    scene.setWorldTransform(driver, Mat4::multiply(Mat4::translation(0.0f, 0.0f, 2.0f), Mat4::zRotation(quarter)));
    scene.solveConstraints();

    assert(rigcx::core::math::nearlyEqual(scene.worldTransform(driven).translationPart(), Vec3{0.0f, 1.0f, 2.0f}));
    // Point constraints copy translation only.
    const Mat4 followerWorld = scene.worldTransform(follower);
    assert(rigcx::core::math::nearlyEqual(followerWorld.translationPart(), Vec3{0.0f, 0.0f, 2.0f}));
    assert(std::fabs(followerWorld[0][0] - 1.0f) < 1e-5f);
}

void testInheritsTransform() {
    MemoryScene scene;
    auto parent = scene.createNode(NodeKind::Transform, "parent");
    auto child = scene.createNode(NodeKind::Transform, "child");
    scene.reparent(child, parent);
    scene.setInheritsTransform(child, false);
    scene.setWorldTransform(parent, Mat4::translation(3.0f, 0.0f, 0.0f));
    assert(rigcx::core::math::nearlyEqual(scene.worldTransform(child).translationPart(), Vec3{}));
}

void testParentGroup() {
    MemoryScene scene;
    auto top = scene.createNode(NodeKind::Transform, "top");
    auto ctl = scene.createNode(NodeKind::Control, "hand_ctl");
    scene.reparent(ctl, top);
    scene.setWorldTransform(ctl, Mat4::translation(0.0f, 4.0f, 0.0f));

    auto group = rigcx::core::dag::addParentGroup(scene, ctl, "buffer");
    assert(scene.nodeName(group) == "hand_ctl_buffer");
    assert(scene.parentOf(group) == top);
    assert(scene.parentOf(ctl) == group);
    assert(scene.worldTransform(group).nearlyEquals(scene.worldTransform(ctl)));
    assert(scene.localTransform(ctl).nearlyEquals(Mat4::identity()));
}

void testJournal() {
    MemoryScene scene;
    auto a = scene.createNode(NodeKind::Joint, "a");
    auto b = scene.createNode(NodeKind::Joint, "b");
    scene.reparent(b, a);
    scene.deleteNodes({a});
    const auto& ops = scene.journal();
    assert(ops.size() == 5);
    assert(ops[2].kind == SceneOpKind::Reparent);
    assert(ops[3].kind == SceneOpKind::Delete);
    assert(scene.counters().structuralChanges() == 5);
    scene.resetJournal();
    assert(scene.journal().empty());
    assert(scene.counters().structuralChanges() == 0);
}

} // namespace

int main() {
    testUniqueNames();
    testReparentKeepsWorld();
    testDeleteTakesDescendantsAndWiring();
    testAttributes();
    testConstraints();
    testInheritsTransform();
    testParentGroup();
    testJournal();
    return 0;
}
