#include "../core/errors.hpp"
#include "../core/graph/evaluator.hpp"
#include "../core/modules/chain.hpp"
#include "../core/modules/corrective.hpp"
#include "../core/rig.hpp"
#include "../core/scene/memory_scene.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <memory>
#include <numbers>
#include <string>

using rigcx::core::MissingReferenceError;
using rigcx::core::Rig;
using rigcx::core::graph::GraphEvaluator;
using rigcx::core::math::Mat4;
using rigcx::core::math::Vec3;
using rigcx::core::modules::Chain;
using rigcx::core::modules::Corrective;
using rigcx::core::scene::AttrType;
using rigcx::core::scene::kInvalidNode;
using rigcx::core::scene::MemoryScene;
using rigcx::core::scene::NodeKind;
using rigcx::core::scene::NodeRef;
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

bool nearVec(const Vec3& a, const Vec3& b) {
    return rigcx::core::math::nearlyEqual(a, b, 1e-4f);
}

struct Fixture {
    std::shared_ptr<MemoryScene> scene = std::make_shared<MemoryScene>();
    std::shared_ptr<Rig> rig = std::make_shared<Rig>(scene);

    std::shared_ptr<Corrective> addCorrective(const std::string& name, int count, NodeRef parent = kInvalidNode) {
        auto corrective = std::dynamic_pointer_cast<Corrective>(rig->addModule("Corrective", name, parent));
        corrective->jointCount.set(count);
        rig->updateModule(name);
        return corrective;
    }

    void pose(float radians) {
        scene->setWorldTransform(rig->rootJoint, Mat4::zRotation(radians));
        scene->solveConstraints();
    }

    Vec3 controlTranslate(const Corrective& corrective, NodeRef ctl) {
        GraphEvaluator eval(corrective.wiring(), [this](NodeRef ref, const std::string& attr) {
            return scene->readAttr(Plug{ref, attr});
        });
        return eval.vector(corrective.wiring().findExternal(ctl).value(), "translate");
    }
};

void testJointsAreSiblings() {
    Fixture f;
    auto corrective = f.addCorrective("elbow", 3);
    const auto joints = corrective->deformJoints.get();
    assert(joints.size() == 3);
    for (auto joint : joints) {
        assert(f.scene->parentOf(joint) == f.rig->rootJoint);
    }

    f.scene->reparent(joints[1], joints[0]);
    f.rig->updateModule("elbow");
    assert(f.scene->parentOf(joints[1]) == f.rig->rootJoint);
}

void testShrinkCascadesBeforeDeleting() {
    Fixture f;
    auto corrective = f.addCorrective("elbow", 3);
    const auto joints = corrective->deformJoints.get();
    auto finger = std::dynamic_pointer_cast<Chain>(f.rig->addModule("Chain", "finger", joints[2]));
    const NodeRef fingerJoint = finger->deformJoints.get()[0];
    assert(f.scene->parentOf(fingerJoint) == joints[2]);

    f.scene->resetJournal();
    corrective->jointCount.set(1);
    f.rig->updateModule("elbow");

    assert(corrective->deformJointCount() == 1);
    assert(finger->parentJoint.get() == joints[0]);
    assert(f.scene->exists(fingerJoint));
    assert(f.scene->parentOf(fingerJoint) == joints[0]);
    assert(!f.scene->exists(joints[1]));
    assert(!f.scene->exists(joints[2]));

    const auto& ops = f.scene->journal();
    auto reparent = std::find_if(ops.begin(), ops.end(), [&](const auto& op) {
        return op.kind == SceneOpKind::Reparent && op.node == fingerJoint;
    });
    auto firstDelete = std::find_if(ops.begin(), ops.end(), [](const auto& op) { return op.kind == SceneOpKind::Delete; });
    assert(reparent != ops.end());
    assert(firstDelete != ops.end());
    assert(reparent < firstDelete);
    assert(f.scene->counters().deletions == 2);
}

void testBuildCreatesLocatorsAndControl() {
    Fixture f;
    auto corrective = f.addCorrective("elbow", 1);
    auto report = f.rig->build();
    assert(report.ok());
    assert(report.results[0].nodesCreated == 21);
    assert(corrective->vectorBase.get() == f.rig->rootJoint);

    const NodeRef space = f.scene->findNode("elbow_vectorsLocalSpace");
    assert(space != kInvalidNode);
    assert(f.scene->parentOf(space) == corrective->extrasGroup.get());
    assert(corrective->vectorBaseLoc.get() == f.scene->findNode("root_vectorBase"));
    assert(corrective->vectorTipLoc.get() == f.scene->findNode("root_vectorTip"));
    assert(corrective->origPoseVectorTipLoc.get() == f.scene->findNode("root_vectorTipOrig"));
    assert(f.scene->parentOf(corrective->origPoseVectorTipLoc.get()) == space);
    assert(nearVec(f.scene->localTransform(corrective->origPoseVectorTipLoc.get()).translationPart(),
                       Vec3{1.0f, 0.0f, 0.0f}));
    for (const auto& c : f.scene->constraintList()) {
        assert(c.driven != corrective->origPoseVectorTipLoc.get());
    }

    const NodeRef ctl = f.scene->findNode("elbow_0_jnt_ctl");
    const NodeRef offset = f.scene->findNode("elbow_0_jnt_ctl_offset");
    const NodeRef buffer = f.scene->findNode("elbow_0_jnt_ctl_buffer");
    assert(f.scene->parentOf(ctl) == offset);
    assert(f.scene->parentOf(offset) == buffer);
    assert(f.scene->parentOf(buffer) == corrective->controlsGroup.get());
    assert(f.scene->isLocked(Plug{ctl, "translateY"}));
    assert(f.scene->isLocked(Plug{ctl, "scaleZ"}));

    auto affected = f.scene->customAttrSpec(ctl, "affectedBy");
    assert(affected && affected->type == AttrType::Enum && affected->persistent);
    assert(affected->enumNames.size() == 2 && affected->enumNames[1] == "Z");
    assert(f.scene->customAttrSpec(ctl, "offsetNegativeZ")->persistent);
    assert(f.scene->customAttrSpec(ctl, "angle")->channelBox);

    const NodeRef affectedCond = f.scene->findNode("elbow_affected_by_0_cond");
    assert(f.scene->sourceOf(Plug{ctl, "translate"})->node == affectedCond);
    assert(f.scene->sourceOf(Plug{ctl, "angle"})->node == f.scene->findNode("elbow_angle_times_axis_mult"));
    const NodeRef yCond = f.scene->findNode("elbow_Y_0_cond");
    assert(std::fabs(f.scene->readAttr(Plug{yCond, "operation"}) - 3.0f) < 1e-6f);
    assert(corrective->wiring().utilityCount() == 14);
}

void testAngleReaderSelectsNegativeOffsets() {
    Fixture f;
    auto corrective = f.addCorrective("elbow", 1);
    f.rig->build();
    const NodeRef ctl = f.scene->findNode("elbow_0_jnt_ctl");
    f.scene->setAttr(Plug{ctl, "offsetNegativeX"}, 2.0f);
    f.scene->setAttr(Plug{ctl, "offsetNegativeY"}, 4.0f);
    f.scene->setAttr(Plug{ctl, "offsetNegativeZ"}, 6.0f);
    f.scene->setAttr(Plug{ctl, "offsetPositiveX"}, 10.0f);
    f.scene->setAttr(Plug{ctl, "offsetPositiveZ"}, -4.0f);

    assert(nearVec(f.controlTranslate(*corrective, ctl), Vec3{}));

    // +90 degrees about Z: the tip swings to +Y, the angle axis is -Z and the Z reading is -0.5.
    f.pose(std::numbers::pi_v<float> / 2.0f);
    f.scene->setAttr(Plug{ctl, "affectedBy"}, 1.0f);
    assert(nearVec(f.controlTranslate(*corrective, ctl), Vec3{1.0f, 2.0f, 3.0f}));

    GraphEvaluator eval(corrective->wiring(), [&](NodeRef ref, const std::string& attr) {
        return f.scene->readAttr(Plug{ref, attr});
    });
    const auto ctlNode = corrective->wiring().findExternal(ctl).value();
    assert(std::fabs(eval.value(ctlNode, "angle") - 90.0f) < 1e-3f);
    assert(std::fabs(eval.value(ctlNode, "zValue") + 1.0f) < 1e-4f);
    assert(std::fabs(eval.value(corrective->valueRangeNode(), "outputZ") + 0.5f) < 1e-4f);

    // The Y reading is zero for this pose.
    f.scene->setAttr(Plug{ctl, "affectedBy"}, 0.0f);
    assert(nearVec(f.controlTranslate(*corrective, ctl), Vec3{}));

    f.pose(-std::numbers::pi_v<float> / 2.0f);
    f.scene->setAttr(Plug{ctl, "affectedBy"}, 1.0f);
    assert(nearVec(f.controlTranslate(*corrective, ctl), Vec3{5.0f, 0.0f, -2.0f}));
}

void testExplicitVectorTip() {
    Fixture f;
    f.rig->setup();
    const NodeRef target = f.scene->createNode(NodeKind::Locator, "tipTarget");
    f.scene->setWorldTransform(target, Mat4::translation(2.0f, 0.0f, 0.0f));
    f.scene->reparent(target, f.rig->rootJoint);

    auto corrective = f.addCorrective("shoulder", 1);
    corrective->vectorTip.set(target);
    f.rig->build();
    const NodeRef ctl = f.scene->findNode("shoulder_0_jnt_ctl");
    f.scene->setAttr(Plug{ctl, "offsetNegativeY"}, 8.0f);
    f.scene->setAttr(Plug{ctl, "affectedBy"}, 1.0f);

    f.pose(std::numbers::pi_v<float> / 2.0f);
    assert(nearVec(f.scene->localTransform(corrective->vectorTipLoc.get()).translationPart(),
                       Vec3{0.0f, 2.0f, 0.0f}));
    assert(nearVec(f.controlTranslate(*corrective, ctl), Vec3{0.0f, 4.0f, 0.0f}));
}

void testMissingReferences() {
    Fixture f;
    auto corrective = f.addCorrective("elbow", 1);
    const NodeRef gone = f.scene->createNode(NodeKind::Locator, "gone");
    f.scene->deleteNodes({gone});

    // A dangling vector_base falls back to parent_joint.
    corrective->vectorBase.set(gone);
    auto report = f.rig->build();
    assert(report.ok());
    assert(corrective->vectorBase.get() == f.rig->rootJoint);
    f.rig->clearBuild();

    corrective->vectorTip.set(gone);
    const auto before = f.scene->nodeCount();
    assert(throwsAs<MissingReferenceError>([&] { f.rig->build(); }));
    assert(f.scene->nodeCount() == before);
    assert(corrective->buildOutput().empty());

    corrective->vectorTip.set(kInvalidNode);
    corrective->vectorBase.set(kInvalidNode);
    corrective->parentJoint.set(gone);
    assert(throwsAs<MissingReferenceError>([&] { f.rig->build(); }));
}

void testPersistentAttributesSurviveRebuild() {
    Fixture f;
    auto corrective = f.addCorrective("elbow", 1);
    f.rig->build();
    NodeRef ctl = f.scene->findNode("elbow_0_jnt_ctl");
    f.scene->setAttr(Plug{ctl, "offsetPositiveY"}, 3.5f);
    f.scene->setAttr(Plug{ctl, "affectedBy"}, 1.0f);

    auto report = f.rig->rebuild();
    assert(report.ok());
    assert(!f.scene->exists(ctl));
    ctl = f.scene->findNode("elbow_0_jnt_ctl");
    assert(ctl != kInvalidNode);
    assert(std::fabs(f.scene->readAttr(Plug{ctl, "offsetPositiveY"}) - 3.5f) < 1e-6f);
    assert(std::fabs(f.scene->readAttr(Plug{ctl, "affectedBy"}) - 1.0f) < 1e-6f);
    assert(std::fabs(f.scene->readAttr(Plug{ctl, "offsetNegativeX"})) < 1e-6f);
    assert(corrective->persistentValue("elbow_0_jnt_ctl.offsetPositiveY").value() == 3.5f);
}

void testRegrownJointStartsWithDefaultOffsets() {
    Fixture f;
    auto corrective = f.addCorrective("elbow", 2);
    auto first = f.rig->build();
    assert(first.ok());
    f.scene->setAttr(Plug{f.scene->findNode("elbow_0_jnt_ctl"), "offsetNegativeY"}, 2.0f);
    f.scene->setAttr(Plug{f.scene->findNode("elbow_1_jnt_ctl"), "offsetNegativeY"}, 3.0f);

    corrective->jointCount.set(1);
    f.rig->updateModule("elbow");
    f.rig->clearBuild();
    assert(!corrective->persistentValue("elbow_1_jnt_ctl.offsetNegativeY"));
    assert(corrective->persistentValue("elbow_0_jnt_ctl.offsetNegativeY").value() == 2.0f);

    corrective->jointCount.set(2);
    f.rig->updateModule("elbow");
    auto report = f.rig->build();
    assert(report.ok());
    const NodeRef regrown = f.scene->findNode("elbow_1_jnt_ctl");
    assert(regrown != kInvalidNode);
    assert(std::fabs(f.scene->readAttr(Plug{regrown, "offsetNegativeY"})) < 1e-6f);
    const NodeRef kept = f.scene->findNode("elbow_0_jnt_ctl");
    assert(std::fabs(f.scene->readAttr(Plug{kept, "offsetNegativeY"}) - 2.0f) < 1e-6f);
}

} // namespace

int main() {
    testJointsAreSiblings();
    testShrinkCascadesBeforeDeleting();
    testBuildCreatesLocatorsAndControl();
    testAngleReaderSelectsNegativeOffsets();
    testExplicitVectorTip();
    testMissingReferences();
    testPersistentAttributesSurviveRebuild();
    testRegrownJointStartsWithDefaultOffsets();
    return 0;
}
