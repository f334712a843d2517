#include "../core/errors.hpp"
#include "../core/modules/chain.hpp"
#include "../core/modules/corrective.hpp"
#include "../core/rig.hpp"
#include "../core/scene/memory_scene.hpp"

#include <cassert>
#include <cmath>
#include <memory>

using rigcx::core::Rig;
using rigcx::core::StructuralInconsistencyError;
using rigcx::core::ValidationError;
using rigcx::core::modules::Chain;
using rigcx::core::modules::Corrective;
using rigcx::core::scene::kInvalidNode;
using rigcx::core::scene::MemoryScene;
using rigcx::core::scene::NodeKind;
using rigcx::core::scene::Plug;

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

struct Fixture {
    std::shared_ptr<MemoryScene> scene = std::make_shared<MemoryScene>();
    std::shared_ptr<Rig> rig = std::make_shared<Rig>(scene);

    std::shared_ptr<Chain> addChain(const std::string& name, int length) {
        auto chain = std::dynamic_pointer_cast<Chain>(rig->addModule("Chain", name));
        chain->chainLength.set(length);
        rig->updateModule(name);
        return chain;
    }
};

void testChainLengthAndParentage() {
    Fixture f;
    auto chain = f.addChain("arm", 3);
    const auto joints = chain->deformJoints.get();
    assert(joints.size() == 3);
    assert(f.scene->parentOf(joints[0]) == f.rig->rootJoint);
    assert(f.scene->parentOf(joints[1]) == joints[0]);
    assert(f.scene->parentOf(joints[2]) == joints[1]);
    assert(f.scene->kindOf(joints[0]) == NodeKind::Joint);
    assert(f.scene->nodeName(joints[0]) == "arm_0_jnt");
    assert(f.scene->nodeName(joints[2]) == "arm_2_jnt");
    for (std::size_t i = 0; i < joints.size(); ++i) {
        const float x = f.scene->worldTransform(joints[i]).translationPart().x;
        assert(std::fabs(x - 5.0f * static_cast<float>(i + 1)) < 1e-4f);
    }
    assert(f.rig->moduleOwningJoint(joints[1]) == chain);

    chain->chainLength.set(1);
    f.rig->updateModule("arm");
    assert(chain->deformJointCount() == 1);
    assert(chain->deformJoints.get()[0] == joints[0]);
    assert(!f.scene->exists(joints[1]));
    assert(!f.scene->exists(joints[2]));
}

void testJointSpacingAppliesToGrowth() {
    Fixture f;
    auto chain = f.addChain("tail", 1);
    chain->jointSpacing.set(2.0f);
    chain->chainLength.set(2);
    f.rig->updateModule("tail");
    const auto joints = chain->deformJoints.get();
    assert(std::fabs(f.scene->readAttr(Plug{joints[1], "translateX"}) - 2.0f) < 1e-5f);
    assert(throwsAs<ValidationError>([&] { chain->jointSpacing.set(-1.0f); }));
}

void testUpdateIsIdempotent() {
    Fixture f;
    auto chain = f.addChain("leg", 4);
    f.scene->resetJournal();
    f.rig->updateModule("leg");
    assert(f.scene->counters().creations == 0);
    assert(f.scene->counters().deletions == 0);
    assert(f.scene->counters().structuralChanges() == 0);
    assert(chain->deformJointCount() == 4);
}

void testChainLengthMinimum() {
    Fixture f;
    auto chain = f.addChain("neck", 2);
    assert(chain->chainLength.descriptor().hasMinValue);
    assert(throwsAs<ValidationError>([&] { chain->chainLength.set(0); }));
    assert(chain->chainLength.get() == 2);
    f.scene->resetJournal();
    f.rig->updateModule("neck");
    assert(f.scene->counters().structuralChanges() == 0);

    chain->chainLength.set(1);
    f.rig->updateModule("neck");
    assert(chain->deformJointCount() == 1);
}

void testUpdateRepairsParentage() {
    Fixture f;
    auto chain = f.addChain("spine", 3);
    const auto joints = chain->deformJoints.get();
    f.scene->reparent(joints[2], f.rig->rootJoint);
    f.rig->updateModule("spine");
    assert(f.scene->parentOf(joints[2]) == joints[1]);
}

void testShrinkDoesNotCascade() {
    Fixture f;
    auto chain = f.addChain("spine", 3);
    const auto joints = chain->deformJoints.get();
    auto corrective =
        std::dynamic_pointer_cast<Corrective>(f.rig->addModule("Corrective", "breath", joints[2]));
    const auto dependentJoint = corrective->deformJoints.get()[0];
    assert(f.scene->parentOf(dependentJoint) == joints[2]);

    chain->chainLength.set(1);
    f.rig->updateModule("spine");

    // The dependent keeps pointing at the deleted joint.
    assert(corrective->parentJoint.get() == joints[2]);
    assert(!f.rig->resolveJoint(joints[2]));
    assert(!f.scene->exists(dependentJoint));
    assert(throwsAs<StructuralInconsistencyError>([&] { f.rig->updateModule("breath"); }));
}

void testBuildCreatesControlHierarchy() {
    Fixture f;
    auto chain = f.addChain("arm", 2);
    const auto joints = chain->deformJoints.get();
    auto report = f.rig->build();
    assert(report.ok());
    assert(report.results.size() == 1);
    assert(report.results[0].nodesCreated == 4);

    auto ctl0 = f.scene->findNode("arm_0_jnt_ctl");
    auto ctl1 = f.scene->findNode("arm_1_jnt_ctl");
    auto buffer0 = f.scene->findNode("arm_0_jnt_ctl_buffer");
    auto buffer1 = f.scene->findNode("arm_1_jnt_ctl_buffer");
    assert(ctl0 != kInvalidNode && ctl1 != kInvalidNode);
    assert(f.scene->kindOf(ctl0) == NodeKind::Control);
    assert(f.scene->parentOf(ctl0) == buffer0);
    assert(f.scene->parentOf(buffer0) == chain->controlsGroup.get());
    assert(f.scene->parentOf(buffer1) == ctl0);
    assert(f.scene->isLocked(Plug{buffer1, "translateX"}));
    assert(f.scene->worldTransform(ctl1).nearlyEquals(f.scene->worldTransform(joints[1])));

    bool constrained = false;
    for (const auto& c : f.scene->constraintList()) {
        if (c.driver == ctl1 && c.driven == joints[1]) constrained = c.offset.nearlyEquals(rigcx::core::math::Mat4::identity());
    }
    assert(constrained);

    f.rig->clearBuild();
    assert(f.scene->findNode("arm_0_jnt_ctl") == kInvalidNode);
    assert(f.scene->findNode("arm_0_jnt_ctl_buffer") == kInvalidNode);
    assert(f.scene->exists(joints[1]));
    assert(chain->buildOutput().empty());

    f.rig->build();
    assert(f.scene->findNode("arm_1_jnt_ctl") != kInvalidNode);
}

} // namespace

int main() {
    testChainLengthAndParentage();
    testJointSpacingAppliesToGrowth();
    testUpdateIsIdempotent();
    testChainLengthMinimum();
    testUpdateRepairsParentage();
    testShrinkDoesNotCascade();
    testBuildCreatesControlHierarchy();
    return 0;
}
