#include "chain.hpp"

#include "../dag.hpp"
#include "../debug_log.hpp"

namespace rigcx::core::modules {

const fields::FieldSchema& Chain::schema() {
    static const fields::FieldSchema s = [] {
        fields::FieldSchema out(&RigModule::baseSchema());
        auto length = fields::intField("chain_length", 1);
        length.hasMinValue = true;
        length.minValue = 1;
        length.displayable = true;
        length.editable = true;
        length.guiOrder = 1;
        length.tooltip = "Number of joints in the chain.";
        out.add(length);
        auto spacing = fields::floatField("joint_spacing", 5.0f);
        spacing.hasMinValue = true;
        spacing.minValue = 0.0f;
        spacing.displayable = true;
        spacing.editable = true;
        spacing.guiOrder = 2;
        spacing.tooltip = "Offset along X given to every joint the chain grows.";
        out.add(spacing);
        return out;
    }();
    return s;
}

Chain::Chain() : RigModule(schema()) {
    name = "chain";
}

const std::string& Chain::typeId() const {
    static const std::string id = "Chain";
    return id;
}

void Chain::initialize() {
    for (int i = 0; i < chainLength.get(); ++i) {
        addChainJoint();
    }
}

void Chain::update() {
    RigModule::update();
    updateChainLength();
}

NodeRef Chain::addChainJoint() {
    auto joints = deformJoints.get();
    std::optional<NodeRef> parent;
    if (!joints.empty()) parent = joints.back();
    NodeRef joint = addDeformJoint(parent);
    sceneRef().setLocalTranslation(joint, scene::Axis::X, jointSpacing.get());
    return joint;
}

void Chain::updateChainLength() {
    const auto current = static_cast<int>(deformJointCount());
    const int diff = chainLength.get() - current;
    if (diff > 0) {
        for (int i = 0; i < diff; ++i) {
            addChainJoint();
        }
    } else if (diff < 0) {
        // Dependents are reported but not redirected; see removeTailJoints.
        removeTailJoints(static_cast<std::size_t>(-diff), false);
    }
}

void Chain::build() {
    auto& scene = sceneRef();
    NodeRef parent = controlsGroup.get();
    for (auto joint : drivingJoints()) {
        auto [ctl, buffer] = addControl(joint);
        if (parent != kInvalidNode) {
            scene.reparent(buffer, parent);
        }
        dag::matrixConstraint(scene, ctl, joint);
        parent = ctl;
    }
    RGCX_DBG_LOG("[rigcx][Chain] %s built %zu control(s)\n", name.c_str(), drivingJoints().size());
}

} // namespace rigcx::core::modules
