#include "corrective.hpp"

#include "../dag.hpp"
#include "../debug_log.hpp"
#include "../errors.hpp"
#include "../naming.hpp"
#include "../rig.hpp"

#include <utility>

namespace rigcx::core::modules {

using graph::GraphNodeId;
using graph::GraphPlug;
using graph::componentPlug;
using scene::Axis;

const fields::FieldSchema& Corrective::schema() {
    static const fields::FieldSchema s = [] {
        fields::FieldSchema out(&RigModule::baseSchema());
        auto count = fields::intField("joint_count", 1);
        count.hasMinValue = true;
        count.minValue = 1;
        count.displayable = true;
        count.editable = true;
        count.guiOrder = 3;
        count.tooltip = "The number of joints for the corrective.\n"
                        "Each joint can be driven in its own way.\n"
                        "However they will all be based on the same vector.";
        out.add(count);

        auto base = fields::objectField("vector_base");
        base.displayable = true;
        base.editable = true;
        base.guiOrder = 1;
        base.tooltip = "Base of the vector tracking the difference between the original pose and the current one.\n"
                       "If left empty, this is set to the parent joint.";
        out.add(base);

        auto tip = fields::objectField("vector_tip");
        tip.displayable = true;
        tip.editable = true;
        tip.guiOrder = 2;
        tip.tooltip = "Tip of the vector tracking the difference between the original pose and the current one.\n"
                      "If left empty, the vector runs along the +X axis of the vector base.";
        out.add(tip);

        out.add(fields::objectField("vector_base_loc"));
        out.add(fields::objectField("vector_tip_loc"));
        out.add(fields::objectField("orig_pose_vector_tip_loc"));
        return out;
    }();
    return s;
}

Corrective::Corrective() : RigModule(schema()) {
    name = "corrective";
}

const std::string& Corrective::typeId() const {
    static const std::string id = "Corrective";
    return id;
}

void Corrective::initialize() {
    for (int i = 0; i < jointCount.get(); ++i) {
        addDeformJoint();
    }
}

void Corrective::update() {
    RigModule::update();
    const int diff = jointCount.get() - static_cast<int>(deformJointCount());
    if (diff > 0) {
        for (int i = 0; i < diff; ++i) {
            addDeformJoint();
        }
    } else if (diff < 0) {
        removeTailJoints(static_cast<std::size_t>(-diff), true);
    }
}

void Corrective::updateParentJoint() {
    const NodeRef expected = parentJoint.get();
    for (auto joint : deformJoints.get()) {
        reparentIfNeeded(joint, expected);
    }
}

std::string Corrective::nodeNameFor(const std::string& role, const std::string& description,
                                    std::optional<int> objectId) const {
    NodeNameParts parts;
    parts.module = name;
    parts.role = role;
    parts.description = description;
    parts.objectId = objectId;
    return composeNodeName(parts);
}

NodeRef Corrective::resolveVectorBase() {
    auto r = rigRef();
    if (!r) throw RigError("module '" + name + "' is not attached to a rig");
    const NodeRef base = vectorBase.get();
    if (base != kInvalidNode && r->resolveJoint(base)) return base;
    if (base != kInvalidNode) {
        RGCX_WARN_LOG("[rigcx][Corrective] %s: vector_base %u no longer exists, using parent_joint\n", name.c_str(),
                      static_cast<unsigned>(base));
    }
    const NodeRef fallback = parentJoint.get();
    if (fallback == kInvalidNode || !r->resolveJoint(fallback)) {
        throw MissingReferenceError("corrective '" + name + "' has neither a vector_base nor a parent_joint");
    }
    vectorBase.set(fallback);
    return fallback;
}

void Corrective::build() {
    auto r = rigRef();
    if (!r) throw RigError("module '" + name + "' is not attached to a rig");
    auto& scene = r->sceneRef();

    const NodeRef base = resolveVectorBase();
    const NodeRef tip = vectorTip.get();
    if (tip != kInvalidNode && !r->resolveJoint(tip)) {
        throw MissingReferenceError("corrective '" + name + "': vector_tip " + std::to_string(tip) +
                                    " no longer exists");
    }
    for (const auto* group : {&controlsGroup, &extrasGroup}) {
        const NodeRef ref = group->get();
        if (ref != kInvalidNode && !r->resolveJoint(ref)) {
            throw MissingReferenceError("corrective '" + name + "': " + group->name() + " no longer exists");
        }
    }

    createLocators(base);

    graph::NodeGraph g;
    valueRange = buildAngleReader(g);
    int objectId = 0;
    for (auto joint : drivingJoints()) {
        const NodeRef ctl = addCorrectiveControl(joint);
        wireOffsets(g, joint, ctl, objectId++);
    }

    g.playback(scene, &buildNodes);
    lastWiring = std::move(g);
    RGCX_DBG_LOG("[rigcx][Corrective] %s built %zu control(s), %zu utility node(s)\n", name.c_str(),
                 drivingJoints().size(), lastWiring.utilityCount());
}

void Corrective::createLocators(NodeRef base) {
    auto& scene = sceneRef();
    const std::string baseName = scene.nodeName(base);

    // Follows the base position only, so locator translates stay expressed in the rest orientation.
    const NodeRef space = addNode(NodeKind::Transform, "vectorsLocalSpace");
    trackBuildNode(space);
    if (extrasGroup.get() != kInvalidNode) scene.reparent(space, extrasGroup.get());
    scene.setInheritsTransform(space, false);
    dag::snapFirstToLast(scene, space, base);
    scene.constrainPoint(base, space);

    const NodeRef baseLoc = createBuildNode(NodeKind::Locator, baseName + "_vectorBase");
    scene.reparent(baseLoc, space);
    dag::snapFirstToLast(scene, baseLoc, base);
    dag::matrixConstraint(scene, base, baseLoc);
    vectorBaseLoc.set(baseLoc);

    const NodeRef tipLoc = createBuildNode(NodeKind::Locator, baseName + "_vectorTip");
    const NodeRef tip = vectorTip.get();
    if (tip != kInvalidNode) {
        scene.reparent(tipLoc, space);
        dag::snapFirstToLast(scene, tipLoc, tip);
        dag::matrixConstraint(scene, tip, tipLoc, true);
    } else {
        scene.reparent(tipLoc, baseLoc);
        dag::resetNode(scene, tipLoc);
        scene.setLocalTranslation(tipLoc, Axis::X, 1.0f);
        scene.reparent(tipLoc, space);
        dag::matrixConstraint(scene, baseLoc, tipLoc, true);
    }
    vectorTipLoc.set(tipLoc);

    // Rest direction: never constrained.
    const NodeRef orig = createBuildNode(NodeKind::Locator, baseName + "_vectorTipOrig");
    scene.reparent(orig, baseLoc);
    dag::resetNode(scene, orig);
    scene.setLocalTranslation(orig, Axis::X, 1.0f);
    scene.reparent(orig, space);
    origPoseVectorTipLoc.set(orig);
}

GraphNodeId Corrective::buildAngleReader(graph::NodeGraph& g) {
    auto& scene = sceneRef();
    const GraphNodeId tip = g.addExternal(vectorTipLoc.get(), NodeKind::Locator, scene.nodeName(vectorTipLoc.get()));
    const GraphNodeId base =
        g.addExternal(vectorBaseLoc.get(), NodeKind::Locator, scene.nodeName(vectorBaseLoc.get()));
    const GraphNodeId orig =
        g.addExternal(origPoseVectorTipLoc.get(), NodeKind::Locator, scene.nodeName(origPoseVectorTipLoc.get()));

    const GraphNodeId source = g.addNode(NodeKind::VectorDifference, nodeNameFor("vector", "source"));
    g.connect(GraphPlug{tip, "translate"}, GraphPlug{source, "input1"});
    g.connect(GraphPlug{base, "translate"}, GraphPlug{source, "input2"});

    const GraphNodeId target = g.addNode(NodeKind::VectorDifference, nodeNameFor("vector", "target"));
    g.connect(GraphPlug{orig, "translate"}, GraphPlug{target, "input1"});
    g.connect(GraphPlug{base, "translate"}, GraphPlug{target, "input2"});

    const GraphNodeId angle = g.addNode(NodeKind::AngleBetween, nodeNameFor("angleBetween", ""));
    g.connect(GraphPlug{source, "output"}, GraphPlug{angle, "vector1"});
    g.connect(GraphPlug{target, "output"}, GraphPlug{angle, "vector2"});

    angleTimesAxis = g.addNode(NodeKind::MultiplyDivide, nodeNameFor("mult", "angle_times_axis"));
    g.connect(GraphPlug{angle, "axis"}, GraphPlug{angleTimesAxis, "input1"});
    for (auto axis : scene::kAllAxes) {
        g.connect(GraphPlug{angle, "angle"}, GraphPlug{angleTimesAxis, componentPlug("input2", axis)});
    }

    // Degrees to the [-1, 1] range.
    const GraphNodeId range = g.addNode(NodeKind::MultiplyDivide, nodeNameFor("mult", "m1_to_p1_range"));
    g.setAttr(range, "operation", static_cast<float>(graph::multiply_divide_op::Divide));
    g.connect(GraphPlug{angleTimesAxis, "output"}, GraphPlug{range, "input1"});
    for (auto axis : scene::kAllAxes) {
        g.setAttr(range, componentPlug("input2", axis), 180.0f);
    }
    return range;
}

NodeRef Corrective::addCorrectiveControl(NodeRef joint) {
    auto& scene = sceneRef();
    auto [ctl, buffer] = addControl(joint);
    if (controlsGroup.get() != kInvalidNode) scene.reparent(buffer, controlsGroup.get());
    trackBuildNode(dag::addParentGroup(scene, ctl, "offset"));
    dag::matrixConstraint(scene, ctl, joint);

    scene::AttrSpec affectedBy;
    affectedBy.type = scene::AttrType::Enum;
    affectedBy.keyable = true;
    affectedBy.enumNames = {"Y", "Z"};
    affectedBy.minValue = 0.0f;
    affectedBy.maxValue = 1.0f;
    createPersistentAttribute(ctl, "affectedBy", affectedBy);

    // Read-only helpers for whoever tunes the offsets.
    for (const char* readout : {"angle", "xValue", "yValue", "zValue"}) {
        scene::AttrSpec spec;
        spec.channelBox = true;
        scene.addCustomAttr(ctl, readout, spec);
    }

    dag::lockTransformChannels(scene, ctl);
    for (auto axis : scene::kAllAxes) {
        scene::AttrSpec offset;
        offset.keyable = true;
        createPersistentAttribute(ctl, std::string("offsetPositive") + scene::axisLetter(axis), offset);
        createPersistentAttribute(ctl, std::string("offsetNegative") + scene::axisLetter(axis), offset);
    }
    return ctl;
}

void Corrective::wireOffsets(graph::NodeGraph& g, NodeRef joint, NodeRef ctl, int objectId) {
    auto& scene = sceneRef();
    const GraphNodeId c = g.addExternal(ctl, NodeKind::Control, scene.nodeName(ctl));

    GraphNodeId conditions[2]{};
    int slot = 0;
    for (Axis angleAxis : {Axis::Y, Axis::Z}) {
        const std::string letter(1, scene::axisLetter(angleAxis));
        const GraphPlug rangeOut{valueRange, componentPlug("output", angleAxis)};

        const GraphNodeId positive =
            g.addNode(NodeKind::MultiplyDivide, nodeNameFor("mult", "positive_offset_" + letter, objectId));
        const GraphNodeId negative =
            g.addNode(NodeKind::MultiplyDivide, nodeNameFor("mult", "negative_offset_" + letter, objectId));
        const GraphNodeId opposite =
            g.addNode(NodeKind::MultDoubleLinear, nodeNameFor("mult", "value_opposite_" + letter, objectId));

        g.connect(rangeOut, GraphPlug{opposite, "input1"});
        g.setAttr(opposite, "input2", -1.0f);
        for (auto axis : scene::kAllAxes) {
            const std::string a(1, scene::axisLetter(axis));
            g.connect(rangeOut, GraphPlug{positive, componentPlug("input1", axis)});
            g.connect(GraphPlug{c, "offsetPositive" + a}, GraphPlug{positive, componentPlug("input2", axis)});
            g.connect(GraphPlug{opposite, "output"}, GraphPlug{negative, componentPlug("input1", axis)});
            g.connect(GraphPlug{c, "offsetNegative" + a}, GraphPlug{negative, componentPlug("input2", axis)});
        }

        const GraphNodeId condition = g.addNode(NodeKind::Condition, nodeNameFor("cond", letter, objectId));
        g.setAttr(condition, "operation", static_cast<float>(graph::condition_op::GreaterOrEqual));
        g.connect(rangeOut, GraphPlug{condition, "firstTerm"});
        g.connect(GraphPlug{positive, "output"}, GraphPlug{condition, "colorIfTrue"});
        g.connect(GraphPlug{negative, "output"}, GraphPlug{condition, "colorIfFalse"});
        conditions[slot++] = condition;
    }

    // affectedBy: 0 picks the Y reading, 1 the Z reading.
    const GraphNodeId affected = g.addNode(NodeKind::Condition, nodeNameFor("cond", "affected_by", objectId));
    g.connect(GraphPlug{c, "affectedBy"}, GraphPlug{affected, "firstTerm"});
    g.connect(GraphPlug{conditions[0], "outColor"}, GraphPlug{affected, "colorIfTrue"});
    g.connect(GraphPlug{conditions[1], "outColor"}, GraphPlug{affected, "colorIfFalse"});
    g.connect(GraphPlug{affected, "outColor"}, GraphPlug{c, "translate"});

    g.connect(GraphPlug{angleTimesAxis, "input2X"}, GraphPlug{c, "angle"});
    g.connect(GraphPlug{angleTimesAxis, "input1X"}, GraphPlug{c, "xValue"});
    g.connect(GraphPlug{angleTimesAxis, "input1Y"}, GraphPlug{c, "yValue"});
    g.connect(GraphPlug{angleTimesAxis, "input1Z"}, GraphPlug{c, "zValue"});

    RGCX_DBG_LOG("[rigcx][Corrective] %s wired %s for joint %s\n", name.c_str(), scene.nodeName(ctl).c_str(),
                 scene.nodeName(joint).c_str());
}

} // namespace rigcx::core::modules
