#pragma once

#include "module.hpp"
#include "../graph/node_graph.hpp"

namespace rigcx::core::modules {

// Pose-space corrective. Every joint is an independent sibling under parent_joint whose control
// is pushed along its authored offsets by how far a tracked vector has rotated away from its
// rest direction.
class Corrective : public RigModule {
public:
    Corrective();

    static const fields::FieldSchema& schema();

    fields::IntField jointCount{store, "joint_count"};
    fields::ObjectField vectorBase{store, "vector_base"};
    fields::ObjectField vectorTip{store, "vector_tip"};

    fields::ObjectField vectorBaseLoc{store, "vector_base_loc"};
    fields::ObjectField vectorTipLoc{store, "vector_tip_loc"};
    fields::ObjectField origPoseVectorTipLoc{store, "orig_pose_vector_tip_loc"};

    const std::string& typeId() const override;

    void initialize() override;
    void update() override;
    void updateParentJoint() override;
    void build() override;

    // Wiring replayed by the last build().
    const graph::NodeGraph& wiring() const { return lastWiring; }
    graph::GraphNodeId valueRangeNode() const { return valueRange; }
    graph::GraphNodeId angleTimesAxisNode() const { return angleTimesAxis; }

private:
    NodeRef resolveVectorBase();
    void createLocators(NodeRef base);
    graph::GraphNodeId buildAngleReader(graph::NodeGraph& g);
    NodeRef addCorrectiveControl(NodeRef joint);
    void wireOffsets(graph::NodeGraph& g, NodeRef joint, NodeRef ctl, int objectId);
    std::string nodeNameFor(const std::string& role, const std::string& description,
                            std::optional<int> objectId = std::nullopt) const;

    graph::NodeGraph lastWiring{};
    graph::GraphNodeId valueRange{0};
    graph::GraphNodeId angleTimesAxis{0};
};

} // namespace rigcx::core::modules
