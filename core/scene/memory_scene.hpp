#pragma once

#include "scene_graph.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace rigcx::core::scene {

struct SceneNode {
    NodeRef ref{kInvalidNode};
    std::string name{};
    NodeKind kind{NodeKind::Transform};
    Mat4 local{Mat4::identity()};
    bool inheritsTransform{true};

    std::weak_ptr<SceneNode> parent{};
    std::vector<std::shared_ptr<SceneNode>> children{};

    std::map<std::string, float> attrs{};
    std::map<std::string, AttrSpec> customAttrs{};
    std::set<std::string> lockedAttrs{};
};

struct SceneConstraint {
    enum class Kind { Rigid, Point };
    Kind kind{Kind::Rigid};
    NodeRef driver{kInvalidNode};
    NodeRef driven{kInvalidNode};
    Mat4 offset{Mat4::identity()};
};

struct SceneConnection {
    Plug src{};
    Plug dst{};
};

enum class SceneOpKind {
    Create,
    Delete,
    Reparent,
    Connect,
    SetAttr,
    AddAttr,
    Constrain,
    SetTransform,
};

struct SceneOp {
    SceneOpKind kind{SceneOpKind::Create};
    NodeRef node{kInvalidNode};
    NodeRef other{kInvalidNode};
    std::string detail{};
};

struct SceneCounters {
    std::size_t creations{0};
    std::size_t deletions{0};
    std::size_t reparents{0};
    std::size_t connections{0};
    std::size_t attrWrites{0};
    std::size_t constraints{0};
    std::size_t transformWrites{0};

    std::size_t structuralChanges() const { return creations + deletions + reparents; }
};

// In-process host scene. Mirrors the behaviour the rig modules rely on from a DCC host:
// unique node names, world-preserving reparent, delete-with-descendants, live constraints
// (solved on demand) and typed custom attributes.
class MemoryScene : public SceneGraph {
public:
    MemoryScene() = default;

    NodeRef createNode(NodeKind kind, const std::string& nameHint) override;
    void deleteNodes(const std::vector<NodeRef>& refs) override;
    bool exists(NodeRef ref) const override;
    std::string nodeName(NodeRef ref) const override;

    Mat4 worldTransform(NodeRef ref) const override;
    void setWorldTransform(NodeRef ref, const Mat4& world) override;
    void setLocalTranslation(NodeRef ref, Axis axis, float value) override;
    void resetLocalTransform(NodeRef ref) override;
    void setInheritsTransform(NodeRef ref, bool inherits) override;

    void reparent(NodeRef child, NodeRef newParent) override;
    NodeRef parentOf(NodeRef ref) const override;

    void connect(const Plug& src, const Plug& dst) override;
    void setAttr(const Plug& plug, float value) override;
    float readAttr(const Plug& plug) const override;
    void addCustomAttr(NodeRef ref, const std::string& name, const AttrSpec& spec) override;
    void lockAttr(const Plug& plug) override;

    void constrainRigid(NodeRef driver, NodeRef driven, bool maintainOffset) override;
    void constrainPoint(NodeRef driver, NodeRef driven) override;

    // Re-applies every live constraint in creation order.
    void solveConstraints();

    bool hasAttr(NodeRef ref, const std::string& name) const;
    bool isLocked(const Plug& plug) const;
    std::optional<AttrSpec> customAttrSpec(NodeRef ref, const std::string& name) const;
    Mat4 localTransform(NodeRef ref) const;
    NodeKind kindOf(NodeRef ref) const;
    std::vector<NodeRef> childrenOf(NodeRef ref) const;
    NodeRef findNode(const std::string& name) const;
    std::optional<Plug> sourceOf(const Plug& dst) const;
    std::size_t nodeCount() const { return nodes.size(); }

    const std::vector<SceneConnection>& connectionList() const { return connections; }
    const std::vector<SceneConstraint>& constraintList() const { return constraints; }
    const std::vector<SceneOp>& journal() const { return ops; }
    const SceneCounters& counters() const { return stats; }
    void resetJournal();

private:
    std::shared_ptr<SceneNode> require(NodeRef ref) const;
    std::string uniqueName(const std::string& hint) const;
    Mat4 worldOf(const SceneNode& node) const;
    void applyWorld(SceneNode& node, const Mat4& world);
    void applyConstraint(const SceneConstraint& c);
    void detach(const std::shared_ptr<SceneNode>& node);
    void collectSubtree(const std::shared_ptr<SceneNode>& node, std::vector<NodeRef>& out) const;
    void record(SceneOpKind kind, NodeRef node, NodeRef other = kInvalidNode, std::string detail = {});

    NodeRef nextRef{1};
    std::unordered_map<NodeRef, std::shared_ptr<SceneNode>> nodes{};
    std::unordered_map<std::string, NodeRef> names{};
    std::vector<SceneConnection> connections{};
    std::vector<SceneConstraint> constraints{};
    std::vector<SceneOp> ops{};
    SceneCounters stats{};
};

} // namespace rigcx::core::scene
