#pragma once

#include "node_catalog.hpp"
#include "../scene/scene_graph.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rigcx::core::graph {

using scene::kInvalidNode;
using scene::NodeRef;
using scene::SceneGraph;

using GraphNodeId = std::size_t;

struct GraphPlug {
    GraphNodeId node{0};
    std::string attr{};

    bool operator==(const GraphPlug& other) const { return node == other.node && attr == other.attr; }
};

struct GraphNode {
    GraphNodeId id{0};
    NodeKind kind{NodeKind::Transform};
    std::string name{};
    // Set when the node stands for an already existing scene node.
    NodeRef external{kInvalidNode};
    std::vector<std::pair<std::string, float>> values{};

    bool isExternal() const { return external != kInvalidNode; }
};

struct GraphConnection {
    GraphPlug src{};
    GraphPlug dst{};
};

// Explicit description of a utility-node network. Nodes, attribute values and connections are
// recorded first and replayed against a SceneGraph in insertion order by playback().
class NodeGraph {
public:
    GraphNodeId addNode(NodeKind kind, const std::string& name);
    GraphNodeId addExternal(NodeRef ref, NodeKind kind, const std::string& label);

    void setAttr(GraphNodeId node, const std::string& attr, float value);
    void connect(const GraphPlug& src, const GraphPlug& dst);

    const GraphNode& node(GraphNodeId id) const;
    const std::vector<GraphNode>& nodeList() const { return nodes; }
    const std::vector<GraphConnection>& connectionList() const { return connections; }
    std::optional<GraphPlug> sourceOf(const GraphPlug& dst) const;
    std::optional<float> valueOf(GraphNodeId node, const std::string& attr) const;
    std::optional<GraphNodeId> findByName(const std::string& name) const;
    std::optional<GraphNodeId> findExternal(NodeRef ref) const;
    std::size_t utilityCount() const;

    // Creates the utility nodes, then applies values and connections. The returned vector maps
    // every GraphNodeId to its scene node. Each utility node is appended to `created` as soon as
    // it exists, so a caller can still delete them when a later step throws.
    std::vector<NodeRef> playback(SceneGraph& scene, std::vector<NodeRef>* created = nullptr) const;

private:
    void checkPlug(const GraphPlug& plug, bool asSource) const;

    std::vector<GraphNode> nodes{};
    std::vector<GraphConnection> connections{};
};

} // namespace rigcx::core::graph
