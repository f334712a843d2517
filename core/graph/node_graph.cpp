#include "node_graph.hpp"

#include "../debug_log.hpp"
#include "../errors.hpp"

#include <algorithm>

namespace rigcx::core::graph {

GraphNodeId NodeGraph::addNode(NodeKind kind, const std::string& name) {
    if (!isUtilityKind(kind)) {
        throw GraphError(std::string("node graph only creates utility nodes, got ") + scene::nodeKindName(kind));
    }
    GraphNode n;
    n.id = nodes.size();
    n.kind = kind;
    n.name = name;
    nodes.push_back(n);
    return n.id;
}

GraphNodeId NodeGraph::addExternal(NodeRef ref, NodeKind kind, const std::string& label) {
    if (ref == kInvalidNode) {
        throw GraphError("cannot bind '" + label + "' to an invalid scene node");
    }
    if (auto existing = findExternal(ref)) return *existing;
    GraphNode n;
    n.id = nodes.size();
    n.kind = kind;
    n.name = label;
    n.external = ref;
    nodes.push_back(n);
    return n.id;
}

void NodeGraph::setAttr(GraphNodeId id, const std::string& attr, float value) {
    checkPlug(GraphPlug{id, attr}, false);
    auto& values = nodes[id].values;
    auto it = std::find_if(values.begin(), values.end(), [&](const auto& kv) { return kv.first == attr; });
    if (it != values.end()) {
        it->second = value;
    } else {
        values.emplace_back(attr, value);
    }
}

void NodeGraph::connect(const GraphPlug& src, const GraphPlug& dst) {
    checkPlug(src, true);
    checkPlug(dst, false);
    if (sourceOf(dst)) {
        throw GraphError("plug " + node(dst.node).name + "." + dst.attr + " is already driven");
    }
    connections.push_back(GraphConnection{src, dst});
}

const GraphNode& NodeGraph::node(GraphNodeId id) const {
    if (id >= nodes.size()) {
        throw GraphError("no graph node with id " + std::to_string(id));
    }
    return nodes[id];
}

std::optional<GraphPlug> NodeGraph::sourceOf(const GraphPlug& dst) const {
    for (const auto& c : connections) {
        if (c.dst == dst) return c.src;
    }
    return std::nullopt;
}

std::optional<float> NodeGraph::valueOf(GraphNodeId id, const std::string& attr) const {
    for (const auto& kv : node(id).values) {
        if (kv.first == attr) return kv.second;
    }
    return std::nullopt;
}

std::optional<GraphNodeId> NodeGraph::findByName(const std::string& name) const {
    for (const auto& n : nodes) {
        if (n.name == name) return n.id;
    }
    return std::nullopt;
}

std::optional<GraphNodeId> NodeGraph::findExternal(NodeRef ref) const {
    for (const auto& n : nodes) {
        if (n.external == ref) return n.id;
    }
    return std::nullopt;
}

std::size_t NodeGraph::utilityCount() const {
    return static_cast<std::size_t>(std::count_if(nodes.begin(), nodes.end(), [](const GraphNode& n) {
        return !n.isExternal();
    }));
}

std::vector<NodeRef> NodeGraph::playback(SceneGraph& scene, std::vector<NodeRef>* created) const {
    std::vector<NodeRef> refs(nodes.size(), kInvalidNode);
    for (const auto& n : nodes) {
        if (n.isExternal()) {
            refs[n.id] = n.external;
            continue;
        }
        refs[n.id] = scene.createNode(n.kind, n.name);
        if (created) created->push_back(refs[n.id]);
    }
    for (const auto& n : nodes) {
        for (const auto& kv : n.values) {
            scene.setAttr(scene::Plug{refs[n.id], kv.first}, kv.second);
        }
    }
    for (const auto& c : connections) {
        scene.connect(scene::Plug{refs[c.src.node], c.src.attr}, scene::Plug{refs[c.dst.node], c.dst.attr});
    }
    RGCX_DBG_LOG("[rigcx][NodeGraph] playback nodes=%zu utilities=%zu connections=%zu\n",
                 nodes.size(), utilityCount(), connections.size());
    return refs;
}

void NodeGraph::checkPlug(const GraphPlug& plug, bool asSource) const {
    const auto& n = node(plug.node);
    if (n.isExternal()) return;
    if (!hasPlug(n.kind, plug.attr)) {
        throw GraphError(std::string("unknown plug ") + scene::nodeKindName(n.kind) + "." + plug.attr);
    }
    if (!asSource && isOutputPlug(n.kind, plug.attr)) {
        throw GraphError("cannot drive output plug " + n.name + "." + plug.attr);
    }
}

} // namespace rigcx::core::graph
