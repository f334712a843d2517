#pragma once

#include "node_graph.hpp"
#include "../math/types.hpp"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace rigcx::core::graph {

using math::Vec3;

// Computes plug values of a NodeGraph without a host. Unconnected plugs on bound scene nodes
// are read through the supplied reader.
class GraphEvaluator {
public:
    using ExternalReader = std::function<float(NodeRef ref, const std::string& attr)>;

    GraphEvaluator(const NodeGraph& graph, ExternalReader reader);

    float value(GraphNodeId node, const std::string& attr);
    float value(const GraphPlug& plug) { return value(plug.node, plug.attr); }
    Vec3 vector(GraphNodeId node, const std::string& compound);
    void invalidate() { cache.clear(); }

private:
    float resolveInput(const GraphNode& node, const std::string& attr);
    float compute(const GraphNode& node, const std::string& attr);

    const NodeGraph& graph_;
    ExternalReader reader_;
    std::map<std::pair<GraphNodeId, std::string>, float> cache{};
    std::set<std::pair<GraphNodeId, std::string>> visiting{};
};

} // namespace rigcx::core::graph
