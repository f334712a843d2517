#include "evaluator.hpp"

#include "../errors.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace rigcx::core::graph {

namespace {

constexpr float kEpsilon = 1e-6f;

bool compare(int op, float first, float second) {
    switch (op) {
    case condition_op::Equal: return first == second;
    case condition_op::NotEqual: return first != second;
    case condition_op::Greater: return first > second;
    case condition_op::GreaterOrEqual: return first >= second;
    case condition_op::Less: return first < second;
    case condition_op::LessOrEqual: return first <= second;
    default: throw GraphError("unknown condition operation " + std::to_string(op));
    }
}

} // namespace

GraphEvaluator::GraphEvaluator(const NodeGraph& graph, ExternalReader reader)
    : graph_(graph), reader_(std::move(reader)) {}

float GraphEvaluator::value(GraphNodeId id, const std::string& attr) {
    auto key = std::make_pair(id, attr);
    auto cached = cache.find(key);
    if (cached != cache.end()) return cached->second;
    if (visiting.count(key)) {
        throw GraphError("cycle while evaluating " + graph_.node(id).name + "." + attr);
    }
    visiting.insert(key);
    const auto& n = graph_.node(id);
    float result = 0.0f;
    try {
        if (!n.isExternal() && isOutputPlug(n.kind, attr)) {
            result = compute(n, attr);
        } else {
            result = resolveInput(n, attr);
        }
    } catch (...) {
        visiting.erase(key);
        throw;
    }
    visiting.erase(key);
    cache[key] = result;
    return result;
}

Vec3 GraphEvaluator::vector(GraphNodeId id, const std::string& compound) {
    Vec3 out;
    for (auto axis : scene::kAllAxes) {
        out[static_cast<int>(axis)] = value(id, componentPlug(compound, axis));
    }
    return out;
}

float GraphEvaluator::resolveInput(const GraphNode& n, const std::string& attr) {
    if (auto src = graph_.sourceOf(GraphPlug{n.id, attr})) {
        return value(*src);
    }
    std::string compound;
    Axis axis{};
    if (splitComponent(n.kind, attr, compound, axis)) {
        if (auto src = graph_.sourceOf(GraphPlug{n.id, compound})) {
            return value(src->node, componentPlug(src->attr, axis));
        }
    }
    if (auto v = graph_.valueOf(n.id, attr)) return *v;
    if (n.isExternal()) {
        if (!reader_) throw GraphError("no reader for external plug " + n.name + "." + attr);
        return reader_(n.external, attr);
    }
    return plugDefault(n.kind, attr);
}

float GraphEvaluator::compute(const GraphNode& n, const std::string& attr) {
    std::string compound;
    Axis axis{};
    if (!splitComponent(n.kind, attr, compound, axis) && isCompoundPlug(n.kind, attr)) {
        throw GraphError("compound plug " + n.name + "." + attr + " must be read per component");
    }
    const int c = static_cast<int>(axis);

    switch (n.kind) {
    case NodeKind::VectorDifference:
        return vector(n.id, "input1")[c] - vector(n.id, "input2")[c];
    case NodeKind::AngleBetween: {
        const Vec3 v1 = vector(n.id, "vector1");
        const Vec3 v2 = vector(n.id, "vector2");
        const float l1 = math::length(v1);
        const float l2 = math::length(v2);
        if (attr == "angle") {
            if (l1 < kEpsilon || l2 < kEpsilon) return 0.0f;
            const float cosine = std::clamp(math::dot(v1, v2) / (l1 * l2), -1.0f, 1.0f);
            return std::acos(cosine) * 180.0f / std::numbers::pi_v<float>;
        }
        const Vec3 axisVec = math::cross(v1, v2);
        const float len = math::length(axisVec);
        if (len < kEpsilon) return 0.0f;
        return axisVec[c] / len;
    }
    case NodeKind::MultiplyDivide: {
        const int op = static_cast<int>(value(n.id, "operation"));
        const float a = value(n.id, componentPlug("input1", axis));
        const float b = value(n.id, componentPlug("input2", axis));
        switch (op) {
        case multiply_divide_op::None: return a;
        case multiply_divide_op::Multiply: return a * b;
        case multiply_divide_op::Divide:
            if (b == 0.0f) throw GraphError("division by zero in " + n.name);
            return a / b;
        case multiply_divide_op::Power: return std::pow(a, b);
        default: throw GraphError("unknown multiplyDivide operation " + std::to_string(op));
        }
    }
    case NodeKind::MultDoubleLinear:
        return value(n.id, "input1") * value(n.id, "input2");
    case NodeKind::Condition: {
        const int op = static_cast<int>(value(n.id, "operation"));
        const bool pass = compare(op, value(n.id, "firstTerm"), value(n.id, "secondTerm"));
        return value(n.id, componentPlug(pass ? "colorIfTrue" : "colorIfFalse", axis));
    }
    default:
        break;
    }
    throw GraphError("plug " + n.name + "." + attr + " is not computable");
}

} // namespace rigcx::core::graph
