#include "node_catalog.hpp"

#include <algorithm>
#include <vector>

namespace rigcx::core::graph {

namespace {

struct PlugDecl {
    const char* name;
    bool compound;
    bool output;
    float defaultValue;
};

const std::vector<PlugDecl>& plugsOf(NodeKind kind) {
    static const std::vector<PlugDecl> kTransform{
        {"translate", true, false, 0.0f},
        {"rotate", true, false, 0.0f},
        {"scale", true, false, 1.0f},
    };
    static const std::vector<PlugDecl> kVectorDifference{
        {"input1", true, false, 0.0f},
        {"input2", true, false, 0.0f},
        {"output", true, true, 0.0f},
    };
    static const std::vector<PlugDecl> kAngleBetween{
        {"vector1", true, false, 0.0f},
        {"vector2", true, false, 0.0f},
        {"angle", false, true, 0.0f},
        {"axis", true, true, 0.0f},
    };
    static const std::vector<PlugDecl> kMultiplyDivide{
        {"operation", false, false, static_cast<float>(multiply_divide_op::Multiply)},
        {"input1", true, false, 0.0f},
        {"input2", true, false, 1.0f},
        {"output", true, true, 0.0f},
    };
    static const std::vector<PlugDecl> kMultDoubleLinear{
        {"input1", false, false, 0.0f},
        {"input2", false, false, 1.0f},
        {"output", false, true, 0.0f},
    };
    static const std::vector<PlugDecl> kCondition{
        {"operation", false, false, static_cast<float>(condition_op::Equal)},
        {"firstTerm", false, false, 0.0f},
        {"secondTerm", false, false, 0.0f},
        {"colorIfTrue", true, false, 0.0f},
        {"colorIfFalse", true, false, 0.0f},
        {"outColor", true, true, 0.0f},
    };
    switch (kind) {
    case NodeKind::VectorDifference: return kVectorDifference;
    case NodeKind::AngleBetween: return kAngleBetween;
    case NodeKind::MultiplyDivide: return kMultiplyDivide;
    case NodeKind::MultDoubleLinear: return kMultDoubleLinear;
    case NodeKind::Condition: return kCondition;
    default: return kTransform;
    }
}

const PlugDecl* findDecl(NodeKind kind, const std::string& name) {
    const auto& plugs = plugsOf(kind);
    auto it = std::find_if(plugs.begin(), plugs.end(), [&](const PlugDecl& p) { return name == p.name; });
    return it == plugs.end() ? nullptr : &*it;
}

} // namespace

bool isUtilityKind(NodeKind kind) {
    switch (kind) {
    case NodeKind::VectorDifference:
    case NodeKind::AngleBetween:
    case NodeKind::MultiplyDivide:
    case NodeKind::MultDoubleLinear:
    case NodeKind::Condition:
        return true;
    default:
        return false;
    }
}

bool isCompoundPlug(NodeKind kind, const std::string& attr) {
    auto decl = findDecl(kind, attr);
    return decl && decl->compound;
}

bool isOutputPlug(NodeKind kind, const std::string& attr) {
    if (auto decl = findDecl(kind, attr)) return decl->output;
    std::string compound;
    Axis axis{};
    if (splitComponent(kind, attr, compound, axis)) {
        return findDecl(kind, compound)->output;
    }
    return false;
}

bool hasPlug(NodeKind kind, const std::string& attr) {
    if (findDecl(kind, attr)) return true;
    std::string compound;
    Axis axis{};
    return splitComponent(kind, attr, compound, axis);
}

float plugDefault(NodeKind kind, const std::string& attr) {
    if (auto decl = findDecl(kind, attr)) return decl->defaultValue;
    std::string compound;
    Axis axis{};
    if (splitComponent(kind, attr, compound, axis)) {
        return findDecl(kind, compound)->defaultValue;
    }
    return 0.0f;
}

std::string componentPlug(const std::string& compound, Axis axis) {
    return compound + scene::axisLetter(axis);
}

bool splitComponent(NodeKind kind, const std::string& attr, std::string& compound, Axis& axis) {
    if (attr.size() < 2) return false;
    const char last = attr.back();
    if (last == 'X') axis = Axis::X;
    else if (last == 'Y') axis = Axis::Y;
    else if (last == 'Z') axis = Axis::Z;
    else return false;
    auto decl = findDecl(kind, attr.substr(0, attr.size() - 1));
    if (!decl || !decl->compound) return false;
    compound = decl->name;
    return true;
}

} // namespace rigcx::core::graph
