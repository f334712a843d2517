#include "scene_graph.hpp"

namespace rigcx::core::scene {

const char* nodeKindName(NodeKind kind) {
    switch (kind) {
    case NodeKind::Transform: return "transform";
    case NodeKind::Joint: return "joint";
    case NodeKind::Locator: return "locator";
    case NodeKind::Control: return "control";
    case NodeKind::VectorDifference: return "vectorDifference";
    case NodeKind::AngleBetween: return "angleBetween";
    case NodeKind::MultiplyDivide: return "multiplyDivide";
    case NodeKind::MultDoubleLinear: return "multDoubleLinear";
    case NodeKind::Condition: return "condition";
    }
    return "unknown";
}

} // namespace rigcx::core::scene
