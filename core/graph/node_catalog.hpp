#pragma once

#include "../scene/scene_graph.hpp"

#include <optional>
#include <string>

namespace rigcx::core::graph {

using scene::Axis;
using scene::NodeKind;

namespace condition_op {
constexpr int Equal = 0;
constexpr int NotEqual = 1;
constexpr int Greater = 2;
constexpr int GreaterOrEqual = 3;
constexpr int Less = 4;
constexpr int LessOrEqual = 5;
} // namespace condition_op

namespace multiply_divide_op {
constexpr int None = 0;
constexpr int Multiply = 1;
constexpr int Divide = 2;
constexpr int Power = 3;
} // namespace multiply_divide_op

// Utility kinds compute values; the other kinds are transforms the graph only binds to.
bool isUtilityKind(NodeKind kind);

// Compound plugs expose X/Y/Z children ("input1" -> "input1X").
bool isCompoundPlug(NodeKind kind, const std::string& attr);
bool isOutputPlug(NodeKind kind, const std::string& attr);
bool hasPlug(NodeKind kind, const std::string& attr);

// Default of a scalar plug or of one compound child.
float plugDefault(NodeKind kind, const std::string& attr);

std::string componentPlug(const std::string& compound, Axis axis);
// "input1Y" -> {"input1", Y}; false when attr is not a compound child.
bool splitComponent(NodeKind kind, const std::string& attr, std::string& compound, Axis& axis);

} // namespace rigcx::core::graph
