#pragma once

#include "../math/mat4.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace rigcx::core::scene {

using math::Mat4;
using math::Vec3;

using NodeRef = uint32_t;
constexpr NodeRef kInvalidNode = std::numeric_limits<uint32_t>::max();

enum class NodeKind {
    Transform,
    Joint,
    Locator,
    Control,
    VectorDifference,
    AngleBetween,
    MultiplyDivide,
    MultDoubleLinear,
    Condition,
};

const char* nodeKindName(NodeKind kind);

enum class Axis { X = 0, Y = 1, Z = 2 };

inline char axisLetter(Axis axis) {
    switch (axis) {
    case Axis::X: return 'X';
    case Axis::Y: return 'Y';
    case Axis::Z: return 'Z';
    }
    return 'X';
}

constexpr Axis kAllAxes[3]{Axis::X, Axis::Y, Axis::Z};

struct Plug {
    NodeRef node{kInvalidNode};
    std::string attr{};

    std::string str() const { return std::to_string(node) + "." + attr; }
    bool operator==(const Plug& other) const { return node == other.node && attr == other.attr; }
};

enum class AttrType { Double, Enum, Bool };

struct AttrSpec {
    AttrType type{AttrType::Double};
    bool keyable{false};
    bool channelBox{false};
    // Persistent attributes keep their authored value across rebuilds of the owning control.
    bool persistent{false};
    std::vector<std::string> enumNames{};
    std::optional<float> minValue{};
    std::optional<float> maxValue{};
    float defaultValue{0.0f};
};

// Host scene-graph surface consumed by the rig modules. Implementations report failures by
// throwing SceneError; callers let them propagate.
class SceneGraph {
public:
    virtual ~SceneGraph() = default;

    virtual NodeRef createNode(NodeKind kind, const std::string& nameHint) = 0;
    virtual void deleteNodes(const std::vector<NodeRef>& refs) = 0;
    virtual bool exists(NodeRef ref) const = 0;
    virtual std::string nodeName(NodeRef ref) const = 0;

    virtual Mat4 worldTransform(NodeRef ref) const = 0;
    virtual void setWorldTransform(NodeRef ref, const Mat4& world) = 0;
    virtual void setLocalTranslation(NodeRef ref, Axis axis, float value) = 0;
    virtual void resetLocalTransform(NodeRef ref) = 0;
    virtual void setInheritsTransform(NodeRef ref, bool inherits) = 0;

    // Keeps the child's world transform. kInvalidNode parents to the world.
    virtual void reparent(NodeRef child, NodeRef newParent) = 0;
    virtual NodeRef parentOf(NodeRef ref) const = 0;

    virtual void connect(const Plug& src, const Plug& dst) = 0;
    virtual void setAttr(const Plug& plug, float value) = 0;
    virtual float readAttr(const Plug& plug) const = 0;
    virtual void addCustomAttr(NodeRef ref, const std::string& name, const AttrSpec& spec) = 0;
    virtual void lockAttr(const Plug& plug) = 0;

    virtual void constrainRigid(NodeRef driver, NodeRef driven, bool maintainOffset) = 0;
    virtual void constrainPoint(NodeRef driver, NodeRef driven) = 0;
};

} // namespace rigcx::core::scene
