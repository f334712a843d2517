#pragma once

#include "../scene/scene_graph.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rigcx::core::fields {

using scene::kInvalidNode;
using scene::NodeRef;

enum class FieldType {
    Int,
    Float,
    Object,
    ObjectList,
};

const char* fieldTypeName(FieldType type);

using NodeRefList = std::vector<NodeRef>;
using FieldValue = std::variant<int, float, NodeRef, NodeRefList>;

FieldType fieldTypeOf(const FieldValue& value);

struct FieldDescriptor {
    std::string name{};
    FieldType type{FieldType::Int};
    FieldValue defaultValue{0};
    bool hasMinValue{false};
    float minValue{0.0f};
    bool hasMaxValue{false};
    float maxValue{0.0f};
    // Presentation only.
    bool displayable{false};
    bool editable{false};
    int guiOrder{0};
    std::string tooltip{};
};

inline FieldDescriptor intField(std::string name, int defaultValue) {
    FieldDescriptor d;
    d.name = std::move(name);
    d.type = FieldType::Int;
    d.defaultValue = defaultValue;
    return d;
}

inline FieldDescriptor floatField(std::string name, float defaultValue) {
    FieldDescriptor d;
    d.name = std::move(name);
    d.type = FieldType::Float;
    d.defaultValue = defaultValue;
    return d;
}

inline FieldDescriptor objectField(std::string name) {
    FieldDescriptor d;
    d.name = std::move(name);
    d.type = FieldType::Object;
    d.defaultValue = kInvalidNode;
    return d;
}

inline FieldDescriptor objectListField(std::string name) {
    FieldDescriptor d;
    d.name = std::move(name);
    d.type = FieldType::ObjectList;
    d.defaultValue = NodeRefList{};
    return d;
}

// Ordered, append-only set of field descriptors declared once per module type.
class FieldSchema {
public:
    FieldSchema() = default;
    explicit FieldSchema(const FieldSchema* base) {
        if (base) descriptors = base->descriptors;
    }

    FieldSchema& add(FieldDescriptor descriptor);
    const FieldDescriptor* find(const std::string& name) const;
    const std::vector<FieldDescriptor>& list() const { return descriptors; }
    std::size_t size() const { return descriptors.size(); }

private:
    std::vector<FieldDescriptor> descriptors{};
};

} // namespace rigcx::core::fields
