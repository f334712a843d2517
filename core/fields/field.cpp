#include "field.hpp"

#include <stdexcept>

namespace rigcx::core::fields {

const char* fieldTypeName(FieldType type) {
    switch (type) {
    case FieldType::Int: return "int";
    case FieldType::Float: return "float";
    case FieldType::Object: return "object";
    case FieldType::ObjectList: return "object list";
    }
    return "unknown";
}

FieldType fieldTypeOf(const FieldValue& value) {
    switch (value.index()) {
    case 0: return FieldType::Int;
    case 1: return FieldType::Float;
    case 2: return FieldType::Object;
    default: return FieldType::ObjectList;
    }
}

FieldSchema& FieldSchema::add(FieldDescriptor descriptor) {
    if (find(descriptor.name)) {
        throw std::logic_error("field declared twice: " + descriptor.name);
    }
    if (fieldTypeOf(descriptor.defaultValue) != descriptor.type) {
        throw std::logic_error("default value type does not match field " + descriptor.name);
    }
    descriptors.push_back(std::move(descriptor));
    return *this;
}

const FieldDescriptor* FieldSchema::find(const std::string& name) const {
    for (const auto& d : descriptors) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

} // namespace rigcx::core::fields
