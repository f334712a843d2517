#include "field_store.hpp"

#include "../errors.hpp"

#include <cmath>
#include <exception>
#include <sstream>

namespace rigcx::core::fields {

namespace {

float numericValue(const FieldValue& value) {
    if (auto i = std::get_if<int>(&value)) return static_cast<float>(*i);
    if (auto f = std::get_if<float>(&value)) return *f;
    return 0.0f;
}

} // namespace

const FieldDescriptor& FieldStore::descriptor(const std::string& name) const {
    if (auto d = schema_->find(name)) return *d;
    throw ValidationError("unknown field '" + name + "'");
}

FieldValue FieldStore::value(const std::string& name) const {
    const auto& d = descriptor(name);
    auto it = values.find(name);
    if (it != values.end()) return it->second;
    return d.defaultValue;
}

void FieldStore::validate(const FieldDescriptor& d, const FieldValue& value) const {
    if (fieldTypeOf(value) != d.type) {
        throw ValidationError("field '" + d.name + "' expects " + fieldTypeName(d.type) + " but got " +
                              fieldTypeName(fieldTypeOf(value)));
    }
    if (d.type != FieldType::Int && d.type != FieldType::Float) return;
    const float v = numericValue(value);
    if (!std::isfinite(v)) {
        throw ValidationError("field '" + d.name + "' rejects non-finite values");
    }
    if (d.hasMinValue && v < d.minValue) {
        std::ostringstream oss;
        oss << "field '" << d.name << "' value " << v << " is below the minimum " << d.minValue;
        throw ValidationError(oss.str());
    }
    if (d.hasMaxValue && v > d.maxValue) {
        std::ostringstream oss;
        oss << "field '" << d.name << "' value " << v << " is above the maximum " << d.maxValue;
        throw ValidationError(oss.str());
    }
}

void FieldStore::setValue(const std::string& name, const FieldValue& value) {
    const auto& d = descriptor(name);
    validate(d, value);
    values[name] = value;
    dirty.insert(name);
    for (const auto& listener : listeners) {
        if (listener) listener(name);
    }
}

void FieldStore::serialize(serde::RigSerializer& serializer) const {
    for (const auto& d : schema_->list()) {
        auto it = values.find(d.name);
        if (it == values.end()) continue;
        serializer.putKey(d.name);
        switch (d.type) {
        case FieldType::Int: serializer.putValue(std::get<int>(it->second)); break;
        case FieldType::Float: serializer.putValue(std::get<float>(it->second)); break;
        case FieldType::Object: serializer.putValue(std::get<NodeRef>(it->second)); break;
        case FieldType::ObjectList: serializer.putList(std::get<NodeRefList>(it->second)); break;
        }
    }
}

serde::SerdeException FieldStore::deserializeFromDocument(const serde::Document& data) {
    try {
        for (const auto& d : schema_->list()) {
            auto child = data.get_child_optional(d.name);
            if (!child) continue;
            switch (d.type) {
            case FieldType::Int: setValue(d.name, child->get_value<int>()); break;
            case FieldType::Float: setValue(d.name, child->get_value<float>()); break;
            case FieldType::Object: setValue(d.name, child->get_value<NodeRef>()); break;
            case FieldType::ObjectList: setValue(d.name, serde::readList<NodeRef>(*child)); break;
            }
        }
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    dirty.clear();
    return std::nullopt;
}

} // namespace rigcx::core::fields
