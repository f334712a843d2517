#pragma once

#include "field_store.hpp"

#include <string>
#include <variant>

namespace rigcx::core::fields {

template <typename T>
class TypedField {
public:
    TypedField(FieldStore& store, std::string name) : store_(&store), name_(std::move(name)) {}

    T get() const { return std::get<T>(store_->value(name_)); }
    void set(const T& value) { store_->setValue(name_, FieldValue{value}); }
    bool isSet() const { return store_->isSet(name_); }
    const std::string& name() const { return name_; }
    const FieldDescriptor& descriptor() const { return store_->descriptor(name_); }

private:
    FieldStore* store_;
    std::string name_;
};

using IntField = TypedField<int>;
using FloatField = TypedField<float>;
using ObjectField = TypedField<NodeRef>;
using ObjectListField = TypedField<NodeRefList>;

} // namespace rigcx::core::fields
