#pragma once

#include "field.hpp"
#include "../serde.hpp"

#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace rigcx::core::fields {

// Per-instance storage for the fields declared by a schema. Only explicitly written values
// are stored; reads fall back to the declared default.
class FieldStore {
public:
    using ChangeListener = std::function<void(const std::string& fieldName)>;

    explicit FieldStore(const FieldSchema& schema) : schema_(&schema) {}

    const FieldSchema& schema() const { return *schema_; }
    const FieldDescriptor& descriptor(const std::string& name) const;

    FieldValue value(const std::string& name) const;
    bool isSet(const std::string& name) const { return values.find(name) != values.end(); }

    // Validates type and bounds and throws ValidationError before anything is stored.
    void setValue(const std::string& name, const FieldValue& value);
    void validate(const FieldDescriptor& descriptor, const FieldValue& value) const;

    bool isDirty(const std::string& name) const { return dirty.count(name) != 0; }
    bool anyDirty() const { return !dirty.empty(); }
    void clearDirty() { dirty.clear(); }

    void addChangeListener(ChangeListener listener) { listeners.push_back(std::move(listener)); }

    void serialize(serde::RigSerializer& serializer) const;
    serde::SerdeException deserializeFromDocument(const serde::Document& data);

private:
    const FieldSchema* schema_;
    std::map<std::string, FieldValue> values{};
    std::set<std::string> dirty{};
    std::vector<ChangeListener> listeners{};
};

} // namespace rigcx::core::fields
