#pragma once

#include <stdexcept>
#include <string>

namespace rigcx::core {

class RigError : public std::runtime_error {
public:
    explicit RigError(const std::string& what) : std::runtime_error(what) {}
};

// A field write violated the field's type or bounds. Nothing was stored.
class ValidationError : public RigError {
public:
    explicit ValidationError(const std::string& what) : RigError(what) {}
};

// The scene hierarchy can no longer be reconciled with a module's declared parent_joint.
class StructuralInconsistencyError : public RigError {
public:
    explicit StructuralInconsistencyError(const std::string& what) : RigError(what) {}
};

// A required reference field resolved to nothing at build time.
class MissingReferenceError : public RigError {
public:
    explicit MissingReferenceError(const std::string& what) : RigError(what) {}
};

// Raised by scene adapters for unknown nodes or invalid operations.
class SceneError : public RigError {
public:
    explicit SceneError(const std::string& what) : RigError(what) {}
};

// A node-graph description is malformed (unknown plug, double-driven input, cycle).
class GraphError : public RigError {
public:
    explicit GraphError(const std::string& what) : RigError(what) {}
};

} // namespace rigcx::core
