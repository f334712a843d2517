#pragma once

#include "../fields/typed_fields.hpp"
#include "../scene/scene_graph.hpp"
#include "../serde.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rigcx::core {
class Rig;
} // namespace rigcx::core

namespace rigcx::core::modules {

using scene::kInvalidNode;
using scene::NodeKind;
using scene::NodeRef;

// A configurable unit of rig construction. Configuration lives in typed fields; the module
// reconciles its owned deform joints against those fields in update() and generates the
// transient control network in build().
class RigModule {
protected:
    fields::FieldStore store;

public:
    explicit RigModule(const fields::FieldSchema& schema);
    RigModule(const RigModule&) = delete;
    RigModule& operator=(const RigModule&) = delete;
    virtual ~RigModule() = default;

    static const fields::FieldSchema& baseSchema();

    std::string name{"module"};

    fields::ObjectField parentJoint{store, "parent_joint"};
    fields::ObjectListField deformJoints{store, "deform_joints"};
    fields::ObjectField controlsGroup{store, "controls_group"};
    fields::ObjectField extrasGroup{store, "extras_group"};

    virtual const std::string& typeId() const = 0;

    // Called once, when the module is first added to a rig. Not called on rehydration.
    virtual void initialize() {}
    virtual void update();
    virtual void updateParentJoint();
    virtual void build() = 0;
    virtual void publish() {}

    virtual std::vector<NodeRef> drivingJoints() const;
    std::size_t deformJointCount() const { return deformJoints.get().size(); }
    bool ownsJoint(NodeRef ref) const;

    fields::FieldStore& fieldStore() { return store; }
    const fields::FieldStore& fieldStore() const { return store; }

    std::shared_ptr<::rigcx::core::Rig> rigRef() const { return rig.lock(); }
    void setRig(const std::shared_ptr<::rigcx::core::Rig>& r) { rig = r; }
    scene::SceneGraph& sceneRef() const;

    // Nodes created by the last build(). Saved with the module so a reloaded rig can clear them.
    const std::vector<NodeRef>& buildOutput() const { return buildNodes; }
    void forgetBuildOutput() {
        buildNodes.clear();
        persistentPlugs.clear();
    }
    // Reads back persistent control attributes so the next build restores them.
    void capturePersistentAttributes();
    // Stored values overlaid with the ones currently authored on live controls.
    std::map<std::string, float> persistentSnapshot() const;
    std::optional<float> persistentValue(const std::string& key) const;

    virtual void serialize(serde::RigSerializer& serializer) const;
    virtual serde::SerdeException deserializeFromDocument(const serde::Document& data);

    using ModuleFactory = std::function<std::shared_ptr<RigModule>()>;
    static bool inHasModuleType(const std::string& id);
    static void inRegisterModuleType(const std::string& id, const ModuleFactory& factory);
    static std::shared_ptr<RigModule> inInstantiateModule(const std::string& id);

protected:
    // Single growth primitive: creates a joint, parents it under `parent` (parent_joint when
    // omitted) and appends it to deform_joints.
    NodeRef addDeformJoint(std::optional<NodeRef> parent = std::nullopt);

    // Deletes the last `count` joints. With `cascade`, every other module whose parent_joint is
    // one of the doomed joints is redirected to the last surviving joint (or to this module's
    // parent_joint) and updated before anything is deleted.
    void removeTailJoints(std::size_t count, bool cascade);

    // Moves `joint` under `expected` when the scene disagrees.
    void reparentIfNeeded(NodeRef joint, NodeRef expected);

    NodeRef addNode(NodeKind kind, const std::string& role, const std::string& description = {},
                    std::optional<int> objectId = std::nullopt);
    NodeRef createBuildNode(NodeKind kind, const std::string& nameHint);
    void trackBuildNode(NodeRef ref) { buildNodes.push_back(ref); }

    // Creates `<joint>_ctl` snapped to the joint inside a locked "buffer" group.
    // Returns {control, buffer}.
    std::pair<NodeRef, NodeRef> addControl(NodeRef joint);

    // Custom control attribute whose authored value survives rebuilds.
    void createPersistentAttribute(NodeRef node, const std::string& attr, const scene::AttrSpec& spec);
    // Drops stored and live persistent attributes of the control named `control`.
    void forgetPersistentAttributes(const std::string& control);

    std::weak_ptr<::rigcx::core::Rig> rig{};
    std::vector<NodeRef> buildNodes{};
    std::vector<std::pair<NodeRef, std::string>> persistentPlugs{};
    std::map<std::string, float> persistentValues{};
};

} // namespace rigcx::core::modules
