#include "module.hpp"

#include "chain.hpp"
#include "corrective.hpp"

#include "../dag.hpp"
#include "../debug_log.hpp"
#include "../errors.hpp"
#include "../naming.hpp"
#include "../rig.hpp"

#include <algorithm>
#include <exception>
#include <unordered_map>

namespace rigcx::core::modules {

namespace {

std::unordered_map<std::string, RigModule::ModuleFactory>& moduleFactories() {
    static std::unordered_map<std::string, RigModule::ModuleFactory> factories;
    return factories;
}

void registerDefaultModules() {
    static bool registered = false;
    if (registered) return;
    registered = true;
    RigModule::inRegisterModuleType("Chain", [] { return std::make_shared<Chain>(); });
    RigModule::inRegisterModuleType("Corrective", [] { return std::make_shared<Corrective>(); });
}

} // namespace

const fields::FieldSchema& RigModule::baseSchema() {
    static const fields::FieldSchema schema = [] {
        fields::FieldSchema s;
        auto parent = fields::objectField("parent_joint");
        parent.displayable = true;
        parent.editable = true;
        parent.guiOrder = 0;
        parent.tooltip = "Joint the module's first deform joint hangs from.";
        s.add(parent);
        auto joints = fields::objectListField("deform_joints");
        joints.displayable = true;
        joints.guiOrder = 100;
        s.add(joints);
        s.add(fields::objectField("controls_group"));
        s.add(fields::objectField("extras_group"));
        return s;
    }();
    return schema;
}

RigModule::RigModule(const fields::FieldSchema& schema) : store(schema) {}

bool RigModule::inHasModuleType(const std::string& id) {
    registerDefaultModules();
    return moduleFactories().find(id) != moduleFactories().end();
}

void RigModule::inRegisterModuleType(const std::string& id, const ModuleFactory& factory) {
    moduleFactories()[id] = factory;
}

std::shared_ptr<RigModule> RigModule::inInstantiateModule(const std::string& id) {
    registerDefaultModules();
    auto it = moduleFactories().find(id);
    if (it == moduleFactories().end()) {
        throw RigError("unknown module type '" + id + "'");
    }
    return it->second();
}

scene::SceneGraph& RigModule::sceneRef() const {
    auto r = rig.lock();
    if (!r) throw RigError("module '" + name + "' is not attached to a rig");
    return r->sceneRef();
}

bool RigModule::ownsJoint(NodeRef ref) const {
    auto joints = deformJoints.get();
    return std::find(joints.begin(), joints.end(), ref) != joints.end();
}

std::vector<NodeRef> RigModule::drivingJoints() const {
    return deformJoints.get();
}

void RigModule::update() {
    updateParentJoint();
}

void RigModule::updateParentJoint() {
    NodeRef expected = parentJoint.get();
    for (auto joint : deformJoints.get()) {
        reparentIfNeeded(joint, expected);
        expected = joint;
    }
}

void RigModule::reparentIfNeeded(NodeRef joint, NodeRef expected) {
    auto r = rigRef();
    if (!r) throw RigError("module '" + name + "' is not attached to a rig");
    auto& scene = r->sceneRef();
    if (!scene.exists(joint)) {
        throw StructuralInconsistencyError("module '" + name + "': owned joint " + std::to_string(joint) +
                                           " no longer exists");
    }
    if (expected == kInvalidNode || !r->resolveJoint(expected)) {
        throw StructuralInconsistencyError("module '" + name + "': expected parent " + std::to_string(expected) +
                                           " of joint '" + scene.nodeName(joint) + "' is missing");
    }
    if (scene.parentOf(joint) == expected) return;
    RGCX_TRACE_LOG("[rigcx][Reconcile] %s: reparent %s under %s\n", name.c_str(), scene.nodeName(joint).c_str(),
                   scene.nodeName(expected).c_str());
    scene.reparent(joint, expected);
}

NodeRef RigModule::addDeformJoint(std::optional<NodeRef> parent) {
    auto r = rigRef();
    if (!r) throw RigError("module '" + name + "' is not attached to a rig");
    auto& scene = r->sceneRef();
    NodeRef target = parent.value_or(parentJoint.get());
    if (target == kInvalidNode || !r->resolveJoint(target)) {
        throw StructuralInconsistencyError("module '" + name + "': cannot add a joint under missing parent " +
                                           std::to_string(target));
    }
    auto joints = deformJoints.get();
    NodeRef joint = addNode(NodeKind::Joint, "jnt", {}, static_cast<int>(joints.size()));
    dag::snapFirstToLast(scene, joint, target);
    scene.reparent(joint, target);
    joints.push_back(joint);
    deformJoints.set(joints);
    RGCX_TRACE_LOG("[rigcx][Reconcile] %s: added %s under %s\n", name.c_str(), scene.nodeName(joint).c_str(),
                   scene.nodeName(target).c_str());
    return joint;
}

void RigModule::removeTailJoints(std::size_t count, bool cascade) {
    auto joints = deformJoints.get();
    count = std::min(count, joints.size());
    if (count == 0) return;
    auto r = rigRef();
    if (!r) throw RigError("module '" + name + "' is not attached to a rig");
    auto& scene = r->sceneRef();

    const auto split = joints.end() - static_cast<std::ptrdiff_t>(count);
    std::vector<NodeRef> doomed(split, joints.end());
    std::vector<NodeRef> kept(joints.begin(), split);

    // Dependents are repaired while every doomed joint still exists.
    auto dependents = r->dependentsOf(doomed, this);
    if (cascade) {
        NodeRef newParent = kept.empty() ? parentJoint.get() : kept.back();
        for (const auto& dep : dependents) {
            RGCX_TRACE_LOG("[rigcx][Reconcile] %s: redirect dependent %s to %s\n", name.c_str(), dep->name.c_str(),
                           scene.nodeName(newParent).c_str());
            dep->parentJoint.set(newParent);
            dep->update();
        }
    } else {
        for (const auto& dep : dependents) {
            RGCX_WARN_LOG("[rigcx][Reconcile] %s: removing joints leaves module '%s' with a dangling parent_joint\n",
                          name.c_str(), dep->name.c_str());
        }
    }

    std::vector<NodeRef> present;
    for (auto ref : doomed) {
        if (!scene.exists(ref)) continue;
        // A regrown joint reuses the name, so its control must start from defaults.
        forgetPersistentAttributes(scene.nodeName(ref) + "_ctl");
        present.push_back(ref);
    }
    if (!present.empty()) scene.deleteNodes(present);
    deformJoints.set(kept);
    RGCX_TRACE_LOG("[rigcx][Reconcile] %s: removed %zu joint(s)\n", name.c_str(), count);
}

NodeRef RigModule::addNode(NodeKind kind, const std::string& role, const std::string& description,
                           std::optional<int> objectId) {
    NodeNameParts parts;
    parts.module = name;
    parts.role = role;
    parts.description = description;
    parts.objectId = objectId;
    return sceneRef().createNode(kind, composeNodeName(parts));
}

NodeRef RigModule::createBuildNode(NodeKind kind, const std::string& nameHint) {
    NodeRef ref = sceneRef().createNode(kind, nameHint);
    trackBuildNode(ref);
    return ref;
}

std::pair<NodeRef, NodeRef> RigModule::addControl(NodeRef joint) {
    auto& scene = sceneRef();
    NodeRef ctl = createBuildNode(NodeKind::Control, scene.nodeName(joint) + "_ctl");
    dag::snapFirstToLast(scene, ctl, joint);
    NodeRef buffer = dag::addParentGroup(scene, ctl, "buffer");
    trackBuildNode(buffer);
    dag::lockTransformChannels(scene, buffer);
    return {ctl, buffer};
}

void RigModule::createPersistentAttribute(NodeRef node, const std::string& attr, const scene::AttrSpec& spec) {
    auto& scene = sceneRef();
    scene::AttrSpec persistent = spec;
    persistent.persistent = true;
    scene.addCustomAttr(node, attr, persistent);
    persistentPlugs.emplace_back(node, attr);
    auto it = persistentValues.find(scene.nodeName(node) + "." + attr);
    if (it != persistentValues.end()) {
        scene.setAttr(scene::Plug{node, attr}, it->second);
    }
}

void RigModule::forgetPersistentAttributes(const std::string& control) {
    const std::string prefix = control + ".";
    for (auto it = persistentValues.begin(); it != persistentValues.end();) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = persistentValues.erase(it);
        } else {
            ++it;
        }
    }
    auto& scene = sceneRef();
    persistentPlugs.erase(std::remove_if(persistentPlugs.begin(), persistentPlugs.end(),
                                         [&](const auto& plug) {
                                             return scene.exists(plug.first) && scene.nodeName(plug.first) == control;
                                         }),
                          persistentPlugs.end());
}

std::map<std::string, float> RigModule::persistentSnapshot() const {
    auto values = persistentValues;
    auto r = rigRef();
    if (!r) return values;
    auto& scene = r->sceneRef();
    for (const auto& [node, attr] : persistentPlugs) {
        if (!scene.exists(node)) continue;
        values[scene.nodeName(node) + "." + attr] = scene.readAttr(scene::Plug{node, attr});
    }
    return values;
}

void RigModule::capturePersistentAttributes() {
    persistentValues = persistentSnapshot();
}

std::optional<float> RigModule::persistentValue(const std::string& key) const {
    auto it = persistentValues.find(key);
    if (it == persistentValues.end()) return std::nullopt;
    return it->second;
}

void RigModule::serialize(serde::RigSerializer& serializer) const {
    serializer.putKey("type");
    serializer.putValue(typeId());
    serializer.putKey("name");
    serializer.putValue(name);

    serde::RigSerializer fieldsOut;
    store.serialize(fieldsOut);
    serializer.putKey("fields");
    serializer.putChild(fieldsOut.root);

    const auto values = persistentSnapshot();
    if (!values.empty()) {
        // Keys are "<control>.<attr>", so they are pushed as literal child names.
        serde::Document attrs;
        for (const auto& [key, value] : values) {
            serde::Document v;
            v.put_value(value);
            attrs.push_back({key, v});
        }
        serializer.putKey("persistent_attributes");
        serializer.putChild(attrs);
    }

    if (!buildNodes.empty()) {
        serializer.putKey("build_output");
        serializer.putList(buildNodes);
    }
    if (!persistentPlugs.empty()) {
        serde::Document plugs;
        for (const auto& [node, attr] : persistentPlugs) {
            serde::Document p;
            p.put("node", node);
            p.put("attr", attr);
            plugs.push_back({"", p});
        }
        serializer.putKey("persistent_plugs");
        serializer.putChild(plugs);
    }
}

serde::SerdeException RigModule::deserializeFromDocument(const serde::Document& data) {
    try {
        if (auto n = data.get_optional<std::string>("name")) name = *n;
        if (auto f = data.get_child_optional("fields")) {
            if (auto err = store.deserializeFromDocument(*f)) return err;
        }
        persistentValues.clear();
        if (auto attrs = data.get_child_optional("persistent_attributes")) {
            for (const auto& kv : *attrs) {
                persistentValues[kv.first] = kv.second.get_value<float>();
            }
        }
        buildNodes.clear();
        if (auto out = data.get_child_optional("build_output")) {
            buildNodes = serde::readList<NodeRef>(*out);
        }
        persistentPlugs.clear();
        if (auto plugs = data.get_child_optional("persistent_plugs")) {
            for (const auto& kv : *plugs) {
                persistentPlugs.emplace_back(kv.second.get<NodeRef>("node"), kv.second.get<std::string>("attr"));
            }
        }
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

} // namespace rigcx::core::modules
