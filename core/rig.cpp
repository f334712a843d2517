#include "rig.hpp"

#include "debug_log.hpp"
#include "errors.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <set>
#include <stdexcept>
#include <utility>

namespace rigcx::core {

Rig::Rig(std::shared_ptr<scene::SceneGraph> scene) : scene_(std::move(scene)) {
    if (!scene_) throw std::invalid_argument("Rig requires a scene");
}

void Rig::setup() {
    auto& scene = sceneRef();
    if (!resolveJoint(rootJoint)) rootJoint = scene.createNode(scene::NodeKind::Joint, "root");
    if (!resolveJoint(controlsRoot)) controlsRoot = scene.createNode(scene::NodeKind::Transform, "controls");
    if (!resolveJoint(extrasRoot)) extrasRoot = scene.createNode(scene::NodeKind::Transform, "extras");
}

std::shared_ptr<RigModule> Rig::addModule(const std::string& type, const std::string& moduleName,
                                          NodeRef parentJoint) {
    setup();
    if (findModule(moduleName)) {
        throw RigError("a module named '" + moduleName + "' already exists");
    }
    const NodeRef parent = parentJoint == kInvalidNode ? rootJoint : parentJoint;
    if (!resolveJoint(parent)) {
        throw MissingReferenceError("parent joint " + std::to_string(parent) + " of module '" + moduleName +
                                    "' does not exist");
    }

    auto module = RigModule::inInstantiateModule(type);
    module->name = moduleName;
    module->setRig(shared_from_this());
    module->parentJoint.set(parent);

    auto& scene = sceneRef();
    const NodeRef controls = scene.createNode(scene::NodeKind::Transform, moduleName + "_controls");
    scene.reparent(controls, controlsRoot);
    const NodeRef extras = scene.createNode(scene::NodeKind::Transform, moduleName + "_extras");
    scene.reparent(extras, extrasRoot);
    module->controlsGroup.set(controls);
    module->extrasGroup.set(extras);

    modules_.push_back(module);
    try {
        module->initialize();
    } catch (const std::exception&) {
        modules_.pop_back();
        std::vector<NodeRef> created = module->deformJoints.get();
        created.push_back(controls);
        created.push_back(extras);
        deleteExisting(created);
        throw;
    }
    module->fieldStore().clearDirty();
    RGCX_DBG_LOG("[rigcx][Rig] added %s '%s' with %zu joint(s)\n", type.c_str(), moduleName.c_str(),
                 module->deformJointCount());
    return module;
}

void Rig::removeModule(const std::string& moduleName) {
    auto module = findModule(moduleName);
    if (!module) throw RigError("no module named '" + moduleName + "'");

    const auto joints = module->deformJoints.get();
    const NodeRef fallback = module->parentJoint.get();
    for (const auto& dep : dependentsOf(joints, module.get())) {
        RGCX_TRACE_LOG("[rigcx][Reconcile] %s: redirect dependent %s before removal\n", moduleName.c_str(),
                       dep->name.c_str());
        dep->parentJoint.set(fallback);
        dep->update();
    }

    std::vector<NodeRef> doomed = module->buildOutput();
    doomed.insert(doomed.end(), joints.begin(), joints.end());
    doomed.push_back(module->controlsGroup.get());
    doomed.push_back(module->extrasGroup.get());
    deleteExisting(doomed);

    modules_.erase(std::remove(modules_.begin(), modules_.end(), module), modules_.end());
    module->forgetBuildOutput();
    module->setRig(nullptr);
}

std::shared_ptr<RigModule> Rig::findModule(const std::string& moduleName) const {
    for (const auto& m : modules_) {
        if (m->name == moduleName) return m;
    }
    return nullptr;
}

std::shared_ptr<RigModule> Rig::moduleOwningJoint(NodeRef joint) const {
    for (const auto& m : modules_) {
        if (m->ownsJoint(joint)) return m;
    }
    return nullptr;
}

std::optional<NodeRef> Rig::resolveJoint(NodeRef ref) const {
    if (ref == kInvalidNode || !scene_->exists(ref)) return std::nullopt;
    return ref;
}

std::vector<std::shared_ptr<RigModule>> Rig::dependentsOf(const std::vector<NodeRef>& joints,
                                                          const RigModule* exclude) const {
    std::vector<std::shared_ptr<RigModule>> out;
    for (const auto& m : modules_) {
        if (m.get() == exclude) continue;
        if (std::find(joints.begin(), joints.end(), m->parentJoint.get()) != joints.end()) {
            out.push_back(m);
        }
    }
    return out;
}

std::vector<std::shared_ptr<RigModule>> Rig::buildOrder() const {
    std::vector<std::shared_ptr<RigModule>> order;
    std::set<const RigModule*> done;
    std::set<const RigModule*> visiting;
    std::function<void(const std::shared_ptr<RigModule>&)> visit = [&](const std::shared_ptr<RigModule>& m) {
        if (done.count(m.get())) return;
        if (visiting.count(m.get())) {
            throw StructuralInconsistencyError("module '" + m->name + "' is its own ancestor");
        }
        visiting.insert(m.get());
        auto owner = moduleOwningJoint(m->parentJoint.get());
        if (owner && owner != m) visit(owner);
        visiting.erase(m.get());
        done.insert(m.get());
        order.push_back(m);
    };
    for (const auto& m : modules_) {
        visit(m);
    }
    return order;
}

void Rig::updateModule(const std::string& moduleName) {
    auto module = findModule(moduleName);
    if (!module) throw RigError("no module named '" + moduleName + "'");
    module->update();
    module->fieldStore().clearDirty();
}

void Rig::updateAll() {
    for (const auto& m : buildOrder()) {
        m->update();
        m->fieldStore().clearDirty();
    }
}

BuildReport Rig::build(BuildPolicy policy) {
    BuildReport report;
    for (const auto& m : buildOrder()) {
        ModuleBuildResult result;
        result.module = m->name;
        const std::size_t before = m->buildOutput().size();
        try {
            m->build();
            result.nodesCreated = m->buildOutput().size() - before;
        } catch (const std::exception& e) {
            discardBuildOutput(*m);
            if (policy == BuildPolicy::AbortOnError) throw;
            RGCX_WARN_LOG("[rigcx][Rig] build of module '%s' failed: %s\n", m->name.c_str(), e.what());
            result.ok = false;
            result.error = e.what();
        }
        report.results.push_back(result);
    }
    RGCX_DBG_LOG("[rigcx][Rig] build modules=%zu failures=%zu\n", report.results.size(), report.failures());
    return report;
}

void Rig::clearBuild() {
    for (const auto& m : modules_) {
        m->capturePersistentAttributes();
        discardBuildOutput(*m);
    }
}

BuildReport Rig::rebuild(BuildPolicy policy) {
    clearBuild();
    return build(policy);
}

void Rig::publish() {
    for (const auto& m : buildOrder()) {
        m->publish();
    }
}

void Rig::discardBuildOutput(RigModule& module) {
    deleteExisting(module.buildOutput());
    module.forgetBuildOutput();
}

void Rig::deleteExisting(const std::vector<NodeRef>& refs) {
    // Earlier deletions may already have taken descendants with them.
    std::vector<NodeRef> present;
    for (auto ref : refs) {
        if (resolveJoint(ref) && std::find(present.begin(), present.end(), ref) == present.end()) {
            present.push_back(ref);
        }
    }
    if (!present.empty()) sceneRef().deleteNodes(present);
}

void Rig::serialize(serde::RigSerializer& serializer) const {
    serializer.putKey("name");
    serializer.putValue(name);
    serializer.putKey("root_joint");
    serializer.putValue(rootJoint);
    serializer.putKey("controls_root");
    serializer.putValue(controlsRoot);
    serializer.putKey("extras_root");
    serializer.putValue(extrasRoot);

    serde::Document list;
    for (const auto& m : modules_) {
        serde::RigSerializer child;
        m->serialize(child);
        list.push_back({"", child.root});
    }
    serializer.putKey("modules");
    serializer.putChild(list);
}

serde::SerdeException Rig::deserializeFromDocument(const serde::Document& data) {
    try {
        if (auto v = data.get_optional<std::string>("name")) name = *v;
        rootJoint = data.get<NodeRef>("root_joint", kInvalidNode);
        controlsRoot = data.get<NodeRef>("controls_root", kInvalidNode);
        extrasRoot = data.get<NodeRef>("extras_root", kInvalidNode);

        modules_.clear();
        if (auto list = data.get_child_optional("modules")) {
            for (const auto& entry : *list) {
                const auto type = entry.second.get<std::string>("type");
                if (!RigModule::inHasModuleType(type)) {
                    return std::string("unknown module type '") + type + "'";
                }
                auto module = RigModule::inInstantiateModule(type);
                module->setRig(shared_from_this());
                if (auto err = module->deserializeFromDocument(entry.second)) return err;
                if (findModule(module->name)) {
                    return std::string("duplicate module name '") + module->name + "'";
                }
                module->fieldStore().clearDirty();
                modules_.push_back(module);
            }
        }
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

} // namespace rigcx::core
