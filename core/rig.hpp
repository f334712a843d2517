#pragma once

#include "modules/module.hpp"
#include "scene/scene_graph.hpp"
#include "serde.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rigcx::core {

using modules::RigModule;
using scene::kInvalidNode;
using scene::NodeRef;

enum class BuildPolicy {
    AbortOnError,
    ContinueOnError,
};

struct ModuleBuildResult {
    std::string module{};
    bool ok{true};
    std::string error{};
    std::size_t nodesCreated{0};
};

struct BuildReport {
    std::vector<ModuleBuildResult> results{};

    bool ok() const {
        for (const auto& r : results) {
            if (!r.ok) return false;
        }
        return true;
    }
    std::size_t failures() const {
        std::size_t n = 0;
        for (const auto& r : results) {
            if (!r.ok) ++n;
        }
        return n;
    }
};

// Owns the modules of one rig, the skeleton root and the top-level control/extras groups.
// Modules reference joints of other modules only by NodeRef; the rig resolves them on demand.
class Rig : public std::enable_shared_from_this<Rig> {
public:
    explicit Rig(std::shared_ptr<scene::SceneGraph> scene);

    // Creates the root joint and the top-level groups if they do not exist yet.
    void setup();

    std::shared_ptr<RigModule> addModule(const std::string& type, const std::string& moduleName,
                                         NodeRef parentJoint = kInvalidNode);
    void removeModule(const std::string& moduleName);

    std::shared_ptr<RigModule> findModule(const std::string& moduleName) const;
    std::shared_ptr<RigModule> moduleOwningJoint(NodeRef joint) const;
    // Empty when the node was deleted from the scene.
    std::optional<NodeRef> resolveJoint(NodeRef ref) const;
    // Modules other than `exclude` whose parent_joint is one of `joints`, in module order.
    std::vector<std::shared_ptr<RigModule>> dependentsOf(const std::vector<NodeRef>& joints,
                                                         const RigModule* exclude = nullptr) const;
    // Parents before children, following parent_joint ownership.
    std::vector<std::shared_ptr<RigModule>> buildOrder() const;

    void updateModule(const std::string& moduleName);
    void updateAll();

    BuildReport build(BuildPolicy policy = BuildPolicy::AbortOnError);
    // Deletes every node created by build(), keeping persistent control attributes.
    void clearBuild();
    BuildReport rebuild(BuildPolicy policy = BuildPolicy::AbortOnError);
    void publish();

    void serialize(serde::RigSerializer& serializer) const;
    serde::SerdeException deserializeFromDocument(const serde::Document& data);

    scene::SceneGraph& sceneRef() const { return *scene_; }
    const std::shared_ptr<scene::SceneGraph>& scene() const { return scene_; }
    const std::vector<std::shared_ptr<RigModule>>& moduleList() const { return modules_; }

    std::string name{"rig"};
    NodeRef rootJoint{kInvalidNode};
    NodeRef controlsRoot{kInvalidNode};
    NodeRef extrasRoot{kInvalidNode};

private:
    void discardBuildOutput(RigModule& module);
    void deleteExisting(const std::vector<NodeRef>& refs);

    std::shared_ptr<scene::SceneGraph> scene_;
    std::vector<std::shared_ptr<RigModule>> modules_{};
};

} // namespace rigcx::core
