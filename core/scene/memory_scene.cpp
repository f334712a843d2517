#include "memory_scene.hpp"

#include "../debug_log.hpp"
#include "../errors.hpp"

#include <algorithm>
#include <cctype>

namespace rigcx::core::scene {

namespace {

bool isTranslateAttr(const std::string& attr, int& axis) {
    if (attr == "translateX") axis = 0;
    else if (attr == "translateY") axis = 1;
    else if (attr == "translateZ") axis = 2;
    else return false;
    return true;
}

std::string stripTrailingDigits(const std::string& name) {
    auto end = name.size();
    while (end > 0 && std::isdigit(static_cast<unsigned char>(name[end - 1]))) --end;
    return name.substr(0, end);
}

} // namespace

NodeRef MemoryScene::createNode(NodeKind kind, const std::string& nameHint) {
    auto node = std::make_shared<SceneNode>();
    node->ref = nextRef++;
    node->kind = kind;
    node->name = uniqueName(nameHint.empty() ? std::string(nodeKindName(kind)) : nameHint);
    nodes[node->ref] = node;
    names[node->name] = node->ref;
    ++stats.creations;
    record(SceneOpKind::Create, node->ref, kInvalidNode, node->name);
    RGCX_DBG_LOG("[rigcx][MemoryScene] create %s ref=%u kind=%s\n", node->name.c_str(), node->ref, nodeKindName(kind));
    return node->ref;
}

void MemoryScene::deleteNodes(const std::vector<NodeRef>& refs) {
    for (auto ref : refs) {
        require(ref);
    }
    std::vector<NodeRef> doomed;
    for (auto ref : refs) {
        auto it = nodes.find(ref);
        if (it == nodes.end()) continue;
        if (std::find(doomed.begin(), doomed.end(), ref) != doomed.end()) continue;
        collectSubtree(it->second, doomed);
    }
    for (auto ref : doomed) {
        auto it = nodes.find(ref);
        if (it == nodes.end()) continue;
        auto node = it->second;
        detach(node);
        names.erase(node->name);
        nodes.erase(it);
        ++stats.deletions;
        record(SceneOpKind::Delete, ref, kInvalidNode, node->name);
    }
    auto isDoomed = [&](NodeRef r) { return std::find(doomed.begin(), doomed.end(), r) != doomed.end(); };
    connections.erase(std::remove_if(connections.begin(), connections.end(), [&](const SceneConnection& c) {
                          return isDoomed(c.src.node) || isDoomed(c.dst.node);
                      }),
                      connections.end());
    constraints.erase(std::remove_if(constraints.begin(), constraints.end(), [&](const SceneConstraint& c) {
                          return isDoomed(c.driver) || isDoomed(c.driven);
                      }),
                      constraints.end());
}

bool MemoryScene::exists(NodeRef ref) const {
    return nodes.find(ref) != nodes.end();
}

std::string MemoryScene::nodeName(NodeRef ref) const {
    return require(ref)->name;
}

Mat4 MemoryScene::worldTransform(NodeRef ref) const {
    return worldOf(*require(ref));
}

void MemoryScene::setWorldTransform(NodeRef ref, const Mat4& world) {
    auto node = require(ref);
    applyWorld(*node, world);
    ++stats.transformWrites;
    record(SceneOpKind::SetTransform, ref);
}

void MemoryScene::setLocalTranslation(NodeRef ref, Axis axis, float value) {
    setAttr(Plug{ref, std::string("translate") + axisLetter(axis)}, value);
}

void MemoryScene::resetLocalTransform(NodeRef ref) {
    auto node = require(ref);
    node->local = Mat4::identity();
    ++stats.transformWrites;
    record(SceneOpKind::SetTransform, ref, kInvalidNode, "reset");
}

void MemoryScene::setInheritsTransform(NodeRef ref, bool inherits) {
    auto node = require(ref);
    if (node->inheritsTransform == inherits) return;
    Mat4 world = worldOf(*node);
    node->inheritsTransform = inherits;
    applyWorld(*node, world);
}

void MemoryScene::reparent(NodeRef child, NodeRef newParent) {
    auto node = require(child);
    std::shared_ptr<SceneNode> target;
    if (newParent != kInvalidNode) {
        target = require(newParent);
        auto tmp = target;
        while (tmp) {
            if (tmp.get() == node.get()) {
                throw SceneError("cannot parent " + node->name + " under its own descendant " + target->name);
            }
            tmp = tmp->parent.lock();
        }
    }
    Mat4 world = worldOf(*node);
    detach(node);
    if (target) {
        node->parent = target;
        target->children.push_back(node);
    }
    applyWorld(*node, world);
    ++stats.reparents;
    record(SceneOpKind::Reparent, child, newParent);
}

NodeRef MemoryScene::parentOf(NodeRef ref) const {
    auto node = require(ref);
    if (auto p = node->parent.lock()) return p->ref;
    return kInvalidNode;
}

void MemoryScene::connect(const Plug& src, const Plug& dst) {
    require(src.node);
    require(dst.node);
    if (sourceOf(dst)) {
        throw SceneError("plug " + nodeName(dst.node) + "." + dst.attr + " is already connected");
    }
    connections.push_back(SceneConnection{src, dst});
    ++stats.connections;
    record(SceneOpKind::Connect, src.node, dst.node, src.attr + "->" + dst.attr);
}

void MemoryScene::setAttr(const Plug& plug, float value) {
    auto node = require(plug.node);
    if (node->lockedAttrs.count(plug.attr)) {
        throw SceneError("attribute " + node->name + "." + plug.attr + " is locked");
    }
    int axis = 0;
    if (isTranslateAttr(plug.attr, axis)) {
        node->local[axis][3] = value;
    } else {
        auto spec = node->customAttrs.find(plug.attr);
        if (spec != node->customAttrs.end()) {
            if (spec->second.minValue && value < *spec->second.minValue) {
                throw SceneError("value below minimum for " + node->name + "." + plug.attr);
            }
            if (spec->second.maxValue && value > *spec->second.maxValue) {
                throw SceneError("value above maximum for " + node->name + "." + plug.attr);
            }
        }
        node->attrs[plug.attr] = value;
    }
    ++stats.attrWrites;
    record(SceneOpKind::SetAttr, plug.node, kInvalidNode, plug.attr);
}

void MemoryScene::addCustomAttr(NodeRef ref, const std::string& name, const AttrSpec& spec) {
    auto node = require(ref);
    if (node->customAttrs.count(name)) {
        throw SceneError("attribute " + node->name + "." + name + " already exists");
    }
    node->customAttrs[name] = spec;
    node->attrs[name] = spec.defaultValue;
    record(SceneOpKind::AddAttr, ref, kInvalidNode, name);
}

void MemoryScene::lockAttr(const Plug& plug) {
    auto node = require(plug.node);
    node->lockedAttrs.insert(plug.attr);
}

void MemoryScene::constrainRigid(NodeRef driver, NodeRef driven, bool maintainOffset) {
    auto drv = require(driver);
    auto dvn = require(driven);
    SceneConstraint c;
    c.kind = SceneConstraint::Kind::Rigid;
    c.driver = driver;
    c.driven = driven;
    if (maintainOffset) {
        c.offset = Mat4::multiply(Mat4::inverse(worldOf(*drv)), worldOf(*dvn));
    }
    constraints.push_back(c);
    applyConstraint(c);
    ++stats.constraints;
    record(SceneOpKind::Constrain, driver, driven, maintainOffset ? "rigid+offset" : "rigid");
}

void MemoryScene::constrainPoint(NodeRef driver, NodeRef driven) {
    require(driver);
    require(driven);
    SceneConstraint c;
    c.kind = SceneConstraint::Kind::Point;
    c.driver = driver;
    c.driven = driven;
    constraints.push_back(c);
    applyConstraint(c);
    ++stats.constraints;
    record(SceneOpKind::Constrain, driver, driven, "point");
}

void MemoryScene::solveConstraints() {
    for (const auto& c : constraints) {
        applyConstraint(c);
    }
}

float MemoryScene::readAttr(const Plug& plug) const {
    auto node = require(plug.node);
    int axis = 0;
    if (isTranslateAttr(plug.attr, axis)) {
        return node->local[axis][3];
    }
    auto it = node->attrs.find(plug.attr);
    if (it != node->attrs.end()) return it->second;
    throw SceneError("unknown attribute " + node->name + "." + plug.attr);
}

bool MemoryScene::hasAttr(NodeRef ref, const std::string& name) const {
    auto node = require(ref);
    int axis = 0;
    return isTranslateAttr(name, axis) || node->attrs.count(name) != 0 || node->customAttrs.count(name) != 0;
}

bool MemoryScene::isLocked(const Plug& plug) const {
    return require(plug.node)->lockedAttrs.count(plug.attr) != 0;
}

std::optional<AttrSpec> MemoryScene::customAttrSpec(NodeRef ref, const std::string& name) const {
    auto node = require(ref);
    auto it = node->customAttrs.find(name);
    if (it == node->customAttrs.end()) return std::nullopt;
    return it->second;
}

Mat4 MemoryScene::localTransform(NodeRef ref) const {
    return require(ref)->local;
}

NodeKind MemoryScene::kindOf(NodeRef ref) const {
    return require(ref)->kind;
}

std::vector<NodeRef> MemoryScene::childrenOf(NodeRef ref) const {
    std::vector<NodeRef> out;
    for (const auto& child : require(ref)->children) {
        if (child) out.push_back(child->ref);
    }
    return out;
}

NodeRef MemoryScene::findNode(const std::string& name) const {
    auto it = names.find(name);
    if (it == names.end()) return kInvalidNode;
    return it->second;
}

std::optional<Plug> MemoryScene::sourceOf(const Plug& dst) const {
    for (const auto& c : connections) {
        if (c.dst == dst) return c.src;
    }
    return std::nullopt;
}

void MemoryScene::resetJournal() {
    ops.clear();
    stats = SceneCounters{};
}

std::shared_ptr<SceneNode> MemoryScene::require(NodeRef ref) const {
    auto it = nodes.find(ref);
    if (it == nodes.end()) {
        throw SceneError("no scene node with ref " + std::to_string(ref));
    }
    return it->second;
}

std::string MemoryScene::uniqueName(const std::string& hint) const {
    if (names.find(hint) == names.end()) return hint;
    const std::string base = stripTrailingDigits(hint);
    for (std::size_t i = 1;; ++i) {
        std::string candidate = base + std::to_string(i);
        if (names.find(candidate) == names.end()) return candidate;
    }
}

Mat4 MemoryScene::worldOf(const SceneNode& node) const {
    if (node.inheritsTransform) {
        if (auto p = node.parent.lock()) {
            return Mat4::multiply(worldOf(*p), node.local);
        }
    }
    return node.local;
}

void MemoryScene::applyWorld(SceneNode& node, const Mat4& world) {
    if (node.inheritsTransform) {
        if (auto p = node.parent.lock()) {
            node.local = Mat4::multiply(Mat4::inverse(worldOf(*p)), world);
            return;
        }
    }
    node.local = world;
}

void MemoryScene::applyConstraint(const SceneConstraint& c) {
    auto driver = require(c.driver);
    auto driven = require(c.driven);
    Mat4 driverWorld = worldOf(*driver);
    if (c.kind == SceneConstraint::Kind::Rigid) {
        applyWorld(*driven, Mat4::multiply(driverWorld, c.offset));
    } else {
        Mat4 world = worldOf(*driven);
        world.setTranslationPart(driverWorld.translationPart());
        applyWorld(*driven, world);
    }
}

void MemoryScene::detach(const std::shared_ptr<SceneNode>& node) {
    if (auto p = node->parent.lock()) {
        auto& siblings = p->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), node), siblings.end());
    }
    node->parent.reset();
}

void MemoryScene::collectSubtree(const std::shared_ptr<SceneNode>& node, std::vector<NodeRef>& out) const {
    if (!node) return;
    if (std::find(out.begin(), out.end(), node->ref) == out.end()) {
        out.push_back(node->ref);
    }
    for (const auto& child : node->children) {
        collectSubtree(child, out);
    }
}

void MemoryScene::record(SceneOpKind kind, NodeRef node, NodeRef other, std::string detail) {
    ops.push_back(SceneOp{kind, node, other, std::move(detail)});
}

} // namespace rigcx::core::scene
