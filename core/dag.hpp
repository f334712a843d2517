#pragma once

#include "scene/scene_graph.hpp"

#include <string>

namespace rigcx::core::dag {

using scene::NodeRef;
using scene::SceneGraph;

// Gives `first` the world transform of `last`.
void snapFirstToLast(SceneGraph& scene, NodeRef first, NodeRef last);

// Inserts a transform between `node` and its parent, matching the node's world transform.
NodeRef addParentGroup(SceneGraph& scene, NodeRef node, const std::string& suffix);

void matrixConstraint(SceneGraph& scene, NodeRef driver, NodeRef driven, bool maintainOffset = false);

void resetNode(SceneGraph& scene, NodeRef node);

// Locks translate/rotate/scale on every axis.
void lockTransformChannels(SceneGraph& scene, NodeRef node);

} // namespace rigcx::core::dag
