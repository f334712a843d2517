#pragma once

#include "../core/rig.hpp"
#include "../core/serde.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace rigcx::core::fmt {

template <typename T>
inline std::string inToJson(const T& item) {
    std::stringstream ss;
    serde::RigSerializer serializer;
    item.serialize(serializer);
    boost::property_tree::write_json(ss, serializer.root, false);
    return ss.str();
}

template <typename T>
inline std::string inToJsonPretty(const T& item) {
    std::stringstream ss;
    serde::RigSerializer serializer;
    item.serialize(serializer);
    boost::property_tree::write_json(ss, serializer.root, true);
    return ss.str();
}

// Rehydrates a rig against nodes that already exist in `scene`. Modules are not initialized.
inline std::shared_ptr<Rig> inLoadRigFromMemory(const std::shared_ptr<scene::SceneGraph>& scene,
                                                const std::string& data) {
    std::stringstream ss(data);
    serde::Document pt;
    boost::property_tree::read_json(ss, pt);
    auto rig = std::make_shared<Rig>(scene);
    if (auto err = rig->deserializeFromDocument(pt)) {
        throw std::runtime_error("failed to load rig: " + *err);
    }
    return rig;
}

inline std::shared_ptr<Rig> inLoadRig(const std::shared_ptr<scene::SceneGraph>& scene, const std::string& file) {
    std::ifstream ifs(file);
    if (!ifs) throw std::runtime_error("cannot open rig file " + file);
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return inLoadRigFromMemory(scene, buffer.str());
}

inline void inWriteRig(const Rig& rig, const std::string& file) {
    serde::RigSerializer serializer;
    rig.serialize(serializer);
    serde::writeJson(serializer, file);
}

} // namespace rigcx::core::fmt
