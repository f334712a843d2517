#pragma once

#include <optional>
#include <string>

namespace rigcx::core {

struct NodeNameParts {
    std::string module{};
    std::string role{};
    std::string description{};
    std::optional<int> objectId{};
};

// <module>[_<description>][_<objectId>]_<role>, e.g. "elbow_positive_offset_Y_0_mult".
inline std::string composeNodeName(const NodeNameParts& parts) {
    std::string out = parts.module;
    auto append = [&](const std::string& seg) {
        if (seg.empty()) return;
        if (!out.empty()) out += "_";
        out += seg;
    };
    append(parts.description);
    if (parts.objectId) append(std::to_string(*parts.objectId));
    append(parts.role);
    return out;
}

} // namespace rigcx::core
