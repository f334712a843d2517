#pragma once

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rigcx::core::serde {

using Document = boost::property_tree::ptree;
using SerdeException = std::optional<std::string>;

class RigSerializer {
public:
    void putKey(const std::string& key) { pendingKey = key; }

    template <typename T>
    void putValue(const T& value) {
        if (!pendingKey.empty()) {
            root.put(pendingKey, value);
            pendingKey.clear();
        }
    }

    void putChild(const Document& child) {
        if (!pendingKey.empty()) {
            root.add_child(pendingKey, child);
            pendingKey.clear();
        }
    }

    template <typename T>
    void putList(const std::vector<T>& values) {
        Document arr;
        for (const auto& v : values) {
            Document elem;
            elem.put("", v);
            arr.push_back({"", elem});
        }
        putChild(arr);
    }

    Document root;

private:
    std::string pendingKey{};
};

template <typename T>
inline std::vector<T> readList(const Document& node) {
    std::vector<T> out;
    for (const auto& elem : node) {
        out.push_back(elem.second.get_value<T>());
    }
    return out;
}

inline void writeJson(const RigSerializer& s, const std::string& path) {
    boost::property_tree::write_json(path, s.root);
}

} // namespace rigcx::core::serde
