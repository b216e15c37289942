#ifndef USML_YAML_ERROR_UTILS_HPP
#define USML_YAML_ERROR_UTILS_HPP

#include "common/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace common::yaml {

inline const char* node_type_name(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: return "map";
        case YAML::NodeType::Sequence: return "sequence";
        case YAML::NodeType::Scalar: return "scalar";
        case YAML::NodeType::Null: return "null";
        case YAML::NodeType::Undefined: break;
    }
    return "undefined";
}

// Debug logging utility for node contents
inline void log_node_keys(const YAML::Node& node, const std::string& context = "") {
    if (!common::log::enabled(common::log::Level::Debug)) {
        return;
    }
    if (!node.IsMap()) {
        common::log::debug(context + " node is not a map");
        return;
    }

    std::string keys;
    for (const auto& key : node) {
        keys += key.first.as<std::string>() + " ";
    }
    common::log::debug("Parsing " + context + " with keys: " + keys);
}

// First key not contained in the allowed set, if any
inline std::optional<std::string> find_unknown_key(
    const YAML::Node& node,
    const std::vector<std::string>& allowed_keys) {
    if (!node.IsMap()) {
        return std::nullopt;
    }
    for (const auto& entry : node) {
        const auto key = entry.first.Scalar();
        if (std::find(allowed_keys.begin(), allowed_keys.end(), key) == allowed_keys.end()) {
            return key;
        }
    }
    return std::nullopt;
}

// yaml-cpp marks are zero-based; report one-based positions
inline std::optional<std::pair<size_t, size_t>> position_of(const YAML::Node& node) {
    const auto mark = node.Mark();
    if (mark.is_null()) {
        return std::nullopt;
    }
    return std::make_pair(static_cast<size_t>(mark.line) + 1,
                          static_cast<size_t>(mark.column) + 1);
}

} // namespace common::yaml

#endif // USML_YAML_ERROR_UTILS_HPP
