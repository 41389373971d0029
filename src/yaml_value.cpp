#include "yaml_value.hpp"
#include <cstdint>
#include <string>

namespace epm {

namespace {

constexpr const char* kStringTag = "tag:yaml.org,2002:str";

} // namespace

ScalarKind classify_scalar(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return ScalarKind::Null;
    }

    // "!" marks a quoted scalar
    const std::string& tag = node.Tag();
    if (tag == "!" || tag == kStringTag) {
        return ScalarKind::String;
    }

    bool b;
    if (YAML::convert<bool>::decode(node, b)) {
        return ScalarKind::Bool;
    }
    int64_t i;
    if (YAML::convert<int64_t>::decode(node, i)) {
        return ScalarKind::Integer;
    }
    double d;
    if (YAML::convert<double>::decode(node, d)) {
        return ScalarKind::Float;
    }
    return ScalarKind::String;
}

bool is_string(const YAML::Node& node) {
    return node.IsScalar() && classify_scalar(node) == ScalarKind::String;
}

nlohmann::json to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;

        case YAML::NodeType::Sequence: {
            auto array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(to_json(item));
            }
            return array;
        }

        case YAML::NodeType::Map: {
            auto object = nlohmann::json::object();
            for (const auto& entry : node) {
                const auto& key = entry.first;
                object[key.IsScalar() ? key.Scalar() : YAML::Dump(key)] = to_json(entry.second);
            }
            return object;
        }

        case YAML::NodeType::Scalar:
            break;
    }

    switch (classify_scalar(node)) {
        case ScalarKind::Null: return nullptr;
        case ScalarKind::Bool: return node.as<bool>();
        case ScalarKind::Integer: return node.as<int64_t>();
        case ScalarKind::Float: return node.as<double>();
        case ScalarKind::String: break;
    }
    return node.Scalar();
}

} // namespace epm
