#pragma once

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace epm {

// Type a YAML scalar resolves to under the core schema.
enum class ScalarKind {
    Null,
    Bool,
    Integer,
    Float,
    String
};

// Quoted and !!str scalars are always strings; plain scalars are resolved
// as null, bool, integer and float before falling back to string.
ScalarKind classify_scalar(const YAML::Node& node);

bool is_string(const YAML::Node& node);

// Converts a YAML node into the JSON value it denotes (used for request bodies).
nlohmann::json to_json(const YAML::Node& node);

} // namespace epm
