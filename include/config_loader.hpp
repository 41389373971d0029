#pragma once

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <expected>

namespace epm {

struct EndpointConfig {
    std::string name;
    std::string url;
    std::string method = "GET";
    std::map<std::string, std::string> headers;
    std::optional<nlohmann::json> body;
};

struct ConfigError {
    enum class Kind {
        Read,   // missing or unreadable file
        Parse   // malformed YAML, or not a list of endpoints
    };

    Kind kind;
    std::string message;
};

class ConfigLoader {
public:
    static std::expected<YAML::Node, ConfigError> load(const std::string& config_path);

    static std::expected<YAML::Node, ConfigError> parse(const std::string& content);

    // Resolves defaults once. Records that are not mappings or carry no
    // scalar url are left out; everything else is kept even when the
    // schema check flagged it.
    static std::vector<EndpointConfig> build_endpoints(const YAML::Node& document);

private:
    static std::optional<EndpointConfig> build_endpoint(const YAML::Node& record, size_t index);
};

} // namespace epm
