#include "config_loader.hpp"
#include "logger.hpp"
#include "yaml_value.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace epm {

std::expected<YAML::Node, ConfigError> ConfigLoader::load(const std::string& config_path) {
    Logger::info(Logger::Component::Config, fmt::format("Load config file {}", config_path));

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return std::unexpected(ConfigError{ConfigError::Kind::Read,
            "Config file not found: " + config_path});
    }
    if (!std::filesystem::is_regular_file(config_path, ec)) {
        return std::unexpected(ConfigError{ConfigError::Kind::Read,
            "Config path is not a regular file: " + config_path});
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{ConfigError::Kind::Read,
            "Failed to open config file: " + config_path});
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(ConfigError{ConfigError::Kind::Read,
            "Failed to read config file: " + config_path});
    }

    return parse(buffer.str());
}

std::expected<YAML::Node, ConfigError> ConfigLoader::parse(const std::string& content) {
    YAML::Node document;
    try {
        document = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        return std::unexpected(ConfigError{ConfigError::Kind::Parse,
            std::string("YAML parsing error: ") + e.what()});
    }

    if (!document.IsSequence()) {
        return std::unexpected(ConfigError{ConfigError::Kind::Parse,
            "Config must be a list of endpoint definitions"});
    }

    return document;
}

std::vector<EndpointConfig> ConfigLoader::build_endpoints(const YAML::Node& document) {
    std::vector<EndpointConfig> endpoints;
    endpoints.reserve(document.size());

    for (size_t i = 0; i < document.size(); ++i) {
        auto endpoint = build_endpoint(document[i], i);
        if (endpoint) {
            endpoints.push_back(std::move(*endpoint));
        }
    }

    Logger::info(Logger::Component::Config,
        fmt::format("Loaded {} of {} endpoint definitions", endpoints.size(), document.size()));
    return endpoints;
}

std::optional<EndpointConfig> ConfigLoader::build_endpoint(const YAML::Node& record, size_t index) {
    if (!record.IsMap()) {
        Logger::warn(Logger::Component::Config,
            fmt::format("Endpoint #{} is not a mapping; excluded from monitoring", index));
        return std::nullopt;
    }

    const auto url = record["url"];
    if (!url || !url.IsScalar()) {
        Logger::warn(Logger::Component::Config,
            fmt::format("Endpoint #{} has no url; excluded from monitoring", index));
        return std::nullopt;
    }

    EndpointConfig endpoint;
    endpoint.url = url.Scalar();

    const auto name = record["name"];
    endpoint.name = (name && name.IsScalar()) ? name.Scalar() : fmt::format("#{}", index);

    const auto method = record["method"];
    if (method && is_string(method) && !method.Scalar().empty()) {
        endpoint.method = method.Scalar();
        std::transform(endpoint.method.begin(), endpoint.method.end(), endpoint.method.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    }

    const auto headers = record["headers"];
    if (headers && headers.IsMap()) {
        for (const auto& header : headers) {
            if (!header.first.IsScalar() || !header.second.IsScalar()) {
                Logger::warn(Logger::Component::Config,
                    fmt::format("Endpoint {}: dropping non-scalar header", endpoint.name));
                continue;
            }
            endpoint.headers[header.first.Scalar()] = header.second.Scalar();
        }
    }

    const auto body = record["body"];
    if (body && !body.IsNull()) {
        endpoint.body = to_json(body);
    }

    return endpoint;
}

} // namespace epm
