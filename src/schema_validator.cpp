#include "schema_validator.hpp"
#include "logger.hpp"
#include "yaml_value.hpp"
#include <spdlog/fmt/fmt.h>
#include <array>
#include <algorithm>

namespace epm {

namespace {

constexpr std::array<const char*, 5> kKnownKeys = {"name", "url", "method", "headers", "body"};

void check_string(const YAML::Node& record, const char* field, bool required,
                  size_t index, std::vector<SchemaIssue>& issues) {
    const auto value = record[field];
    if (!value) {
        if (required) {
            issues.push_back({index, field, fmt::format("missing required key '{}'", field)});
        }
        return;
    }
    if (!is_string(value)) {
        issues.push_back({index, field, fmt::format("'{}' should be a string", field)});
    }
}

} // namespace

std::vector<SchemaIssue> SchemaValidator::validate(const YAML::Node& document) {
    Logger::info(Logger::Component::Schema, "Validating YAML schema");

    std::vector<SchemaIssue> issues;
    if (!document.IsSequence()) {
        issues.push_back({0, "", "top level should be a list of endpoint definitions"});
    } else {
        for (size_t i = 0; i < document.size(); ++i) {
            validate_record(document[i], i, issues);
        }
    }

    for (const auto& issue : issues) {
        Logger::error(Logger::Component::Schema,
            fmt::format("SchemaError: endpoint #{}{}: {}", issue.index,
                        issue.field.empty() ? "" : " (" + issue.field + ")", issue.message));
    }
    return issues;
}

void SchemaValidator::validate_record(const YAML::Node& record, size_t index,
                                      std::vector<SchemaIssue>& issues) {
    if (!record.IsMap()) {
        issues.push_back({index, "", "endpoint definition should be a mapping"});
        return;
    }

    check_string(record, "name", true, index, issues);
    check_string(record, "url", true, index, issues);
    check_string(record, "method", false, index, issues);
    check_string(record, "body", false, index, issues);

    const auto headers = record["headers"];
    if (headers) {
        if (!headers.IsMap()) {
            issues.push_back({index, "headers", "'headers' should be a mapping"});
        } else {
            for (const auto& header : headers) {
                if (!is_string(header.first)) {
                    issues.push_back({index, "headers", "header names should be strings"});
                    break;
                }
            }
        }
    }

    for (const auto& entry : record) {
        const std::string key = entry.first.IsScalar() ? entry.first.Scalar() : YAML::Dump(entry.first);
        bool known = std::any_of(kKnownKeys.begin(), kKnownKeys.end(),
                                 [&key](const char* k) { return key == k; });
        if (!known) {
            issues.push_back({index, key, fmt::format("unexpected key '{}'", key)});
        }
    }
}

} // namespace epm
