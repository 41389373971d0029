#include "health_checker.hpp"
#include "logger.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <string_view>

namespace epm {

HealthChecker::HealthChecker(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

ProbeResult HealthChecker::check(const EndpointConfig& endpoint) {
    auto target = split_url(endpoint.url);
    if (!target) {
        Logger::debug(Logger::Component::Probe,
            fmt::format("Endpoint {}: {}", endpoint.name, target.error()));
        return ProbeResult::Down;
    }

    auto start = std::chrono::steady_clock::now();
    try {
        httplib::Client client(target->origin);
        client.set_connection_timeout(timeout_);
        client.set_read_timeout(timeout_);
        client.set_write_timeout(timeout_);
        client.set_follow_location(false);

        httplib::Request request;
        request.method = endpoint.method;
        request.path = target->path;
        for (const auto& [name, value] : endpoint.headers) {
            request.headers.emplace(name, value);
        }
        if (endpoint.body) {
            request.body = endpoint.body->dump();
            if (!request.has_header("Content-Type")) {
                request.set_header("Content-Type", "application/json");
            }
        }

        auto res = client.send(request);
        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        if (!res) {
            Logger::debug(Logger::Component::Probe,
                fmt::format("Endpoint {}: DOWN ({}, {}ms)", endpoint.name,
                            httplib::to_string(res.error()), duration_ms));
            return ProbeResult::Down;
        }

        auto result = classify_status(res->status);
        Logger::debug(Logger::Component::Probe,
            fmt::format("Endpoint {}: {} (status {}, {}ms)", endpoint.name,
                        to_string(result), res->status, duration_ms));
        return result;

    } catch (const std::exception& e) {
        Logger::debug(Logger::Component::Probe,
            fmt::format("Endpoint {} health check exception: {}", endpoint.name, e.what()));
        return ProbeResult::Down;
    }
}

ProbeResult HealthChecker::classify_status(int status) {
    return (status >= 200 && status < 300) ? ProbeResult::Up : ProbeResult::Down;
}

std::expected<RequestTarget, std::string> HealthChecker::split_url(const std::string& url) {
    std::string_view rest(url);

    auto scheme_end = rest.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::unexpected("Missing scheme in URL: " + url);
    }

    std::string scheme(rest.substr(0, scheme_end));
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http" && scheme != "https") {
        return std::unexpected("Unsupported scheme in URL: " + url);
    }
    rest.remove_prefix(scheme_end + 3);

    auto authority_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, authority_end);
    rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
        Logger::debug(Logger::Component::Probe,
            fmt::format("Ignoring credentials in URL for host {}", authority));
    }
    if (authority.empty()) {
        return std::unexpected("No host in URL: " + url);
    }

    rest = rest.substr(0, rest.find('#'));

    RequestTarget target;
    target.origin = scheme + "://" + std::string(authority);
    if (rest.empty()) {
        target.path = "/";
    } else if (rest.front() == '?') {
        target.path = "/" + std::string(rest);
    } else {
        target.path = std::string(rest);
    }
    return target;
}

} // namespace epm
