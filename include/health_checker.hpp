#pragma once

#include "config_loader.hpp"
#include "probe_result.hpp"
#include <chrono>
#include <expected>
#include <string>

namespace epm {

// "http://host:8080/a/b?q=1#frag" -> origin "http://host:8080", path "/a/b?q=1"
struct RequestTarget {
    std::string origin;
    std::string path;
};

class HealthChecker {
public:
    explicit HealthChecker(std::chrono::milliseconds timeout = std::chrono::milliseconds(500));

    // One request, no retry. Any transport failure is Down; never throws.
    ProbeResult check(const EndpointConfig& endpoint);

    // [200, 300) is Up, anything else Down
    static ProbeResult classify_status(int status);

    static std::expected<RequestTarget, std::string> split_url(const std::string& url);

private:
    std::chrono::milliseconds timeout_;
};

} // namespace epm
