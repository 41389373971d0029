#pragma once

#include "probe_result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace epm {

struct DomainStats {
    uint64_t up = 0;
    uint64_t total = 0;
};

struct DomainAvailability {
    std::string domain;
    int percentage;
};

class AvailabilityAggregator {
public:
    // Count one probe against the domain, creating its entry on first use
    void record(const std::string& domain, ProbeResult result);

    // Cumulative percentage per domain, in first-seen order
    std::vector<DomainAvailability> snapshot() const;

    std::optional<DomainStats> stats(const std::string& domain) const;

    size_t domain_count() const;

    // round(100 * up / total), ties to even
    static int percentage(const DomainStats& stats);

private:
    std::vector<std::pair<std::string, DomainStats>> domains_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace epm
