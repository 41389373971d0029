#include "availability_aggregator.hpp"

namespace epm {

void AvailabilityAggregator::record(const std::string& domain, ProbeResult result) {
    auto [it, inserted] = index_.try_emplace(domain, domains_.size());
    if (inserted) {
        domains_.emplace_back(domain, DomainStats{});
    }

    auto& stats = domains_[it->second].second;
    ++stats.total;
    if (result == ProbeResult::Up) {
        ++stats.up;
    }
}

std::vector<DomainAvailability> AvailabilityAggregator::snapshot() const {
    std::vector<DomainAvailability> result;
    result.reserve(domains_.size());
    for (const auto& [domain, stats] : domains_) {
        result.push_back({domain, percentage(stats)});
    }
    return result;
}

std::optional<DomainStats> AvailabilityAggregator::stats(const std::string& domain) const {
    auto it = index_.find(domain);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return domains_[it->second].second;
}

size_t AvailabilityAggregator::domain_count() const {
    return domains_.size();
}

int AvailabilityAggregator::percentage(const DomainStats& stats) {
    if (stats.total == 0) {
        return 0;
    }

    const uint64_t scaled = 100 * stats.up;
    uint64_t quotient = scaled / stats.total;
    const uint64_t twice_remainder = 2 * (scaled % stats.total);

    if (twice_remainder > stats.total ||
        (twice_remainder == stats.total && quotient % 2 == 1)) {
        ++quotient;
    }
    return static_cast<int>(quotient);
}

} // namespace epm
