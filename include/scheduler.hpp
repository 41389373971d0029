#pragma once

#include "availability_aggregator.hpp"
#include "config_loader.hpp"
#include "domain_extractor.hpp"
#include "logger.hpp"
#include "probe_result.hpp"
#include "reporter.hpp"
#include <spdlog/fmt/fmt.h>
#include <atomic>
#include <chrono>
#include <concepts>
#include <functional>
#include <string>
#include <vector>

namespace epm {

// Anything that can probe an endpoint (C++20 concept)
template<typename T>
concept EndpointProber = requires(T prober, const EndpointConfig& endpoint) {
    { prober.check(endpoint) } -> std::same_as<ProbeResult>;
};

// Sleeps in short slices so a stop request is noticed within ~100ms.
void interruptible_sleep(std::chrono::milliseconds duration, const std::atomic<bool>& stop_requested);

template<EndpointProber Prober>
class Scheduler {
public:
    enum class State {
        Running,
        Stopped
    };

    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    Scheduler(std::vector<EndpointConfig> endpoints,
              Prober& prober,
              const DomainExtractor& extractor,
              Reporter& reporter,
              std::chrono::milliseconds interval,
              SleepFn sleep)
        : prober_(prober), reporter_(reporter), interval_(interval), sleep_(std::move(sleep)) {
        targets_.reserve(endpoints.size());
        for (auto& endpoint : endpoints) {
            auto domain = extractor.extract(endpoint.url);
            if (!domain) {
                Logger::warn(Logger::Component::Domain,
                    fmt::format("Endpoint {}: {}; grouping under the raw URL", endpoint.name, domain.error()));
            }
            std::string key = domain.value_or(endpoint.url);
            targets_.push_back({std::move(endpoint), std::move(key)});
        }
    }

    // Probe every endpoint in order, then report. Returns false when a stop
    // request cut the sweep short; nothing is reported in that case.
    bool run_cycle(const std::atomic<bool>& stop_requested) {
        for (const auto& target : targets_) {
            if (stop_requested.load()) {
                return false;
            }
            aggregator_.record(target.domain, prober_.check(target.endpoint));
        }

        reporter_.report(aggregator_.snapshot());
        ++cycles_completed_;
        return true;
    }

    // Probe, report and sleep until stop_requested is set. Terminal.
    void run(const std::atomic<bool>& stop_requested) {
        if (state_ == State::Stopped) {
            return;
        }

        Logger::info(Logger::Component::Monitor,
            fmt::format("Monitoring {} endpoints every {}ms", targets_.size(), interval_.count()));

        while (!stop_requested.load()) {
            if (!run_cycle(stop_requested)) {
                break;
            }
            sleep_(interval_);
        }

        state_ = State::Stopped;
        Logger::info(Logger::Component::Monitor,
            fmt::format("Monitoring loop stopped after {} cycles", cycles_completed_));
    }

    State state() const { return state_; }

    size_t cycles_completed() const { return cycles_completed_; }

    const AvailabilityAggregator& aggregator() const { return aggregator_; }

private:
    struct Target {
        EndpointConfig endpoint;
        std::string domain;
    };

    std::vector<Target> targets_;
    Prober& prober_;
    Reporter& reporter_;
    AvailabilityAggregator aggregator_;
    std::chrono::milliseconds interval_;
    SleepFn sleep_;
    State state_ = State::Running;
    size_t cycles_completed_ = 0;
};

} // namespace epm
