#include "monitor_app.hpp"
#include "config_loader.hpp"
#include "domain_extractor.hpp"
#include "health_checker.hpp"
#include "logger.hpp"
#include "reporter.hpp"
#include "scheduler.hpp"
#include "schema_validator.hpp"
#include <spdlog/fmt/fmt.h>

namespace epm {

int run_monitor(int argc, const char* const argv[], const MonitorSettings& settings,
                std::ostream& out, std::ostream& err, const std::atomic<bool>& stop_requested) {
    if (argc != 2) {
        std::string usage = fmt::format("Usage: {} <config_file_path>",
                                        argc > 0 ? argv[0] : "endpoint_monitor");
        Logger::error(Logger::Component::Monitor, usage);
        err << usage << std::endl;
        return 1;
    }

    Logger::info(Logger::Component::Monitor, "Starting endpoint monitor");

    auto document = ConfigLoader::load(argv[1]);
    if (!document.has_value()) {
        const char* kind = document.error().kind == ConfigError::Kind::Read ? "read" : "parse";
        Logger::error(Logger::Component::Config,
            fmt::format("Config {} error: {}", kind, document.error().message));
        err << "Failed to load configuration: " << document.error().message << std::endl;
        return 1;
    }

    auto issues = SchemaValidator::validate(*document);
    if (!issues.empty()) {
        Logger::warn(Logger::Component::Schema,
            fmt::format("{} schema issues found; monitoring continues", issues.size()));
    }

    auto endpoints = ConfigLoader::build_endpoints(*document);
    if (endpoints.empty()) {
        Logger::warn(Logger::Component::Config, "No endpoints to monitor");
    }

    DomainExtractor extractor(settings.suffix_list_path, settings.include_private_suffixes);
    HealthChecker health_checker(settings.probe_timeout);
    Reporter reporter(out);

    Scheduler<HealthChecker> scheduler(std::move(endpoints), health_checker, extractor, reporter,
        settings.cycle_interval,
        [&stop_requested](std::chrono::milliseconds duration) {
            interruptible_sleep(duration, stop_requested);
        });

    scheduler.run(stop_requested);

    out << "\nMonitoring stopped by user." << std::endl;
    Logger::error(Logger::Component::Monitor, "Monitoring stopped by user.");
    return 0;
}

} // namespace epm
