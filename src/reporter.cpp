#include "reporter.hpp"
#include "logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace epm {

Reporter::Reporter(std::ostream& out)
    : out_(out) {}

void Reporter::report(const std::vector<DomainAvailability>& snapshot) {
    for (const auto& availability : snapshot) {
        out_ << format_line(availability) << '\n';
    }
    out_ << "---" << std::endl;

    Logger::debug(Logger::Component::Report,
        fmt::format("Reported availability for {} domains", snapshot.size()));
}

std::string Reporter::format_line(const DomainAvailability& availability) {
    return fmt::format("{} has {}% availability percentage", availability.domain, availability.percentage);
}

} // namespace epm
