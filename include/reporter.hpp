#pragma once

#include "availability_aggregator.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace epm {

class Reporter {
public:
    explicit Reporter(std::ostream& out);

    // "<domain> has <n>% availability percentage" per domain, then "---"
    void report(const std::vector<DomainAvailability>& snapshot);

    static std::string format_line(const DomainAvailability& availability);

private:
    std::ostream& out_;
};

} // namespace epm
