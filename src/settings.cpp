#include "settings.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace epm {

namespace {

bool parse_flag(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // namespace

void MonitorSettings::load_from_env() {
    if (auto e = std::getenv("ENDPOINT_MONITOR_LOG_FILE"); e && *e) log_file = e;
    if (auto e = std::getenv("ENDPOINT_MONITOR_LOG_LEVEL"); e && *e) log_level = e;
    if (auto e = std::getenv("ENDPOINT_MONITOR_SUFFIX_LIST"); e && *e) suffix_list_path = e;
    if (auto e = std::getenv("ENDPOINT_MONITOR_PRIVATE_SUFFIXES")) include_private_suffixes = parse_flag(e);
}

} // namespace epm
