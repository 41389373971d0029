#pragma once

#include <chrono>
#include <string>

namespace epm {

struct MonitorSettings {
    std::string log_file = "logs/endpoint_monitor.log";
    std::string log_level = "INFO";
    std::string suffix_list_path;  // empty: libpsl's newest list
    bool include_private_suffixes = false;

    // Fixed cadence; not overridable
    std::chrono::seconds cycle_interval{15};
    std::chrono::milliseconds probe_timeout{500};

    // ENDPOINT_MONITOR_LOG_FILE, ENDPOINT_MONITOR_LOG_LEVEL,
    // ENDPOINT_MONITOR_SUFFIX_LIST, ENDPOINT_MONITOR_PRIVATE_SUFFIXES
    void load_from_env();
};

} // namespace epm
