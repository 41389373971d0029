#pragma once

#include "settings.hpp"
#include <atomic>
#include <ostream>

namespace epm {

// Command-line entry: `<program> <config_file_path>`.
// Returns the process exit code: 1 on usage or config errors, 0 once
// stop_requested ends the monitoring loop. The logger must already be set up.
int run_monitor(int argc, const char* const argv[], const MonitorSettings& settings,
                std::ostream& out, std::ostream& err, const std::atomic<bool>& stop_requested);

} // namespace epm
