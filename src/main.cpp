#include "logger.hpp"
#include "monitor_app.hpp"
#include "settings.hpp"
#include <atomic>
#include <csignal>
#include <iostream>

using namespace epm;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    MonitorSettings settings;
    settings.load_from_env();

    Logger::init(settings.log_file, settings.log_level);

    // Install signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int status = run_monitor(argc, argv, settings, std::cout, std::cerr, shutdown_requested);

    Logger::shutdown();
    return status;
}
