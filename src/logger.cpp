#include "logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/fmt.h>
#include <iostream>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace epm {

namespace {

// Upper-case level name padded to 8 columns: "INFO    ", "WARNING ".
class LevelNameFormatter : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&,
                spdlog::memory_buf_t& dest) override {
        std::string name = level_name(msg.level);
        name.resize(std::max<size_t>(name.size(), 8), ' ');
        dest.append(name.data(), name.data() + name.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return spdlog::details::make_unique<LevelNameFormatter>();
    }

private:
    static std::string level_name(spdlog::level::level_enum level) {
        switch (level) {
            case spdlog::level::trace: return "TRACE";
            case spdlog::level::debug: return "DEBUG";
            case spdlog::level::info: return "INFO";
            case spdlog::level::warn: return "WARNING";
            case spdlog::level::err: return "ERROR";
            case spdlog::level::critical: return "CRITICAL";
            default: return "NOTSET";
        }
    }
};

std::unique_ptr<spdlog::formatter> make_formatter() {
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<LevelNameFormatter>('*').set_pattern("%Y-%m-%d %H:%M:%S %* %v");
    return formatter;
}

} // namespace

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& log_file, const std::string& log_level) {
    auto level = string_to_level(log_level);

    // stdout is reserved for the availability report
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    try {
        std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();
        std::error_code ec;
        if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
            std::filesystem::create_directories(log_dir, ec);
            if (ec) {
                std::cerr << "Cannot create log directory " << log_dir.string()
                          << ": " << ec.message() << std::endl;
            }
        }

        constexpr size_t max_size = 10 * 1024 * 1024;  // 10MB
        constexpr size_t max_files = 5;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, max_size, max_files);
        file_sink->set_level(level);
        sinks.push_back(file_sink);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }

    spdlog::drop("endpoint_monitor");
    logger_ = std::make_shared<spdlog::logger>("endpoint_monitor", sinks.begin(), sinks.end());
    logger_->set_level(level);
    logger_->set_formatter(make_formatter());
    logger_->flush_on(spdlog::level::info);

    spdlog::register_logger(logger_);
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop_all();
        logger_.reset();
    }
}

void Logger::info(Component component, const std::string& message) {
    if (logger_) {
        logger_->info("[{}] {}", component_to_string(component), message);
    }
}

void Logger::warn(Component component, const std::string& message) {
    if (logger_) {
        logger_->warn("[{}] {}", component_to_string(component), message);
    }
}

void Logger::error(Component component, const std::string& message) {
    if (logger_) {
        logger_->error("[{}] {}", component_to_string(component), message);
    }
}

void Logger::debug(Component component, const std::string& message) {
    if (logger_) {
        logger_->debug("[{}] {}", component_to_string(component), message);
    }
}

std::string Logger::component_to_string(Component component) {
    switch (component) {
        case Component::Monitor: return "Monitor";
        case Component::Config: return "Config";
        case Component::Schema: return "Schema";
        case Component::Probe: return "Probe";
        case Component::Domain: return "Domain";
        case Component::Report: return "Report";
        default: return "Unknown";
    }
}

spdlog::level::level_enum Logger::string_to_level(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return spdlog::level::debug;
    if (upper == "INFO") return spdlog::level::info;
    if (upper == "WARN" || upper == "WARNING") return spdlog::level::warn;
    if (upper == "ERROR") return spdlog::level::err;
    return spdlog::level::info;
}

} // namespace epm
