/// @file log.cpp
/// @brief Logging system implementation for relay_core
///
/// Extends the spdlog-based logging with:
/// - Named loggers for the core, event and cascade subsystems
/// - Console and rotating file sinks driven by LogConfig
/// - Per-logger level overrides (one per routing worker)

#include <relay/core/log.hpp>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <map>
#include <memory>
#include <vector>
#include <filesystem>

namespace relay_core {

// =============================================================================
// Logger Registry
// =============================================================================

namespace {

/// Registry of named loggers. Every logger writes through one dist sink so
/// its real sinks can be swapped under the dist sink's own lock.
struct LoggerRegistry {
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    std::map<std::string, std::shared_ptr<spdlog::sinks::dist_sink_mt>> outputs;
    std::map<std::string, spdlog::level::level_enum> level_overrides;
    spdlog::level::level_enum global_level = spdlog::level::info;
    std::string log_directory;
    bool console_enabled = true;
    bool file_enabled = false;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
};

LoggerRegistry& get_registry() {
    static LoggerRegistry registry;
    return registry;
}

/// Create sinks based on current configuration (registry lock held)
std::vector<spdlog::sink_ptr> create_sinks(const std::string& name) {
    auto& reg = get_registry();
    std::vector<spdlog::sink_ptr> sinks;

    if (reg.console_enabled) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console_sink);
    }

    if (reg.file_enabled && !reg.log_directory.empty()) {
        try {
            std::filesystem::path log_path = std::filesystem::path(reg.log_directory) / (name + ".log");
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path.string(),
                reg.max_file_size,
                reg.max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::warn("Could not open log file for '{}': {}", name, e.what());
        }
    }

    return sinks;
}

/// Level for `name`: its override if one was set, else the global level
spdlog::level::level_enum level_for(const std::string& name) {
    auto& reg = get_registry();
    auto it = reg.level_overrides.find(name);
    return it != reg.level_overrides.end() ? it->second : reg.global_level;
}

} // anonymous namespace

// =============================================================================
// Logger Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.console_enabled = config.console_enabled;
    reg.file_enabled = config.file_enabled;
    reg.log_directory = config.log_directory;
    reg.max_file_size = config.max_file_size;
    reg.max_files = config.max_files;
    reg.global_level = config.level;

    // Swap the sinks behind loggers created before configuration
    for (auto& [name, output] : reg.outputs) {
        output->set_sinks(create_sinks(name));
    }
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level_for(name));
    }

    spdlog::set_level(reg.global_level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it != reg.loggers.end()) {
        return it->second;
    }

    auto output = std::make_shared<spdlog::sinks::dist_sink_mt>(create_sinks(name));
    auto logger = std::make_shared<spdlog::logger>(name, output);
    logger->set_level(level_for(name));

    reg.outputs[name] = output;
    reg.loggers[name] = logger;
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }

    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("relay_core");
    return logger;
}

std::shared_ptr<spdlog::logger> event_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("relay_event");
    return logger;
}

std::shared_ptr<spdlog::logger> cascade_logger() {
    static std::shared_ptr<spdlog::logger> logger = get_logger("cascade");
    return logger;
}

// =============================================================================
// Log Level Management
// =============================================================================

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto logger = get_logger(name);

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.level_overrides[name] = level;
    logger->set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off") return spdlog::level::off;
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Logging Shutdown
// =============================================================================

void flush_all_loggers() {
    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    spdlog::default_logger()->flush();
}

void shutdown_logging() {
    flush_all_loggers();

    auto& reg = get_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        spdlog::drop(name);
    }
    reg.loggers.clear();
    reg.outputs.clear();
    reg.level_overrides.clear();

    spdlog::shutdown();
}

} // namespace relay_core
