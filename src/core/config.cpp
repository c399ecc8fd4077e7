/// @file config.cpp
/// @brief JSON configuration loading for relay

#include <relay/core/config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>

namespace relay_core {

namespace {

/// Read an optional log level name under `key`
Result<std::optional<spdlog::level::level_enum>> read_level(
    const nlohmann::json& section, const std::string& key, const std::string& path)
{
    if (!section.contains(key) || section[key].is_null()) {
        return std::optional<spdlog::level::level_enum>{};
    }
    const auto& value = section[key];
    if (!value.is_string()) {
        return Error(ConfigError::invalid_value(path, "expected a level name string"));
    }
    auto level = parse_log_level(value.get<std::string>());
    if (!level) {
        return Error(ConfigError::invalid_value(path, "unknown log level '" + value.get<std::string>() + "'"));
    }
    return std::optional<spdlog::level::level_enum>{*level};
}

Result<void> read_logging(const nlohmann::json& j, LogConfig& out) {
    if (!j.is_object()) {
        return Error(ConfigError::invalid_value("logging", "expected an object"));
    }

    auto level = read_level(j, "level", "logging.level");
    if (!level) {
        return std::move(level).error();
    }
    if (level.value()) {
        out.level = *level.value();
    }

    try {
        out.console_enabled = j.value("console", out.console_enabled);
        out.file_enabled = j.value("file", out.file_enabled);
        out.log_directory = j.value("directory", out.log_directory);
        out.max_file_size = j.value("max_file_size", out.max_file_size);
        out.max_files = j.value("max_files", out.max_files);
    } catch (const nlohmann::json::type_error& e) {
        return Error(ConfigError::invalid_value("logging", e.what()));
    }

    return Ok();
}

Result<void> read_worker(const nlohmann::json& j, WorkerConfig& out) {
    if (!j.is_object()) {
        return Error(ConfigError::invalid_value("worker", "expected an object"));
    }

    if (j.contains("name")) {
        if (!j["name"].is_string()) {
            return Error(ConfigError::invalid_value("worker.name", "expected a string"));
        }
        out.name = j["name"].get<std::string>();
    }

    auto level = read_level(j, "log_level", "worker.log_level");
    if (!level) {
        return std::move(level).error();
    }
    out.log_level = level.value();

    return Ok();
}

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

Result<RelayConfig> config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error(ConfigError::invalid_value("<root>", "expected an object"));
    }

    RelayConfig config;

    if (j.contains("logging")) {
        auto r = read_logging(j["logging"], config.logging);
        if (!r) {
            return std::move(r).error();
        }
    }

    if (j.contains("worker")) {
        auto r = read_worker(j["worker"], config.worker);
        if (!r) {
            return std::move(r).error();
        }
    }

    return config;
}

Result<RelayConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error(ConfigError::file_not_found(path.string()));
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return Error(ConfigError::parse_failed(path.string(), e.what()));
    }

    auto config = config_from_json(j);
    if (!config) {
        core_logger()->warn("Rejected config '{}': {}", path.string(), config.error().message());
        return config;
    }

    core_logger()->debug("Loaded config from '{}'", path.string());
    return config;
}

// =============================================================================
// Saving
// =============================================================================

nlohmann::json config_to_json(const RelayConfig& config) {
    nlohmann::json logging;
    logging["level"] = log_level_name(config.logging.level);
    logging["console"] = config.logging.console_enabled;
    logging["file"] = config.logging.file_enabled;
    logging["directory"] = config.logging.log_directory;
    logging["max_file_size"] = config.logging.max_file_size;
    logging["max_files"] = config.logging.max_files;

    nlohmann::json worker;
    worker["name"] = config.worker.name;
    if (config.worker.log_level) {
        worker["log_level"] = log_level_name(*config.worker.log_level);
    }

    nlohmann::json j;
    j["logging"] = std::move(logging);
    j["worker"] = std::move(worker);
    return j;
}

} // namespace relay_core
