#pragma once

/// @file config.hpp
/// @brief Runtime configuration for relay (logging and routing workers)

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace relay_core {

// =============================================================================
// WorkerConfig
// =============================================================================

/// Settings for one cascade routing worker
struct WorkerConfig {
    /// Name of the worker thread and of its logger
    std::string name = "cascade-worker";
    /// Level of this worker's own logger (named after the worker)
    std::optional<spdlog::level::level_enum> log_level;
};

// =============================================================================
// RelayConfig
// =============================================================================

/// Top-level configuration document
///
/// JSON layout:
/// @code
/// {
///   "logging": { "level": "debug", "console": true, "file": false,
///                "directory": "logs", "max_file_size": 1048576, "max_files": 3 },
///   "worker":  { "name": "ui-router", "log_level": "trace" }
/// }
/// @endcode
struct RelayConfig {
    LogConfig logging;
    WorkerConfig worker;
};

/// Build a config from a parsed JSON document. Missing keys keep defaults.
[[nodiscard]] Result<RelayConfig> config_from_json(const nlohmann::json& j);

/// Read and parse a JSON config file
[[nodiscard]] Result<RelayConfig> load_config(const std::filesystem::path& path);

/// Serialize a config back to JSON
[[nodiscard]] nlohmann::json config_to_json(const RelayConfig& config);

} // namespace relay_core
