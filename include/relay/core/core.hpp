#pragma once

/// @file core.hpp
/// @brief Main include file for relay_core module
///
/// This header includes all relay_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Error handling
#include "error.hpp"

// Logging and configuration
#include "log.hpp"
#include "config.hpp"

/// @namespace relay_core
/// @brief Shared infrastructure for the relay libraries
///
/// - **Error Handling**: Result<T> monadic error handling and ErrorException
/// - **Logging**: spdlog-backed named loggers
/// - **Configuration**: JSON config for logging and routing workers
///
/// Example usage:
/// @code
/// #include <relay/core/core.hpp>
///
/// auto config = relay_core::load_config("relay.json");
/// if (!config) {
///     RELAY_LOG_ERROR("{}", relay_core::build_error_chain(config.error()));
///     return 1;
/// }
/// relay_core::configure_logging(config->logging);
/// @endcode
