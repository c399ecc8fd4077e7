#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for relay_core

#include <cstdint>

namespace relay_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct QueueError;
struct ConfigError;
class Error;
class ErrorException;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging / Configuration
// =============================================================================

struct LogConfig;
struct WorkerConfig;
struct RelayConfig;

} // namespace relay_core
