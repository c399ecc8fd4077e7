/// @file error.cpp
/// @brief Error handling implementation for relay_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Error formatting utilities
/// - Explicit template instantiations for common Result types

#include <relay/core/error.hpp>
#include <sstream>
#include <vector>

namespace relay_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* queue_error_kind_name(QueueError::Kind kind) {
    switch (kind) {
        case QueueError::Kind::Poisoned: return "poisoned";
        case QueueError::Kind::AlreadyBorrowed: return "already-borrowed";
    }
    return "unknown";
}

/// Format queue error
std::string format_queue_error(const QueueError& err) {
    std::ostringstream oss;
    oss << "[QueueError:" << queue_error_kind_name(err.kind) << "] " << err.message;
    return oss.str();
}

/// Format config error with the offending key or path
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (err.kind == ConfigError::Kind::InvalidValue && !err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, QueueError>) {
            oss << detail::format_queue_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::string, Error>;

} // namespace relay_core
