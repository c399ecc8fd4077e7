#pragma once

/// @file error.hpp
/// @brief Error handling types for relay_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>
#include <type_traits>

namespace relay_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    InvalidArgument,
    InvalidState,
    NotFound,
    IOError,
    ParseError,
    Poisoned,
    AlreadyBorrowed,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::Poisoned: return "Poisoned";
        case ErrorCode::AlreadyBorrowed: return "AlreadyBorrowed";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Event queue errors
struct QueueError {
    enum class Kind : std::uint8_t {
        Poisoned,         // A callback threw while holding the write lock
        AlreadyBorrowed,  // Re-entrant mutation from inside a listener callback
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static QueueError poisoned() {
        return QueueError{Kind::Poisoned,
            "Event queue lock is poisoned (a callback threw while holding it)"};
    }

    [[nodiscard]] static QueueError already_borrowed() {
        return QueueError{Kind::AlreadyBorrowed,
            "Event queue is already borrowed (re-entrant call from a listener callback)"};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,   // Config file missing or unreadable
        ParseFailed,    // Malformed JSON
        InvalidValue,   // Key present with a wrong type or unknown value
    };

    Kind kind;
    std::string message;
    std::string key;  // Offending key for InvalidValue, path otherwise

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, path};
    }

    [[nodiscard]] static ConfigError parse_failed(const std::string& path, const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Failed to parse '" + path + "': " + reason, path};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, key};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        QueueError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(QueueError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(QueueError::Kind kind) {
        switch (kind) {
            case QueueError::Kind::Poisoned: return ErrorCode::Poisoned;
            case QueueError::Kind::AlreadyBorrowed: return ErrorCode::AlreadyBorrowed;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// ErrorException
// =============================================================================

/// Exception carrying an Error, for operations without a result channel
class ErrorException : public std::runtime_error {
public:
    explicit ErrorException(Error error)
        : std::runtime_error(error.message()), m_error(std::move(error)) {}

    [[nodiscard]] const Error& error() const noexcept { return m_error; }
    [[nodiscard]] ErrorCode code() const noexcept { return m_error.code(); }

private:
    Error m_error;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type holding either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor. When T and E are the same type a plain value
    /// is a success; build errors with err() instead.
    Result(E error) requires (!std::is_same_v<T, E>) : m_error(std::move(error)) {}

    /// Tagged constructors (index 0 = value, index 1 = error)
    Result(std::in_place_index_t<0>, T value) : m_value(std::move(value)) {}
    Result(std::in_place_index_t<1>, E error) : m_error(std::move(error)) {}

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }
    [[nodiscard]] E&& error() && { return std::move(*m_error); }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(std::in_place_index<0>, func(std::move(*m_value)));
        }
        return Result<U, E>(std::in_place_index<1>, std::move(*m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::in_place_index<1>, std::move(*m_error));
    }

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::in_place_index<0>, std::move(*m_value));
        }
        return func(*m_error);
    }

private:
    std::optional<T> m_value;
    std::optional<E> m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() = default;

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}
    Result(std::in_place_index_t<1>, E error) : m_error(std::move(error)) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }

    /// Get error
    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }
    [[nodiscard]] E&& error() && { return std::move(*m_error); }

    /// Operator bool
    explicit operator bool() const noexcept { return !m_error.has_value(); }

    /// Unwrap
    void unwrap() const {
        if (m_error.has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    std::optional<E> m_error;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind tag and context chain
std::string build_error_chain(const Error& error);

} // namespace relay_core
