#pragma once

/// @file emit_result.hpp
/// @brief Outcome of emitting an event into a log

#include "fwd.hpp"
#include <relay/core/error.hpp>

#include <optional>
#include <utility>

namespace relay_event {

/// Delivered, or Undelivered carrying the event back to the caller.
/// An event is undelivered when nobody listens; this is not an error.
template<typename T>
class EmitResult {
public:
    [[nodiscard]] static EmitResult delivered() { return EmitResult(); }

    [[nodiscard]] static EmitResult undelivered(T event) {
        EmitResult r;
        r.m_event.emplace(std::move(event));
        return r;
    }

    [[nodiscard]] bool was_delivered() const noexcept { return !m_event.has_value(); }

    /// The returned event (undelivered case only)
    [[nodiscard]] std::optional<T>& event() noexcept { return m_event; }
    [[nodiscard]] const std::optional<T>& event() const noexcept { return m_event; }

    /// Ok if delivered, Err(event) otherwise
    [[nodiscard]] relay_core::Result<void, T> into_result() && {
        if (m_event) {
            return relay_core::Result<void, T>(std::move(*m_event));
        }
        return relay_core::Result<void, T>();
    }

private:
    EmitResult() = default;

    std::optional<T> m_event;
};

} // namespace relay_event
