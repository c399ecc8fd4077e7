#pragma once

/// @file raw_queue.hpp
/// @brief Broadcast event log with per-listener cursors
///
/// RawQueue is the unsynchronized core shared by every queue variant.
/// Events are appended to one buffer; each listener owns a cursor (index of
/// its next unread event) in a SlotMap. The consumed prefix is trimmed only
/// when a listener sitting at index 0 moves, since only such a listener can
/// be holding the front of the buffer.

#include "fwd.hpp"
#include "emit_result.hpp"
#include <relay/structures/slot_map.hpp>

#include <algorithm>
#include <functional>
#include <iterator>
#include <span>
#include <type_traits>
#include <vector>

namespace relay_event {

/// Cursor key of one listener (the tag type is the cursor itself)
using ListenerKey = relay_structures::SlotKey<std::size_t>;

/// Append-only broadcast log
/// @tparam T Event type
template<typename T>
class RawQueue {
public:
    using value_type = T;
    using size_type = std::size_t;

    RawQueue() = default;

    // =========================================================================
    // Listener Registration
    // =========================================================================

    /// Register a cursor at the current end; no retroactive replay
    [[nodiscard]] ListenerKey create_listener() {
        return m_cursors.insert(m_events.size());
    }

    /// Remove a cursor. Trims the buffer if the cursor was at the front.
    void remove_listener(ListenerKey key) {
        auto old = m_cursors.remove(key);
        if (old && *old == 0) {
            cleanup();
        }
    }

    // =========================================================================
    // Emission
    // =========================================================================

    /// Append an event if at least one listener is registered
    EmitResult<T> emit(T event) {
        if (m_cursors.empty()) {
            return EmitResult<T>::undelivered(std::move(event));
        }
        m_events.push_back(std::move(event));
        return EmitResult<T>::delivered();
    }

    bool push(T event) {
        return emit(std::move(event)).was_delivered();
    }

    /// Append a range if at least one listener is registered
    /// @return true if the range was appended
    template<typename InputIt>
    bool extend(InputIt first, InputIt last) {
        if (m_cursors.empty()) {
            return false;
        }
        m_events.insert(m_events.end(), first, last);
        return true;
    }

    // =========================================================================
    // Consumption
    // =========================================================================

    /// Run f on the events unseen by `key`, then mark them seen.
    /// The buffer is trimmed only after f returns or throws.
    /// @throws std::out_of_range if the key is not registered
    template<typename F>
    auto pull_with(ListenerKey key, F&& f) -> std::invoke_result_t<F, std::span<const T>> {
        size_type& cursor = m_cursors.at(key);
        const size_type start = cursor;
        cursor = m_events.size();

        TrimOnExit trim{start == 0 ? this : nullptr};
        std::span<const T> unseen(m_events.data() + start, m_events.size() - start);
        return std::invoke(std::forward<F>(f), unseen);
    }

    /// Next unread event of `key`, or nullptr
    [[nodiscard]] const T* peek_get(ListenerKey key) const {
        const size_type* cursor = m_cursors.get(key);
        if (!cursor || *cursor >= m_events.size()) {
            return nullptr;
        }
        return &m_events[*cursor];
    }

    /// Advance `key` past the event returned by peek_get
    void peek_finish(ListenerKey key) {
        size_type* cursor = m_cursors.get(key);
        if (!cursor || *cursor >= m_events.size()) {
            return;
        }
        ++*cursor;
        if (*cursor == 1) {
            cleanup();
        }
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// True iff no events are buffered
    [[nodiscard]] bool is_empty() const noexcept { return m_events.empty(); }

    [[nodiscard]] size_type buffered() const noexcept { return m_events.size(); }

    [[nodiscard]] size_type listener_count() const noexcept { return m_cursors.size(); }

    [[nodiscard]] bool has_listeners() const noexcept { return !m_cursors.empty(); }

private:
    /// Runs cleanup() when a pull that started at the front ends
    struct TrimOnExit {
        RawQueue* queue;

        ~TrimOnExit() {
            if (queue) {
                queue->cleanup();
            }
        }
    };

    /// Drop the prefix every listener has seen and re-base the cursors.
    /// With no listeners everything is collectible.
    void cleanup() {
        size_type min_cursor = m_events.size();
        for (size_type cursor : m_cursors) {
            min_cursor = std::min(min_cursor, cursor);
        }
        if (min_cursor == 0) {
            return;
        }

        for (size_type& cursor : m_cursors) {
            cursor -= min_cursor;
        }
        m_events.erase(m_events.begin(), m_events.begin() + static_cast<std::ptrdiff_t>(min_cursor));
    }

    std::vector<T> m_events;
    relay_structures::SlotMap<size_type> m_cursors;
};

} // namespace relay_event
