#pragma once

/// @file queue.hpp
/// @brief Event queue handles and listeners over a sharing strategy
///
/// Queue<T, Cell> re-exposes the RawQueue contract behind one of the cells
/// from cell.hpp. Listener<T, Cell> is a private read cursor into that
/// queue; destroying it unregisters the cursor.

#include "fwd.hpp"
#include "cell.hpp"
#include "raw_queue.hpp"

#include <iterator>
#include <optional>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace relay_event {

// =============================================================================
// Listener
// =============================================================================

/// Read cursor into a queue
/// @tparam T Event type
/// @tparam Cell Sharing strategy of the queue it was created from
template<typename T, typename Cell>
class Listener {
public:
    using value_type = T;
    using Ref = typename Cell::Ref;
    using inner_type = typename Cell::inner_type;

    Listener(Ref ref, ListenerKey key) : m_ref(std::move(ref)), m_key(key) {}

    ~Listener() { release(); }

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    Listener(Listener&& other) noexcept
        : m_ref(std::exchange(other.m_ref, Ref{}))
        , m_key(std::exchange(other.m_key, ListenerKey::null())) {}

    Listener& operator=(Listener&& other) noexcept {
        if (this != &other) {
            release();
            m_ref = std::exchange(other.m_ref, Ref{});
            m_key = std::exchange(other.m_key, ListenerKey::null());
        }
        return *this;
    }

    // =========================================================================
    // Consumption
    // =========================================================================

    /// Apply f to the events since the last call, without copying them.
    /// The log stays locked while f runs.
    template<typename F>
    decltype(auto) with(F&& f) const {
        return Cell::write_ref(m_ref, [&](inner_type& q) -> decltype(auto) {
            return q.pull_with(m_key, std::forward<F>(f));
        });
    }

    /// Like with(), also passing how many handles and listeners share the
    /// log, counted while the lock is held
    template<typename F>
    decltype(auto) with_use_count(F&& f) const {
        return Cell::write_ref(m_ref, [&](inner_type& q) -> decltype(auto) {
            const long count = Cell::use_count(m_ref);
            return q.pull_with(m_key, [&](std::span<const T> events) -> decltype(auto) {
                return std::invoke(std::forward<F>(f), events, count);
            });
        });
    }

    /// Apply f to each new event
    template<typename F>
    auto map(F&& f) const -> std::vector<std::invoke_result_t<F&, const T&>> {
        return with([&](std::span<const T> events) {
            std::vector<std::invoke_result_t<F&, const T&>> out;
            out.reserve(events.size());
            for (const T& event : events) {
                out.push_back(f(event));
            }
            return out;
        });
    }

    /// Copy of the new events
    [[nodiscard]] std::vector<T> peek() const {
        return with([](std::span<const T> events) {
            return std::vector<T>(events.begin(), events.end());
        });
    }

    /// Take a single unread event, if any
    [[nodiscard]] std::optional<T> next() const {
        return Cell::write_ref(m_ref, [&](inner_type& q) -> std::optional<T> {
            const T* event = q.peek_get(m_key);
            if (!event) {
                return std::nullopt;
            }
            std::optional<T> out(*event);
            q.peek_finish(m_key);
            return out;
        });
    }

    [[nodiscard]] ListenerKey key() const noexcept { return m_key; }
    [[nodiscard]] const Ref& queue_ref() const noexcept { return m_ref; }

private:
    void release() noexcept {
        if (!m_ref) {
            return;
        }
        if (!Cell::release_listener(m_ref, m_key)) {
            relay_core::event_logger()->warn(
                "Listener {} not removed: event log is poisoned", m_key.index);
        }
        m_ref = Ref{};
    }

    Ref m_ref{};
    ListenerKey m_key;
};

// =============================================================================
// Queue
// =============================================================================

/// Producer-side handle to a broadcast log
/// @tparam T Event type
/// @tparam Cell Sharing strategy (ExclusiveCell, LocalCell or SyncCell)
template<typename T, typename Cell>
class Queue {
public:
    using value_type = T;
    using cell_type = Cell;
    using inner_type = typename Cell::inner_type;
    using listener_type = Listener<T, Cell>;

    Queue() = default;

    // =========================================================================
    // Emission
    // =========================================================================

    /// Append if anyone listens; otherwise hand the event back
    EmitResult<T> emit(T event) {
        return m_cell.write([&](inner_type& q) { return q.emit(std::move(event)); });
    }

    /// emit() reduced to delivered / not delivered
    bool push(T event) {
        return m_cell.write([&](inner_type& q) { return q.push(std::move(event)); });
    }

    /// Append a whole range in one critical section
    template<std::ranges::input_range R>
    bool extend(R&& events) {
        return m_cell.write([&](inner_type& q) {
            return q.extend(std::ranges::begin(events), std::ranges::end(events));
        });
    }

    // =========================================================================
    // Listening
    // =========================================================================

    /// New cursor at the current end of the log
    [[nodiscard]] listener_type listen() const {
        ListenerKey key = m_cell.write([](inner_type& q) { return q.create_listener(); });
        return listener_type(m_cell.ref(), key);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// True iff nothing is buffered
    [[nodiscard]] bool is_empty() const {
        return m_cell.read([](const inner_type& q) { return q.is_empty(); });
    }

    [[nodiscard]] std::size_t listener_count() const {
        return m_cell.read([](const inner_type& q) { return q.listener_count(); });
    }

    [[nodiscard]] std::size_t buffered() const {
        return m_cell.read([](const inner_type& q) { return q.buffered(); });
    }

    [[nodiscard]] const Cell& cell() const noexcept { return m_cell; }

protected:
    Cell m_cell;
};

// =============================================================================
// Aliases
// =============================================================================

/// Single owner, single thread
template<typename T>
using ExclusiveQueue = Queue<T, ExclusiveCell<RawQueue<T>>>;

/// Shared handles, single thread
template<typename T>
using LocalQueue = Queue<T, LocalCell<RawQueue<T>>>;

/// Shared handles, any thread
template<typename T>
using SyncQueue = Queue<T, SyncCell<RawQueue<T>>>;

template<typename T>
using ExclusiveListener = Listener<T, ExclusiveCell<RawQueue<T>>>;

template<typename T>
using LocalListener = Listener<T, LocalCell<RawQueue<T>>>;

template<typename T>
using SyncListener = Listener<T, SyncCell<RawQueue<T>>>;

} // namespace relay_event
