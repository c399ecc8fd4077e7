#pragma once

/// @file cell.hpp
/// @brief Sharing strategies for event logs
///
/// A cell owns one log (`Inner`) and decides how handles and listeners
/// reach it. All three expose the same surface so Queue and Listener are
/// written once:
/// - `Ref` is what a listener keeps to reach the log
/// - `read(f)` / `write(f)` run f on the log (interior mutability)
/// - `write_ref(ref, f)` is the same for a listener's Ref
/// - `release_listener(ref, key)` never throws; unregisters a cursor from a
///   destructor. Non-locking cells defer it while the log is borrowed.
///   Returns false if the log is poisoned.
/// - `use_count(ref)` counts handles and listeners sharing the log

#include "fwd.hpp"
#include "raw_queue.hpp"
#include <relay/core/error.hpp>
#include <relay/core/log.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace relay_event {

namespace detail {

/// Log plus its borrow flag
template<typename Inner>
struct BorrowedStorage {
    Inner inner;
    bool borrowed = false;
    /// Listeners released while the log was borrowed
    std::vector<ListenerKey> deferred_removals;
};

/// Marks a non-locking log as mutably borrowed for the guard's lifetime.
/// Removals deferred during the borrow are applied when it ends.
template<typename Inner>
class BorrowGuard {
public:
    explicit BorrowGuard(BorrowedStorage<Inner>& storage) : m_storage(storage) {
        if (m_storage.borrowed) {
            throw relay_core::ErrorException(relay_core::QueueError::already_borrowed());
        }
        m_storage.borrowed = true;
    }

    ~BorrowGuard() {
        m_storage.borrowed = false;
        while (!m_storage.deferred_removals.empty()) {
            const ListenerKey key = m_storage.deferred_removals.back();
            m_storage.deferred_removals.pop_back();
            m_storage.inner.remove_listener(key);
        }
    }

    BorrowGuard(const BorrowGuard&) = delete;
    BorrowGuard& operator=(const BorrowGuard&) = delete;

private:
    BorrowedStorage<Inner>& m_storage;
};

/// Remove now, or after the borrow in progress ends
template<typename Inner>
void release_or_defer(BorrowedStorage<Inner>& storage, ListenerKey key) noexcept {
    if (storage.borrowed) {
        storage.deferred_removals.push_back(key);
        return;
    }
    BorrowGuard<Inner> guard(storage);
    storage.inner.remove_listener(key);
}

} // namespace detail

// =============================================================================
// ExclusiveCell
// =============================================================================

/// Single owner. Listeners hold a raw pointer and must not outlive the cell.
template<typename Inner>
class ExclusiveCell {
public:
    using inner_type = Inner;
    using Ref = detail::BorrowedStorage<Inner>*;

    ExclusiveCell() = default;

    ExclusiveCell(const ExclusiveCell&) = delete;
    ExclusiveCell& operator=(const ExclusiveCell&) = delete;
    ExclusiveCell(ExclusiveCell&&) = delete;
    ExclusiveCell& operator=(ExclusiveCell&&) = delete;

    [[nodiscard]] Ref ref() const noexcept { return &m_storage; }

    template<typename F>
    decltype(auto) read(F&& f) const {
        return std::invoke(std::forward<F>(f), std::as_const(m_storage.inner));
    }

    template<typename F>
    decltype(auto) write(F&& f) const {
        return write_ref(&m_storage, std::forward<F>(f));
    }

    template<typename F>
    static decltype(auto) write_ref(Ref ref, F&& f) {
        detail::BorrowGuard<Inner> guard(*ref);
        return std::invoke(std::forward<F>(f), ref->inner);
    }

    static bool release_listener(Ref ref, ListenerKey key) noexcept {
        detail::release_or_defer(*ref, key);
        return true;
    }

    /// Exclusive logs are never shared
    [[nodiscard]] static long use_count(Ref) noexcept { return 1; }

private:
    mutable detail::BorrowedStorage<Inner> m_storage;
};

// =============================================================================
// LocalCell
// =============================================================================

/// Reference-counted, single-threaded. Copying the cell shares the log.
template<typename Inner>
class LocalCell {
public:
    using inner_type = Inner;
    using Ref = std::shared_ptr<detail::BorrowedStorage<Inner>>;

    LocalCell() : m_storage(std::make_shared<detail::BorrowedStorage<Inner>>()) {}

    [[nodiscard]] Ref ref() const noexcept { return m_storage; }

    template<typename F>
    decltype(auto) read(F&& f) const {
        return std::invoke(std::forward<F>(f), std::as_const(m_storage->inner));
    }

    template<typename F>
    decltype(auto) write(F&& f) const {
        return write_ref(m_storage, std::forward<F>(f));
    }

    template<typename F>
    static decltype(auto) write_ref(const Ref& ref, F&& f) {
        detail::BorrowGuard<Inner> guard(*ref);
        return std::invoke(std::forward<F>(f), ref->inner);
    }

    static bool release_listener(const Ref& ref, ListenerKey key) noexcept {
        detail::release_or_defer(*ref, key);
        return true;
    }

    [[nodiscard]] static long use_count(const Ref& ref) noexcept { return ref.use_count(); }
    [[nodiscard]] long use_count() const noexcept { return m_storage.use_count(); }

    /// Drop this handle's reference
    void reset() noexcept { m_storage.reset(); }

private:
    Ref m_storage;
};

// =============================================================================
// SyncCell
// =============================================================================

/// Reference-counted, thread-safe. One reader/writer lock guards the whole
/// log (buffer and cursors together). A callback that throws while the
/// write lock is held poisons the log; every later operation throws
/// ErrorException(QueueError::poisoned()).
///
/// Calling back into the same log from inside a write callback deadlocks.
template<typename Inner>
class SyncCell {
public:
    using inner_type = Inner;

    struct State {
        mutable std::shared_mutex mutex;
        bool poisoned = false;
        Inner inner;
    };

    using Ref = std::shared_ptr<State>;

    SyncCell() : m_state(std::make_shared<State>()) {}

    [[nodiscard]] Ref ref() const noexcept { return m_state; }

    template<typename F>
    decltype(auto) read(F&& f) const {
        std::shared_lock lock(m_state->mutex);
        if (m_state->poisoned) {
            throw relay_core::ErrorException(relay_core::QueueError::poisoned());
        }
        return std::invoke(std::forward<F>(f), std::as_const(m_state->inner));
    }

    template<typename F>
    decltype(auto) write(F&& f) const {
        return write_ref(m_state, std::forward<F>(f));
    }

    template<typename F>
    static decltype(auto) write_ref(const Ref& state, F&& f) {
        std::unique_lock lock(state->mutex);
        if (state->poisoned) {
            throw relay_core::ErrorException(relay_core::QueueError::poisoned());
        }
        try {
            return std::invoke(std::forward<F>(f), state->inner);
        } catch (...) {
            state->poisoned = true;
            relay_core::event_logger()->error("Event log poisoned by a throwing callback");
            throw;
        }
    }

    template<typename F>
    static bool try_write_ref(const Ref& state, F&& f) noexcept {
        std::unique_lock lock(state->mutex);
        if (state->poisoned) {
            return false;
        }
        std::invoke(std::forward<F>(f), state->inner);
        return true;
    }

    static bool release_listener(const Ref& state, ListenerKey key) noexcept {
        return try_write_ref(state, [key](Inner& inner) { inner.remove_listener(key); });
    }

    [[nodiscard]] static long use_count(const Ref& state) noexcept { return state.use_count(); }
    [[nodiscard]] long use_count() const noexcept { return m_state.use_count(); }

    [[nodiscard]] bool is_poisoned() const {
        std::shared_lock lock(m_state->mutex);
        return m_state->poisoned;
    }

    /// Drop this handle's reference
    void reset() noexcept { m_state.reset(); }

private:
    Ref m_state;
};

} // namespace relay_event
