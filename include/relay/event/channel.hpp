#pragma once

/// @file channel.hpp
/// @brief Blocking MPMC channels and readiness multiplexing for relay_event
///
/// Channels carry "new data" notifications (and copies of events) from
/// producers to threads that block instead of polling. Select waits on any
/// number of receivers of any element type and reports which one is ready.

#include "fwd.hpp"
#include <relay/core/error.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace relay_event {

/// Payload-free notification
struct Token {
    bool operator==(const Token&) const = default;
};

// =============================================================================
// Errors
// =============================================================================

enum class RecvError : std::uint8_t {
    Disconnected,  // No senders left and nothing buffered
};

enum class TryRecvError : std::uint8_t {
    Empty,
    Disconnected,
};

enum class RecvTimeoutError : std::uint8_t {
    Timeout,
    Disconnected,
};

/// Failed send; the value is handed back
template<typename T>
struct SendError {
    enum class Kind : std::uint8_t {
        Full,          // Bounded channel at capacity (try_send only)
        Disconnected,  // No receivers left
    };

    Kind kind;
    T value;
};

namespace detail {

// =============================================================================
// ReadySignal
// =============================================================================

/// Wakes one Select when any watched channel changes
struct ReadySignal {
    std::mutex mutex;
    std::condition_variable cv;
    bool ready = false;

    void notify() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ready = true;
        }
        cv.notify_one();
    }
};

// =============================================================================
// ChannelCore
// =============================================================================

/// Type-independent part of a channel: endpoint counts, wakeups, watchers
class ChannelCore {
public:
    explicit ChannelCore(std::size_t capacity) : m_capacity(capacity) {}
    virtual ~ChannelCore() = default;

    ChannelCore(const ChannelCore&) = delete;
    ChannelCore& operator=(const ChannelCore&) = delete;

    /// Has data, or can never get any more
    [[nodiscard]] bool is_ready() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return has_pending_locked() || m_senders == 0;
    }

    void watch(std::shared_ptr<ReadySignal> signal) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_watchers.push_back(std::move(signal));
    }

    void unwatch(const std::shared_ptr<ReadySignal>& signal) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_watchers.erase(std::remove(m_watchers.begin(), m_watchers.end(), signal), m_watchers.end());
    }

    void add_sender() {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_senders;
    }

    void add_receiver() {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_receivers;
    }

    void release_sender() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (--m_senders == 0) {
            m_not_empty.notify_all();
            notify_watchers_locked();
        }
    }

    void release_receiver() {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (--m_receivers == 0) {
            m_not_full.notify_all();
            // Buffered values die outside the lock
            auto orphaned = take_all_locked();
            lock.unlock();
        }
    }

    [[nodiscard]] bool senders_gone() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_senders == 0;
    }

    [[nodiscard]] bool receivers_gone() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_receivers == 0;
    }

protected:
    /// Buffer non-empty (lock held)
    [[nodiscard]] virtual bool has_pending_locked() const = 0;

    /// Move the buffer out so it can be destroyed unlocked (lock held)
    [[nodiscard]] virtual std::shared_ptr<void> take_all_locked() = 0;

    void notify_watchers_locked() {
        for (auto& watcher : m_watchers) {
            watcher->notify();
        }
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_not_empty;
    std::condition_variable m_not_full;
    std::size_t m_senders = 0;
    std::size_t m_receivers = 0;
    std::size_t m_capacity;  // 0 = unbounded
    std::vector<std::shared_ptr<ReadySignal>> m_watchers;
};

// =============================================================================
// ChannelState
// =============================================================================

template<typename T>
class ChannelState final : public ChannelCore {
public:
    using ChannelCore::ChannelCore;

    relay_core::Result<void, SendError<T>> send(T value) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_full.wait(lock, [this] {
            return m_receivers == 0 || m_capacity == 0 || m_queue.size() < m_capacity;
        });
        if (m_receivers == 0) {
            return SendError<T>{SendError<T>::Kind::Disconnected, std::move(value)};
        }
        push_locked(std::move(value));
        return {};
    }

    relay_core::Result<void, SendError<T>> try_send(T value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_receivers == 0) {
            return SendError<T>{SendError<T>::Kind::Disconnected, std::move(value)};
        }
        if (m_capacity != 0 && m_queue.size() >= m_capacity) {
            return SendError<T>{SendError<T>::Kind::Full, std::move(value)};
        }
        push_locked(std::move(value));
        return {};
    }

    relay_core::Result<T, RecvError> recv() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_empty.wait(lock, [this] { return !m_queue.empty() || m_senders == 0; });
        if (m_queue.empty()) {
            return RecvError::Disconnected;
        }
        return pop_locked();
    }

    relay_core::Result<T, TryRecvError> try_recv() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return m_senders == 0 ? TryRecvError::Disconnected : TryRecvError::Empty;
        }
        return pop_locked();
    }

    relay_core::Result<T, RecvTimeoutError> recv_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(m_mutex);
        const bool woke = m_not_empty.wait_until(lock, deadline, [this] {
            return !m_queue.empty() || m_senders == 0;
        });
        if (!m_queue.empty()) {
            return pop_locked();
        }
        return woke ? RecvTimeoutError::Disconnected : RecvTimeoutError::Timeout;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }

protected:
    [[nodiscard]] bool has_pending_locked() const override { return !m_queue.empty(); }

    [[nodiscard]] std::shared_ptr<void> take_all_locked() override {
        return std::make_shared<std::deque<T>>(std::exchange(m_queue, {}));
    }

private:
    void push_locked(T value) {
        m_queue.push_back(std::move(value));
        m_not_empty.notify_one();
        notify_watchers_locked();
    }

    T pop_locked() {
        T value = std::move(m_queue.front());
        m_queue.pop_front();
        m_not_full.notify_one();
        return value;
    }

    std::deque<T> m_queue;
};

/// Start offset for the next Select scan
inline std::size_t next_select_offset() {
    static std::atomic<std::size_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace detail

// =============================================================================
// Sender
// =============================================================================

/// Sending half. Copies share the channel; it disconnects for receivers
/// when the last sender is released.
template<typename T>
class Sender {
public:
    using value_type = T;

    Sender(const Sender& other) : m_state(other.m_state) {
        if (m_state) m_state->add_sender();
    }

    Sender(Sender&& other) noexcept : m_state(std::exchange(other.m_state, nullptr)) {}

    Sender& operator=(Sender other) noexcept {
        std::swap(m_state, other.m_state);
        return *this;
    }

    ~Sender() {
        if (m_state) m_state->release_sender();
    }

    /// Blocks while a bounded channel is full
    relay_core::Result<void, SendError<T>> send(T value) const {
        return m_state->send(std::move(value));
    }

    relay_core::Result<void, SendError<T>> try_send(T value) const {
        return m_state->try_send(std::move(value));
    }

    /// Route-destination interface: false once no receiver is left
    bool push(T value) const {
        return send(std::move(value)).is_ok();
    }

    [[nodiscard]] std::size_t size() const { return m_state->size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }
    [[nodiscard]] bool is_disconnected() const { return m_state->receivers_gone(); }

private:
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> channel_unbounded();
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> channel_bounded(std::size_t);

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : m_state(std::move(state)) {
        m_state->add_sender();
    }

    std::shared_ptr<detail::ChannelState<T>> m_state;
};

// =============================================================================
// Receiver
// =============================================================================

/// Receiving half. Copies share the channel (each value goes to one of them).
template<typename T>
class Receiver {
public:
    using value_type = T;

    Receiver(const Receiver& other) : m_state(other.m_state) {
        if (m_state) m_state->add_receiver();
    }

    Receiver(Receiver&& other) noexcept : m_state(std::exchange(other.m_state, nullptr)) {}

    Receiver& operator=(Receiver other) noexcept {
        std::swap(m_state, other.m_state);
        return *this;
    }

    ~Receiver() {
        if (m_state) m_state->release_receiver();
    }

    /// Blocks until a value arrives or every sender is gone
    relay_core::Result<T, RecvError> recv() const { return m_state->recv(); }

    relay_core::Result<T, TryRecvError> try_recv() const { return m_state->try_recv(); }

    template<typename Rep, typename Period>
    relay_core::Result<T, RecvTimeoutError> recv_timeout(std::chrono::duration<Rep, Period> timeout) const {
        return m_state->recv_until(std::chrono::steady_clock::now() + timeout);
    }

    [[nodiscard]] std::size_t size() const { return m_state->size(); }
    [[nodiscard]] bool empty() const { return size() == 0; }

    /// No sender is left (values may still be buffered)
    [[nodiscard]] bool is_disconnected() const { return m_state->senders_gone(); }

private:
    friend class Select;
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> channel_unbounded();
    template<typename U>
    friend std::pair<Sender<U>, Receiver<U>> channel_bounded(std::size_t);

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : m_state(std::move(state)) {
        m_state->add_receiver();
    }

    std::shared_ptr<detail::ChannelState<T>> m_state;
};

// =============================================================================
// Construction
// =============================================================================

template<typename T>
[[nodiscard]] std::pair<Sender<T>, Receiver<T>> channel_unbounded() {
    auto state = std::make_shared<detail::ChannelState<T>>(0);
    return {Sender<T>(state), Receiver<T>(state)};
}

/// @throws relay_core::ErrorException (InvalidArgument) if capacity is 0
template<typename T>
[[nodiscard]] std::pair<Sender<T>, Receiver<T>> channel_bounded(std::size_t capacity) {
    if (capacity == 0) {
        throw relay_core::ErrorException(relay_core::Error(
            relay_core::ErrorCode::InvalidArgument, "channel_bounded: capacity must be at least 1"));
    }
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    return {Sender<T>(state), Receiver<T>(state)};
}

// =============================================================================
// Select
// =============================================================================

/// A receiver picked by Select; complete the receive with recv()
class SelectedOperation {
public:
    [[nodiscard]] std::size_t index() const noexcept { return m_index; }

    /// Receive from the selected receiver (must be the one registered
    /// under index()). Fails only if it is disconnected and drained.
    template<typename T>
    relay_core::Result<T, RecvError> recv(const Receiver<T>& rx) const {
        return rx.recv();
    }

private:
    friend class Select;
    explicit SelectedOperation(std::size_t index) : m_index(index) {}

    std::size_t m_index;
};

/// Wait-set over receivers of any element type.
/// Built per wait; register with recv(), then select().
class Select {
public:
    Select() : m_signal(std::make_shared<detail::ReadySignal>()) {}

    ~Select() {
        for (auto& core : m_cores) {
            core->unwatch(m_signal);
        }
    }

    Select(const Select&) = delete;
    Select& operator=(const Select&) = delete;

    /// Register a receiver
    /// @return Its index in this wait-set
    template<typename T>
    std::size_t recv(const Receiver<T>& rx) {
        std::shared_ptr<detail::ChannelCore> core = rx.m_state;
        core->watch(m_signal);
        m_cores.push_back(std::move(core));
        return m_cores.size() - 1;
    }

    /// Block until a registered receiver has data or is disconnected
    SelectedOperation select() {
        for (;;) {
            {
                std::lock_guard<std::mutex> lock(m_signal->mutex);
                m_signal->ready = false;
            }
            if (auto op = try_select()) {
                return *op;
            }
            std::unique_lock<std::mutex> lock(m_signal->mutex);
            m_signal->cv.wait(lock, [this] { return m_signal->ready; });
        }
    }

    /// Non-blocking scan starting at a rotating offset
    std::optional<SelectedOperation> try_select() {
        const std::size_t n = m_cores.size();
        if (n == 0) {
            return std::nullopt;
        }
        const std::size_t start = detail::next_select_offset() % n;
        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t idx = (start + i) % n;
            if (m_cores[idx]->is_ready()) {
                return SelectedOperation(idx);
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_cores.size(); }

private:
    std::shared_ptr<detail::ReadySignal> m_signal;
    std::vector<std::shared_ptr<detail::ChannelCore>> m_cores;
};

} // namespace relay_event
