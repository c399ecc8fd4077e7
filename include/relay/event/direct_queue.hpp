#pragma once

/// @file direct_queue.hpp
/// @brief Thread-safe queue that hands each subscriber its own copy
///
/// Faster to consume than TokenQueue (no second pull through a listener)
/// at the cost of one copy per subscriber per event.

#include "fwd.hpp"
#include "cascade.hpp"
#include "channel.hpp"
#include "queue.hpp"

#include <algorithm>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace relay_event {

// =============================================================================
// DirectLog
// =============================================================================

/// Broadcast log plus copy-receiving subscribers
template<typename T>
class DirectLog : public RawQueue<T> {
public:
    /// Copies go to every live subscriber; the event is buffered only if a
    /// listener exists. Delivered if either received it.
    EmitResult<T> emit(T event) {
        const bool to_subscribers = deliver_copies(event);
        if (this->has_listeners()) {
            return RawQueue<T>::emit(std::move(event));
        }
        if (to_subscribers) {
            return EmitResult<T>::delivered();
        }
        return EmitResult<T>::undelivered(std::move(event));
    }

    bool push(T event) {
        return emit(std::move(event)).was_delivered();
    }

    template<typename InputIt>
    bool extend(InputIt first, InputIt last) {
        std::vector<T> events(first, last);
        std::erase_if(m_subscribers, [&](const Sender<T>& s) {
            return !std::all_of(events.begin(), events.end(), [&](const T& e) { return s.push(e); });
        });
        if (RawQueue<T>::extend(std::make_move_iterator(events.begin()), std::make_move_iterator(events.end()))) {
            return true;
        }
        return !m_subscribers.empty();
    }

    void add_subscriber(Sender<T> subscriber) {
        m_subscribers.push_back(std::move(subscriber));
    }

    /// No buffered event and every subscriber channel drained
    [[nodiscard]] bool is_empty() const {
        return RawQueue<T>::is_empty()
            && std::all_of(m_subscribers.begin(), m_subscribers.end(),
                           [](const Sender<T>& s) { return s.empty(); });
    }

private:
    /// @return true if at least one subscriber is still connected
    bool deliver_copies(const T& event) {
        std::erase_if(m_subscribers, [&](const Sender<T>& s) { return !s.push(event); });
        return !m_subscribers.empty();
    }

    std::vector<Sender<T>> m_subscribers;
};

// =============================================================================
// DirectCascade
// =============================================================================

/// Cascade over a Receiver<T>; routes one event per readiness.
/// The input is exhausted once the receiver is disconnected and drained.
template<typename T>
class DirectCascade final : public BasicCascade<DirectCascade<T>, T> {
public:
    explicit DirectCascade(Receiver<T> input) : m_input(std::move(input)) {}

    std::size_t register_input(Select& sel) const override {
        return sel.recv(m_input);
    }

    std::optional<CleanupIndices> try_run(const SelectedOperation& oper) override {
        auto event = oper.recv(m_input);
        if (event.is_err()) {
            return std::nullopt;
        }

        CleanupIndices clx;
        this->m_chain.route(std::move(event).value(), clx);
        return clx;
    }

private:
    Receiver<T> m_input;
};

/// Internal routing hop: whatever is pushed into the sender is routed by
/// the returned cascade
template<typename T>
[[nodiscard]] std::pair<Sender<T>, DirectCascade<T>> make_cascade_channel() {
    auto [tx, rx] = channel_unbounded<T>();
    return {std::move(tx), DirectCascade<T>(std::move(rx))};
}

// =============================================================================
// DirectQueue
// =============================================================================

/// Thread-safe shared queue whose subscribers receive copies of each event
template<typename T>
class DirectQueue : public Queue<T, SyncCell<DirectLog<T>>> {
public:
    /// Unbounded channel receiving a copy of every later event
    [[nodiscard]] Receiver<T> subscribe() const {
        auto channel = channel_unbounded<T>();
        this->m_cell.write([&](DirectLog<T>& log) { log.add_subscriber(std::move(channel.first)); });
        return std::move(channel.second);
    }

    /// Cascade fed by a fresh subscription
    [[nodiscard]] DirectCascade<T> cascade() const {
        return DirectCascade<T>(subscribe());
    }
};

} // namespace relay_event
