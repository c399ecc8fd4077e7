#pragma once

/// @file token_queue.hpp
/// @brief Thread-safe queue that wakes subscribers with tokens
///
/// Every delivered emit sends one Token to each subscriber, so consumers
/// can block on a Receiver<Token> and then pull the log through their
/// listener. Tokens are sent with try_send: a full bounded subscriber just
/// misses the token, a disconnected one is pruned.

#include "fwd.hpp"
#include "cascade.hpp"
#include "channel.hpp"
#include "queue.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace relay_event {

// =============================================================================
// TokenLog
// =============================================================================

/// Broadcast log plus token subscribers
template<typename T>
class TokenLog : public RawQueue<T> {
public:
    EmitResult<T> emit(T event) {
        auto result = RawQueue<T>::emit(std::move(event));
        if (result.was_delivered()) {
            notify();
        }
        return result;
    }

    bool push(T event) {
        return emit(std::move(event)).was_delivered();
    }

    template<typename InputIt>
    bool extend(InputIt first, InputIt last) {
        if (!RawQueue<T>::extend(first, last)) {
            return false;
        }
        notify();
        return true;
    }

    void add_subscriber(Sender<Token> subscriber) {
        m_subscribers.push_back(std::move(subscriber));
    }

    /// Token to every subscriber; drop the ones whose receiver is gone
    void notify() {
        std::erase_if(m_subscribers, [](const Sender<Token>& s) {
            auto sent = s.try_send(Token{});
            return sent.is_err() && sent.error().kind == SendError<Token>::Kind::Disconnected;
        });
    }

    [[nodiscard]] const std::vector<Sender<Token>>& subscribers() const noexcept { return m_subscribers; }

private:
    std::vector<Sender<Token>> m_subscribers;
};

template<typename T>
using TokenListener = Listener<T, SyncCell<TokenLog<T>>>;

/// Listener paired with its wakeup channel
template<typename T>
struct CombinedListener {
    TokenListener<T> listener;
    Receiver<Token> notifier;
};

// =============================================================================
// TokenCascade
// =============================================================================

/// Cascade over a TokenQueue. Each token pulls the whole unseen batch.
/// The input is exhausted when the cascade's listener holds the last
/// reference to the log (no producer can emit again) or the token channel
/// disconnected.
template<typename T>
class TokenCascade final : public BasicCascade<TokenCascade<T>, T> {
public:
    TokenCascade(TokenListener<T> listener, Receiver<Token> notifier)
        : m_listener(std::move(listener)), m_notifier(std::move(notifier)) {}

    std::size_t register_input(Select& sel) const override {
        return sel.recv(m_notifier);
    }

    std::optional<CleanupIndices> try_run(const SelectedOperation& oper) override {
        if (oper.recv(m_notifier).is_err()) {
            return std::nullopt;
        }

        // The reference count is read under the same lock as the batch
        bool last_ref = false;
        std::vector<T> events = m_listener.with_use_count([&](std::span<const T> batch, long refs) {
            last_ref = refs == 1;
            return std::vector<T>(batch.begin(), batch.end());
        });

        CleanupIndices clx;
        for (T& event : events) {
            this->m_chain.route(std::move(event), clx);
        }

        if (last_ref) {
            return std::nullopt;
        }
        return clx;
    }

private:
    TokenListener<T> m_listener;
    Receiver<Token> m_notifier;
};

// =============================================================================
// TokenQueue
// =============================================================================

/// Thread-safe shared queue with token notifications.
/// Copies share the log. Releasing a handle sends one token to every
/// subscriber after the reference is dropped, so a cascade wakes up and can
/// see that it holds the last reference.
template<typename T>
class TokenQueue : public Queue<T, SyncCell<TokenLog<T>>> {
    using Base = Queue<T, SyncCell<TokenLog<T>>>;

public:
    TokenQueue() = default;
    TokenQueue(const TokenQueue&) = default;
    TokenQueue(TokenQueue&&) noexcept = default;
    TokenQueue& operator=(const TokenQueue& other) {
        if (this != &other) {
            TokenQueue tmp(other);
            std::swap(this->m_cell, tmp.m_cell);
        }
        return *this;
    }
    TokenQueue& operator=(TokenQueue&& other) noexcept {
        if (this != &other) {
            TokenQueue tmp(std::move(other));
            std::swap(this->m_cell, tmp.m_cell);
        }
        return *this;
    }

    ~TokenQueue() { release(); }

    /// Unbounded token channel
    [[nodiscard]] Receiver<Token> subscribe() const {
        auto [tx, rx] = channel_unbounded<Token>();
        add_subscriber(std::move(tx));
        return std::move(rx);
    }

    /// Bounded token channel; tokens beyond `capacity` are dropped
    [[nodiscard]] Receiver<Token> subscribe_bounded(std::size_t capacity) const {
        auto [tx, rx] = channel_bounded<Token>(capacity);
        add_subscriber(std::move(tx));
        return std::move(rx);
    }

    /// Listener and subscription registered in one critical section
    [[nodiscard]] CombinedListener<T> listen_and_subscribe() const {
        auto channel = channel_unbounded<Token>();
        ListenerKey key = this->m_cell.write([&](TokenLog<T>& log) {
            log.add_subscriber(std::move(channel.first));
            return log.create_listener();
        });
        return CombinedListener<T>{TokenListener<T>(this->m_cell.ref(), key), std::move(channel.second)};
    }

    /// Cascade fed by this queue
    [[nodiscard]] TokenCascade<T> cascade() const {
        auto [listener, notifier] = listen_and_subscribe();
        return TokenCascade<T>(std::move(listener), std::move(notifier));
    }

private:
    void add_subscriber(Sender<Token> tx) const {
        this->m_cell.write([&](TokenLog<T>& log) { log.add_subscriber(std::move(tx)); });
    }

    void release() noexcept {
        if (!this->m_cell.ref()) {
            return;
        }
        std::vector<Sender<Token>> subscribers;
        const bool copied = SyncCell<TokenLog<T>>::try_write_ref(this->m_cell.ref(), [&](TokenLog<T>& log) {
            subscribers = log.subscribers();
        });
        this->m_cell.reset();
        if (!copied) {
            return;
        }
        // A full or dead subscriber needs no extra wakeup
        for (const auto& s : subscribers) {
            (void)s.try_send(Token{});
        }
    }
};

} // namespace relay_event
