#pragma once

/// @file bidir.hpp
/// @brief Bidirectional 1:1 queues (no multicasting, single thread)
///
/// Two endpoints share one state with an inbox per direction. An endpoint
/// emits into the other side's inbox and drains its own. The primary
/// receives Tp and sends Ts; secondary() returns the other end.
///
/// BidirQueue keeps every event per direction (FIFO); BidirSingleQueue
/// keeps only the newest one.

#include "fwd.hpp"
#include "emit_result.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace relay_event {

// =============================================================================
// Inboxes
// =============================================================================

/// FIFO inbox
template<typename T>
class QueueInbox {
public:
    void push(T event) { m_items.push_back(std::move(event)); }

    [[nodiscard]] std::vector<T> drain() {
        std::vector<T> out(std::make_move_iterator(m_items.begin()), std::make_move_iterator(m_items.end()));
        m_items.clear();
        return out;
    }

    [[nodiscard]] std::optional<T> take_newest() {
        if (m_items.empty()) {
            return std::nullopt;
        }
        std::optional<T> newest(std::move(m_items.back()));
        m_items.clear();
        return newest;
    }

    [[nodiscard]] bool empty() const noexcept { return m_items.empty(); }

private:
    std::deque<T> m_items;
};

/// Inbox holding at most one event; a push replaces the previous one
template<typename T>
class SingleInbox {
public:
    void push(T event) { m_item = std::move(event); }

    [[nodiscard]] std::vector<T> drain() {
        std::vector<T> out;
        if (m_item) {
            out.push_back(std::move(*m_item));
            m_item.reset();
        }
        return out;
    }

    [[nodiscard]] std::optional<T> take_newest() {
        return std::exchange(m_item, std::nullopt);
    }

    [[nodiscard]] bool empty() const noexcept { return !m_item.has_value(); }

private:
    std::optional<T> m_item;
};

// =============================================================================
// BidirEndpoint
// =============================================================================

namespace detail {

/// Inboxes shared by both ends of a bidirectional queue
template<typename Tp, typename Ts, template<typename> class Inbox>
struct BidirState {
    Inbox<Tp> to_primary;
    Inbox<Ts> to_secondary;
};

} // namespace detail

/// One end of a bidirectional queue
/// @tparam Tp Events the primary receives
/// @tparam Ts Events the secondary receives
/// @tparam Inbox QueueInbox or SingleInbox
/// @tparam IsPrimary Which end this is
template<typename Tp, typename Ts, template<typename> class Inbox, bool IsPrimary>
class BidirEndpoint {
public:
    /// Events this end receives
    using in_type = std::conditional_t<IsPrimary, Tp, Ts>;
    /// Events this end sends
    using out_type = std::conditional_t<IsPrimary, Ts, Tp>;
    using other_type = BidirEndpoint<Tp, Ts, Inbox, !IsPrimary>;

    /// Fresh pair of inboxes
    BidirEndpoint() : m_state(std::make_shared<State>()) {}

    /// The other end of this queue (all calls return the same shared end)
    [[nodiscard]] other_type secondary() const { return other_type(m_state); }

    // =========================================================================
    // Sending
    // =========================================================================

    /// Always delivered: the other end has exactly one reader
    EmitResult<out_type> emit(out_type event) {
        outbox().push(std::move(event));
        return EmitResult<out_type>::delivered();
    }

    bool push(out_type event) {
        return emit(std::move(event)).was_delivered();
    }

    /// Outgoing inbox is empty
    [[nodiscard]] bool is_empty() const { return outbox().empty(); }

    // =========================================================================
    // Receiving
    // =========================================================================

    /// Drain the own inbox
    [[nodiscard]] std::vector<in_type> peek() const { return inbox().drain(); }

    template<typename F>
    decltype(auto) with(F&& f) const {
        std::vector<in_type> events = inbox().drain();
        return std::invoke(std::forward<F>(f), std::span<const in_type>(events));
    }

    template<typename F>
    auto map(F&& f) const -> std::vector<std::invoke_result_t<F&, const in_type&>> {
        std::vector<std::invoke_result_t<F&, const in_type&>> out;
        for (const in_type& event : inbox().drain()) {
            out.push_back(f(event));
        }
        return out;
    }

    /// Drain the own inbox, answering each event with f's reply (if any)
    template<typename F>
    void bounce(F&& f) const {
        for (in_type& event : inbox().drain()) {
            std::optional<out_type> reply = f(std::move(event));
            if (reply) {
                outbox().push(std::move(*reply));
            }
        }
    }

    /// Newest own event; the older ones are dropped
    [[nodiscard]] std::optional<in_type> retrieve_newest() const { return inbox().take_newest(); }

private:
    template<typename, typename, template<typename> class, bool>
    friend class BidirEndpoint;

    using State = detail::BidirState<Tp, Ts, Inbox>;

    explicit BidirEndpoint(std::shared_ptr<State> state) : m_state(std::move(state)) {}

    Inbox<in_type>& inbox() const {
        if constexpr (IsPrimary) {
            return m_state->to_primary;
        } else {
            return m_state->to_secondary;
        }
    }

    Inbox<out_type>& outbox() const {
        if constexpr (IsPrimary) {
            return m_state->to_secondary;
        } else {
            return m_state->to_primary;
        }
    }

    std::shared_ptr<State> m_state;
};

/// FIFO in each direction
template<typename Tp, typename Ts>
using BidirQueue = BidirEndpoint<Tp, Ts, QueueInbox, true>;

/// Newest event only, in each direction
template<typename Tp, typename Ts>
using BidirSingleQueue = BidirEndpoint<Tp, Ts, SingleInbox, true>;

} // namespace relay_event
