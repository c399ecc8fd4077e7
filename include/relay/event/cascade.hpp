#pragma once

/// @file cascade.hpp
/// @brief Filter chains that forward events between queues
///
/// A cascade is bound to one input and owns an ordered list of routes plus
/// an optional finalizer. Each incoming event is offered to the routes in
/// attachment order; the first route whose filter matches takes it. A route
/// whose destination rejects delivery is removed, or turned into a
/// blackhole (keeps matching, drops silently) if it was attached with
/// persist_on_disconnect. Route changes are collected per batch in a
/// CleanupIndices map and applied afterwards by cleanup().
///
/// Concrete cascades live next to their input type:
/// TokenCascade in token_queue.hpp, DirectCascade in direct_queue.hpp.

#include "fwd.hpp"
#include "channel.hpp"
#include <relay/core/error.hpp>
#include <relay/core/log.hpp>

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relay_event {

// =============================================================================
// Basic Types
// =============================================================================

/// Route index -> true (turn into blackhole) / false (remove).
/// The key one past the last route removes the finalizer.
using CleanupIndices = std::unordered_map<std::size_t, bool>;

/// Result of offering one event to one route
enum class RouteOutcome : std::uint8_t {
    Kept,               // Not matched; event continues down the chain
    Forwarded,          // Matched and delivered (or discarded by a blackhole)
    ChangeToBlackhole,  // Matched, delivery failed, route persists
    Disconnected,       // Matched, delivery failed, route is removed
    Detached,           // Observer route lost its destination; event continues
};

/// Anything events can be pushed into; false means "will never accept again"
template<typename S, typename T>
concept EventSink = requires(S& sink, T event) {
    { sink.push(std::move(event)) } -> std::convertible_to<bool>;
};

/// Destination that rejects everything
template<typename T>
class BlackHole {
public:
    bool push(T) const noexcept { return false; }
};

// =============================================================================
// RouteChain
// =============================================================================

/// Ordered routes plus finalizer; shared by every cascade kind
/// @tparam T Event type
template<typename T>
class RouteChain {
public:
    /// Offer the event to one route. `discard` is set when the route is a
    /// blackhole or already failed earlier in this batch: a match must
    /// then be swallowed without delivery.
    using Step = std::function<RouteOutcome(T& event, bool discard)>;

    /// Called once per routed event: Ok if a route took it, Err(event)
    /// otherwise. Returning false removes the finalizer.
    using Finalizer = std::function<bool(relay_core::Result<void, T>)>;

    void add_route(Step step) {
        m_routes.push_back(Route{std::move(step), false});
    }

    void set_finalizer(Finalizer finalizer) {
        m_finalizer = std::move(finalizer);
    }

    /// Run one event through the chain, recording route failures in clx
    /// @return true if a route consumed the event
    bool route(T event, CleanupIndices& clx) {
        bool consumed = false;

        for (std::size_t n = 0; n < m_routes.size() && !consumed; ++n) {
            const bool discard = m_routes[n].blackholed || clx.contains(n);
            switch (m_routes[n].step(event, discard)) {
                case RouteOutcome::Kept:
                    break;
                case RouteOutcome::Forwarded:
                    consumed = true;
                    break;
                case RouteOutcome::ChangeToBlackhole:
                    clx.emplace(n, true);
                    consumed = true;
                    break;
                case RouteOutcome::Disconnected:
                    clx.emplace(n, false);
                    consumed = true;
                    break;
                case RouteOutcome::Detached:
                    clx.emplace(n, false);
                    break;
            }
        }

        const std::size_t finalizer_key = m_routes.size();
        if (m_finalizer && !clx.contains(finalizer_key)) {
            auto outcome = consumed
                ? relay_core::Result<void, T>()
                : relay_core::Result<void, T>(std::move(event));
            if (!m_finalizer(std::move(outcome))) {
                clx.emplace(finalizer_key, false);
            }
        }

        return consumed;
    }

    /// Apply the changes collected by route()
    /// @return true while a live route or the finalizer remains
    bool cleanup(CleanupIndices clx) {
        auto log = relay_core::cascade_logger();

        if (clx.erase(m_routes.size()) > 0 && m_finalizer) {
            m_finalizer = nullptr;
            log->debug("Finalizer removed");
        }

        std::vector<Route> kept;
        kept.reserve(m_routes.size());
        for (std::size_t n = 0; n < m_routes.size(); ++n) {
            auto it = clx.find(n);
            if (it == clx.end()) {
                kept.push_back(std::move(m_routes[n]));
            } else if (it->second) {
                m_routes[n].blackholed = true;
                kept.push_back(std::move(m_routes[n]));
                log->debug("Route {} became a blackhole (destination disconnected)", n);
            } else {
                log->debug("Route {} removed (destination disconnected)", n);
            }
        }
        m_routes = std::move(kept);

        return has_work();
    }

    /// A non-blackholed route or the finalizer is left
    [[nodiscard]] bool has_work() const {
        return static_cast<bool>(m_finalizer)
            || std::any_of(m_routes.begin(), m_routes.end(), [](const Route& r) { return !r.blackholed; });
    }

    [[nodiscard]] bool empty() const noexcept { return m_routes.empty(); }
    [[nodiscard]] std::size_t route_count() const noexcept { return m_routes.size(); }
    [[nodiscard]] bool has_finalizer() const noexcept { return static_cast<bool>(m_finalizer); }

    [[nodiscard]] std::size_t blackhole_count() const {
        return static_cast<std::size_t>(
            std::count_if(m_routes.begin(), m_routes.end(), [](const Route& r) { return r.blackholed; }));
    }

private:
    struct Route {
        Step step;
        bool blackholed = false;
    };

    std::vector<Route> m_routes;
    Finalizer m_finalizer;
};

// =============================================================================
// CascadeBase
// =============================================================================

/// Capability interface a routing worker drives.
/// try_run and cleanup are split so the worker can decide between them.
class CascadeBase {
public:
    virtual ~CascadeBase() = default;

    /// Register exactly one receiver with `sel`
    /// @return The index Select assigned to it
    virtual std::size_t register_input(Select& sel) const = 0;

    /// Complete the selected receive and route what arrived
    /// @return nullopt if the input is exhausted (drop this cascade),
    ///         an empty map if nothing changed, otherwise input for cleanup()
    virtual std::optional<CleanupIndices> try_run(const SelectedOperation& oper) = 0;

    /// Apply route changes
    /// @return false once no live route and no finalizer remain
    virtual bool cleanup(CleanupIndices clx) = 0;

    [[nodiscard]] virtual bool is_outs_empty() const = 0;
};

// =============================================================================
// BasicCascade
// =============================================================================

/// Builder and bookkeeping shared by the concrete cascades
/// @tparam Derived Concrete cascade (CRTP)
/// @tparam T Event type
template<typename Derived, typename T>
class BasicCascade : public CascadeBase {
public:
    using value_type = T;

    // =========================================================================
    // Builder
    // =========================================================================

    /// Forward events matching `predicate` to `dest`
    template<typename O, typename F>
        requires EventSink<O, T> && std::predicate<F&, const T&>
    Derived& attach_route(O dest, bool persist_on_disconnect, F predicate) & {
        m_chain.add_route(
            [dest = std::move(dest), persist_on_disconnect, predicate = std::move(predicate)](
                T& event, bool discard) mutable -> RouteOutcome {
                if (!std::invoke(predicate, std::as_const(event))) {
                    return RouteOutcome::Kept;
                }
                if (discard || dest.push(std::move(event))) {
                    return RouteOutcome::Forwarded;
                }
                return persist_on_disconnect ? RouteOutcome::ChangeToBlackhole : RouteOutcome::Disconnected;
            });
        return self();
    }

    template<typename O, typename F>
        requires EventSink<O, T> && std::predicate<F&, const T&>
    Derived&& attach_route(O dest, bool persist_on_disconnect, F predicate) && {
        return std::move(attach_route(std::move(dest), persist_on_disconnect, std::move(predicate)));
    }

    /// Forward a transformed event. `transform` returns a success holding the
    /// mapped value to forward, or an error holding the event to hand it back
    /// to the chain (use Result::err when both types are the same).
    template<typename O, typename F,
             typename R = typename std::invoke_result_t<F&, T>::value_type>
        requires EventSink<O, R>
    Derived& attach_mapped_route(O dest, bool persist_on_disconnect, F transform) & {
        m_chain.add_route(
            [dest = std::move(dest), persist_on_disconnect, transform = std::move(transform)](
                T& event, bool discard) mutable -> RouteOutcome {
                auto mapped = std::invoke(transform, std::move(event));
                if (mapped.is_err()) {
                    event = std::move(mapped).error();
                    return RouteOutcome::Kept;
                }
                if (discard || dest.push(std::move(mapped).value())) {
                    return RouteOutcome::Forwarded;
                }
                return persist_on_disconnect ? RouteOutcome::ChangeToBlackhole : RouteOutcome::Disconnected;
            });
        return self();
    }

    template<typename O, typename F,
             typename R = typename std::invoke_result_t<F&, T>::value_type>
        requires EventSink<O, R>
    Derived&& attach_mapped_route(O dest, bool persist_on_disconnect, F transform) && {
        return std::move(attach_mapped_route(std::move(dest), persist_on_disconnect, std::move(transform)));
    }

    /// Copy every event reaching this point into `dest`; the event continues
    template<typename O>
        requires EventSink<O, T> && std::copy_constructible<T>
    Derived& attach_notify(O dest) & {
        m_chain.add_route([dest = std::move(dest)](T& event, bool discard) mutable -> RouteOutcome {
            if (!discard && !dest.push(T(event))) {
                return RouteOutcome::Detached;
            }
            return RouteOutcome::Kept;
        });
        return self();
    }

    template<typename O>
        requires EventSink<O, T> && std::copy_constructible<T>
    Derived&& attach_notify(O dest) && {
        return std::move(attach_notify(std::move(dest)));
    }

    /// Push a Token into `dest` for every event reaching this point; the
    /// event continues. The event itself may not be visible yet when the
    /// token is consumed.
    template<typename O>
        requires EventSink<O, Token>
    Derived& attach_notify_via_token(O dest) & {
        m_chain.add_route([dest = std::move(dest)](T&, bool discard) mutable -> RouteOutcome {
            if (!discard && !dest.push(Token{})) {
                return RouteOutcome::Detached;
            }
            return RouteOutcome::Kept;
        });
        return self();
    }

    template<typename O>
        requires EventSink<O, Token>
    Derived&& attach_notify_via_token(O dest) && {
        return std::move(attach_notify_via_token(std::move(dest)));
    }

    /// Register the finalizer (replaces a previous one)
    template<typename F>
        requires std::invocable<F&, relay_core::Result<void, T>>
    Derived& set_finalizer(F finalizer) & {
        m_chain.set_finalizer(std::move(finalizer));
        return self();
    }

    template<typename F>
        requires std::invocable<F&, relay_core::Result<void, T>>
    Derived&& set_finalizer(F finalizer) && {
        return std::move(set_finalizer(std::move(finalizer)));
    }

    /// Type-erase for a routing worker
    /// @return Error if no route is attached
    [[nodiscard]] relay_core::Result<CascadeBox> wrap() && {
        if (m_chain.empty()) {
            return relay_core::Error(relay_core::ErrorCode::InvalidState, "cascade has no routes");
        }
        return CascadeBox(std::make_unique<Derived>(std::move(self())));
    }

    // =========================================================================
    // CascadeBase
    // =========================================================================

    bool cleanup(CleanupIndices clx) override {
        return m_chain.cleanup(std::move(clx));
    }

    [[nodiscard]] bool is_outs_empty() const override {
        return m_chain.empty();
    }

    [[nodiscard]] const RouteChain<T>& chain() const noexcept { return m_chain; }

protected:
    RouteChain<T> m_chain;

private:
    Derived& self() noexcept { return static_cast<Derived&>(*this); }
};

} // namespace relay_event
