/// @file test_cascade.cpp
/// @brief Tests for route chains, TokenCascade and DirectCascade

#include <catch2/catch_test_macros.hpp>
#include <relay/event/event.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace relay_event;
using relay_core::ErrorCode;
using relay_core::Result;

namespace {

template<typename Cascade>
std::optional<CleanupIndices> run_once(Cascade& cascade) {
    Select sel;
    cascade.register_input(sel);
    return cascade.try_run(sel.select());
}

template<typename T>
std::vector<T> drain(const Receiver<T>& rx) {
    std::vector<T> out;
    while (auto value = rx.try_recv()) {
        out.push_back(std::move(value).value());
    }
    return out;
}

bool is_even(const int& e) { return e % 2 == 0; }
bool always(const int&) { return true; }

} // anonymous namespace

// =============================================================================
// Route order
// =============================================================================

TEST_CASE("Cascade: first matching route takes the event", "[event][cascade]") {
    auto [input, cascade] = make_cascade_channel<int>();
    auto [to_a, from_a] = channel_unbounded<int>();
    auto [to_b, from_b] = channel_unbounded<int>();

    cascade.attach_route(to_a, false, is_even)
           .attach_route(to_b, false, always);

    for (int i = 1; i <= 4; ++i) {
        input.push(i);
        auto clx = run_once(cascade);
        REQUIRE(clx.has_value());
        REQUIRE(clx->empty());
    }

    REQUIRE(drain(from_a) == std::vector<int>{2, 4});
    REQUIRE(drain(from_b) == std::vector<int>{1, 3});
}

TEST_CASE("Cascade: TokenCascade routes a whole batch per token", "[event][cascade]") {
    TokenQueue<int> source;
    auto [to_a, from_a] = channel_unbounded<int>();

    auto cascade = source.cascade().attach_route(to_a, false, always);
    source.extend(std::vector<int>{1, 2, 3});

    auto clx = run_once(cascade);
    REQUIRE(clx.has_value());
    REQUIRE(drain(from_a) == std::vector<int>{1, 2, 3});
}

// =============================================================================
// Disconnection
// =============================================================================

TEST_CASE("Cascade: disconnected route is removed", "[event][cascade]") {
    TokenQueue<int> source;
    auto [to_a, from_a] = channel_unbounded<int>();
    auto [to_b, from_b] = channel_unbounded<int>();

    auto cascade = source.cascade()
        .attach_route(to_a, false, is_even)
        .attach_route(to_b, false, always);
    { auto gone = std::move(from_a); }

    source.extend(std::vector<int>{1, 2, 3, 4});
    auto clx = run_once(cascade);

    REQUIRE(clx.has_value());
    REQUIRE(clx->size() == 1);
    REQUIRE_FALSE(clx->at(0));
    // Matches of the failed route are swallowed for the rest of the batch
    REQUIRE(drain(from_b) == std::vector<int>{1, 3});

    REQUIRE(cascade.cleanup(std::move(*clx)));
    REQUIRE(cascade.chain().route_count() == 1);

    source.push(6);
    REQUIRE(run_once(cascade)->empty());
    REQUIRE(drain(from_b) == std::vector<int>{6});
}

TEST_CASE("Cascade: persistent route turns into a blackhole", "[event][cascade]") {
    TokenQueue<int> source;
    auto [to_a, from_a] = channel_unbounded<int>();
    auto [to_b, from_b] = channel_unbounded<int>();

    auto cascade = source.cascade()
        .attach_route(to_a, true, is_even)
        .attach_route(to_b, false, always);
    { auto gone = std::move(from_a); }

    source.push(2);
    auto clx = run_once(cascade);
    REQUIRE(clx->at(0));
    REQUIRE(cascade.cleanup(std::move(*clx)));
    REQUIRE(cascade.chain().blackhole_count() == 1);
    REQUIRE(cascade.chain().route_count() == 2);

    source.extend(std::vector<int>{4, 5});
    REQUIRE(run_once(cascade)->empty());
    REQUIRE(drain(from_b) == std::vector<int>{5});
}

TEST_CASE("Cascade: cleanup reports when no work is left", "[event][cascade]") {
    auto [input, cascade] = make_cascade_channel<int>();
    auto [to_a, from_a] = channel_unbounded<int>();

    cascade.attach_route(to_a, false, always);
    { auto gone = std::move(from_a); }

    input.push(1);
    auto clx = run_once(cascade);
    REQUIRE_FALSE(cascade.cleanup(std::move(*clx)));
    REQUIRE(cascade.is_outs_empty());
}

TEST_CASE("Cascade: only blackholes left means no work", "[event][cascade]") {
    auto [input, cascade] = make_cascade_channel<int>();
    cascade.attach_route(BlackHole<int>{}, true, always);

    input.push(1);
    auto clx = run_once(cascade);
    REQUIRE_FALSE(cascade.cleanup(std::move(*clx)));
    REQUIRE_FALSE(cascade.is_outs_empty());
}

// =============================================================================
// Finalizer
// =============================================================================

TEST_CASE("Cascade: finalizer sees every routed event", "[event][cascade][finalizer]") {
    auto [input, cascade] = make_cascade_channel<int>();
    auto [to_a, from_a] = channel_unbounded<int>();

    std::vector<int> unrouted;
    int routed = 0;
    cascade.attach_route(to_a, false, is_even)
           .set_finalizer([&](Result<void, int> r) {
               if (r.is_ok()) {
                   ++routed;
               } else {
                   unrouted.push_back(r.error());
               }
               return true;
           });

    for (int i = 1; i <= 5; ++i) {
        input.push(i);
        REQUIRE(run_once(cascade)->empty());
    }

    REQUIRE(routed == 2);
    REQUIRE(unrouted == std::vector<int>{1, 3, 5});
}

TEST_CASE("Cascade: finalizer returning false is removed", "[event][cascade][finalizer]") {
    auto [input, cascade] = make_cascade_channel<int>();
    auto [to_a, from_a] = channel_unbounded<int>();

    int calls = 0;
    cascade.attach_route(to_a, false, is_even)
           .set_finalizer([&](Result<void, int>) {
               ++calls;
               return false;
           });

    input.push(1);
    auto clx = run_once(cascade);
    REQUIRE(clx->size() == 1);
    REQUIRE(clx->contains(cascade.chain().route_count()));

    REQUIRE(cascade.cleanup(std::move(*clx)));
    REQUIRE_FALSE(cascade.chain().has_finalizer());

    input.push(3);
    REQUIRE(run_once(cascade)->empty());
    REQUIRE(calls == 1);
}

TEST_CASE("Cascade: blackholed route still counts as routed", "[event][cascade][finalizer]") {
    auto [input, cascade] = make_cascade_channel<int>();

    int ok = 0;
    int err = 0;
    cascade.attach_route(BlackHole<int>{}, true, is_even)
           .set_finalizer([&](Result<void, int> r) {
               (r.is_ok() ? ok : err) += 1;
               return true;
           });

    input.push(2);
    auto clx = run_once(cascade);
    REQUIRE(cascade.cleanup(std::move(*clx)));
    REQUIRE(cascade.chain().blackhole_count() == 1);

    input.push(4);
    input.push(5);
    REQUIRE(run_once(cascade)->empty());
    REQUIRE(run_once(cascade)->empty());

    REQUIRE(ok == 2);
    REQUIRE(err == 1);
}

// =============================================================================
// Route kinds
// =============================================================================

TEST_CASE("Cascade: mapped route", "[event][cascade]") {
    auto [input, cascade] = make_cascade_channel<int>();
    auto [to_text, from_text] = channel_unbounded<std::string>();
    auto [to_rest, from_rest] = channel_unbounded<int>();

    cascade.attach_mapped_route(to_text, false, [](int e) -> Result<std::string, int> {
               if (e % 2 == 0) {
                   return std::string("even ") + std::to_string(e);
               }
               return e;
           })
           .attach_route(to_rest, false, always);

    input.push(1);
    input.push(2);
    (void)run_once(cascade);
    (void)run_once(cascade);

    REQUIRE(drain(from_text) == std::vector<std::string>{"even 2"});
    REQUIRE(drain(from_rest) == std::vector<int>{1});
}

TEST_CASE("Cascade: mapped route with the same event type", "[event][cascade]") {
    auto [input, cascade] = make_cascade_channel<int>();
    auto [to_scaled, from_scaled] = channel_unbounded<int>();
    auto [to_rest, from_rest] = channel_unbounded<int>();

    cascade.attach_mapped_route(to_scaled, false, [](int e) {
               if (e > 10) {
                   return Result<int, int>::ok(e / 10);
               }
               return Result<int, int>::err(e);
           })
           .attach_route(to_rest, false, always);

    input.push(50);
    input.push(3);
    (void)run_once(cascade);
    (void)run_once(cascade);

    REQUIRE(drain(from_scaled) == std::vector<int>{5});
    REQUIRE(drain(from_rest) == std::vector<int>{3});
}

TEST_CASE("Cascade: notify route copies and continues", "[event][cascade]") {
    auto [input, cascade] = make_cascade_channel<int>();
    auto [to_log, from_log] = channel_unbounded<int>();
    auto [to_b, from_b] = channel_unbounded<int>();

    cascade.attach_notify(to_log)
           .attach_route(to_b, false, always);

    input.push(1);
    REQUIRE(run_once(cascade)->empty());
    REQUIRE(drain(from_log) == std::vector<int>{1});
    REQUIRE(drain(from_b) == std::vector<int>{1});

    SECTION("dead observer is detached, event still delivered") {
        { auto gone = std::move(from_log); }
        input.push(2);
        auto clx = run_once(cascade);
        REQUIRE_FALSE(clx->at(0));
        REQUIRE(drain(from_b) == std::vector<int>{2});

        REQUIRE(cascade.cleanup(std::move(*clx)));
        REQUIRE(cascade.chain().route_count() == 1);
    }
}

TEST_CASE("Cascade: notify via token", "[event][cascade]") {
    auto [input, cascade] = make_cascade_channel<int>();
    auto [tokens, token_rx] = channel_unbounded<Token>();
    auto [to_b, from_b] = channel_unbounded<int>();

    cascade.attach_notify_via_token(tokens)
           .attach_route(to_b, false, is_even);

    input.push(1);
    input.push(2);
    (void)run_once(cascade);
    (void)run_once(cascade);

    REQUIRE(token_rx.size() == 2);
    REQUIRE(drain(from_b) == std::vector<int>{2});
}

// =============================================================================
// Lifetime
// =============================================================================

TEST_CASE("Cascade: wrap needs a route", "[event][cascade]") {
    TokenQueue<int> source;

    SECTION("no routes") {
        auto boxed = source.cascade().wrap();
        REQUIRE(boxed.is_err());
        REQUIRE(boxed.error().code() == ErrorCode::InvalidState);
    }

    SECTION("with a route") {
        auto boxed = source.cascade().attach_route(BlackHole<int>{}, false, always).wrap();
        REQUIRE(boxed.is_ok());
        REQUIRE(static_cast<bool>(boxed.value()));
        REQUIRE_FALSE(boxed.value()->is_outs_empty());
    }
}

TEST_CASE("Cascade: TokenCascade exhausts when producers are gone", "[event][cascade]") {
    auto source = std::make_unique<TokenQueue<int>>();
    auto [to_b, from_b] = channel_unbounded<int>();
    auto cascade = source->cascade().attach_route(to_b, false, always);

    source->push(1);
    source.reset();

    // The pending batch is still routed before the input reports exhaustion
    auto clx = run_once(cascade);
    REQUIRE_FALSE(clx.has_value());
    REQUIRE(drain(from_b) == std::vector<int>{1});
}

TEST_CASE("Cascade: DirectCascade exhausts when senders are gone", "[event][cascade]") {
    auto [input, cascade] = make_cascade_channel<int>();
    auto [to_b, from_b] = channel_unbounded<int>();
    cascade.attach_route(to_b, false, always);

    input.push(1);
    { auto gone = std::move(input); }

    REQUIRE(run_once(cascade).has_value());
    REQUIRE_FALSE(run_once(cascade).has_value());
    REQUIRE(drain(from_b) == std::vector<int>{1});
}

TEST_CASE("Cascade: DirectQueue subscription feeds a cascade", "[event][cascade]") {
    DirectQueue<int> source;
    auto [to_b, from_b] = channel_unbounded<int>();
    auto cascade = source.cascade().attach_route(to_b, false, always);

    REQUIRE(source.push(8));
    REQUIRE(run_once(cascade)->empty());
    REQUIRE(drain(from_b) == std::vector<int>{8});
}
