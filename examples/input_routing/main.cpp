/// @file main.cpp
/// @brief Input Routing Demo
///
/// Routes raw input events from a UI thread to a background routing worker.
/// Clicks go to a click queue, drags are forwarded as positions to a cursor
/// queue, and everything else is counted by the finalizer. The click handler
/// answers through a token channel.
///
/// Usage: input_routing [config.json]

#include <relay/core/core.hpp>
#include <relay/event/event.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Position {
    int x = 0;
    int y = 0;
};

struct Input {
    enum class Kind { Click, MouseMove, Drag, Key };

    Kind kind = Kind::Key;
    Position pos;
    char key = 0;

    static Input click(int x, int y) { return {Kind::Click, {x, y}, 0}; }
    static Input mouse_move(int x, int y) { return {Kind::MouseMove, {x, y}, 0}; }
    static Input drag(int x, int y) { return {Kind::Drag, {x, y}, 0}; }
    static Input key_press(char c) { return {Kind::Key, {}, c}; }
};

const char* kind_name(Input::Kind kind) {
    switch (kind) {
        case Input::Kind::Click: return "click";
        case Input::Kind::MouseMove: return "mouse-move";
        case Input::Kind::Drag: return "drag";
        case Input::Kind::Key: return "key";
    }
    return "unknown";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace std::chrono_literals;

    relay_core::init_logging();

    relay_core::RelayConfig config;
    config.worker.name = "input-router";
    if (argc > 1) {
        auto loaded = relay_core::load_config(argv[1]);
        if (!loaded) {
            RELAY_LOG_ERROR("{}", relay_core::build_error_chain(loaded.error()));
            return EXIT_FAILURE;
        }
        config = std::move(loaded).value();
    }
    relay_core::configure_logging(config.logging);

    RELAY_LOG_INFO("=== Input Routing Demo ===");

    // -------------------------------------------------------------------------
    // Queues
    // -------------------------------------------------------------------------

    relay_event::TokenQueue<Input> input;
    relay_event::TokenQueue<Input> clicks;
    relay_event::DirectQueue<Position> cursor;

    auto click_in = clicks.listen_and_subscribe();
    auto cursor_rx = cursor.subscribe();
    auto [ack_tx, ack_rx] = relay_event::channel_unbounded<relay_event::Token>();

    std::atomic<int> unrouted{0};

    // -------------------------------------------------------------------------
    // Cascade: input -> clicks / cursor, with a click acknowledgement token
    // -------------------------------------------------------------------------

    auto cascade = input.cascade()
        .attach_route(clicks, false, [](const Input& e) { return e.kind == Input::Kind::Click; })
        .attach_mapped_route(cursor, true, [](Input e) -> relay_core::Result<Position, Input> {
            if (e.kind == Input::Kind::Drag) {
                return e.pos;
            }
            return e;
        })
        .set_finalizer([&unrouted](relay_core::Result<void, Input> r) {
            if (r.is_err()) {
                RELAY_LOG_DEBUG("No route for {} event", kind_name(r.error().kind));
                unrouted.fetch_add(1, std::memory_order_relaxed);
            }
            return true;
        })
        .wrap();

    if (!cascade) {
        RELAY_LOG_CRITICAL("Router not started: {}", relay_core::build_error_chain(cascade.error()));
        return EXIT_FAILURE;
    }

    auto [hop_tx, hop_cascade] = relay_event::make_cascade_channel<Input>();
    auto ack_cascade = std::move(hop_cascade)
        .attach_notify_via_token(ack_tx)
        .wrap();

    relay_event::CascadeWorker worker({}, config.worker);
    worker.submit(std::move(cascade).value());
    worker.submit(std::move(ack_cascade).value());

    // -------------------------------------------------------------------------
    // UI thread: produce input
    // -------------------------------------------------------------------------

    std::thread ui([input]() mutable {
        const std::vector<Input> script = {
            Input::mouse_move(1, 1),
            Input::click(10, 20),
            Input::drag(11, 21),
            Input::drag(12, 22),
            Input::key_press('q'),
            Input::click(30, 40),
        };
        for (const auto& e : script) {
            RELAY_LOG_TRACE("UI produced {} event", kind_name(e.kind));
            input.push(e);
            std::this_thread::sleep_for(5ms);
        }
    });

    // -------------------------------------------------------------------------
    // Consumers
    // -------------------------------------------------------------------------

    int handled_clicks = 0;
    while (handled_clicks < 2) {
        if (click_in.notifier.recv_timeout(1s).is_err()) {
            RELAY_LOG_WARN("Timed out waiting for clicks");
            break;
        }
        for (const Input& e : click_in.listener.peek()) {
            RELAY_LOG_INFO("Click at ({}, {})", e.pos.x, e.pos.y);
            hop_tx.push(e);
            ++handled_clicks;
        }
    }

    ui.join();

    while (auto pos = cursor_rx.recv_timeout(100ms)) {
        RELAY_LOG_INFO("Cursor dragged to ({}, {})", pos.value().x, pos.value().y);
    }

    std::size_t acks = 0;
    while (ack_rx.recv_timeout(100ms).is_ok()) {
        ++acks;
    }

    RELAY_LOG_INFO("Clicks handled: {}, acknowledged: {}, unrouted events: {}",
                 handled_clicks, acks, unrouted.load());

    worker.stop();
    relay_core::shutdown_logging();
    return EXIT_SUCCESS;
}
