/// @file test_notifying_queues.cpp
/// @brief Tests for TokenQueue and DirectQueue

#include <catch2/catch_test_macros.hpp>
#include <relay/event/event.hpp>
#include <memory>
#include <span>
#include <string>
#include <thread>
#include <vector>

using namespace relay_event;

namespace {

std::size_t pending_tokens(const Receiver<Token>& rx) {
    std::size_t n = 0;
    while (rx.try_recv().is_ok()) {
        ++n;
    }
    return n;
}

template<typename T>
std::size_t subscriber_count(const TokenQueue<T>& queue) {
    return queue.cell().read([](const TokenLog<T>& log) { return log.subscribers().size(); });
}

} // anonymous namespace

// =============================================================================
// TokenQueue
// =============================================================================

TEST_CASE("TokenQueue: one token per delivered emit", "[event][token_queue]") {
    TokenQueue<int> queue;
    auto [listener, notifier] = queue.listen_and_subscribe();

    queue.push(1);
    queue.push(2);
    queue.extend(std::vector<int>{3, 4});

    REQUIRE(pending_tokens(notifier) == 3);
    REQUIRE(listener.peek() == std::vector<int>{1, 2, 3, 4});
}

TEST_CASE("TokenQueue: undelivered emit sends no token", "[event][token_queue]") {
    TokenQueue<int> queue;
    auto notifier = queue.subscribe();

    auto result = queue.emit(5);
    REQUIRE_FALSE(result.was_delivered());
    REQUIRE(*result.event() == 5);
    REQUIRE(pending_tokens(notifier) == 0);
}

TEST_CASE("TokenQueue: bounded subscriber misses surplus tokens", "[event][token_queue]") {
    TokenQueue<int> queue;
    auto listener = queue.listen();
    auto notifier = queue.subscribe_bounded(1);

    queue.push(1);
    queue.push(2);
    queue.push(3);

    REQUIRE(pending_tokens(notifier) == 1);
    REQUIRE(subscriber_count(queue) == 1);
    REQUIRE(listener.peek().size() == 3);
}

TEST_CASE("TokenQueue: dead subscribers are pruned on notify", "[event][token_queue]") {
    TokenQueue<int> queue;
    auto listener = queue.listen();
    {
        auto gone = queue.subscribe();
    }
    auto alive = queue.subscribe();
    REQUIRE(subscriber_count(queue) == 2);

    queue.push(1);

    REQUIRE(subscriber_count(queue) == 1);
    REQUIRE(pending_tokens(alive) == 1);
}

TEST_CASE("TokenQueue: releasing a handle wakes subscribers", "[event][token_queue]") {
    auto queue = std::make_unique<TokenQueue<int>>();
    auto [listener, notifier] = queue->listen_and_subscribe();
    TokenQueue<int> copy = *queue;

    queue.reset();
    REQUIRE(pending_tokens(notifier) == 1);

    // The listener's reference is now the only one left besides `copy`
    long refs = listener.with_use_count([](std::span<const int>, long count) { return count; });
    REQUIRE(refs == 2);
}

TEST_CASE("TokenQueue: producer on another thread", "[event][token_queue][threads]") {
    TokenQueue<std::string> queue;
    auto [listener, notifier] = queue.listen_and_subscribe();

    std::thread producer([queue]() mutable {
        queue.push("a");
        queue.push("b");
    });

    std::vector<std::string> received;
    while (received.size() < 2) {
        REQUIRE(notifier.recv().is_ok());
        for (auto& s : listener.peek()) {
            received.push_back(s);
        }
    }
    producer.join();

    REQUIRE(received == std::vector<std::string>{"a", "b"});
}

// =============================================================================
// DirectQueue
// =============================================================================

TEST_CASE("DirectQueue: subscribers get copies", "[event][direct_queue]") {
    DirectQueue<int> queue;
    auto a = queue.subscribe();
    auto b = queue.subscribe();

    REQUIRE(queue.push(7));

    REQUIRE(a.try_recv().value() == 7);
    REQUIRE(b.try_recv().value() == 7);
    // Nobody listens, so nothing was buffered in the log
    REQUIRE(queue.buffered() == 0);
}

TEST_CASE("DirectQueue: listeners and subscribers together", "[event][direct_queue]") {
    DirectQueue<int> queue;
    auto listener = queue.listen();
    auto rx = queue.subscribe();

    queue.extend(std::vector<int>{1, 2});

    REQUIRE_FALSE(queue.is_empty());
    REQUIRE(listener.peek() == std::vector<int>{1, 2});
    REQUIRE_FALSE(queue.is_empty());
    REQUIRE(rx.recv().value() == 1);
    REQUIRE(rx.recv().value() == 2);
    REQUIRE(queue.is_empty());
}

TEST_CASE("DirectQueue: delivery needs a live consumer", "[event][direct_queue]") {
    DirectQueue<int> queue;

    SECTION("nobody at all") {
        auto result = queue.emit(1);
        REQUIRE_FALSE(result.was_delivered());
    }

    SECTION("subscriber dropped") {
        {
            auto rx = queue.subscribe();
            REQUIRE(queue.push(1));
        }
        auto result = queue.emit(2);
        REQUIRE_FALSE(result.was_delivered());
        REQUIRE(*result.event() == 2);
    }

    SECTION("listener only") {
        auto listener = queue.listen();
        REQUIRE(queue.push(3));
        REQUIRE(listener.next() == 3);
    }
}
