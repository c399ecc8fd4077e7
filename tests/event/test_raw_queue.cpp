/// @file test_raw_queue.cpp
/// @brief Tests for the broadcast log and its garbage collection

#include <catch2/catch_test_macros.hpp>
#include <relay/event/event.hpp>
#include <span>
#include <stdexcept>
#include <vector>

using namespace relay_event;

namespace {

std::vector<int> pull(RawQueue<int>& q, ListenerKey key) {
    return q.pull_with(key, [](std::span<const int> events) {
        return std::vector<int>(events.begin(), events.end());
    });
}

} // anonymous namespace

TEST_CASE("RawQueue: emit without listeners", "[event][raw_queue]") {
    RawQueue<int> q;

    auto result = q.emit(7);
    REQUIRE_FALSE(result.was_delivered());
    REQUIRE(result.event() == 7);
    REQUIRE(q.is_empty());

    REQUIRE_FALSE(q.push(8));
    std::vector<int> batch{1, 2};
    REQUIRE_FALSE(q.extend(batch.begin(), batch.end()));
    REQUIRE(q.is_empty());
}

TEST_CASE("RawQueue: listeners start at the current end", "[event][raw_queue]") {
    RawQueue<int> q;
    auto first = q.create_listener();
    q.push(1);

    auto late = q.create_listener();
    q.push(2);

    REQUIRE(pull(q, first) == std::vector<int>{1, 2});
    REQUIRE(pull(q, late) == std::vector<int>{2});
}

TEST_CASE("RawQueue: each listener sees every event once", "[event][raw_queue]") {
    RawQueue<int> q;
    auto a = q.create_listener();
    auto b = q.create_listener();

    std::vector<int> batch{1, 2, 3};
    REQUIRE(q.extend(batch.begin(), batch.end()));

    REQUIRE(pull(q, a) == batch);
    REQUIRE(pull(q, a).empty());
    REQUIRE(pull(q, b) == batch);
}

TEST_CASE("RawQueue: buffer trimmed once all listeners read", "[event][raw_queue]") {
    RawQueue<int> q;
    auto a = q.create_listener();
    auto b = q.create_listener();
    q.push(1);
    q.push(2);

    SECTION("slowest listener keeps events alive") {
        (void)pull(q, a);
        REQUIRE(q.buffered() == 2);
        (void)pull(q, b);
        REQUIRE(q.is_empty());
    }

    SECTION("removing the slowest listener trims") {
        (void)pull(q, a);
        q.remove_listener(b);
        REQUIRE(q.is_empty());
        REQUIRE(q.listener_count() == 1);
    }

    SECTION("removing the last listener frees everything") {
        q.remove_listener(a);
        q.remove_listener(b);
        REQUIRE(q.is_empty());
        REQUIRE_FALSE(q.has_listeners());
    }
}

TEST_CASE("RawQueue: trimming keeps cursors consistent", "[event][raw_queue]") {
    RawQueue<int> q;
    auto a = q.create_listener();
    auto b = q.create_listener();

    q.push(1);
    (void)pull(q, a);
    q.push(2);
    (void)pull(q, b);

    // b read [1, 2]; only 2 is still unread by a
    REQUIRE(q.buffered() == 1);
    REQUIRE(pull(q, a) == std::vector<int>{2});
    REQUIRE(q.is_empty());

    q.push(3);
    REQUIRE(pull(q, b) == std::vector<int>{3});
    REQUIRE(pull(q, a) == std::vector<int>{3});
}

TEST_CASE("RawQueue: peek_get and peek_finish", "[event][raw_queue]") {
    RawQueue<int> q;
    auto key = q.create_listener();
    REQUIRE(q.peek_get(key) == nullptr);

    q.push(10);
    q.push(20);

    const int* first = q.peek_get(key);
    REQUIRE(first != nullptr);
    REQUIRE(*first == 10);
    REQUIRE(*q.peek_get(key) == 10);

    q.peek_finish(key);
    REQUIRE(*q.peek_get(key) == 20);
    REQUIRE(q.buffered() == 1);

    q.peek_finish(key);
    REQUIRE(q.peek_get(key) == nullptr);
    q.peek_finish(key);
    REQUIRE(q.is_empty());
}

TEST_CASE("RawQueue: void callback", "[event][raw_queue]") {
    RawQueue<int> q;
    auto key = q.create_listener();
    q.push(5);

    int sum = 0;
    q.pull_with(key, [&](std::span<const int> events) {
        for (int e : events) {
            sum += e;
        }
    });
    REQUIRE(sum == 5);
    REQUIRE(q.is_empty());
}

TEST_CASE("RawQueue: buffer trimmed after a throwing consumer", "[event][raw_queue]") {
    RawQueue<int> q;
    auto key = q.create_listener();
    q.push(1);

    REQUIRE_THROWS_AS(q.pull_with(key, [](std::span<const int>) -> int {
        throw std::runtime_error("consumer failed");
    }), std::runtime_error);
    REQUIRE(q.is_empty());

    for (int i = 0; i < 100; ++i) {
        q.push(i);
        REQUIRE(pull(q, key) == std::vector<int>{i});
    }
    REQUIRE(q.is_empty());
}

TEST_CASE("RawQueue: unknown listener key", "[event][raw_queue]") {
    RawQueue<int> q;
    auto key = q.create_listener();
    q.remove_listener(key);

    REQUIRE_THROWS_AS(pull(q, key), std::out_of_range);
    REQUIRE(q.peek_get(key) == nullptr);
}
