#include <catch2/catch_test_macros.hpp>
#include "event_buffer.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace cerberus_dash;
using namespace std::chrono_literals;

namespace {

LogEntry numbered(int i) {
    LogEntry entry;
    entry.time = "00:00:00";
    entry.source = "test";
    entry.message = "entry " + std::to_string(i);
    return entry;
}

} // namespace

TEST_CASE("EventBuffer bounded history", "[buffer]") {
    EventBuffer buffer(3);

    SECTION("Size never exceeds capacity") {
        for (int i = 0; i < 10; ++i) {
            buffer.push(numbered(i));
            REQUIRE(buffer.size() <= buffer.capacity());
        }
        REQUIRE(buffer.size() == 3);
    }

    SECTION("Overflow keeps the most recent entries in order") {
        for (int i = 0; i < 5; ++i) {
            buffer.push(numbered(i));
        }
        auto snapshot = buffer.snapshot(10);
        REQUIRE(snapshot.size() == 3);
        REQUIRE(snapshot[0].message == "entry 2");
        REQUIRE(snapshot[1].message == "entry 3");
        REQUIRE(snapshot[2].message == "entry 4");
    }

    SECTION("Snapshot limit returns the newest entries, oldest first") {
        for (int i = 0; i < 3; ++i) {
            buffer.push(numbered(i));
        }
        auto snapshot = buffer.snapshot(2);
        REQUIRE(snapshot.size() == 2);
        REQUIRE(snapshot[0].message == "entry 1");
        REQUIRE(snapshot[1].message == "entry 2");

        REQUIRE(buffer.snapshot(0).empty());
    }

    SECTION("Empty buffer") {
        REQUIRE(buffer.snapshot(100).empty());
        REQUIRE(buffer.size() == 0);
    }
}

TEST_CASE("EventBuffer rejects zero capacity", "[buffer]") {
    REQUIRE_THROWS_AS(EventBuffer(0), std::invalid_argument);
}

TEST_CASE("Subscriptions receive only entries pushed after subscribing", "[buffer][broadcast]") {
    EventBuffer buffer(10);
    buffer.push(numbered(0));

    auto sub = buffer.subscribe();
    REQUIRE(buffer.subscriber_count() == 1);
    REQUIRE_FALSE(sub->try_next().has_value());

    buffer.push(numbered(1));
    auto next = sub->wait_next(100ms);
    REQUIRE(next.has_value());
    REQUIRE(next->message == "entry 1");

    SECTION("Timeout when idle") {
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(sub->wait_next(50ms).has_value());
        REQUIRE(std::chrono::steady_clock::now() - start >= 40ms);
        REQUIRE_FALSE(sub->is_closed());
    }

    SECTION("Unsubscribe closes only that subscription") {
        auto other = buffer.subscribe();
        buffer.unsubscribe(sub);

        REQUIRE(sub->is_closed());
        REQUIRE(buffer.subscriber_count() == 1);

        buffer.push(numbered(2));
        REQUIRE_FALSE(sub->wait_next(10ms).has_value());
        REQUIRE(other->wait_next(100ms)->message == "entry 2");
        REQUIRE(buffer.size() == 3);
    }
}

TEST_CASE("Entries are broadcast, not shared between subscribers", "[buffer][broadcast]") {
    EventBuffer buffer(100);
    auto a = buffer.subscribe();
    auto b = buffer.subscribe();

    buffer.push(numbered(1));

    // Draining a must not take the entry away from b
    REQUIRE(a->try_next()->message == "entry 1");
    REQUIRE_FALSE(a->try_next().has_value());
    REQUIRE(b->try_next()->message == "entry 1");
}

TEST_CASE("Concurrent subscribers each see every entry in order", "[buffer][broadcast][concurrency]") {
    constexpr int kSubscribers = 5;
    constexpr int kEntries = 500;

    EventBuffer buffer(1000);

    std::vector<SubscriptionPtr> subs;
    for (int i = 0; i < kSubscribers; ++i) {
        subs.push_back(buffer.subscribe());
    }

    std::vector<std::vector<std::string>> received(kSubscribers);
    std::vector<std::thread> readers;
    for (int i = 0; i < kSubscribers; ++i) {
        readers.emplace_back([&, i]() {
            while (static_cast<int>(received[i].size()) < kEntries) {
                auto entry = subs[i]->wait_next(2000ms);
                if (!entry) break;
                received[i].push_back(entry->message);
            }
        });
    }

    std::thread producer([&buffer]() {
        for (int i = 0; i < kEntries; ++i) {
            buffer.push(numbered(i));
        }
    });

    producer.join();
    for (auto& reader : readers) reader.join();

    for (int i = 0; i < kSubscribers; ++i) {
        REQUIRE(received[i].size() == kEntries);
        for (int n = 0; n < kEntries; ++n) {
            REQUIRE(received[i][n] == "entry " + std::to_string(n));
        }
        REQUIRE(subs[i]->dropped() == 0);
    }
}

TEST_CASE("Multiple producers deliver the same order to every subscriber", "[buffer][concurrency]") {
    EventBuffer buffer(1000);
    auto a = buffer.subscribe();
    auto b = buffer.subscribe();

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&buffer, p]() {
            for (int i = 0; i < 100; ++i) {
                buffer.push(numbered(p * 1000 + i));
            }
        });
    }
    for (auto& t : producers) t.join();

    std::vector<std::string> seen_a, seen_b;
    while (auto e = a->try_next()) seen_a.push_back(e->message);
    while (auto e = b->try_next()) seen_b.push_back(e->message);

    REQUIRE(seen_a.size() == 400);
    REQUIRE(seen_a == seen_b);

    auto history = buffer.snapshot(1000);
    REQUIRE(history.size() == 400);
    for (size_t i = 0; i < history.size(); ++i) {
        REQUIRE(history[i].message == seen_a[i]);
    }
}

TEST_CASE("A stalled subscriber is bounded and never blocks the producer", "[buffer][broadcast]") {
    EventBuffer buffer(4);
    auto slow = buffer.subscribe();

    for (int i = 0; i < 10; ++i) {
        buffer.push(numbered(i));
    }

    REQUIRE(slow->pending() == 4);
    REQUIRE(slow->dropped() == 6);
    REQUIRE(slow->try_next()->message == "entry 6");
}

TEST_CASE("close_all wakes waiting subscribers", "[buffer]") {
    EventBuffer buffer(10);
    auto sub = buffer.subscribe();

    std::atomic<bool> woke{false};
    std::thread waiter([&]() {
        auto entry = sub->wait_next(5000ms);
        woke = !entry.has_value();
    });

    std::this_thread::sleep_for(50ms);
    auto start = std::chrono::steady_clock::now();
    buffer.close_all();
    waiter.join();

    REQUIRE(woke);
    REQUIRE(std::chrono::steady_clock::now() - start < 2000ms);
    REQUIRE(sub->is_closed());
    REQUIRE(buffer.subscriber_count() == 0);
}

TEST_CASE("A closed buffer refuses subscribers but keeps history", "[buffer]") {
    EventBuffer buffer(10);
    buffer.close_all();
    REQUIRE(buffer.is_closed());

    auto late = buffer.subscribe();
    REQUIRE(late->is_closed());
    REQUIRE(buffer.subscriber_count() == 0);

    LogEntry entry;
    entry.message = "after close";
    buffer.push(entry);
    REQUIRE_FALSE(late->try_next().has_value());
    REQUIRE(buffer.snapshot(10).size() == 1);
}
