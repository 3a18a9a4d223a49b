#include <catch2/catch_test_macros.hpp>
#include "stream/ack_dispatcher.hpp"
#include "stream/ack_queue.hpp"

#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace ingestgate;

// ============================================================================
// AckQueue
// ============================================================================

TEST_CASE("AckQueue preserves FIFO order for a single producer", "[ack_queue]") {
    AckQueue<int, 16> queue;
    for (int i = 0; i < 10; ++i) {
        REQUIRE(queue.try_push(i));
    }
    for (int i = 0; i < 10; ++i) {
        auto item = queue.try_pop();
        REQUIRE(item.has_value());
        REQUIRE(*item == i);
    }
    REQUIRE_FALSE(queue.try_pop().has_value());
}

TEST_CASE("AckQueue drops and counts when full, then recovers", "[ack_queue]") {
    AckQueue<int, 4> queue;
    for (int i = 0; i < 4; ++i) {
        REQUIRE(queue.try_push(i));
    }
    REQUIRE_FALSE(queue.try_push(99));
    REQUIRE(queue.overflow_count() == 1);
    REQUIRE(queue.pushed_count() == 4);

    std::vector<int> drained;
    REQUIRE(queue.drain(drained, 16) == 4);
    REQUIRE(drained == std::vector<int>{0, 1, 2, 3});

    // A dropped push leaves no hole: the next item is consumed normally
    REQUIRE(queue.try_push(5));
    auto item = queue.try_pop();
    REQUIRE(item.has_value());
    REQUIRE(*item == 5);
}

TEST_CASE("AckQueue delivers every item from concurrent producers", "[ack_queue][concurrency]") {
    AckQueue<int, 1024> queue;
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 200;

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                while (!queue.try_push(p * kPerProducer + i)) {
                    std::this_thread::yield();
                }
            }
        });
    }

    std::set<int> seen;
    std::vector<int> last_by_producer(kProducers, -1);
    while (seen.size() < static_cast<size_t>(kProducers * kPerProducer)) {
        if (auto item = queue.try_pop()) {
            const int producer = *item / kPerProducer;
            // Per-producer order is preserved
            REQUIRE(*item > last_by_producer[producer]);
            last_by_producer[producer] = *item;
            seen.insert(*item);
        }
    }
    for (auto& t : producers) t.join();

    REQUIRE(seen.size() == static_cast<size_t>(kProducers * kPerProducer));
    REQUIRE_FALSE(queue.try_pop().has_value());
}

// ============================================================================
// AckDispatcher
// ============================================================================

TEST_CASE("AckDispatcher tracks the latest offset per key", "[ack]") {
    auto dispatcher = std::make_shared<AckDispatcher>();
    auto a = dispatcher->make_callback("a", 1);
    auto b = dispatcher->make_callback("b", 1);

    a(0);
    a(5);
    b(3);
    a(9);
    dispatcher->flush();

    REQUIRE(dispatcher->last_offset("a") == 9);
    REQUIRE(dispatcher->last_offset("b") == 3);
    REQUIRE_FALSE(dispatcher->last_offset("c").has_value());

    const auto stats = dispatcher->get_stats();
    REQUIRE(stats.received == 4);
    REQUIRE(stats.processed == 4);
    REQUIRE(stats.regressions == 0);
}

TEST_CASE("AckDispatcher samples once per interval crossing", "[ack]") {
    AckDispatcher::Config config;
    config.sample_interval = 1000;
    auto dispatcher = std::make_shared<AckDispatcher>(config);
    auto cb = dispatcher->make_callback("t", 1);

    // Buckets 0, 0, 0, 1, 1, 2, 5
    for (StreamOffset offset : {0, 10, 999, 1000, 1500, 2999, 5000}) {
        cb(offset);
    }
    dispatcher->flush();

    REQUIRE(dispatcher->get_stats().reported == 4);
}

TEST_CASE("AckDispatcher counts regressions within one generation", "[ack]") {
    auto dispatcher = std::make_shared<AckDispatcher>();
    auto cb = dispatcher->make_callback("t", 1);

    cb(10);
    cb(4);
    dispatcher->flush();

    REQUIRE(dispatcher->get_stats().regressions == 1);
    REQUIRE(dispatcher->last_offset("t") == 10);
}

TEST_CASE("AckDispatcher resets tracking for a new generation", "[ack]") {
    auto dispatcher = std::make_shared<AckDispatcher>();
    auto old_stream = dispatcher->make_callback("t", 1);
    auto new_stream = dispatcher->make_callback("t", 2);

    old_stream(500);
    new_stream(0);
    old_stream(501);   // Late ack from the superseded stream is ignored
    new_stream(1);
    dispatcher->flush();

    REQUIRE(dispatcher->get_stats().regressions == 0);
    REQUIRE(dispatcher->last_offset("t") == 1);
}

TEST_CASE("AckDispatcher callbacks are no-ops after shutdown or destruction", "[ack]") {
    AckCallback cb;
    {
        auto dispatcher = std::make_shared<AckDispatcher>();
        cb = dispatcher->make_callback("t", 1);
        cb(1);
        dispatcher->shutdown();
        cb(2);
        REQUIRE(dispatcher->get_stats().received == 1);
        REQUIRE(dispatcher->get_stats().processed == 1);

        // flush after shutdown returns immediately
        dispatcher->flush();
    }
    REQUIRE_NOTHROW(cb(3));
}

TEST_CASE("AckDispatcher accepts acks from many threads", "[ack][concurrency]") {
    auto dispatcher = std::make_shared<AckDispatcher>();
    constexpr int kStreams = 4;
    constexpr int kAcks = 500;

    std::vector<std::thread> threads;
    for (int s = 0; s < kStreams; ++s) {
        threads.emplace_back([&, s] {
            auto cb = dispatcher->make_callback("key-" + std::to_string(s), 1);
            for (int i = 0; i < kAcks; ++i) {
                cb(i);
            }
        });
    }
    for (auto& t : threads) t.join();
    dispatcher->flush();

    const auto stats = dispatcher->get_stats();
    REQUIRE(stats.received + stats.dropped == kStreams * kAcks);
    REQUIRE(stats.processed == stats.received);
    REQUIRE(stats.regressions == 0);
    for (int s = 0; s < kStreams; ++s) {
        REQUIRE(dispatcher->last_offset("key-" + std::to_string(s)) == kAcks - 1);
    }
}
