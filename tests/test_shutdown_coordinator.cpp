#include <catch2/catch_test_macros.hpp>
#include "server/shutdown_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace ingestgate;

TEST_CASE("ShutdownCoordinator: requests are admitted before shutdown", "[shutdown]") {
    ShutdownCoordinator sc;
    CHECK(sc.try_enter_request());
    CHECK(sc.try_enter_request());
    CHECK(sc.in_flight_count() == 2);
    sc.leave_request();
    sc.leave_request();
    CHECK(sc.in_flight_count() == 0);
    CHECK_FALSE(sc.is_shutting_down());
}

TEST_CASE("ShutdownCoordinator: requests are refused after shutdown", "[shutdown]") {
    ShutdownCoordinator sc;
    REQUIRE(sc.try_enter_request());
    sc.initiate_shutdown();
    sc.initiate_shutdown();  // Idempotent

    CHECK(sc.is_shutting_down());
    CHECK_FALSE(sc.try_enter_request());

    // The request admitted before shutdown still completes
    CHECK(sc.in_flight_count() == 1);
    sc.leave_request();
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: drain returns at once with nothing in flight", "[shutdown]") {
    ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(1000)});

    sc.initiate_shutdown();
    const auto start = std::chrono::steady_clock::now();
    CHECK(sc.wait_for_drain());
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(500));
}

TEST_CASE("ShutdownCoordinator: drain waits for the last request", "[shutdown]") {
    ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(5000)});
    REQUIRE(sc.try_enter_request());

    std::atomic<bool> finished{false};
    std::atomic<bool> drained{false};
    std::thread drain_thread([&] {
        sc.initiate_shutdown();
        drained = sc.wait_for_drain();
        finished = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    CHECK_FALSE(finished.load());

    sc.leave_request();
    drain_thread.join();
    CHECK(drained.load());
}

TEST_CASE("ShutdownCoordinator: drain gives up after the timeout", "[shutdown]") {
    ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(50)});
    REQUIRE(sc.try_enter_request());
    sc.initiate_shutdown();

    const auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(sc.wait_for_drain());
    CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(40));
    CHECK(sc.in_flight_count() == 1);

    sc.leave_request();
}

TEST_CASE("ShutdownCoordinator: concurrent admission and shutdown", "[shutdown][concurrency]") {
    ShutdownCoordinator sc(ShutdownCoordinator::Config{std::chrono::milliseconds(2000)});

    std::atomic<int> admitted{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([&] {
            RequestGuard guard(sc);
            if (guard.admitted()) {
                admitted.fetch_add(1);
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            } else {
                refused.fetch_add(1);
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    sc.initiate_shutdown();
    for (auto& t : threads) t.join();

    CHECK(sc.wait_for_drain());
    CHECK(sc.in_flight_count() == 0);
    CHECK(admitted.load() + refused.load() == 20);
}

TEST_CASE("RequestGuard releases its slot on scope exit", "[shutdown]") {
    ShutdownCoordinator sc;
    {
        RequestGuard guard(sc);
        CHECK(guard.admitted());
        CHECK(sc.in_flight_count() == 1);
    }
    CHECK(sc.in_flight_count() == 0);

    sc.initiate_shutdown();
    {
        RequestGuard guard(sc);
        CHECK_FALSE(guard.admitted());
        CHECK(sc.in_flight_count() == 0);
    }
    CHECK(sc.in_flight_count() == 0);
}
