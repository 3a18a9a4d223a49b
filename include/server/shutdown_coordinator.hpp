#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace ingestgate {

/**
 * @brief In-flight request accounting for orderly shutdown
 *
 * Requests enter through try_enter_request() (or RequestGuard). Once
 * initiate_shutdown() is called new requests are refused and
 * wait_for_drain() blocks until the last in-flight request leaves; only then
 * are the streams closed.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Called by the signal path to initiate shutdown
    void initiate_shutdown();

    /// Called at start of each request. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();

    /// Called when request completes.
    void leave_request();

    /// Blocks until all in-flight requests complete or timeout.
    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_relaxed);
    }

private:
    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

/**
 * @brief Scoped request admission
 */
class RequestGuard {
public:
    explicit RequestGuard(ShutdownCoordinator& coordinator)
        : coordinator_(coordinator),
          admitted_(coordinator.try_enter_request()) {}

    ~RequestGuard() {
        if (admitted_) coordinator_.leave_request();
    }

    RequestGuard(const RequestGuard&) = delete;
    RequestGuard& operator=(const RequestGuard&) = delete;

    [[nodiscard]] bool admitted() const { return admitted_; }

private:
    ShutdownCoordinator& coordinator_;
    bool admitted_;
};

} // namespace ingestgate
