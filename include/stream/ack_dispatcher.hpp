#pragma once

#include "stream/ack_queue.hpp"
#include "stream/stream_provider.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace ingestgate {

/**
 * @brief One durability acknowledgment reported by a provider stream
 *
 * generation identifies the stream instance for the key (it changes on every
 * recreation), so offsets restarting at 0 are not reported as regressions.
 */
struct AckEvent {
    std::string key;
    uint64_t generation = 0;
    StreamOffset offset = 0;
};

/**
 * @brief Moves durability acknowledgments off the provider's delivery path
 *
 * The callbacks handed to providers only push into a bounded lock-free queue,
 * so they never block, never do I/O and never touch registry locks. A single
 * reporter thread drains the queue, tracks the latest offset per key and logs
 * a sample (each time the offset crosses a multiple of sample_interval).
 *
 *   [delivery thread A] --ack--> [AckQueue] --drain--> [reporter thread] --> log
 *   [delivery thread B] --ack-->
 *
 * Must be owned by a std::shared_ptr: callbacks hold a weak reference and
 * become no-ops once the dispatcher is gone.
 */
class AckDispatcher : public std::enable_shared_from_this<AckDispatcher> {
public:
    struct Config {
        uint64_t sample_interval = 1000;
        std::chrono::milliseconds poll_interval{50};
    };

    struct Stats {
        uint64_t received;      ///< Events pushed into the queue
        uint64_t processed;     ///< Events handled by the reporter thread
        uint64_t dropped;       ///< Events lost to a full queue
        uint64_t reported;      ///< Sampled log lines emitted
        uint64_t regressions;   ///< Offsets lower than the previous one for the same stream
    };

    AckDispatcher();
    explicit AckDispatcher(const Config& config);
    ~AckDispatcher();

    AckDispatcher(const AckDispatcher&) = delete;
    AckDispatcher& operator=(const AckDispatcher&) = delete;

    /**
     * @brief Build the callback a provider stream invokes on every ack
     * @param key         Destination key the stream serves
     * @param generation  Registry-assigned stream instance number
     */
    [[nodiscard]] AckCallback make_callback(std::string key, uint64_t generation);

    /// Enqueue one event (non-blocking; drops when full).
    void dispatch(AckEvent event);

    /// Block until every event enqueued before the call has been processed.
    void flush();

    /// Drain remaining events and stop the reporter thread.
    void shutdown();

    [[nodiscard]] Stats get_stats() const;

    /// Latest offset processed for key (current generation only).
    [[nodiscard]] std::optional<StreamOffset> last_offset(const std::string& key) const;

private:
    struct KeyTrack {
        uint64_t generation = 0;
        StreamOffset last_offset = -1;
        int64_t last_bucket = -1;
    };

    void reporter_thread_func();
    void process(const AckEvent& event);

    static constexpr size_t kMaxBatchSize = 512;

    Config config_;
    AckQueue<AckEvent> queue_;

    std::thread reporter_thread_;
    std::atomic<bool> running_{false};

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::condition_variable drained_cv_;
    std::atomic<bool> flush_requested_{false};

    // Reporter thread writes, readers take tracks_mutex_
    std::unordered_map<std::string, KeyTrack> tracks_;
    mutable std::mutex tracks_mutex_;

    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> reported_{0};
    std::atomic<uint64_t> regressions_{0};
};

} // namespace ingestgate
