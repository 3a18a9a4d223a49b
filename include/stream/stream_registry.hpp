#pragma once

#include "stream/ack_dispatcher.hpp"
#include "stream/stream_handle.hpp"
#include "stream/stream_provider.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace ingestgate {

/**
 * @brief Owns one long-lived provider stream per destination key
 *
 * Per key:
 *   (none) → CONNECTING → OPEN → DEGRADED → (closed, removed) → CONNECTING → OPEN
 * A failed creation returns to (none) without publishing a handle.
 *
 * Locking:
 * - One mutex per key, created lazily (try_emplace under key_locks_mutex_) and
 *   never destroyed. It is held across check → create → publish, including
 *   the blocking provider call, so concurrent callers for one key observe a
 *   single creation. Different keys never wait on each other.
 * - streams_mutex_ (shared_mutex) guards the key → handle map; it is never
 *   held across provider I/O.
 * - ingest_record() takes no per-key lock: submissions on an open handle run
 *   concurrently and are ordered by the provider.
 *
 * Liveness is checked lazily, only by get_or_create_stream().
 */
class StreamRegistry {
public:
    /**
     * @brief Fixed operational parameters passed to every creation
     */
    struct Config {
        size_t max_inflight_records = 50000;
        bool recovery = true;
        BackpressureMode backpressure = BackpressureMode::BLOCK;
    };

    struct Stats {
        uint64_t creations;           ///< Successful provider creations
        uint64_t recreations;         ///< Non-OPEN handles replaced
        uint64_t creation_failures;
        uint64_t close_failures;      ///< Logged and swallowed
        uint64_t records_submitted;
        uint64_t submit_failures;
        size_t active_streams;
    };

    /**
     * @param provider     Stream factory (the external transport)
     * @param credentials  Passed uniformly to every creation
     * @param dispatcher   Ack sink; may be null (no acknowledgment reporting)
     * @param config       Operational parameters
     */
    StreamRegistry(std::shared_ptr<IStreamProvider> provider,
                   Credentials credentials,
                   std::shared_ptr<AckDispatcher> dispatcher,
                   const Config& config);

    /// Same as above with a default-constructed Config.
    StreamRegistry(std::shared_ptr<IStreamProvider> provider,
                   Credentials credentials,
                   std::shared_ptr<AckDispatcher> dispatcher);

    /// Closes every remaining stream.
    ~StreamRegistry();

    StreamRegistry(const StreamRegistry&) = delete;
    StreamRegistry& operator=(const StreamRegistry&) = delete;

    /**
     * @brief Return the cached OPEN handle for key, or (re)create one
     *
     * A cached handle in any other state is closed (best-effort) and replaced.
     * On failure nothing is cached; the next call retries from scratch.
     *
     * @return Handle, or CREATION_ERROR / SCHEMA_RESOLUTION_ERROR
     */
    [[nodiscard]] Result<std::shared_ptr<StreamHandle>> get_or_create_stream(
        const std::string& key, const StreamDescriptor& descriptor);

    /**
     * @brief Submit a record to the cached handle for key
     *
     * Never creates a stream. Without a cached handle: NOT_FOUND, no side effects.
     */
    [[nodiscard]] Result<PendingIngestion> ingest_record(const std::string& key, Record record);

    /// Drain the cached handle for key. NOT_FOUND without one.
    [[nodiscard]] Status flush_stream(const std::string& key);

    /// Best-effort close; the entry is removed even if close fails.
    void close_stream(const std::string& key);

    /// Close every cached stream independently (orderly shutdown).
    void close_all();

    /// Same as close_stream(); used when a table leaves the configuration.
    void remove_table(const std::string& key);

    /// Snapshot of keys with a cached handle.
    [[nodiscard]] std::set<std::string> active_tables() const;

    /// CONNECTING during creation, else the cached handle's last state.
    [[nodiscard]] std::optional<StreamState> stream_state(const std::string& key) const;

    [[nodiscard]] Stats get_stats() const;

    const Config& config() const { return config_; }

private:
    std::mutex& key_lock(const std::string& key);
    std::shared_ptr<StreamHandle> find(const std::string& key) const;

    /// Caller holds key_lock(key).
    void close_locked(const std::string& key);

    /// Caller holds key_lock(key).
    Result<std::shared_ptr<StreamHandle>> create_locked(
        const std::string& key, const StreamDescriptor& descriptor);

    std::shared_ptr<IStreamProvider> provider_;
    Credentials credentials_;
    std::shared_ptr<AckDispatcher> dispatcher_;
    Config config_;

    std::unordered_map<std::string, std::shared_ptr<StreamHandle>> streams_;
    std::unordered_set<std::string> connecting_;
    mutable std::shared_mutex streams_mutex_;

    std::unordered_map<std::string, std::unique_ptr<std::mutex>> key_locks_;
    std::mutex key_locks_mutex_;

    std::atomic<uint64_t> next_generation_{1};

    std::atomic<uint64_t> creations_{0};
    std::atomic<uint64_t> recreations_{0};
    std::atomic<uint64_t> creation_failures_{0};
    std::atomic<uint64_t> close_failures_{0};
    std::atomic<uint64_t> records_submitted_{0};
    std::atomic<uint64_t> submit_failures_{0};
};

} // namespace ingestgate
