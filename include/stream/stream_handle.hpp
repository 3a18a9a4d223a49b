#pragma once

#include "stream/pending_ingestion.hpp"
#include "stream/stream_provider.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace ingestgate {

/**
 * @brief Registry-side wrapper around one provider stream
 *
 * The only component that talks to the provider stream directly. Translates
 * the provider's state vocabulary into StreamState so the registry's health
 * check stays provider-agnostic, and turns provider exceptions into Status.
 *
 * Thread-safety: submit() may be called concurrently; close() is idempotent
 * and serialized internally.
 */
class StreamHandle {
public:
    StreamHandle(std::string key, uint64_t generation, std::unique_ptr<IIngestStream> stream);
    ~StreamHandle();

    StreamHandle(const StreamHandle&) = delete;
    StreamHandle& operator=(const StreamHandle&) = delete;

    const std::string& key() const { return key_; }
    const std::string& stream_id() const { return stream_id_; }

    /// Registry-assigned instance number, unique per key across recreations.
    uint64_t generation() const { return generation_; }

    [[nodiscard]] Result<PendingIngestion> submit(Record record);

    /// Block until every submitted record is durable.
    [[nodiscard]] Status flush();

    /// Release the provider stream. Later calls return ok without side effects.
    [[nodiscard]] Status close();

    /**
     * @brief Query the provider and translate its state
     *
     * Anything other than OPEN marks the handle DEGRADED (or CLOSED once
     * closed) in last_state().
     */
    [[nodiscard]] StreamState liveness();

    /// State recorded by the most recent liveness() or close(), no provider call.
    [[nodiscard]] StreamState last_state() const {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool is_closed() const {
        return closed_.load(std::memory_order_acquire);
    }

    static StreamState translate(ProviderStreamState state);

private:
    std::string key_;
    uint64_t generation_;
    std::unique_ptr<IIngestStream> stream_;
    std::string stream_id_;

    std::atomic<StreamState> state_{StreamState::OPEN};
    std::atomic<bool> closed_{false};
    std::mutex close_mutex_;
};

} // namespace ingestgate
