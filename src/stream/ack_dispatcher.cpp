#include "stream/ack_dispatcher.hpp"
#include "core/utils.hpp"

#include <format>
#include <vector>

namespace ingestgate {

// ============================================================================
// Construction / Destruction
// ============================================================================

AckDispatcher::AckDispatcher() : AckDispatcher(Config{}) {}

AckDispatcher::AckDispatcher(const Config& config)
    : config_(config) {
    if (config_.sample_interval == 0) {
        config_.sample_interval = 1;
    }
    running_.store(true, std::memory_order_release);
    reporter_thread_ = std::thread(&AckDispatcher::reporter_thread_func, this);
}

AckDispatcher::~AckDispatcher() {
    shutdown();
}

// ============================================================================
// Producer side (provider delivery threads)
// ============================================================================

AckCallback AckDispatcher::make_callback(std::string key, uint64_t generation) {
    std::weak_ptr<AckDispatcher> weak = weak_from_this();
    return [weak = std::move(weak), key = std::move(key), generation](StreamOffset offset) {
        if (auto self = weak.lock()) {
            self->dispatch(AckEvent{key, generation, offset});
        }
    };
}

void AckDispatcher::dispatch(AckEvent event) {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }
    // Full queue: dropped and counted; sampling tolerates gaps
    (void)queue_.try_push(std::move(event));
}

// ============================================================================
// Control
// ============================================================================

void AckDispatcher::flush() {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    const uint64_t target = queue_.pushed_count();

    std::unique_lock<std::mutex> lock(wake_mutex_);
    flush_requested_.store(true, std::memory_order_release);
    wake_cv_.notify_one();
    drained_cv_.wait(lock, [this, target] {
        return processed_.load(std::memory_order_acquire) >= target
            || !running_.load(std::memory_order_acquire);
    });
}

void AckDispatcher::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_cv_.notify_one();
    }

    if (reporter_thread_.joinable()) {
        reporter_thread_.join();
    }

    drained_cv_.notify_all();
}

AckDispatcher::Stats AckDispatcher::get_stats() const {
    return Stats{
        .received = queue_.pushed_count(),
        .processed = processed_.load(std::memory_order_relaxed),
        .dropped = queue_.overflow_count(),
        .reported = reported_.load(std::memory_order_relaxed),
        .regressions = regressions_.load(std::memory_order_relaxed)
    };
}

std::optional<StreamOffset> AckDispatcher::last_offset(const std::string& key) const {
    std::lock_guard<std::mutex> lock(tracks_mutex_);
    const auto it = tracks_.find(key);
    if (it == tracks_.end() || it->second.last_offset < 0) {
        return std::nullopt;
    }
    return it->second.last_offset;
}

// ============================================================================
// Reporter Thread
// ============================================================================

void AckDispatcher::process(const AckEvent& event) {
    bool report = false;
    StreamOffset previous = -1;
    {
        std::lock_guard<std::mutex> lock(tracks_mutex_);
        auto& track = tracks_[event.key];

        if (event.generation < track.generation) {
            return;  // Late ack from a superseded stream
        }
        if (event.generation > track.generation) {
            track = KeyTrack{};
            track.generation = event.generation;
        }

        if (event.offset < track.last_offset) {
            previous = track.last_offset;
        } else {
            track.last_offset = event.offset;
            const auto bucket = static_cast<int64_t>(
                event.offset / static_cast<StreamOffset>(config_.sample_interval));
            if (bucket > track.last_bucket) {
                track.last_bucket = bucket;
                report = true;
            }
        }
    }

    if (previous >= 0) {
        regressions_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("[{}] Ack offset went backwards: {} after {}",
            event.key, event.offset, previous));
        return;
    }

    if (report) {
        reported_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("[{}] Acknowledged up to offset: {}",
            event.key, event.offset));
    }
}

void AckDispatcher::reporter_thread_func() {
    std::vector<AckEvent> batch;
    batch.reserve(kMaxBatchSize);

    while (true) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, config_.poll_interval, [this] {
                return flush_requested_.load(std::memory_order_acquire)
                    || !running_.load(std::memory_order_acquire);
            });
        }

        while (true) {
            batch.clear();
            const size_t drained = queue_.drain(batch, kMaxBatchSize);
            if (drained == 0) {
                break;
            }
            for (const auto& event : batch) {
                process(event);
            }
            processed_.fetch_add(drained, std::memory_order_release);
        }

        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            flush_requested_.store(false, std::memory_order_release);
        }
        drained_cv_.notify_all();

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
    }
}

} // namespace ingestgate
