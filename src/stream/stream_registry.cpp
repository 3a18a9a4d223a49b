#include "stream/stream_registry.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <vector>

namespace ingestgate {

StreamRegistry::StreamRegistry(std::shared_ptr<IStreamProvider> provider,
                               Credentials credentials,
                               std::shared_ptr<AckDispatcher> dispatcher,
                               const Config& config)
    : provider_(std::move(provider)),
      credentials_(std::move(credentials)),
      dispatcher_(std::move(dispatcher)),
      config_(config) {}

StreamRegistry::StreamRegistry(std::shared_ptr<IStreamProvider> provider,
                               Credentials credentials,
                               std::shared_ptr<AckDispatcher> dispatcher)
    : StreamRegistry(std::move(provider), std::move(credentials), std::move(dispatcher), Config{}) {}

StreamRegistry::~StreamRegistry() {
    close_all();
}

// ============================================================================
// Lookup helpers
// ============================================================================

std::mutex& StreamRegistry::key_lock(const std::string& key) {
    std::lock_guard<std::mutex> lock(key_locks_mutex_);
    auto [it, inserted] = key_locks_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_unique<std::mutex>();
    }
    return *it->second;
}

std::shared_ptr<StreamHandle> StreamRegistry::find(const std::string& key) const {
    std::shared_lock lock(streams_mutex_);
    const auto it = streams_.find(key);
    return it != streams_.end() ? it->second : nullptr;
}

// ============================================================================
// Get-or-create
// ============================================================================

Result<std::shared_ptr<StreamHandle>> StreamRegistry::get_or_create_stream(
    const std::string& key, const StreamDescriptor& descriptor) {
    std::lock_guard<std::mutex> key_guard(key_lock(key));

    if (auto existing = find(key)) {
        const StreamState state = existing->liveness();
        if (state == StreamState::OPEN) {
            return Result<std::shared_ptr<StreamHandle>>::ok(std::move(existing));
        }
        utils::log::warn(std::format("Stream {} is in state {}, recreating...",
            key, stream_state_to_string(state)));
        close_locked(key);
        recreations_.fetch_add(1, std::memory_order_relaxed);
    }

    return create_locked(key, descriptor);
}

Result<std::shared_ptr<StreamHandle>> StreamRegistry::create_locked(
    const std::string& key, const StreamDescriptor& descriptor) {
    using HandleResult = Result<std::shared_ptr<StreamHandle>>;

    if (!descriptor.schema || descriptor.table_name.empty()) {
        creation_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Failed to resolve schema for {}", key));
        return HandleResult::error(ErrorCategory::SCHEMA_RESOLUTION_ERROR,
            std::format("no schema resolved for table {}", key));
    }

    {
        std::unique_lock lock(streams_mutex_);
        connecting_.insert(key);
    }

    utils::log::info(std::format("Creating new stream for table {} ({})",
        key, descriptor.table_name));

    const uint64_t generation = next_generation_.fetch_add(1, std::memory_order_relaxed);

    StreamOptions options;
    options.max_inflight_records = config_.max_inflight_records;
    options.recovery = config_.recovery;
    options.backpressure = config_.backpressure;
    if (dispatcher_) {
        options.ack_callback = dispatcher_->make_callback(key, generation);
    }

    const utils::Timer timer;
    auto created = Result<std::unique_ptr<IIngestStream>>::error(
        ErrorCategory::CREATION_ERROR, "provider returned no stream");
    try {
        created = provider_->create_stream(credentials_, descriptor, options);
    } catch (const std::exception& e) {
        created = Result<std::unique_ptr<IIngestStream>>::error(
            ErrorCategory::CREATION_ERROR, e.what());
    }

    if (created.is_error() || !created.value()) {
        {
            std::unique_lock lock(streams_mutex_);
            connecting_.erase(key);
        }
        creation_failures_.fetch_add(1, std::memory_order_relaxed);

        const ErrorCategory category = is_creation_error(created.error_category())
            ? created.error_category() : ErrorCategory::CREATION_ERROR;
        const std::string message = created.is_error()
            ? created.error_message() : "provider returned no stream";
        utils::log::error(std::format("Failed to create stream for {} ({}): {}",
            key, error_category_to_string(category), message));
        return HandleResult::error(category, message);
    }

    auto handle = std::make_shared<StreamHandle>(key, generation, std::move(created.value()));
    {
        std::unique_lock lock(streams_mutex_);
        streams_[key] = handle;
        connecting_.erase(key);
    }
    creations_.fetch_add(1, std::memory_order_relaxed);

    utils::log::info(std::format("Stream created for {}: {} ({}ms)",
        key, handle->stream_id(), timer.elapsed_ms().count()));
    return HandleResult::ok(std::move(handle));
}

// ============================================================================
// Submission
// ============================================================================

Result<PendingIngestion> StreamRegistry::ingest_record(const std::string& key, Record record) {
    auto handle = find(key);
    if (!handle) {
        return Result<PendingIngestion>::error(ErrorCategory::NOT_FOUND,
            std::format("No stream available for table {}", key));
    }

    auto pending = handle->submit(std::move(record));
    if (pending.is_error()) {
        submit_failures_.fetch_add(1, std::memory_order_relaxed);
    } else {
        records_submitted_.fetch_add(1, std::memory_order_relaxed);
    }
    return pending;
}

Status StreamRegistry::flush_stream(const std::string& key) {
    auto handle = find(key);
    if (!handle) {
        return Status::error(ErrorCategory::NOT_FOUND,
            std::format("No stream available for table {}", key));
    }
    return handle->flush();
}

// ============================================================================
// Teardown
// ============================================================================

void StreamRegistry::close_locked(const std::string& key) {
    auto handle = find(key);
    if (!handle) {
        return;
    }

    const auto status = handle->close();
    if (status.is_error()) {
        close_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Error closing stream for {}: {}",
            key, status.error_message()));
    } else {
        utils::log::info(std::format("Stream closed for {}", key));
    }

    std::unique_lock lock(streams_mutex_);
    const auto it = streams_.find(key);
    if (it != streams_.end() && it->second == handle) {
        streams_.erase(it);
    }
}

void StreamRegistry::close_stream(const std::string& key) {
    std::lock_guard<std::mutex> key_guard(key_lock(key));
    close_locked(key);
}

void StreamRegistry::close_all() {
    const auto keys = active_tables();
    if (keys.empty()) {
        return;
    }

    utils::log::info(std::format("Closing all streams ({})...", keys.size()));
    for (const auto& key : keys) {
        close_stream(key);
    }
    utils::log::info("All streams closed");
}

void StreamRegistry::remove_table(const std::string& key) {
    utils::log::info(std::format("Removing stream for table {}", key));
    close_stream(key);
}

// ============================================================================
// Observation
// ============================================================================

std::set<std::string> StreamRegistry::active_tables() const {
    std::shared_lock lock(streams_mutex_);
    std::set<std::string> keys;
    for (const auto& [key, handle] : streams_) {
        keys.insert(key);
    }
    return keys;
}

std::optional<StreamState> StreamRegistry::stream_state(const std::string& key) const {
    std::shared_lock lock(streams_mutex_);
    if (connecting_.contains(key)) {
        return StreamState::CONNECTING;
    }
    const auto it = streams_.find(key);
    if (it == streams_.end()) {
        return std::nullopt;
    }
    return it->second->last_state();
}

StreamRegistry::Stats StreamRegistry::get_stats() const {
    size_t active = 0;
    {
        std::shared_lock lock(streams_mutex_);
        active = streams_.size();
    }
    return Stats{
        .creations = creations_.load(std::memory_order_relaxed),
        .recreations = recreations_.load(std::memory_order_relaxed),
        .creation_failures = creation_failures_.load(std::memory_order_relaxed),
        .close_failures = close_failures_.load(std::memory_order_relaxed),
        .records_submitted = records_submitted_.load(std::memory_order_relaxed),
        .submit_failures = submit_failures_.load(std::memory_order_relaxed),
        .active_streams = active
    };
}

} // namespace ingestgate
