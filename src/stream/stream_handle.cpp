#include "stream/stream_handle.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>

namespace ingestgate {

StreamHandle::StreamHandle(std::string key, uint64_t generation,
                           std::unique_ptr<IIngestStream> stream)
    : key_(std::move(key)),
      generation_(generation),
      stream_(std::move(stream)),
      stream_id_(stream_ ? stream_->stream_id() : std::string{}) {}

StreamHandle::~StreamHandle() {
    if (!closed_.load(std::memory_order_acquire)) {
        const auto status = close();
        if (status.is_error()) {
            utils::log::warn(std::format("Stream {} for {} failed to close on release: {}",
                stream_id_, key_, status.error_message()));
        }
    }
}

StreamState StreamHandle::translate(ProviderStreamState state) {
    switch (state) {
        case ProviderStreamState::OPENED:        return StreamState::OPEN;
        case ProviderStreamState::UNINITIALIZED: return StreamState::CONNECTING;
        case ProviderStreamState::CLOSED:        return StreamState::CLOSED;
        case ProviderStreamState::FLUSHING:
        case ProviderStreamState::RECOVERING:
        case ProviderStreamState::FAILED:        return StreamState::DEGRADED;
    }
    return StreamState::DEGRADED;
}

Result<PendingIngestion> StreamHandle::submit(Record record) {
    if (closed_.load(std::memory_order_acquire) || !stream_) {
        return Result<PendingIngestion>::error(ErrorCategory::SUBMIT_ERROR,
            std::format("stream {} for {} is closed", stream_id_, key_));
    }

    try {
        auto accepted = stream_->ingest(std::move(record));
        if (accepted.is_error()) {
            return Result<PendingIngestion>::error(accepted.error_category(),
                                                   accepted.error_message());
        }
        return Result<PendingIngestion>::ok(PendingIngestion(std::move(accepted.value())));
    } catch (const std::exception& e) {
        return Result<PendingIngestion>::error(ErrorCategory::SUBMIT_ERROR, e.what());
    }
}

Status StreamHandle::flush() {
    if (closed_.load(std::memory_order_acquire) || !stream_) {
        return Status::error(ErrorCategory::FLUSH_ERROR,
            std::format("stream {} for {} is closed", stream_id_, key_));
    }

    try {
        return stream_->flush();
    } catch (const std::exception& e) {
        return Status::error(ErrorCategory::FLUSH_ERROR, e.what());
    }
}

Status StreamHandle::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_.load(std::memory_order_acquire)) {
        return Status::ok();
    }
    closed_.store(true, std::memory_order_release);
    state_.store(StreamState::CLOSED, std::memory_order_release);

    if (!stream_) {
        return Status::ok();
    }

    try {
        auto status = stream_->close();
        if (status.is_error()) {
            return Status::error(ErrorCategory::CLOSE_ERROR, status.error_message());
        }
        return status;
    } catch (const std::exception& e) {
        return Status::error(ErrorCategory::CLOSE_ERROR, e.what());
    }
}

StreamState StreamHandle::liveness() {
    if (closed_.load(std::memory_order_acquire) || !stream_) {
        return StreamState::CLOSED;
    }

    StreamState observed = StreamState::DEGRADED;
    try {
        observed = translate(stream_->state());
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Liveness check for {} ({}) failed: {}",
            key_, stream_id_, e.what()));
    }

    if (!closed_.load(std::memory_order_acquire)) {
        state_.store(observed == StreamState::OPEN ? StreamState::OPEN : StreamState::DEGRADED,
                     std::memory_order_release);
    }
    return observed;
}

} // namespace ingestgate
