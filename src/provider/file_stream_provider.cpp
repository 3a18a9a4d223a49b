#include "provider/file_stream_provider.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <exception>
#include <format>
#include <stdexcept>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ingestgate {

// ============================================================================
// FileIngestStream: lifecycle
// ============================================================================

FileIngestStream::FileIngestStream(std::string stream_id,
                                   std::filesystem::path path,
                                   StreamOptions options)
    : stream_id_(std::move(stream_id)),
      path_(std::move(path)),
      options_(std::move(options)) {}

FileIngestStream::~FileIngestStream() {
    const auto status = close();
    if (status.is_error()) {
        utils::log::warn(std::format("Stream {}: {}", stream_id_, status.error_message()));
    }
}

Status FileIngestStream::open() {
    std::string error;
    if (!open_segment(error)) {
        return Status::error(ErrorCategory::CREATION_ERROR, error);
    }
    if (!repair_tail(error)) {
        ::close(fd_);
        fd_ = -1;
        return Status::error(ErrorCategory::CREATION_ERROR, error);
    }

    state_.store(ProviderStreamState::OPENED, std::memory_order_release);
    delivery_thread_ = std::thread(&FileIngestStream::delivery_loop, this);
    return Status::ok();
}

bool FileIngestStream::open_segment(std::string& error) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        error = std::format("cannot open segment {}: {}", path_.string(), std::strerror(errno));
        return false;
    }

    // One live writer per segment; released when the descriptor closes
    if (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        error = errno == EWOULDBLOCK
            ? std::format("segment {} is in use by another stream", path_.string())
            : std::format("cannot lock segment {}: {}", path_.string(), std::strerror(errno));
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}

bool FileIngestStream::repair_tail(std::string& error) {
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        error = std::format("fstat {}: {}", path_.string(), std::strerror(errno));
        return false;
    }
    if (!S_ISREG(st.st_mode) || st.st_size == 0) {
        return true;
    }

    // Reading needs a second descriptor: fd_ is write-only
    const int rfd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (rfd < 0) {
        error = std::format("cannot read segment {}: {}", path_.string(), std::strerror(errno));
        return false;
    }

    off_t end = st.st_size;
    off_t keep = 0;
    bool found = false;
    char buf[4096];
    while (end > 0 && !found) {
        const off_t start = end > static_cast<off_t>(sizeof(buf)) ? end - static_cast<off_t>(sizeof(buf)) : 0;
        const ssize_t n = ::pread(rfd, buf, static_cast<size_t>(end - start), start);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = std::format("read {}: {}", path_.string(), std::strerror(errno));
            ::close(rfd);
            return false;
        }
        for (ssize_t i = n; i > 0; --i) {
            if (buf[i - 1] == '\n') {
                keep = start + i;
                found = true;
                break;
            }
        }
        end = start;
    }
    ::close(rfd);

    if (keep == st.st_size) {
        return true;
    }
    utils::log::warn(std::format("Segment {}: dropping {} bytes of incomplete trailing line",
        path_.string(), st.st_size - keep));
    if (::ftruncate(fd_, keep) != 0) {
        error = std::format("truncate {}: {}", path_.string(), std::strerror(errno));
        return false;
    }
    return true;
}

Status FileIngestStream::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return Status::ok();
        }
        closed_ = true;
        stopping_ = true;
    }
    work_cv_.notify_all();
    space_cv_.notify_all();

    // Delivery thread drains everything already accepted before exiting
    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
    }

    Status result = Status::ok();
    if (fd_ >= 0) {
        if (::close(fd_) != 0) {
            result = Status::error(ErrorCategory::CLOSE_ERROR,
                std::format("close {}: {}", path_.string(), std::strerror(errno)));
        }
        fd_ = -1;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.store(ProviderStreamState::CLOSED, std::memory_order_release);
    }
    durable_cv_.notify_all();
    return result;
}

// ============================================================================
// FileIngestStream: submission
// ============================================================================

Result<std::shared_future<StreamOffset>> FileIngestStream::ingest(Record record) {
    using FutureResult = Result<std::shared_future<StreamOffset>>;

    auto accepting = [this] {
        const auto s = state_.load(std::memory_order_acquire);
        return !stopping_ &&
               (s == ProviderStreamState::OPENED || s == ProviderStreamState::RECOVERING);
    };

    std::unique_lock<std::mutex> lock(mutex_);
    if (!accepting()) {
        return FutureResult::error(ErrorCategory::SUBMIT_ERROR,
            std::format("stream {} is {}{}", stream_id_,
                        provider_state_to_string(state_.load(std::memory_order_acquire)),
                        failure_reason_.empty() ? "" : ": " + failure_reason_));
    }

    const size_t ceiling = options_.max_inflight_records;
    if (ceiling > 0 && inflight_ >= ceiling) {
        if (options_.backpressure == BackpressureMode::REJECT) {
            return FutureResult::error(ErrorCategory::BACKPRESSURE,
                std::format("stream {} has {} records in flight", stream_id_, inflight_));
        }
        space_cv_.wait(lock, [this, ceiling, &accepting] {
            return inflight_ < ceiling || !accepting();
        });
        if (!accepting()) {
            return FutureResult::error(ErrorCategory::SUBMIT_ERROR,
                std::format("stream {} stopped while waiting for capacity", stream_id_));
        }
    }

    Pending pending;
    pending.offset = next_offset_++;
    pending.record = std::move(record);
    auto future = pending.promise.get_future().share();

    queue_.push_back(std::move(pending));
    ++inflight_;
    lock.unlock();

    work_cv_.notify_one();
    return FutureResult::ok(std::move(future));
}

Status FileIngestStream::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    const StreamOffset target = next_offset_ - 1;
    durable_cv_.wait(lock, [this, target] {
        const auto s = state_.load(std::memory_order_acquire);
        return durable_offset_ >= target ||
               s == ProviderStreamState::FAILED ||
               s == ProviderStreamState::CLOSED;
    });

    if (durable_offset_ >= target) {
        return Status::ok();
    }
    return Status::error(ErrorCategory::FLUSH_ERROR,
        failure_reason_.empty() ? std::format("stream {} closed", stream_id_) : failure_reason_);
}

StreamOffset FileIngestStream::durable_offset() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return durable_offset_;
}

// ============================================================================
// FileIngestStream: delivery thread
// ============================================================================

bool FileIngestStream::write_batch(const std::vector<Pending>& batch, std::string& error) {
    std::string out;
    out.reserve(batch.size() * 128);
    for (const auto& pending : batch) {
        const nlohmann::json line = {
            {"offset", pending.offset},
            {"stream_id", stream_id_},
            {"record", pending.record.to_json()}
        };
        out += line.dump();
        out += '\n';
    }

    // The segment end right before this write is the only safe truncation point
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        error = std::format("fstat {}: {}", path_.string(), std::strerror(errno));
        return false;
    }
    const auto base = static_cast<uint64_t>(st.st_size);

    size_t written = 0;
    while (written < out.size()) {
        const ssize_t n = ::write(fd_, out.data() + written, out.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            error = std::format("write {}: {}", path_.string(), std::strerror(errno));
            discard_partial_write(base);
            return false;
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd_) != 0) {
        error = std::format("fsync {}: {}", path_.string(), std::strerror(errno));
        discard_partial_write(base);
        return false;
    }
    return true;
}

void FileIngestStream::discard_partial_write(uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        utils::log::error(std::format("Stream {}: cannot truncate {} back to {} bytes: {}",
            stream_id_, path_.string(), size, std::strerror(errno)));
    }
}

bool FileIngestStream::reopen(std::string& error) {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    return open_segment(error);
}

void FileIngestStream::fail_all(std::vector<Pending>& batch, const std::string& reason) {
    for (auto& pending : batch) {
        pending.promise.set_exception(std::make_exception_ptr(std::runtime_error(reason)));
    }
    batch.clear();
}

void FileIngestStream::delivery_loop() {
    std::vector<Pending> batch;
    batch.reserve(kMaxBatchSize);

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return !queue_.empty() || stopping_; });
            if (queue_.empty()) {
                break;  // Stopping and fully drained
            }
            batch.clear();
            while (!queue_.empty() && batch.size() < kMaxBatchSize) {
                batch.push_back(std::move(queue_.front()));
                queue_.pop_front();
            }
        }

        std::string error;
        bool written = write_batch(batch, error);

        // write_batch() has already cut any partial lines off the segment
        if (!written && options_.recovery) {
            state_.store(ProviderStreamState::RECOVERING, std::memory_order_release);
            utils::log::warn(std::format("Stream {} recovering after: {}", stream_id_, error));

            std::string reopen_error;
            if (reopen(reopen_error) && write_batch(batch, error)) {
                written = true;
                state_.store(ProviderStreamState::OPENED, std::memory_order_release);
                utils::log::info(std::format("Stream {} recovered", stream_id_));
            } else if (!reopen_error.empty()) {
                error = reopen_error;
            }
        }

        if (!written) {
            utils::log::error(std::format("Stream {} failed: {}", stream_id_, error));

            std::vector<Pending> rest;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                state_.store(ProviderStreamState::FAILED, std::memory_order_release);
                failure_reason_ = error;
                rest.reserve(queue_.size());
                for (auto& pending : queue_) {
                    rest.push_back(std::move(pending));
                }
                queue_.clear();
                inflight_ = 0;
            }
            fail_all(batch, error);
            fail_all(rest, error);
            space_cv_.notify_all();
            durable_cv_.notify_all();
            break;
        }

        const StreamOffset last = batch.back().offset;
        const size_t count = batch.size();
        for (auto& pending : batch) {
            pending.promise.set_value(pending.offset);
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            durable_offset_ = last;
            inflight_ -= count;
        }
        space_cv_.notify_all();
        durable_cv_.notify_all();

        if (options_.ack_callback) {
            try {
                options_.ack_callback(last);
            } catch (const std::exception& e) {
                utils::log::warn(std::format("Stream {}: ack callback threw: {}", stream_id_, e.what()));
            }
        }
    }
}

// ============================================================================
// FileStreamProvider
// ============================================================================

FileStreamProvider::FileStreamProvider(Config config)
    : config_(std::move(config)) {}

std::string FileStreamProvider::name() const {
    return "file:" + config_.data_dir;
}

std::filesystem::path FileStreamProvider::segment_path(const std::string& table_name) const {
    std::string file = table_name;
    for (char& c : file) {
        if (c == '/' || c == '\\') c = '_';
    }
    return std::filesystem::path(config_.data_dir) / (file + ".jsonl");
}

Result<std::unique_ptr<IIngestStream>> FileStreamProvider::create_stream(
    const Credentials& credentials,
    const StreamDescriptor& descriptor,
    const StreamOptions& options) {
    using StreamResult = Result<std::unique_ptr<IIngestStream>>;

    if (descriptor.table_name.empty() || !descriptor.schema) {
        return StreamResult::error(ErrorCategory::SCHEMA_RESOLUTION_ERROR,
            "descriptor has no table name or schema");
    }
    if (credentials.client_id.empty() || credentials.client_secret.empty()) {
        return StreamResult::error(ErrorCategory::CREATION_ERROR, "missing client credentials");
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.data_dir, ec);
    if (ec) {
        return StreamResult::error(ErrorCategory::CREATION_ERROR,
            std::format("cannot create data directory {}: {}", config_.data_dir, ec.message()));
    }

    const uint64_t n = stream_counter_.fetch_add(1, std::memory_order_relaxed) + 1;
    auto stream = std::make_unique<FileIngestStream>(
        std::format("{}-{}", descriptor.table_name, n),
        segment_path(descriptor.table_name),
        options);

    const auto status = stream->open();
    if (status.is_error()) {
        return StreamResult::error(status.error_category(), status.error_message());
    }

    utils::log::info(std::format("Opened stream {} -> {} (max_inflight={}, recovery={}, backpressure={})",
        stream->stream_id(), stream->path().string(), options.max_inflight_records,
        utils::booltostr(options.recovery), backpressure_mode_to_string(options.backpressure)));
    return StreamResult::ok(std::move(stream));
}

} // namespace ingestgate
