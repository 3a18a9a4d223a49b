#pragma once

#include "stream/stream_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ingestgate {

/**
 * @brief Provider stream backed by an append-only JSON-lines segment file
 *
 * Offsets are assigned at ingest() time, starting at 0. A dedicated delivery
 * thread writes queued records strictly in offset order, fsyncs each batch,
 * resolves the batch's futures and then reports the batch's highest offset to
 * the ack callback.
 *
 * Line format: {"offset":N,"stream_id":"...","record":{...}}
 *
 * Backpressure: at most max_inflight_records unacknowledged records; beyond
 * that ingest() blocks (BLOCK) or fails with BACKPRESSURE (REJECT).
 *
 * Failure: a write/fsync error truncates the segment back to its size right
 * before that write, so bytes that were durable when the write began survive.
 * With recovery enabled the file is reopened and the batch retried once
 * (state RECOVERING meanwhile); otherwise, or if the retry fails, the stream
 * goes FAILED and every pending future receives the error.
 *
 * The segment is flock()ed for the stream's lifetime, so a second stream on
 * the same segment fails to open. An incomplete trailing line left by a crash
 * is cut off at open.
 */
class FileIngestStream : public IIngestStream {
public:
    FileIngestStream(std::string stream_id, std::filesystem::path path, StreamOptions options);
    ~FileIngestStream() override;

    FileIngestStream(const FileIngestStream&) = delete;
    FileIngestStream& operator=(const FileIngestStream&) = delete;

    /// Open the segment and start the delivery thread. Called once by the provider.
    [[nodiscard]] Status open();

    [[nodiscard]] const std::string& stream_id() const override { return stream_id_; }
    [[nodiscard]] ProviderStreamState state() const override {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] Result<std::shared_future<StreamOffset>> ingest(Record record) override;
    [[nodiscard]] Status flush() override;
    [[nodiscard]] Status close() override;

    const std::filesystem::path& path() const { return path_; }

    /// Highest durable offset, -1 before the first ack.
    [[nodiscard]] StreamOffset durable_offset() const;

private:
    struct Pending {
        StreamOffset offset = 0;
        Record record;
        std::promise<StreamOffset> promise;
    };

    void delivery_loop();
    bool open_segment(std::string& error);
    bool repair_tail(std::string& error);
    bool write_batch(const std::vector<Pending>& batch, std::string& error);
    void discard_partial_write(uint64_t size);
    bool reopen(std::string& error);
    void fail_all(std::vector<Pending>& batch, const std::string& reason);

    static constexpr size_t kMaxBatchSize = 256;

    std::string stream_id_;
    std::filesystem::path path_;
    StreamOptions options_;

    int fd_ = -1;  // Delivery thread only once open() returns

    std::atomic<ProviderStreamState> state_{ProviderStreamState::UNINITIALIZED};

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable space_cv_;
    mutable std::condition_variable durable_cv_;
    std::deque<Pending> queue_;
    StreamOffset next_offset_ = 0;
    StreamOffset durable_offset_ = -1;
    size_t inflight_ = 0;
    bool stopping_ = false;
    bool closed_ = false;
    std::string failure_reason_;

    std::thread delivery_thread_;
};

/**
 * @brief Local durable stream provider
 *
 * Each table gets the segment <data_dir>/<table_name>.jsonl; recreated
 * streams append to the same segment with offsets restarting at 0 and a new
 * stream id.
 */
class FileStreamProvider : public IStreamProvider {
public:
    struct Config {
        std::string data_dir = "./data";
        std::string server_endpoint;   // Reported in logs only
    };

    explicit FileStreamProvider(Config config);

    [[nodiscard]] Result<std::unique_ptr<IIngestStream>> create_stream(
        const Credentials& credentials,
        const StreamDescriptor& descriptor,
        const StreamOptions& options) override;

    [[nodiscard]] std::string name() const override;

    /// Segment path used for a table name.
    [[nodiscard]] std::filesystem::path segment_path(const std::string& table_name) const;

private:
    Config config_;
    std::atomic<uint64_t> stream_counter_{0};
};

} // namespace ingestgate
