#pragma once

#include "config/config_types.hpp"
#include "server/shutdown_coordinator.hpp"
#include "stream/ack_dispatcher.hpp"
#include "stream/stream_registry.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ingestgate {

/**
 * @brief Status code plus body, independent of the HTTP binding
 */
struct ServiceResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

/**
 * @brief Request layer over the stream registry
 *
 * One method per route; HttpServer only extracts path parameters and copies
 * the ServiceResponse onto the wire. Errors use the body
 * {"error": message, "status_code": code}.
 *
 * The table map is hot-reloadable: update_tables() swaps it under a
 * shared_mutex and closes the streams of tables that were removed or whose
 * definition changed, so the next ingest builds a stream with the new schema.
 */
class IngestService {
public:
    struct Config {
        std::chrono::milliseconds ack_timeout{30000};  // 0 = wait forever
    };

    struct Stats {
        uint64_t ingest_requests;
        uint64_t ingest_success;
        uint64_t validation_errors;
        uint64_t ingest_errors;
        uint64_t ack_timeouts;
        uint64_t flush_requests;
        uint64_t rejected_shutdown;
    };

    IngestService(std::shared_ptr<StreamRegistry> registry,
                  std::shared_ptr<AckDispatcher> dispatcher,
                  std::shared_ptr<ShutdownCoordinator> shutdown,
                  std::map<std::string, TableConfig> tables,
                  const Config& config);

    IngestService(const IngestService&) = delete;
    IngestService& operator=(const IngestService&) = delete;

    // ── Routes ─────────────────────────────────────────────────────────
    [[nodiscard]] ServiceResponse root() const;
    [[nodiscard]] ServiceResponse health() const;
    [[nodiscard]] ServiceResponse table_health(const std::string& table_key) const;
    [[nodiscard]] ServiceResponse ingest(const std::string& table_key,
                                         std::string_view body,
                                         bool wait_for_ack);
    [[nodiscard]] ServiceResponse flush(const std::string& table_key);
    [[nodiscard]] ServiceResponse metrics() const;

    /**
     * @brief Replace the table map after a config reload
     * @return Keys whose streams were closed (removed or changed tables)
     */
    std::vector<std::string> update_tables(std::map<std::string, TableConfig> tables);

    [[nodiscard]] std::vector<std::string> table_keys() const;
    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] static ServiceResponse error_response(int status, const std::string& message);

private:
    using TableMap = std::map<std::string, TableConfig>;

    std::shared_ptr<const TableMap> snapshot() const;

    std::shared_ptr<StreamRegistry> registry_;
    std::shared_ptr<AckDispatcher> dispatcher_;
    std::shared_ptr<ShutdownCoordinator> shutdown_;
    const Config config_;

    std::shared_ptr<const TableMap> tables_;
    mutable std::shared_mutex tables_mutex_;

    std::atomic<uint64_t> ingest_requests_{0};
    std::atomic<uint64_t> ingest_success_{0};
    std::atomic<uint64_t> validation_errors_{0};
    std::atomic<uint64_t> ingest_errors_{0};
    std::atomic<uint64_t> ack_timeouts_{0};
    std::atomic<uint64_t> flush_requests_{0};
    std::atomic<uint64_t> rejected_shutdown_{0};
};

} // namespace ingestgate
