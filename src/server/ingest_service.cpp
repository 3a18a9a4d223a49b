#include "server/ingest_service.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <mutex>
#include <optional>
#include <utility>

namespace ingestgate {

namespace {

bool same_definition(const TableConfig& a, const TableConfig& b) {
    if (a.table_name != b.table_name || a.message_name != b.message_name ||
        a.fields.size() != b.fields.size()) {
        return false;
    }
    for (size_t i = 0; i < a.fields.size(); ++i) {
        if (a.fields[i].name != b.fields[i].name || a.fields[i].type != b.fields[i].type) {
            return false;
        }
    }
    return true;
}

ServiceResponse json_response(int status, const nlohmann::json& body) {
    return ServiceResponse{status, body.dump(), http::kJsonContentType};
}

} // anonymous namespace

IngestService::IngestService(std::shared_ptr<StreamRegistry> registry,
                             std::shared_ptr<AckDispatcher> dispatcher,
                             std::shared_ptr<ShutdownCoordinator> shutdown,
                             std::map<std::string, TableConfig> tables,
                             const Config& config)
    : registry_(std::move(registry)),
      dispatcher_(std::move(dispatcher)),
      shutdown_(std::move(shutdown)),
      config_(config),
      tables_(std::make_shared<const TableMap>(std::move(tables))) {}

ServiceResponse IngestService::error_response(int status, const std::string& message) {
    return json_response(status, {{"error", message}, {"status_code", status}});
}

std::shared_ptr<const IngestService::TableMap> IngestService::snapshot() const {
    std::shared_lock lock(tables_mutex_);
    return tables_;
}

// ============================================================================
// Informational routes
// ============================================================================

ServiceResponse IngestService::root() const {
    const auto tables = snapshot();

    nlohmann::json keys = nlohmann::json::array();
    nlohmann::json endpoints = nlohmann::json::object();
    for (const auto& [key, table] : *tables) {
        keys.push_back(key);
        endpoints[key] = {
            {"ingest", "/ingest/" + key},
            {"flush", "/flush/" + key},
            {"health", "/health/" + key}
        };
    }

    return json_response(200, {
        {"service", std::string(http::kServiceName)},
        {"version", std::string(http::kServiceVersion)},
        {"tables", std::move(keys)},
        {"endpoints", std::move(endpoints)}
    });
}

ServiceResponse IngestService::health() const {
    nlohmann::json active = nlohmann::json::array();
    for (const auto& key : registry_->active_tables()) {
        active.push_back(key);
    }
    return json_response(200, {
        {"status", (shutdown_ && shutdown_->is_shutting_down()) ? "shutting_down" : "healthy"},
        {"active_streams", std::move(active)}
    });
}

ServiceResponse IngestService::table_health(const std::string& table_key) const {
    const auto tables = snapshot();
    const auto it = tables->find(table_key);
    if (it == tables->end()) {
        return error_response(404, std::format("Table {} not found", table_key));
    }

    const auto state = registry_->stream_state(table_key);
    nlohmann::json body = {
        {"table", table_key},
        {"table_name", it->second.table_name},
        {"stream_active", registry_->active_tables().contains(table_key)},
        {"stream_state", nullptr},
        {"status", "healthy"}
    };
    if (state) {
        body["stream_state"] = stream_state_to_string(*state);
    }
    if (dispatcher_) {
        if (const auto offset = dispatcher_->last_offset(table_key)) {
            body["last_acked_offset"] = *offset;
        }
    }
    return json_response(200, body);
}

// ============================================================================
// Ingest / flush
// ============================================================================

ServiceResponse IngestService::ingest(const std::string& table_key,
                                      std::string_view body,
                                      bool wait_for_ack) {
    ingest_requests_.fetch_add(1, std::memory_order_relaxed);

    std::optional<RequestGuard> guard;
    if (shutdown_) {
        guard.emplace(*shutdown_);
        if (!guard->admitted()) {
            rejected_shutdown_.fetch_add(1, std::memory_order_relaxed);
            return error_response(503, "Service is shutting down");
        }
    }

    const auto tables = snapshot();
    const auto it = tables->find(table_key);
    if (it == tables->end()) {
        return error_response(404, std::format("Table {} not found", table_key));
    }
    const TableConfig& table = it->second;
    if (!table.schema) {
        return error_response(500, std::format("Table {} has no resolved schema", table_key));
    }

    const auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        validation_errors_.fetch_add(1, std::memory_order_relaxed);
        return error_response(400, "Validation error: request body is not valid JSON");
    }

    auto record = table.schema->decode(parsed);
    if (record.is_error()) {
        validation_errors_.fetch_add(1, std::memory_order_relaxed);
        return error_response(400, std::format("Validation error: {}", record.error_message()));
    }

    const StreamDescriptor descriptor{table.table_name, table.schema, table.message_name};
    const auto handle = registry_->get_or_create_stream(table_key, descriptor);
    if (handle.is_error()) {
        ingest_errors_.fetch_add(1, std::memory_order_relaxed);
        return error_response(500, std::format("Failed to ingest record: {}", handle.error_message()));
    }

    auto pending = registry_->ingest_record(table_key, std::move(record.value()));
    if (pending.is_error()) {
        utils::log::error(std::format("Error ingesting record into {}: {}",
            table_key, pending.error_message()));
        ingest_errors_.fetch_add(1, std::memory_order_relaxed);
        if (pending.error_category() == ErrorCategory::BACKPRESSURE) {
            return error_response(503, std::format("Stream is at capacity: {}", pending.error_message()));
        }
        return error_response(500, std::format("Failed to ingest record: {}", pending.error_message()));
    }

    nlohmann::json response = {
        {"status", "success"},
        {"table", table_key},
        {"message", "Record ingested successfully"},
        {"wait_for_ack", wait_for_ack}
    };

    if (wait_for_ack) {
        const auto& future = pending.value();
        if (config_.ack_timeout.count() > 0 && !future.wait_for(config_.ack_timeout)) {
            ack_timeouts_.fetch_add(1, std::memory_order_relaxed);
            return error_response(504, std::format(
                "Timed out after {}ms waiting for acknowledgment", config_.ack_timeout.count()));
        }
        const auto offset = future.wait();
        if (offset.is_error()) {
            ingest_errors_.fetch_add(1, std::memory_order_relaxed);
            return error_response(500, std::format("Record was not acknowledged: {}", offset.error_message()));
        }
        response["offset"] = offset.value();
    }

    ingest_success_.fetch_add(1, std::memory_order_relaxed);
    return json_response(200, response);
}

ServiceResponse IngestService::flush(const std::string& table_key) {
    flush_requests_.fetch_add(1, std::memory_order_relaxed);

    std::optional<RequestGuard> guard;
    if (shutdown_) {
        guard.emplace(*shutdown_);
        if (!guard->admitted()) {
            rejected_shutdown_.fetch_add(1, std::memory_order_relaxed);
            return error_response(503, "Service is shutting down");
        }
    }

    const auto tables = snapshot();
    if (!tables->contains(table_key)) {
        return error_response(404, std::format("Table {} not found", table_key));
    }

    const auto status = registry_->flush_stream(table_key);
    if (status.error_category() == ErrorCategory::NOT_FOUND) {
        return json_response(200, {
            {"status", "no_active_stream"},
            {"table", table_key},
            {"message", "No active stream to flush"}
        });
    }
    if (status.is_error()) {
        utils::log::error(std::format("Error flushing stream for {}: {}",
            table_key, status.error_message()));
        return error_response(500, std::format("Failed to flush stream: {}", status.error_message()));
    }

    return json_response(200, {
        {"status", "success"},
        {"table", table_key},
        {"message", "Stream flushed successfully"}
    });
}

// ============================================================================
// Metrics (Prometheus text format)
// ============================================================================

ServiceResponse IngestService::metrics() const {
    std::string output;

    const auto rs = registry_->get_stats();
    output += std::format(
        "# HELP ingestgate_streams_active Streams currently cached by the registry\n"
        "# TYPE ingestgate_streams_active gauge\n"
        "ingestgate_streams_active {}\n\n"
        "# HELP ingestgate_stream_creations_total Stream creations by outcome\n"
        "# TYPE ingestgate_stream_creations_total counter\n"
        "ingestgate_stream_creations_total{{result=\"success\"}} {}\n"
        "ingestgate_stream_creations_total{{result=\"failure\"}} {}\n\n"
        "# HELP ingestgate_stream_recreations_total Non-open streams replaced\n"
        "# TYPE ingestgate_stream_recreations_total counter\n"
        "ingestgate_stream_recreations_total {}\n\n"
        "# HELP ingestgate_stream_close_failures_total Stream closes that reported an error\n"
        "# TYPE ingestgate_stream_close_failures_total counter\n"
        "ingestgate_stream_close_failures_total {}\n\n"
        "# HELP ingestgate_records_submitted_total Record submissions by outcome\n"
        "# TYPE ingestgate_records_submitted_total counter\n"
        "ingestgate_records_submitted_total{{result=\"accepted\"}} {}\n"
        "ingestgate_records_submitted_total{{result=\"failed\"}} {}\n\n",
        rs.active_streams, rs.creations, rs.creation_failures, rs.recreations,
        rs.close_failures, rs.records_submitted, rs.submit_failures);

    if (dispatcher_) {
        const auto ds = dispatcher_->get_stats();
        output += std::format(
            "# HELP ingestgate_acks_total Durability acknowledgments by outcome\n"
            "# TYPE ingestgate_acks_total counter\n"
            "ingestgate_acks_total{{result=\"received\"}} {}\n"
            "ingestgate_acks_total{{result=\"processed\"}} {}\n"
            "ingestgate_acks_total{{result=\"dropped\"}} {}\n\n"
            "# HELP ingestgate_ack_regressions_total Offsets lower than the previous one on the same stream\n"
            "# TYPE ingestgate_ack_regressions_total counter\n"
            "ingestgate_ack_regressions_total {}\n\n",
            ds.received, ds.processed, ds.dropped, ds.regressions);

        for (const auto& key : registry_->active_tables()) {
            if (const auto offset = dispatcher_->last_offset(key)) {
                output += std::format("ingestgate_last_acked_offset{{table=\"{}\"}} {}\n", key, *offset);
            }
        }
        output += '\n';
    }

    const auto ss = get_stats();
    output += std::format(
        "# HELP ingestgate_ingest_requests_total Ingest requests by outcome\n"
        "# TYPE ingestgate_ingest_requests_total counter\n"
        "ingestgate_ingest_requests_total{{result=\"success\"}} {}\n"
        "ingestgate_ingest_requests_total{{result=\"invalid\"}} {}\n"
        "ingestgate_ingest_requests_total{{result=\"error\"}} {}\n"
        "ingestgate_ingest_requests_total{{result=\"ack_timeout\"}} {}\n"
        "ingestgate_ingest_requests_total{{result=\"shutting_down\"}} {}\n\n"
        "# HELP ingestgate_flush_requests_total Flush requests received\n"
        "# TYPE ingestgate_flush_requests_total counter\n"
        "ingestgate_flush_requests_total {}\n",
        ss.ingest_success, ss.validation_errors, ss.ingest_errors,
        ss.ack_timeouts, ss.rejected_shutdown, ss.flush_requests);

    return ServiceResponse{200, std::move(output), http::kMetricsContentType};
}

// ============================================================================
// Hot reload
// ============================================================================

std::vector<std::string> IngestService::update_tables(std::map<std::string, TableConfig> tables) {
    auto next = std::make_shared<const TableMap>(std::move(tables));
    std::shared_ptr<const TableMap> previous;
    {
        std::unique_lock lock(tables_mutex_);
        previous = std::exchange(tables_, next);
    }

    std::vector<std::string> closed;
    for (const auto& [key, old_table] : *previous) {
        const auto it = next->find(key);
        if (it == next->end()) {
            utils::log::info(std::format("Table {} removed from configuration", key));
            registry_->remove_table(key);
            closed.push_back(key);
        } else if (!same_definition(old_table, it->second)) {
            utils::log::info(std::format("Table {} definition changed", key));
            registry_->remove_table(key);
            closed.push_back(key);
        }
    }
    for (const auto& [key, table] : *next) {
        if (!previous->contains(key)) {
            utils::log::info(std::format("Table {} added ({})", key, table.table_name));
        }
    }
    return closed;
}

std::vector<std::string> IngestService::table_keys() const {
    const auto tables = snapshot();
    std::vector<std::string> keys;
    keys.reserve(tables->size());
    for (const auto& [key, table] : *tables) {
        keys.push_back(key);
    }
    return keys;
}

IngestService::Stats IngestService::get_stats() const {
    return Stats{
        .ingest_requests = ingest_requests_.load(std::memory_order_relaxed),
        .ingest_success = ingest_success_.load(std::memory_order_relaxed),
        .validation_errors = validation_errors_.load(std::memory_order_relaxed),
        .ingest_errors = ingest_errors_.load(std::memory_order_relaxed),
        .ack_timeouts = ack_timeouts_.load(std::memory_order_relaxed),
        .flush_requests = flush_requests_.load(std::memory_order_relaxed),
        .rejected_shutdown = rejected_shutdown_.load(std::memory_order_relaxed)
    };
}

} // namespace ingestgate
