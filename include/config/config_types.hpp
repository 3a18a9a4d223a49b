#pragma once

#include "core/types.hpp"
#include "schema/table_schema.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ingestgate {

// ============================================================================
// Configuration Types (mirror the TOML hierarchy)
// ============================================================================

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;            // Server certificate (PEM)
    std::string key_file;             // Server private key (PEM)
    std::string ca_file;              // CA cert for client verification (mTLS)
    bool require_client_cert = false; // mTLS mode
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    size_t thread_pool_size = 8;
    uint32_t shutdown_timeout_ms = 30000;  // Drain window for in-flight requests
    size_t max_body_bytes = 1024 * 1024;
    TlsConfig tls;
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Remote workspace the streams are addressed to
 *
 * Passed through to the provider; the file provider only logs the endpoint.
 */
struct WorkspaceConfig {
    std::string server_endpoint;
    std::string workspace_id;
    std::string workspace_url;
};

/// Names of the environment variables holding the client secrets.
struct CredentialsConfig {
    std::string client_id_env = "DATABRICKS_CLIENT_ID";
    std::string client_secret_env = "DATABRICKS_CLIENT_SECRET";
};

struct StreamsConfig {
    std::string provider = "file";
    std::string data_dir = "./data";
    size_t max_inflight_records = 50000;
    bool recovery = true;
    BackpressureMode backpressure = BackpressureMode::BLOCK;
    uint64_t ack_sample_interval = 1000;
    std::chrono::milliseconds ack_timeout{30000};  // 0 = wait forever
};

struct ConfigWatcherConfig {
    bool enabled = true;
    int poll_interval_seconds = 5;
};

/**
 * @brief One [tables.<key>] entry with its schema resolved at load time
 */
struct TableConfig {
    std::string key;
    std::string table_name;      // Fully qualified sink name
    std::string message_name;
    std::vector<FieldDef> fields;
    TableSchemaPtr schema;
};

struct GatewayConfig {
    ServerConfig server;
    LoggingConfig logging;
    WorkspaceConfig workspace;
    CredentialsConfig credentials;
    StreamsConfig streams;
    ConfigWatcherConfig config_watcher;
    std::map<std::string, TableConfig> tables;  // Keyed by table key
};

} // namespace ingestgate
