#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace ingestgate {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    if (!std::filesystem::exists(file_path)) {
        throw std::runtime_error(std::format("Config file not found: {}", file_path));
    }
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

template<typename T>
T non_negative(const toml::table& tbl, std::string_view section,
               std::string_view key, int64_t fallback) {
    const int64_t value = tbl[key].value_or(fallback);
    if (value < 0) {
        throw std::runtime_error(
            std::format("{}.{} must be >= 0, got {}", section, key, value));
    }
    return static_cast<T>(value);
}

} // anonymous namespace

// ============================================================================
// Section extractors
// ============================================================================

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    cfg.port = static_cast<uint16_t>(s["port"].value_or(8000));
    cfg.thread_pool_size = non_negative<size_t>(s, "server", "threads", 8);
    cfg.shutdown_timeout_ms = non_negative<uint32_t>(s, "server", "shutdown_timeout_ms", 30000);
    cfg.max_body_bytes = non_negative<size_t>(s, "server", "max_body_bytes", 1024 * 1024);

    if (const auto* port = s["port"].as_integer()) {
        const int64_t p = port->get();
        if (p < 1 || p > 65535) {
            throw std::runtime_error(std::format("server.port must be 1-65535, got {}", p));
        }
    }

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.enabled = (*tls)["enabled"].value_or(false);
        cfg.tls.cert_file = (*tls)["cert_file"].value_or(""s);
        cfg.tls.key_file = (*tls)["key_file"].value_or(""s);
        cfg.tls.ca_file = (*tls)["ca_file"].value_or(""s);
        cfg.tls.require_client_cert = (*tls)["require_client_cert"].value_or(false);
    }
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

WorkspaceConfig ConfigLoader::extract_workspace(const toml::table& root) {
    WorkspaceConfig cfg;
    const auto* ws = root["workspace"].as_table();
    if (!ws) return cfg;

    cfg.server_endpoint = (*ws)["server_endpoint"].value_or(""s);
    cfg.workspace_id = (*ws)["workspace_id"].value_or(""s);
    cfg.workspace_url = (*ws)["workspace_url"].value_or(""s);
    return cfg;
}

CredentialsConfig ConfigLoader::extract_credentials(const toml::table& root) {
    CredentialsConfig cfg;
    const auto* creds = root["credentials"].as_table();
    if (!creds) return cfg;

    cfg.client_id_env = (*creds)["client_id_env"].value_or(cfg.client_id_env);
    cfg.client_secret_env = (*creds)["client_secret_env"].value_or(cfg.client_secret_env);
    return cfg;
}

StreamsConfig ConfigLoader::extract_streams(const toml::table& root) {
    StreamsConfig cfg;
    const auto* streams = root["streams"].as_table();
    if (!streams) return cfg;
    const auto& s = *streams;

    cfg.provider = utils::to_lower(s["provider"].value_or("file"s));
    cfg.data_dir = s["data_dir"].value_or("./data"s);
    cfg.max_inflight_records = non_negative<size_t>(s, "streams", "max_inflight_records", 50000);
    cfg.recovery = s["recovery"].value_or(true);
    cfg.ack_sample_interval = non_negative<uint64_t>(s, "streams", "ack_sample_interval", 1000);
    cfg.ack_timeout = std::chrono::milliseconds(
        non_negative<int64_t>(s, "streams", "ack_timeout_ms", 30000));

    const std::string mode = s["backpressure"].value_or("block"s);
    const auto parsed = parse_backpressure_mode(mode);
    if (!parsed) {
        throw std::runtime_error(
            std::format("streams.backpressure must be 'block' or 'reject', got '{}'", mode));
    }
    cfg.backpressure = *parsed;
    return cfg;
}

ConfigWatcherConfig ConfigLoader::extract_config_watcher(const toml::table& root) {
    ConfigWatcherConfig cfg;
    const auto* cw = root["config_watcher"].as_table();
    if (!cw) return cfg;

    cfg.enabled = (*cw)["enabled"].value_or(true);
    cfg.poll_interval_seconds = (*cw)["poll_interval_seconds"].value_or(5);
    return cfg;
}

std::map<std::string, TableConfig> ConfigLoader::extract_tables(const toml::table& root) {
    std::map<std::string, TableConfig> result;
    const auto* tables = root["tables"].as_table();
    if (!tables) return result;

    for (const auto& [key_node, node] : *tables) {
        const auto* t = node.as_table();
        if (!t) {
            throw std::runtime_error(std::format("tables.{} must be a table", key_node.str()));
        }

        TableConfig cfg;
        cfg.key = std::string(key_node.str());
        cfg.table_name = (*t)["table_name"].value_or(""s);
        cfg.message_name = (*t)["message_name"].value_or(""s);

        if (const auto* fields = (*t)["fields"].as_array()) {
            cfg.fields.reserve(fields->size());
            for (const auto& elem : *fields) {
                const auto* f = elem.as_table();
                if (!f) {
                    throw std::runtime_error(
                        std::format("tables.{}.fields entries must be tables", cfg.key));
                }
                FieldDef def;
                def.name = (*f)["name"].value_or(""s);
                def.type = parse_field_type(utils::to_lower((*f)["type"].value_or("string"s)));
                cfg.fields.emplace_back(std::move(def));
            }
        }

        cfg.schema = std::make_shared<const TableSchema>(
            cfg.key, cfg.table_name, cfg.message_name, cfg.fields);
        result.emplace(cfg.key, std::move(cfg));
    }
    return result;
}

GatewayConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    GatewayConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.workspace = extract_workspace(tbl);
    config.credentials = extract_credentials(tbl);
    config.streams = extract_streams(tbl);
    config.config_watcher = extract_config_watcher(tbl);
    config.tables = extract_tables(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.server.tls.enabled) {
        if (config.server.tls.cert_file.empty()) {
            errors.push_back("server.tls.cert_file required when TLS is enabled");
        }
        if (config.server.tls.key_file.empty()) {
            errors.push_back("server.tls.key_file required when TLS is enabled");
        }
        if (config.server.tls.require_client_cert && config.server.tls.ca_file.empty()) {
            errors.push_back("server.tls.ca_file required when require_client_cert is true");
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug, info, warn or error, got '{}'", config.logging.level));
    }

    if (config.streams.provider != "file") {
        errors.push_back(std::format("streams.provider '{}' is not supported", config.streams.provider));
    }
    if (config.streams.data_dir.empty()) {
        errors.push_back("streams.data_dir must not be empty");
    }

    if (config.credentials.client_id_env.empty() || config.credentials.client_secret_env.empty()) {
        errors.push_back("credentials.client_id_env and credentials.client_secret_env must not be empty");
    }

    if (config.config_watcher.enabled && config.config_watcher.poll_interval_seconds <= 0) {
        errors.push_back("config_watcher.poll_interval_seconds must be > 0");
    }

    // Each destination table owns one stream and one segment
    std::unordered_map<std::string, std::string> table_owner;
    for (const auto& [key, table] : config.tables) {
        if (table.table_name.empty()) {
            errors.push_back(std::format("tables.{}.table_name must not be empty", key));
        } else if (const auto [it, inserted] = table_owner.emplace(table.table_name, key); !inserted) {
            errors.push_back(std::format("tables.{}.table_name '{}' is already used by tables.{}",
                key, table.table_name, it->second));
        }
        if (table.message_name.empty()) {
            errors.push_back(std::format("tables.{}.message_name must not be empty", key));
        }

        std::unordered_set<std::string> seen;
        for (size_t i = 0; i < table.fields.size(); ++i) {
            const auto& name = table.fields[i].name;
            if (name.empty()) {
                errors.push_back(std::format("tables.{}.fields[{}].name must not be empty", key, i));
            } else if (!seen.insert(name).second) {
                errors.push_back(std::format("tables.{}: duplicate field '{}'", key, name));
            }
        }
    }

    return errors;
}

} // namespace ingestgate
