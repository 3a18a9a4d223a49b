#pragma once

#include "config/config_types.hpp"

#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ingestgate {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to ingestgate.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every validation problem found, empty when the config is usable.
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

private:
    static GatewayConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(GatewayConfig config);

    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static WorkspaceConfig extract_workspace(const toml::table& root);
    static CredentialsConfig extract_credentials(const toml::table& root);
    static StreamsConfig extract_streams(const toml::table& root);
    static ConfigWatcherConfig extract_config_watcher(const toml::table& root);
    static std::map<std::string, TableConfig> extract_tables(const toml::table& root);
};

} // namespace ingestgate
