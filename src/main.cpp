#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "config/config_watcher.hpp"
#include "config/credential_source.hpp"
#include "provider/file_stream_provider.hpp"
#include "server/http_server.hpp"
#include "server/ingest_service.hpp"
#include "server/shutdown_coordinator.hpp"
#include "stream/ack_dispatcher.hpp"
#include "stream/stream_registry.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

using namespace ingestgate;

namespace {

/**
 * SIGINT/SIGTERM are blocked in every thread and consumed here with
 * sigwait(), so the shutdown sequence runs in ordinary thread context.
 */
void signal_wait_loop(sigset_t signals,
                      std::shared_ptr<ShutdownCoordinator> shutdown,
                      std::shared_ptr<ConfigWatcher> watcher,
                      std::shared_ptr<HttpServer> server) {
    int signal = 0;
    if (sigwait(&signals, &signal) != 0) {
        utils::log::error("sigwait failed, signal-driven shutdown unavailable");
        return;
    }
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Stop accepting new requests
    shutdown->initiate_shutdown();

    if (watcher) {
        watcher->stop();
    }

    // Wait for in-flight requests to drain
    if (shutdown->wait_for_drain()) {
        utils::log::info("All in-flight requests drained");
    } else {
        utils::log::warn(std::format("Shutdown timeout: {} requests still in flight",
            shutdown->in_flight_count()));
    }

    server->stop();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Ingestion gateway starting...");

        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
            utils::log::error("Failed to block termination signals");
            return 1;
        }

        // =====================================================================
        // [1/6] Configuration
        // =====================================================================
        std::string config_file = "config/ingestgate.toml";
        if (argc > 1) {
            config_file = argv[1];
        }
        utils::log::info(std::format("[1/6] Loading configuration from {}", config_file));

        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const GatewayConfig& cfg = config_result.config;

        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }
        utils::log::info(std::format("Loaded {} table(s), workspace {} ({})",
            cfg.tables.size(),
            cfg.workspace.workspace_id.empty() ? "<unset>" : cfg.workspace.workspace_id,
            cfg.workspace.workspace_url.empty() ? "<unset>" : cfg.workspace.workspace_url));

        // =====================================================================
        // [2/6] Credentials
        // =====================================================================
        utils::log::info("[2/6] Resolving client credentials");
        const CredentialSource credential_source(cfg.credentials.client_id_env,
                                                 cfg.credentials.client_secret_env);
        auto credentials = credential_source.load();
        if (credentials.is_error()) {
            utils::log::error(std::format("Credentials unavailable: {}", credentials.error_message()));
            return 1;
        }

        // =====================================================================
        // [3/6] Stream provider, ack dispatcher, registry
        // =====================================================================
        utils::log::info(std::format("[3/6] Stream provider: {} (data_dir={}, endpoint={})",
            cfg.streams.provider, cfg.streams.data_dir,
            cfg.workspace.server_endpoint.empty() ? "<unset>" : cfg.workspace.server_endpoint));

        auto provider = std::make_shared<FileStreamProvider>(FileStreamProvider::Config{
            .data_dir = cfg.streams.data_dir,
            .server_endpoint = cfg.workspace.server_endpoint
        });

        AckDispatcher::Config ack_config;
        ack_config.sample_interval = cfg.streams.ack_sample_interval;
        auto dispatcher = std::make_shared<AckDispatcher>(ack_config);

        StreamRegistry::Config registry_config;
        registry_config.max_inflight_records = cfg.streams.max_inflight_records;
        registry_config.recovery = cfg.streams.recovery;
        registry_config.backpressure = cfg.streams.backpressure;
        auto registry = std::make_shared<StreamRegistry>(
            provider, std::move(credentials.value()), dispatcher, registry_config);

        // =====================================================================
        // [4/6] Request layer
        // =====================================================================
        utils::log::info("[4/6] Request layer initializing...");
        ShutdownCoordinator::Config shutdown_config;
        shutdown_config.shutdown_timeout = std::chrono::milliseconds(cfg.server.shutdown_timeout_ms);
        auto shutdown = std::make_shared<ShutdownCoordinator>(shutdown_config);

        IngestService::Config service_config;
        service_config.ack_timeout = cfg.streams.ack_timeout;
        auto service = std::make_shared<IngestService>(
            registry, dispatcher, shutdown, cfg.tables, service_config);

        auto server = std::make_shared<HttpServer>(service, cfg.server);

        // =====================================================================
        // [5/6] Config watcher - hot-reload tables and log level
        // =====================================================================
        std::shared_ptr<ConfigWatcher> watcher;
        if (cfg.config_watcher.enabled) {
            utils::log::info("[5/6] Config watcher initializing...");
            watcher = std::make_shared<ConfigWatcher>(
                config_file, std::chrono::seconds{cfg.config_watcher.poll_interval_seconds});

            watcher->set_callback([service](const GatewayConfig& new_cfg) {
                if (const auto level = utils::log::parse_level(new_cfg.logging.level)) {
                    utils::log::set_level(*level);
                }
                const auto closed = service->update_tables(new_cfg.tables);
                utils::log::info(std::format("Tables reloaded: {} configured, {} stream(s) closed",
                    new_cfg.tables.size(), closed.size()));
            });
            watcher->start();
        } else {
            utils::log::info("[5/6] Config watcher: disabled");
        }

        std::thread signal_thread(signal_wait_loop, signals, shutdown, watcher, server);

        // =====================================================================
        // [6/6] Serve (blocking until stop)
        // =====================================================================
        utils::log::info(std::format("[6/6] Ready on {}://{}:{} ({} tables)",
            cfg.server.tls.enabled ? "https" : "http",
            cfg.server.host, cfg.server.port, cfg.tables.size()));

        int exit_code = 0;
        try {
            server->start();
        } catch (const std::exception& e) {
            utils::log::error(std::format("Fatal: {}", e.what()));
            exit_code = 1;
        }

        // Wake the signal thread if the server stopped on its own
        if (!shutdown->is_shutting_down()) {
            ::kill(::getpid(), SIGTERM);
        }
        signal_thread.join();

        registry->close_all();
        dispatcher->shutdown();

        const auto stats = registry->get_stats();
        utils::log::info(std::format("Shutdown complete ({} streams created, {} records submitted)",
            stats.creations, stats.records_submitted));
        return exit_code;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
