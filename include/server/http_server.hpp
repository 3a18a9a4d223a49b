#pragma once

#include "config/config_types.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in the header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace ingestgate {

class IngestService;
struct ServiceResponse;

/**
 * @brief HTTP binding of IngestService
 *
 * Routes:
 *   GET  /                     service info and per-table endpoints
 *   GET  /health               global health, active streams
 *   GET  /health/{table}       per-table stream state
 *   POST /ingest/{table}       ?wait_for_ack=true waits for durability
 *   POST /flush/{table}        drain the table's stream
 *   GET  /metrics              Prometheus text
 *
 * start() blocks in listen() until stop() is called from another thread.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<IngestService> service, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve; throws std::runtime_error if the socket cannot be bound.
    void start();

    /// Stop listening; safe to call from any thread, and before start().
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    /// Message for an exception that escaped a route handler, of any type.
    [[nodiscard]] static std::string describe_exception(std::exception_ptr ep);

private:
    void register_routes(httplib::Server& svr);

    static void write_response(const ServiceResponse& response, httplib::Response& res);
    static bool wants_ack(const httplib::Request& req);

    std::shared_ptr<IngestService> service_;
    const ServerConfig config_;

    std::unique_ptr<httplib::Server> server_;
    std::mutex server_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace ingestgate
