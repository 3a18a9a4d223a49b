#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/ingest_service.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace ingestgate {

HttpServer::HttpServer(std::shared_ptr<IngestService> service, ServerConfig config)
    : service_(std::move(service)),
      config_(std::move(config)) {}

HttpServer::~HttpServer() {
    stop();
}

std::string HttpServer::describe_exception(std::exception_ptr ep) {
    if (!ep) {
        return "unknown error";
    }
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

// ============================================================================
// start(): creates server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    std::unique_ptr<httplib::Server> svr_ptr;
    if (config_.tls.enabled) {
        const char* ca_cert_path = (config_.tls.require_client_cert && !config_.tls.ca_file.empty())
            ? config_.tls.ca_file.c_str() : nullptr;
        auto ssl_svr = std::make_unique<httplib::SSLServer>(
            config_.tls.cert_file.c_str(), config_.tls.key_file.c_str(), ca_cert_path);
        if (!ssl_svr->is_valid()) {
            throw std::runtime_error(std::format("Invalid TLS configuration (cert={}, key={})",
                config_.tls.cert_file, config_.tls.key_file));
        }
        utils::log::info(std::format("TLS enabled: cert={}, key={}, mTLS={}",
            config_.tls.cert_file, config_.tls.key_file,
            config_.tls.require_client_cert ? "required" : "off"));
        svr_ptr = std::move(ssl_svr);
    } else {
        svr_ptr = std::make_unique<httplib::Server>();
    }

    const size_t pool_size = config_.thread_pool_size > 0 ? config_.thread_pool_size : 1;
    svr_ptr->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr_ptr->set_payload_max_length(config_.max_body_bytes);

    register_routes(*svr_ptr);

    httplib::Server* svr = nullptr;
    {
        std::lock_guard lock(server_mutex_);
        if (stop_requested_.load()) {
            return;
        }
        server_ = std::move(svr_ptr);
        svr = server_.get();
    }

    utils::log::info(std::format("Starting {} on {}:{} ({}, {} threads)",
        http::kServiceName, config_.host, config_.port,
        config_.tls.enabled ? "HTTPS" : "HTTP", pool_size));

    running_.store(true);
    const bool ok = svr->listen(config_.host, config_.port);
    running_.store(false);

    if (!ok && !stop_requested_.load()) {
        throw std::runtime_error(std::format("Failed to start HTTP server on {}:{}",
            config_.host, config_.port));
    }
}

void HttpServer::stop() {
    std::lock_guard lock(server_mutex_);
    if (stop_requested_.exchange(true)) {
        return;
    }
    if (server_) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

// ============================================================================
// Routes
// ============================================================================

void HttpServer::register_routes(httplib::Server& svr) {
    svr.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        write_response(service_->root(), res);
    });
    svr.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        write_response(service_->health(), res);
    });
    svr.Get(http::kTableHealthPattern, [this](const httplib::Request& req, httplib::Response& res) {
        write_response(service_->table_health(req.matches[1].str()), res);
    });
    svr.Post(http::kIngestPattern, [this](const httplib::Request& req, httplib::Response& res) {
        write_response(service_->ingest(req.matches[1].str(), req.body, wants_ack(req)), res);
    });
    svr.Post(http::kFlushPattern, [this](const httplib::Request& req, httplib::Response& res) {
        write_response(service_->flush(req.matches[1].str()), res);
    });
    svr.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
        write_response(service_->metrics(), res);
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                 std::exception_ptr ep) {
        utils::log::error(std::format("Unhandled exception on {} {}: {}",
            req.method, req.path, describe_exception(ep)));
        write_response(IngestService::error_response(500, "Internal server error"), res);
    });
}

void HttpServer::write_response(const ServiceResponse& response, httplib::Response& res) {
    res.status = response.status;
    res.set_content(response.body, response.content_type);
}

bool HttpServer::wants_ack(const httplib::Request& req) {
    if (!req.has_param("wait_for_ack")) {
        return false;
    }
    const std::string value = utils::to_lower(req.get_param_value("wait_for_ack"));
    return value == "true" || value == "1" || value == "yes";
}

} // namespace ingestgate
