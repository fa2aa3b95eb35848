#include "api/http_server.h"

#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "api/chat_endpoints.h"
#include "utils/gzip.h"
#include "utils/request_id.h"

namespace chatgw {

namespace {

std::string error_body(const std::string& code, const std::string& message, const std::string& path) {
    nlohmann::json body = {
        {"error", {{"code", code}, {"message", message}}},
        {"path", path}
    };
    return body.dump();
}

std::string describe(const std::exception_ptr& ep) {
    if (!ep) return "unknown";
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

}  // namespace

HttpServer::HttpServer(int port, ChatEndpoints& chat, std::string bind_address)
    : port_(port), bind_address_(std::move(bind_address)), chat_(chat) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::addMiddleware(Middleware mw) {
    middlewares_.push_back(std::move(mw));
}

void HttpServer::applyCors(httplib::Response& res) const {
    if (!cors_.enabled) return;
    if (!res.has_header("Access-Control-Allow-Origin"))
        res.set_header("Access-Control-Allow-Origin", cors_.allow_origin);
    if (!res.has_header("Access-Control-Allow-Methods"))
        res.set_header("Access-Control-Allow-Methods", cors_.allow_methods);
    if (!res.has_header("Access-Control-Allow-Headers"))
        res.set_header("Access-Control-Allow-Headers", cors_.allow_headers);
}

httplib::Server::HandlerResponse HttpServer::preRoute(const httplib::Request& req, httplib::Response& res) {
    // Short-circuited responses skip post-routing, so CORS goes on here too
    applyCors(res);
    if (cors_.enabled && req.method == "OPTIONS") {
        res.status = 204;
        return httplib::Server::HandlerResponse::Handled;
    }

    auto request_id = req.get_header_value("X-Request-Id");
    res.set_header("X-Request-Id", request_id.empty() ? generate_request_id() : request_id);

    // Continue the caller's trace under a new span
    const auto trace_id = parse_trace_id(req.get_header_value("traceparent")).value_or(generate_trace_id());
    res.set_header("traceparent", "00-" + trace_id + "-" + generate_span_id() + "-01");

    for (auto& mw : middlewares_) {
        if (!mw(req, res)) return httplib::Server::HandlerResponse::Handled;
    }
    return httplib::Server::HandlerResponse::Unhandled;
}

void HttpServer::compressBody(const httplib::Request& req, httplib::Response& res) const {
    // Event streams have no body yet at this point and are never compressed
    if (res.body.empty() || res.has_header("Content-Encoding")) return;
    if (!accepts_gzip(req.get_header_value("Accept-Encoding"))) return;

    auto compressed = gzip_compress(res.body);
    if (!compressed) {
        spdlog::warn("gzip failed for {}, sending identity body", req.path);
        return;
    }

    auto content_type = res.get_header_value("Content-Type");
    if (content_type.empty()) content_type = "application/octet-stream";
    const auto length = compressed->size();
    res.set_content(std::move(*compressed), content_type);
    // Content-Length was already computed for the identity body
    auto stale = res.headers.equal_range("Content-Length");
    res.headers.erase(stale.first, stale.second);
    res.set_header("Content-Length", std::to_string(length));
    res.set_header("Content-Encoding", "gzip");
    res.set_header("Vary", "Accept-Encoding");
}

void HttpServer::postRoute(const httplib::Request& req, httplib::Response& res) {
    applyCors(res);
    if (compression_enabled_) {
        compressBody(req, res);
    }
}

void HttpServer::installHandlers() {
    server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        return preRoute(req, res);
    });
    server_.set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        postRoute(req, res);
    });

    if (access_logger_) {
        server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
            access_logger_(req, res);
        });
    }

    server_.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        // Routes that already wrote an error body keep it
        if (!res.body.empty()) return;
        const bool not_found = res.status == 404;
        res.set_content(error_body(not_found ? "not_found" : "http_error",
                                   not_found ? "no route for " + req.method + " " + req.path
                                             : "HTTP " + std::to_string(res.status),
                                   req.path),
                        "application/json");
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        const auto what = describe(ep);
        spdlog::error("Unhandled exception on {} {}: {}", req.method, req.path, what);
        res.status = 500;
        res.set_content(error_body("internal_error", what, req.path), "application/json");
    });
}

void HttpServer::start() {
    if (running_) return;

    installHandlers();
    chat_.registerRoutes(server_);
    if (worker_threads_ > 0) {
        const auto count = worker_threads_;
        server_.new_task_queue = [count] { return new httplib::ThreadPool(count); };
    }

    if (!server_.bind_to_port(bind_address_, port_)) {
        throw std::runtime_error("failed to bind " + bind_address_ + ":" + std::to_string(port_));
    }

    spdlog::debug("Listening on {}:{} with {} workers", bind_address_, port_,
                  worker_threads_ > 0 ? std::to_string(worker_threads_) : std::string("default"));
    running_ = true;
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void HttpServer::stop() {
    if (!running_) return;
    chat_.closeAllStreams();
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace chatgw
