#pragma once

#include <httplib.h>
#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace chatgw {

class ChatEndpoints;

/// Runs before routing; returning false ends the request with whatever the
/// middleware put into the response.
using Middleware = std::function<bool(const httplib::Request&, httplib::Response&)>;
using AccessLogger = std::function<void(const httplib::Request&, const httplib::Response&)>;

/// Front HTTP server of the gateway. Owns the listener thread and the
/// cross-cutting behavior shared by all routes: CORS, request/trace ids,
/// gzip for buffered bodies and JSON error bodies.
class HttpServer {
public:
    HttpServer(int port, ChatEndpoints& chat, std::string bind_address = "127.0.0.1");
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Binds and starts listening on a background thread.
    /// Throws std::runtime_error if the address cannot be bound.
    void start();

    /// Ends open streams, then stops the listener and joins it.
    void stop();

    void addMiddleware(Middleware mw);
    void enableCors(bool enable) { cors_.enabled = enable; }
    void setCorsOrigin(std::string origin) { cors_.allow_origin = std::move(origin); }
    void setCorsMethods(std::string methods) { cors_.allow_methods = std::move(methods); }
    void setCorsHeaders(std::string headers) { cors_.allow_headers = std::move(headers); }
    void enableCompression(bool enable) { compression_enabled_ = enable; }
    void setLogger(AccessLogger logger) { access_logger_ = std::move(logger); }
    /// Size of the request worker pool. Every open event stream holds one
    /// worker until it ends. 0 keeps httplib's default pool.
    void setWorkerThreads(size_t count) { worker_threads_ = count; }

    int port() const { return port_; }
    bool isRunning() const { return running_.load(); }

    // Extra routes may be registered before start()
    httplib::Server& getServer() { return server_; }

private:
    struct CorsPolicy {
        bool enabled{true};
        std::string allow_origin{"*"};
        std::string allow_methods{"GET, POST, OPTIONS"};
        std::string allow_headers{"*"};
    };

    void installHandlers();
    httplib::Server::HandlerResponse preRoute(const httplib::Request& req, httplib::Response& res);
    void postRoute(const httplib::Request& req, httplib::Response& res);
    void applyCors(httplib::Response& res) const;
    void compressBody(const httplib::Request& req, httplib::Response& res) const;

    int port_;
    std::string bind_address_;
    ChatEndpoints& chat_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::vector<Middleware> middlewares_;
    CorsPolicy cors_;
    bool compression_enabled_{true};
    AccessLogger access_logger_{};
    size_t worker_threads_{0};
};

}  // namespace chatgw
