#include "upstream/ollama_client.h"

#include <atomic>
#include <mutex>
#include <set>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace chatgw {

namespace {

bool is_success(int status) {
    return status >= 200 && status < 300;
}

httplib::Request build_request(const UpstreamEndpoint& endpoint, const UpstreamChatRequest& request) {
    httplib::Request req;
    req.method = "POST";
    req.path = endpoint.chat_path;
    req.body = nlohmann::json(request).dump();
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", request.stream ? "application/x-ndjson" : "application/json");
    return req;
}

void configure(httplib::Client& client, const UpstreamEndpoint& endpoint) {
    client.set_connection_timeout(endpoint.connect_timeout_sec, 0);
    client.set_read_timeout(endpoint.read_timeout_sec, 0);
    client.set_write_timeout(endpoint.connect_timeout_sec, 0);
    client.set_keep_alive(false);
    if (endpoint.scheme == "https") {
        client.enable_server_certificate_verification(endpoint.tls_verify);
    }
}

UpstreamResult invalid_client(const std::string& base_url) {
    UpstreamResult result;
    result.error = UpstreamError::Connection;
    result.detail = "invalid upstream url " + base_url;
    return result;
}

UpstreamResult canceled_result() {
    UpstreamResult result;
    result.error = UpstreamError::Canceled;
    result.detail = "upstream calls canceled";
    return result;
}

UpstreamResult classify_failure(httplib::Error err, bool head_received) {
    UpstreamResult result;
    result.detail = httplib::to_string(err);
    if (err == httplib::Error::Canceled) {
        result.error = UpstreamError::Canceled;
    } else if (head_received) {
        result.error = UpstreamError::Read;
    } else {
        result.error = UpstreamError::Connection;
    }
    return result;
}

}  // namespace

const char* to_string(UpstreamError error) {
    switch (error) {
        case UpstreamError::None:
            return "none";
        case UpstreamError::Connection:
            return "connection";
        case UpstreamError::Read:
            return "read";
        case UpstreamError::Status:
            return "status";
        case UpstreamError::Canceled:
            return "canceled";
    }
    return "unknown";
}

// Connections currently open to the upstream. stop() on a client shuts its
// socket down from another thread, which unblocks a pending read.
class OllamaClient::InFlight {
public:
    // Registers `client` for the lifetime of one call
    class Scope {
    public:
        Scope(InFlight& owner, httplib::Client& client) : owner_(owner), client_(client) {
            admitted_ = owner_.enter(&client_);
        }
        ~Scope() {
            if (admitted_) owner_.leave(&client_);
        }
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        bool admitted() const { return admitted_; }

    private:
        InFlight& owner_;
        httplib::Client& client_;
        bool admitted_{false};
    };

    void cancel() {
        std::lock_guard<std::mutex> lock(mutex_);
        canceled_ = true;
        for (auto* client : clients_) {
            client->stop();
        }
    }

    bool canceled() const { return canceled_.load(); }

private:
    bool enter(httplib::Client* client) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (canceled_) return false;
        clients_.insert(client);
        return true;
    }

    void leave(httplib::Client* client) {
        std::lock_guard<std::mutex> lock(mutex_);
        clients_.erase(client);
    }

    std::mutex mutex_;
    std::set<httplib::Client*> clients_;
    std::atomic<bool> canceled_{false};
};

OllamaClient::OllamaClient(UpstreamEndpoint endpoint)
    : endpoint_(std::move(endpoint)), in_flight_(std::make_shared<InFlight>()) {}

void OllamaClient::cancelAll() const {
    spdlog::info("Canceling upstream calls to {}", baseUrl());
    in_flight_->cancel();
}

bool OllamaClient::canceled() const {
    return in_flight_->canceled();
}

std::string OllamaClient::baseUrl() const {
    return endpoint_.scheme + "://" + endpoint_.host + ":" + std::to_string(endpoint_.port);
}

UpstreamResult OllamaClient::chat(const UpstreamChatRequest& request) const {
    // scheme://host:port selects plain or TLS transport
    httplib::Client client(baseUrl());
    if (!client.is_valid()) {
        return invalid_client(baseUrl());
    }
    configure(client, endpoint_);
    InFlight::Scope scope(*in_flight_, client);
    if (!scope.admitted()) {
        return canceled_result();
    }

    bool head_received = false;
    auto req = build_request(endpoint_, request);
    req.response_handler = [&head_received](const httplib::Response&) {
        head_received = true;
        return true;
    };

    httplib::Response res;
    httplib::Error err = httplib::Error::Success;
    if (!client.send(req, res, err)) {
        if (in_flight_->canceled()) {
            return canceled_result();
        }
        auto result = classify_failure(err, head_received);
        spdlog::debug("Upstream chat failed: kind={} detail={}", to_string(result.error), result.detail);
        return result;
    }

    UpstreamResult result;
    result.status = res.status;
    result.body = std::move(res.body);
    return result;
}

UpstreamResult OllamaClient::chatStream(const UpstreamChatRequest& request,
                                        const ChunkCallback& on_chunk) const {
    httplib::Client client(baseUrl());
    if (!client.is_valid()) {
        return invalid_client(baseUrl());
    }
    configure(client, endpoint_);
    InFlight::Scope scope(*in_flight_, client);
    if (!scope.admitted()) {
        return canceled_result();
    }

    const auto& in_flight = *in_flight_;
    bool head_received = false;
    int status = 0;
    std::string error_body;

    auto req = build_request(endpoint_, request);
    req.response_handler = [&head_received, &status](const httplib::Response& response) {
        head_received = true;
        status = response.status;
        return true;
    };
    req.content_receiver = [&status, &error_body, &on_chunk, &in_flight](
                               const char* data, size_t length, uint64_t /*offset*/, uint64_t /*total*/) {
        if (in_flight.canceled()) {
            return false;
        }
        if (!is_success(status)) {
            error_body.append(data, length);
            return true;
        }
        return on_chunk(data, length);
    };

    httplib::Response res;
    httplib::Error err = httplib::Error::Success;
    const bool sent = client.send(req, res, err);
    if (!sent && in_flight.canceled()) {
        return canceled_result();
    }

    if (head_received && !is_success(status)) {
        UpstreamResult result;
        result.error = UpstreamError::Status;
        result.status = status;
        if (sent) {
            result.detail = "HTTP " + std::to_string(status);
            result.body = std::move(error_body);
        } else {
            result.detail = httplib::to_string(err);
            result.body_incomplete = true;
        }
        return result;
    }

    if (!sent) {
        auto result = classify_failure(err, head_received);
        result.status = status;
        return result;
    }

    UpstreamResult result;
    result.status = status;
    return result;
}

}  // namespace chatgw
