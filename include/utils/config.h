#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "upstream/ollama_client.h"

namespace chatgw {

struct GatewayConfig {
    int port{8080};
    std::string bind_address{"127.0.0.1"};
    std::string upstream_url{"http://127.0.0.1:11434"};
    std::string upstream_chat_path{"/api/chat"};
    int upstream_connect_timeout_sec{10};
    int upstream_read_timeout_sec{86400};
    bool upstream_tls_verify{true};
    std::string default_model{"llama3:8b"};
    std::map<std::string, std::string> model_aliases{{"llama3.1", "llama3:8b"}};
    size_t stream_queue_capacity{16};
    // Request workers; each open stream occupies one for its whole lifetime
    size_t worker_threads{64};
    // How long shutdown waits for stream relays to finish
    int shutdown_grace_ms{5000};
    bool cors_enabled{true};
    std::string cors_allow_origin{"*"};
    std::string cors_allow_methods{"GET, POST, OPTIONS"};
    std::string cors_allow_headers{"*"};
    bool gzip_enabled{true};
};

struct UpstreamUrl {
    std::string scheme;
    std::string host;
    int port{11434};
};

// Accepts "host", "host:port" and "http[s]://host[:port][/...]". Without a
// port, http uses 11434 and https 443. Other schemes are rejected.
std::optional<UpstreamUrl> parseUpstreamUrl(const std::string& url, std::string* error = nullptr);

// Connection settings for OllamaClient. Throws std::invalid_argument if
// upstream_url cannot be parsed.
UpstreamEndpoint toUpstreamEndpoint(const GatewayConfig& cfg);

GatewayConfig loadGatewayConfig();
std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog();

}  // namespace chatgw
