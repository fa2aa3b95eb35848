#include "utils/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace chatgw {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

/// Get environment variable with fallback to another name
std::optional<std::string> getEnvWithFallback(const char* name, const char* fallback) {
    if (auto v = getEnvValue(name)) {
        return v;
    }
    if (auto v = getEnvValue(fallback)) {
        spdlog::debug("Environment variable '{}' not set, using '{}'", name, fallback);
        return v;
    }
    return std::nullopt;
}

std::optional<bool> parseBool(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    return std::nullopt;
}

std::filesystem::path defaultConfigPath() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) return {};
    return home / ".chatgw/config.json";
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    try {
        ifs >> out;
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring config file {}: {}", path.string(), e.what());
        return false;
    }
}

void applyJson(GatewayConfig& cfg, const nlohmann::json& j) {
    if (!j.is_object()) return;
    if (j.contains("port") && j["port"].is_number_integer()) {
        cfg.port = j["port"].get<int>();
    }
    if (j.contains("bind_address") && j["bind_address"].is_string()) {
        cfg.bind_address = j["bind_address"].get<std::string>();
    }
    if (j.contains("upstream_url") && j["upstream_url"].is_string()) {
        cfg.upstream_url = j["upstream_url"].get<std::string>();
    }
    if (j.contains("upstream_chat_path") && j["upstream_chat_path"].is_string()) {
        cfg.upstream_chat_path = j["upstream_chat_path"].get<std::string>();
    }
    if (j.contains("upstream_connect_timeout_sec") && j["upstream_connect_timeout_sec"].is_number_integer()) {
        cfg.upstream_connect_timeout_sec = j["upstream_connect_timeout_sec"].get<int>();
    }
    if (j.contains("upstream_read_timeout_sec") && j["upstream_read_timeout_sec"].is_number_integer()) {
        cfg.upstream_read_timeout_sec = j["upstream_read_timeout_sec"].get<int>();
    }
    if (j.contains("upstream_tls_verify") && j["upstream_tls_verify"].is_boolean()) {
        cfg.upstream_tls_verify = j["upstream_tls_verify"].get<bool>();
    }
    if (j.contains("default_model") && j["default_model"].is_string()) {
        cfg.default_model = j["default_model"].get<std::string>();
    }
    if (j.contains("model_aliases") && j["model_aliases"].is_object()) {
        for (const auto& [alias, target] : j["model_aliases"].items()) {
            if (target.is_string()) {
                cfg.model_aliases[alias] = target.get<std::string>();
            }
        }
    }
    if (j.contains("stream_queue_capacity") && j["stream_queue_capacity"].is_number_unsigned()) {
        auto v = j["stream_queue_capacity"].get<size_t>();
        if (v > 0) cfg.stream_queue_capacity = v;
    }
    if (j.contains("worker_threads") && j["worker_threads"].is_number_unsigned()) {
        auto v = j["worker_threads"].get<size_t>();
        if (v > 0) cfg.worker_threads = v;
    }
    if (j.contains("shutdown_grace_ms") && j["shutdown_grace_ms"].is_number_unsigned()) {
        cfg.shutdown_grace_ms = j["shutdown_grace_ms"].get<int>();
    }
    if (j.contains("cors_enabled") && j["cors_enabled"].is_boolean()) {
        cfg.cors_enabled = j["cors_enabled"].get<bool>();
    }
    if (j.contains("cors_allow_origin") && j["cors_allow_origin"].is_string()) {
        cfg.cors_allow_origin = j["cors_allow_origin"].get<std::string>();
    }
    if (j.contains("cors_allow_methods") && j["cors_allow_methods"].is_string()) {
        cfg.cors_allow_methods = j["cors_allow_methods"].get<std::string>();
    }
    if (j.contains("cors_allow_headers") && j["cors_allow_headers"].is_string()) {
        cfg.cors_allow_headers = j["cors_allow_headers"].get<std::string>();
    }
    if (j.contains("gzip_enabled") && j["gzip_enabled"].is_boolean()) {
        cfg.gzip_enabled = j["gzip_enabled"].get<bool>();
    }
}

std::optional<int> parsePositiveInt(const std::string& value) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size() || v <= 0) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

std::optional<UpstreamUrl> parseUpstreamUrl(const std::string& url, std::string* error) {
    UpstreamUrl out;
    out.scheme = "http";
    std::string rest = url;

    auto scheme_pos = rest.find("://");
    if (scheme_pos != std::string::npos) {
        out.scheme = rest.substr(0, scheme_pos);
        std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        rest = rest.substr(scheme_pos + 3);
    }
    if (out.scheme == "https") {
        out.port = 443;
    } else if (out.scheme != "http") {
        if (error) *error = "unsupported scheme: " + out.scheme;
        return std::nullopt;
    }

    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        auto port = parsePositiveInt(rest.substr(colon + 1));
        if (!port || *port > 65535) {
            if (error) *error = "invalid port in upstream url: " + url;
            return std::nullopt;
        }
        out.port = *port;
        rest = rest.substr(0, colon);
    }

    if (rest.empty()) {
        if (error) *error = "missing host in upstream url: " + url;
        return std::nullopt;
    }
    out.host = rest;
    return out;
}

UpstreamEndpoint toUpstreamEndpoint(const GatewayConfig& cfg) {
    std::string error;
    auto url = parseUpstreamUrl(cfg.upstream_url, &error);
    if (!url) {
        throw std::invalid_argument(error);
    }
    UpstreamEndpoint endpoint;
    endpoint.scheme = url->scheme;
    endpoint.host = url->host;
    endpoint.port = url->port;
    endpoint.chat_path = cfg.upstream_chat_path.empty() ? "/api/chat" : cfg.upstream_chat_path;
    endpoint.connect_timeout_sec = cfg.upstream_connect_timeout_sec;
    endpoint.read_timeout_sec = cfg.upstream_read_timeout_sec;
    endpoint.tls_verify = cfg.upstream_tls_verify;
    return endpoint;
}

std::pair<GatewayConfig, std::string> loadGatewayConfigWithLog() {
    GatewayConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    // file
    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("CHATGW_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }

    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJson(cfg_path, j)) {
            applyJson(cfg, j);
            log << "file=" << cfg_path.string() << " ";
            used_file = true;
        }
    }

    // env overrides
    if (auto v = getEnvValue("CHATGW_PORT")) {
        if (auto port = parsePositiveInt(*v)) {
            cfg.port = *port;
            log << "env:PORT=" << cfg.port << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("CHATGW_BIND_ADDRESS")) {
        cfg.bind_address = *v;
        log << "env:BIND_ADDRESS=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvWithFallback("CHATGW_UPSTREAM_URL", "OLLAMA_HOST")) {
        cfg.upstream_url = *v;
        log << "env:UPSTREAM_URL=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("CHATGW_UPSTREAM_CHAT_PATH")) {
        cfg.upstream_chat_path = *v;
        log << "env:UPSTREAM_CHAT_PATH=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("CHATGW_UPSTREAM_CONNECT_TIMEOUT")) {
        if (auto secs = parsePositiveInt(*v)) {
            cfg.upstream_connect_timeout_sec = *secs;
            log << "env:UPSTREAM_CONNECT_TIMEOUT=" << *secs << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("CHATGW_UPSTREAM_READ_TIMEOUT")) {
        if (auto secs = parsePositiveInt(*v)) {
            cfg.upstream_read_timeout_sec = *secs;
            log << "env:UPSTREAM_READ_TIMEOUT=" << *secs << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("CHATGW_UPSTREAM_TLS_VERIFY")) {
        if (auto flag = parseBool(*v)) {
            cfg.upstream_tls_verify = *flag;
            log << "env:UPSTREAM_TLS_VERIFY=" << (*flag ? "on" : "off") << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("CHATGW_DEFAULT_MODEL")) {
        if (!v->empty()) {
            cfg.default_model = *v;
            log << "env:DEFAULT_MODEL=" << *v << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("CHATGW_STREAM_QUEUE_CAPACITY")) {
        if (auto cap = parsePositiveInt(*v)) {
            cfg.stream_queue_capacity = static_cast<size_t>(*cap);
            log << "env:STREAM_QUEUE_CAPACITY=" << *cap << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("CHATGW_WORKER_THREADS")) {
        if (auto count = parsePositiveInt(*v)) {
            cfg.worker_threads = static_cast<size_t>(*count);
            log << "env:WORKER_THREADS=" << *count << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("CHATGW_GZIP")) {
        if (auto flag = parseBool(*v)) {
            cfg.gzip_enabled = *flag;
            log << "env:GZIP=" << (*flag ? "on" : "off") << " ";
            used_env = true;
        }
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

GatewayConfig loadGatewayConfig() {
    auto info = loadGatewayConfigWithLog();
    return info.first;
}

}  // namespace chatgw
