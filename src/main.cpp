#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

#include "api/chat_endpoints.h"
#include "api/http_server.h"
#include "core/buffered_chat_bridge.h"
#include "core/model_normalizer.h"
#include "core/streaming_chat_bridge.h"
#include "runtime/state.h"
#include "upstream/ollama_client.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

void applyServeOptions(chatgw::GatewayConfig& cfg, const chatgw::ServeOptions& opts) {
    if (opts.port != 0) cfg.port = opts.port;
    if (!opts.host.empty()) cfg.bind_address = opts.host;
    if (!opts.upstream.empty()) cfg.upstream_url = opts.upstream;
    if (!opts.default_model.empty()) cfg.default_model = opts.default_model;
}

void signalHandler(int) {
    chatgw::request_shutdown();
}

}  // namespace

int run_gateway(const chatgw::GatewayConfig& cfg, const std::string& config_sources) {
    chatgw::g_running_flag.store(true);

    try {
        chatgw::logger::init_from_env();
        spdlog::info("chatgw {} starting (config {})", CHATGW_VERSION, config_sources);

        // Shared for the lifetime of the process; read-only after this point.
        const chatgw::OllamaClient upstream(chatgw::toUpstreamEndpoint(cfg));
        const chatgw::ModelNormalizer normalizer(cfg.default_model, cfg.model_aliases);
        spdlog::info("Upstream: {}{} default model: {}",
                     upstream.baseUrl(), upstream.endpoint().chat_path, normalizer.defaultModel());

        chatgw::BufferedChatBridge buffered(upstream, normalizer);
        chatgw::StreamingChatBridge streaming(upstream, normalizer, cfg.stream_queue_capacity);
        chatgw::ChatEndpoints endpoints(buffered, streaming, upstream.baseUrl());

        chatgw::HttpServer server(cfg.port, endpoints, cfg.bind_address);
        server.enableCors(cfg.cors_enabled);
        server.setCorsOrigin(cfg.cors_allow_origin);
        server.setCorsMethods(cfg.cors_allow_methods);
        server.setCorsHeaders(cfg.cors_allow_headers);
        server.enableCompression(cfg.gzip_enabled);
        server.setWorkerThreads(cfg.worker_threads);
        server.setLogger([](const httplib::Request& req, const httplib::Response& res) {
            spdlog::info("{} {} {} {}", req.remote_addr, req.method, req.path, res.status);
        });

        server.start();
        spdlog::info("Server running on {}:{}", cfg.bind_address, cfg.port);

        while (chatgw::is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutting down ({} streams active)", chatgw::active_stream_count());
        // Unblock relays waiting on the upstream before the workers are joined
        upstream.cancelAll();
        server.stop();
        if (!chatgw::wait_for_streams_idle(std::chrono::milliseconds(cfg.shutdown_grace_ms))) {
            spdlog::warn("{} stream relays still running after {} ms",
                         chatgw::active_stream_count(), cfg.shutdown_grace_ms);
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("Gateway shutdown complete");
    return 0;
}

int main(int argc, char* argv[]) {
    auto cli_result = chatgw::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif

    auto [cfg, sources] = chatgw::loadGatewayConfigWithLog();
    applyServeOptions(cfg, cli_result.serve_options);
    sources += " command=" + chatgw::subcommandToString(cli_result.subcommand);
    return run_gateway(cfg, sources);
}
