#include "core/streaming_chat_bridge.h"

#include <string_view>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

#include "runtime/state.h"
#include "utils/utf8.h"

namespace chatgw {

StreamingChatBridge::StreamingChatBridge(const OllamaClient& client, const ModelNormalizer& normalizer,
                                         size_t queue_capacity)
    : client_(client), normalizer_(normalizer), queue_capacity_(queue_capacity) {}

std::shared_ptr<EventChannel> StreamingChatBridge::handle(const ChatRequest& request) const {
    UpstreamChatRequest upstream;
    upstream.model = normalizer_.normalize(request.model);
    upstream.messages = request.messages;
    upstream.stream = true;
    spdlog::info("using model (stream): {}", upstream.model);

    auto channel = std::make_shared<EventChannel>(queue_capacity_);
    // Counted from here so a shutdown that starts before the thread runs
    // still waits for it.
    auto guard = std::make_shared<StreamGuard>();
    try {
        // The relay owns copies of everything it touches; it may outlive the
        // handler and the bridge. It is not joined: shutdown cancels the
        // upstream calls and waits on the stream count instead.
        std::thread([client = client_, upstream = std::move(upstream), channel, guard]() mutable {
            relay(client, upstream, *channel);
            guard.reset();
        }).detach();
    } catch (const std::system_error& e) {
        spdlog::error("failed to start stream relay: {}", e.what());
        channel->push(std::string("Error contacting Ollama API: ") + e.what());
        channel->close();
    }
    return channel;
}

void StreamingChatBridge::relay(const OllamaClient& client, const UpstreamChatRequest& request,
                                EventChannel& channel) {
    size_t forwarded = 0;

    auto result = client.chatStream(request, [&channel, &forwarded](const char* data, size_t length) {
        if (!channel.push(decode_chunk_text(std::string_view(data, length)))) {
            return false;  // consumer is gone
        }
        ++forwarded;
        return true;
    });

    switch (result.error) {
        case UpstreamError::None:
            spdlog::debug("stream relay finished: {} chunks", forwarded);
            break;
        case UpstreamError::Canceled:
            spdlog::info("stream relay canceled after {} chunks", forwarded);
            break;
        case UpstreamError::Connection:
            spdlog::error("failed to send request to ollama (stream): {}", result.detail);
            channel.push("Error contacting Ollama API: " + result.detail);
            break;
        case UpstreamError::Status:
            spdlog::warn("ollama responded with status {} (stream)", result.status);
            channel.push(result.body_incomplete ? std::string(kUnknownUpstreamError)
                                                : decode_lossy(result.body));
            break;
        case UpstreamError::Read:
            spdlog::error("ollama stream broke after {} chunks: {}", forwarded, result.detail);
            channel.push(kStreamErrorPrefix + result.detail);
            break;
    }
    channel.close();
}

}  // namespace chatgw
