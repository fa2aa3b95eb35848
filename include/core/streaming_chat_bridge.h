#pragma once

#include <cstddef>
#include <memory>

#include "core/chat_types.h"
#include "core/event_channel.h"
#include "core/model_normalizer.h"
#include "upstream/ollama_client.h"

namespace chatgw {

// Prefix of the last event when the upstream stream broke after it started.
constexpr const char* kStreamErrorPrefix = "__ERR__:";
// Payload used when the upstream rejected the request and its body was unreadable.
constexpr const char* kUnknownUpstreamError = "unknown error from ollama";

constexpr size_t kDefaultStreamQueueCapacity = 16;

/// Streaming chat: relays the upstream body to the caller one event per
/// received chunk. Each call gets its own relay thread that feeds the
/// returned channel; the channel is closed when the relay ends.
class StreamingChatBridge {
public:
    StreamingChatBridge(const OllamaClient& client, const ModelNormalizer& normalizer,
                        size_t queue_capacity = kDefaultStreamQueueCapacity);

    /// Starts the relay and returns immediately. The consumer pops events
    /// until std::nullopt, or closes the channel to abandon the stream.
    std::shared_ptr<EventChannel> handle(const ChatRequest& request) const;

    /// Runs one relay to completion on the calling thread and closes `channel`.
    /// Stream counting is left to the caller.
    static void relay(const OllamaClient& client, const UpstreamChatRequest& request,
                      EventChannel& channel);

private:
    const OllamaClient& client_;
    const ModelNormalizer& normalizer_;
    size_t queue_capacity_;
};

}  // namespace chatgw
