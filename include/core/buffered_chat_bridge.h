#pragma once

#include "core/chat_types.h"
#include "core/model_normalizer.h"
#include "upstream/ollama_client.h"

namespace chatgw {

/// Non-streaming chat: one upstream call, one flat answer. Every failure is
/// reported as the answer text; handle() never throws for upstream problems.
class BufferedChatBridge {
public:
    BufferedChatBridge(const OllamaClient& client, const ModelNormalizer& normalizer);

    ChatResponse handle(const ChatRequest& request) const;

private:
    const OllamaClient& client_;
    const ModelNormalizer& normalizer_;
};

}  // namespace chatgw
