#include "core/buffered_chat_bridge.h"

#include <spdlog/spdlog.h>

#include "core/content_extractor.h"
#include "utils/json_utils.h"
#include "utils/utf8.h"

namespace chatgw {

BufferedChatBridge::BufferedChatBridge(const OllamaClient& client, const ModelNormalizer& normalizer)
    : client_(client), normalizer_(normalizer) {}

ChatResponse BufferedChatBridge::handle(const ChatRequest& request) const {
    UpstreamChatRequest upstream;
    upstream.model = normalizer_.normalize(request.model);
    upstream.messages = request.messages;
    upstream.stream = false;
    spdlog::info("using model: {}", upstream.model);

    auto result = client_.chat(upstream);
    if (result.error == UpstreamError::Read) {
        spdlog::error("failed to read response body: {}", result.detail);
        return {"Failed to read response body: " + result.detail};
    }
    if (!result.ok()) {
        spdlog::error("failed to send request to ollama: {}", result.detail);
        return {"Error contacting Ollama API: " + result.detail};
    }

    std::string parse_error;
    auto document = parse_json(result.body, &parse_error);
    if (!document) {
        auto text = decode_lossy(result.body);
        spdlog::warn("invalid json from ollama: {} body: {}", parse_error, text);
        return {text};
    }

    if (auto content = extract_content(*document)) {
        return {*content};
    }
    spdlog::debug("no content field in upstream response (status {}), returning raw body", result.status);
    return {result.body};
}

}  // namespace chatgw
