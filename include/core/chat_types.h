#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace chatgw {

struct ChatMessage {
    std::string role;
    std::string content;
};

// Body accepted by /api/chat and /api/chat/stream.
// `stream` is accepted for compatibility but the endpoint decides the mode.
struct ChatRequest {
    std::vector<ChatMessage> messages;
    std::optional<std::string> model;
    std::optional<bool> stream;
};

// Body sent to the inference server's chat endpoint.
struct UpstreamChatRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    bool stream{false};
};

struct ChatResponse {
    std::string content;
};

void to_json(nlohmann::json& j, const ChatMessage& m);
void from_json(const nlohmann::json& j, ChatMessage& m);
void to_json(nlohmann::json& j, const UpstreamChatRequest& r);
void to_json(nlohmann::json& j, const ChatResponse& r);

/// Parse an inbound chat request body.
/// @param body Raw request body
/// @param error Receives a human readable reason when parsing fails
/// @return Parsed request, or std::nullopt if the body is not a valid ChatRequest
std::optional<ChatRequest> parse_chat_request(const std::string& body, std::string* error = nullptr);

}  // namespace chatgw
