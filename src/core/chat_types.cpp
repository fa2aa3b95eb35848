#include "core/chat_types.h"

#include "utils/json_utils.h"

namespace chatgw {

void to_json(nlohmann::json& j, const ChatMessage& m) {
    j = nlohmann::json{{"role", m.role}, {"content", m.content}};
}

void from_json(const nlohmann::json& j, ChatMessage& m) {
    j.at("role").get_to(m.role);
    j.at("content").get_to(m.content);
}

void to_json(nlohmann::json& j, const UpstreamChatRequest& r) {
    j = nlohmann::json{
        {"model", r.model},
        {"messages", r.messages},
        {"stream", r.stream}
    };
}

void to_json(nlohmann::json& j, const ChatResponse& r) {
    j = nlohmann::json{{"content", r.content}};
}

std::optional<ChatRequest> parse_chat_request(const std::string& body, std::string* error) {
    std::string parse_error;
    auto parsed = parse_json(body, &parse_error);
    if (!parsed) {
        if (error) *error = "invalid JSON: " + parse_error;
        return std::nullopt;
    }
    const auto& j = *parsed;
    if (!j.is_object()) {
        if (error) *error = "request body must be a JSON object";
        return std::nullopt;
    }

    std::string missing;
    if (!has_required_keys(j, {"messages"}, &missing)) {
        if (error) *error = "missing field: " + missing;
        return std::nullopt;
    }
    if (!j["messages"].is_array()) {
        if (error) *error = "messages must be an array";
        return std::nullopt;
    }

    ChatRequest req;
    req.messages.reserve(j["messages"].size());
    for (const auto& item : j["messages"]) {
        if (!item.is_object() || !item.contains("role") || !item.contains("content") ||
            !item["role"].is_string() || !item["content"].is_string()) {
            if (error) *error = "each message needs string role and content";
            return std::nullopt;
        }
        req.messages.push_back(item.get<ChatMessage>());
    }

    if (!is_unset(j, "model")) {
        if (!j["model"].is_string()) {
            if (error) *error = "model must be a string";
            return std::nullopt;
        }
        req.model = j["model"].get<std::string>();
    }
    if (!is_unset(j, "stream")) {
        if (!j["stream"].is_boolean()) {
            if (error) *error = "stream must be a boolean";
            return std::nullopt;
        }
        req.stream = j["stream"].get<bool>();
    }
    return req;
}

}  // namespace chatgw
