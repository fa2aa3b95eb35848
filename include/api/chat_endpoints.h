#pragma once

#include <httplib.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/buffered_chat_bridge.h"
#include "core/streaming_chat_bridge.h"

namespace chatgw {

/// Routes:
///   POST /api/chat         buffered answer, always 200 {"content": ...}
///   POST /api/chat/stream  text/event-stream, one event per upstream chunk
///   GET  /health
class ChatEndpoints {
public:
    ChatEndpoints(const BufferedChatBridge& buffered, const StreamingChatBridge& streaming,
                  std::string upstream_url = "");

    void registerRoutes(httplib::Server& server);

    /// Closes every stream still being written so blocked writers return.
    void closeAllStreams();

private:
    const BufferedChatBridge& buffered_;
    const StreamingChatBridge& streaming_;
    std::string upstream_url_;

    std::mutex streams_mutex_;
    std::vector<std::weak_ptr<EventChannel>> streams_;

    void trackStream(const std::shared_ptr<EventChannel>& channel);

    static void setJson(httplib::Response& res, const nlohmann::json& body);
    static void respondError(httplib::Response& res, int status, const std::string& code, const std::string& message);
};

}  // namespace chatgw
