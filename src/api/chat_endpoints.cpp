#include "api/chat_endpoints.h"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "core/chat_types.h"
#include "runtime/state.h"
#include "utils/sse.h"
#include "utils/version.h"

namespace chatgw {

using json = nlohmann::json;

ChatEndpoints::ChatEndpoints(const BufferedChatBridge& buffered, const StreamingChatBridge& streaming,
                             std::string upstream_url)
    : buffered_(buffered), streaming_(streaming), upstream_url_(std::move(upstream_url)) {}

void ChatEndpoints::setJson(httplib::Response& res, const json& body) {
    // Text that slipped through undecoded must not turn a reply into a 500
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void ChatEndpoints::respondError(httplib::Response& res, int status, const std::string& code,
                                 const std::string& message) {
    res.status = status;
    setJson(res, {{"error", {{"code", code}, {"message", message}}}});
}

void ChatEndpoints::trackStream(const std::shared_ptr<EventChannel>& channel) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_.erase(std::remove_if(streams_.begin(), streams_.end(),
                                  [](const std::weak_ptr<EventChannel>& w) { return w.expired(); }),
                   streams_.end());
    streams_.push_back(channel);
}

void ChatEndpoints::closeAllStreams() {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for (auto& weak : streams_) {
        if (auto channel = weak.lock()) {
            channel->close();
        }
    }
    streams_.clear();
}

void ChatEndpoints::registerRoutes(httplib::Server& server) {
    server.Post("/api/chat", [this](const httplib::Request& req, httplib::Response& res) {
        std::string error;
        auto parsed = parse_chat_request(req.body, &error);
        if (!parsed) {
            respondError(res, 400, "invalid_request", error);
            return;
        }
        auto response = buffered_.handle(*parsed);
        setJson(res, json(response));
    });

    server.Post("/api/chat/stream", [this](const httplib::Request& req, httplib::Response& res) {
        std::string error;
        auto parsed = parse_chat_request(req.body, &error);
        if (!parsed) {
            respondError(res, 400, "invalid_request", error);
            return;
        }

        auto channel = streaming_.handle(*parsed);
        trackStream(channel);

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider("text/event-stream",
            [channel](size_t /*offset*/, httplib::DataSink& sink) {
                auto event = channel->pop();
                if (!event) {
                    sink.done();
                    return true;
                }
                const std::string frame = format_sse_event(*event);
                if (!sink.write(frame.data(), frame.size())) {
                    channel->close();
                    return false;
                }
                return true;
            },
            [channel](bool success) {
                if (!success) {
                    spdlog::debug("stream writer ended early, closing relay channel");
                }
                channel->close();
            });
    });

    server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        json body = {
            {"status", "ok"},
            {"version", CHATGW_VERSION},
            {"active_streams", active_stream_count()},
            {"total_streams", total_stream_count()},
        };
        if (!upstream_url_.empty()) {
            body["upstream"] = upstream_url_;
        }
        setJson(res, body);
    });
}

}  // namespace chatgw
