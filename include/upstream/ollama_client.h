#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "core/chat_types.h"

namespace httplib {
class Client;
}

namespace chatgw {

/// Failure kinds reported by the upstream transport
enum class UpstreamError {
    None = 0,
    Connection,  // request could not be sent or no response head arrived
    Read,        // response head arrived, body transfer failed
    Status,      // non-success HTTP status (streaming only)
    Canceled,    // the chunk callback asked to stop, or cancelAll() ran
};

const char* to_string(UpstreamError error);

struct UpstreamResult {
    UpstreamError error{UpstreamError::None};
    std::string detail;
    int status{0};
    std::string body;
    // Set when a non-success status arrived but its body could not be read
    bool body_incomplete{false};

    bool ok() const { return error == UpstreamError::None; }
};

struct UpstreamEndpoint {
    std::string scheme{"http"};  // "http" or "https"
    std::string host{"127.0.0.1"};
    int port{11434};
    std::string chat_path{"/api/chat"};
    int connect_timeout_sec{10};
    int read_timeout_sec{86400};
    // https only: verify the server certificate against the system store
    bool tls_verify{true};
};

/// Called for every body chunk of a successful streaming response, in
/// arrival order. Returning false cancels the transfer.
using ChunkCallback = std::function<bool(const char* data, size_t length)>;

/// Client for the inference server's chat endpoint. One instance is shared
/// by every request; it holds immutable connection settings, and each call
/// opens its own connection because httplib::Client serializes the requests
/// issued through one instance. Copies share the set of calls in flight, so
/// cancelAll() on any copy reaches relays that run on their own copy.
class OllamaClient {
public:
    explicit OllamaClient(UpstreamEndpoint endpoint);

    /// Buffered POST. The status code is reported but not judged: whatever
    /// body the server sends is returned with error None.
    UpstreamResult chat(const UpstreamChatRequest& request) const;

    /// Streaming POST. Body chunks of a 2xx response go to `on_chunk` as
    /// they arrive; a non-2xx body is collected into the result instead.
    UpstreamResult chatStream(const UpstreamChatRequest& request, const ChunkCallback& on_chunk) const;

    /// Aborts every call in flight and makes later calls fail with
    /// UpstreamError::Canceled. Used on shutdown.
    void cancelAll() const;
    bool canceled() const;

    const UpstreamEndpoint& endpoint() const { return endpoint_; }
    std::string baseUrl() const;

private:
    class InFlight;

    UpstreamEndpoint endpoint_;
    std::shared_ptr<InFlight> in_flight_;
};

}  // namespace chatgw
