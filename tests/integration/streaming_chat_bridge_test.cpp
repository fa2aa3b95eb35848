#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "core/streaming_chat_bridge.h"
#include "integration/fake_ollama.h"
#include "runtime/state.h"

using namespace chatgw;
using namespace std::chrono_literals;

namespace {
constexpr int kFakePort = 18512;
constexpr int kClosedPort = 18598;

UpstreamEndpoint endpointFor(int port, const std::string& path = "/api/chat") {
    UpstreamEndpoint endpoint;
    endpoint.host = "127.0.0.1";
    endpoint.port = port;
    endpoint.chat_path = path;
    endpoint.connect_timeout_sec = 2;
    endpoint.read_timeout_sec = 5;
    return endpoint;
}

ChatRequest userSays(const std::string& text, std::optional<std::string> model = std::nullopt) {
    ChatRequest req;
    req.messages.push_back({"user", text});
    req.model = std::move(model);
    req.stream = false;  // ignored; the streaming bridge always streams
    return req;
}

std::vector<std::string> drain(EventChannel& channel) {
    std::vector<std::string> events;
    while (auto event = channel.pop()) {
        events.push_back(*event);
    }
    return events;
}
}  // namespace

class StreamingChatBridgeTest : public ::testing::Test {
protected:
    test::FakeOllama fake{kFakePort};
    ModelNormalizer normalizer;
};

TEST_F(StreamingChatBridgeTest, OneEventPerUpstreamChunk) {
    OllamaClient client(endpointFor(kFakePort));
    StreamingChatBridge bridge(client, normalizer);

    auto channel = bridge.handle(userSays("Hi"));
    ASSERT_TRUE(channel);
    EXPECT_EQ(drain(*channel), (std::vector<std::string>{"a", "b", "c"}));

    auto sent = fake.lastRequest();
    EXPECT_EQ(sent["stream"], true);
    EXPECT_EQ(sent["model"], "llama3:8b");
}

TEST_F(StreamingChatBridgeTest, NormalizesModel) {
    OllamaClient client(endpointFor(kFakePort));
    StreamingChatBridge bridge(client, normalizer);

    auto channel = bridge.handle(userSays("Hi", std::string("qwen2.5")));
    drain(*channel);
    EXPECT_EQ(fake.lastRequest()["model"], "qwen2:5");
}

TEST_F(StreamingChatBridgeTest, ErrorStatusBodyIsTheOnlyEvent) {
    OllamaClient client(endpointFor(kFakePort, "/status"));
    StreamingChatBridge bridge(client, normalizer);

    auto events = drain(*bridge.handle(userSays("Hi")));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], R"({"error":"model 'nope' not found"})");
}

TEST_F(StreamingChatBridgeTest, InvalidUtf8ChunkBecomesEmptyEvent) {
    OllamaClient client(endpointFor(kFakePort, "/bad-chunk"));
    StreamingChatBridge bridge(client, normalizer);

    EXPECT_EQ(drain(*bridge.handle(userSays("Hi"))), (std::vector<std::string>{"a", "", "c"}));
}

TEST_F(StreamingChatBridgeTest, ErrorStatusBodyIsDecodedAsText) {
    OllamaClient client(endpointFor(kFakePort, "/latin1"));
    StreamingChatBridge bridge(client, normalizer);

    auto events = drain(*bridge.handle(userSays("Hi")));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], "upstream error: caf\xEF\xBF\xBD");
}

TEST_F(StreamingChatBridgeTest, CancelAllEndsRelayWaitingOnUpstream) {
    OllamaClient client(endpointFor(kFakePort, "/stall"));
    StreamingChatBridge bridge(client, normalizer);

    auto channel = bridge.handle(userSays("Hi"));
    auto first = channel->pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "a");

    // The upstream is silent now; only cancellation can end the relay early
    auto rest = std::async(std::launch::async, [&channel]() { return drain(*channel); });
    client.cancelAll();
    ASSERT_EQ(rest.wait_for(1s), std::future_status::ready);
    EXPECT_TRUE(rest.get().empty());
    EXPECT_TRUE(wait_for_streams_idle(2s));

    // Calls after cancellation end at once without an event
    EXPECT_TRUE(drain(*bridge.handle(userSays("Hi"))).empty());
}

TEST_F(StreamingChatBridgeTest, BrokenStreamEndsWithErrorSentinel) {
    OllamaClient client(endpointFor(kFakePort, "/drop"));
    StreamingChatBridge bridge(client, normalizer);

    auto events = drain(*bridge.handle(userSays("Hi")));
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "a");
    EXPECT_EQ(events[1].rfind(kStreamErrorPrefix, 0), 0u) << events[1];
}

TEST_F(StreamingChatBridgeTest, RelayStopsWhenConsumerCloses) {
    OllamaClient client(endpointFor(kFakePort, "/endless"));
    UpstreamChatRequest upstream;
    upstream.model = "llama3:8b";
    upstream.messages.push_back({"user", "Hi"});
    upstream.stream = true;

    EventChannel channel(1);
    auto relay = std::async(std::launch::async, [&]() {
        StreamingChatBridge::relay(client, upstream, channel);
    });

    for (int i = 0; i < 3; ++i) {
        auto event = channel.pop();
        ASSERT_TRUE(event.has_value());
        EXPECT_EQ(*event, "tick");
    }
    channel.close();

    ASSERT_EQ(relay.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(channel.isClosed());
    // Only data already buffered remains; no error event follows a hang-up
    for (const auto& event : drain(channel)) {
        EXPECT_EQ(event, "tick");
    }
}

TEST_F(StreamingChatBridgeTest, StreamCountersFollowRelays) {
    OllamaClient client(endpointFor(kFakePort));
    StreamingChatBridge bridge(client, normalizer);

    const auto total_before = total_stream_count();
    drain(*bridge.handle(userSays("Hi")));
    EXPECT_GE(total_stream_count(), total_before + 1);

    // the relay thread drops its guard right after closing the channel
    for (int i = 0; i < 100 && active_stream_count() != 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(active_stream_count(), 0u);
}

TEST(StreamingChatBridgeUnreachableTest, ConnectionFailureIsSingleEvent) {
    ModelNormalizer normalizer;
    OllamaClient client(endpointFor(kClosedPort));
    StreamingChatBridge bridge(client, normalizer, 4);

    auto channel = bridge.handle(userSays("Hi"));
    EXPECT_EQ(channel->capacity(), 4u);
    auto events = drain(*channel);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].rfind("Error contacting Ollama API: ", 0), 0u) << events[0];
}
