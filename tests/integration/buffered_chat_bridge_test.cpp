#include <gtest/gtest.h>

#include "core/buffered_chat_bridge.h"
#include "integration/fake_ollama.h"

using namespace chatgw;

namespace {
constexpr int kFakePort = 18511;
constexpr int kClosedPort = 18599;

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
    return req;
}
}  // namespace

class BufferedChatBridgeTest : public ::testing::Test {
protected:
    test::FakeOllama fake{kFakePort};
    ModelNormalizer normalizer;
};

TEST_F(BufferedChatBridgeTest, ReturnsAssistantContent) {
    OllamaClient client(endpointFor(kFakePort));
    BufferedChatBridge bridge(client, normalizer);

    auto response = bridge.handle(userSays("Hi"));
    EXPECT_EQ(response.content, "hello");
}

TEST_F(BufferedChatBridgeTest, SendsNormalizedModelWithStreamFalse) {
    OllamaClient client(endpointFor(kFakePort));
    BufferedChatBridge bridge(client, normalizer);

    bridge.handle(userSays("Hi", std::string("llama3.1")));
    auto sent = fake.lastRequest();
    EXPECT_EQ(sent["model"], "llama3:8b");
    EXPECT_EQ(sent["stream"], false);
    ASSERT_EQ(sent["messages"].size(), 1u);
    EXPECT_EQ(sent["messages"][0]["role"], "user");
    EXPECT_EQ(sent["messages"][0]["content"], "Hi");

    bridge.handle(userSays("Hi", std::string("mistral.7b")));
    EXPECT_EQ(fake.lastRequest()["model"], "mistral:7b");

    bridge.handle(userSays("Hi"));
    EXPECT_EQ(fake.lastRequest()["model"], "llama3:8b");
}

TEST_F(BufferedChatBridgeTest, NonJsonBodyIsReturnedVerbatim) {
    OllamaClient client(endpointFor(kFakePort, "/plain"));
    BufferedChatBridge bridge(client, normalizer);

    EXPECT_EQ(bridge.handle(userSays("Hi")).content, "not json{{");
}

TEST_F(BufferedChatBridgeTest, JsonWithoutContentIsReturnedVerbatim) {
    OllamaClient client(endpointFor(kFakePort, "/no-content"));
    BufferedChatBridge bridge(client, normalizer);

    EXPECT_EQ(bridge.handle(userSays("Hi")).content, R"({"done":true})");
}

TEST_F(BufferedChatBridgeTest, ErrorStatusBodyIsNotJudged) {
    OllamaClient client(endpointFor(kFakePort, "/status"));
    BufferedChatBridge bridge(client, normalizer);

    // The error body holds no content field, so it comes back as is
    EXPECT_EQ(bridge.handle(userSays("Hi")).content, R"({"error":"model 'nope' not found"})");
}

TEST_F(BufferedChatBridgeTest, NonUtf8BodyIsDecodedWithReplacementCharacters) {
    OllamaClient client(endpointFor(kFakePort, "/latin1"));
    BufferedChatBridge bridge(client, normalizer);

    auto content = bridge.handle(userSays("Hi")).content;
    EXPECT_EQ(content, "upstream error: caf\xEF\xBF\xBD");
    EXPECT_NO_THROW((void)nlohmann::json(ChatResponse{content}).dump());
}

TEST_F(BufferedChatBridgeTest, CanceledClientAnswersWithErrorText) {
    OllamaClient client(endpointFor(kFakePort));
    BufferedChatBridge bridge(client, normalizer);
    client.cancelAll();

    const auto before = fake.requestCount();
    auto content = bridge.handle(userSays("Hi")).content;
    EXPECT_EQ(content.rfind("Error contacting Ollama API: ", 0), 0u) << content;
    EXPECT_EQ(fake.requestCount(), before);
}

TEST_F(BufferedChatBridgeTest, TruncatedBodyReportsReadFailure) {
    OllamaClient client(endpointFor(kFakePort, "/drop"));
    BufferedChatBridge bridge(client, normalizer);

    auto content = bridge.handle(userSays("Hi")).content;
    EXPECT_EQ(content.rfind("Failed to read response body: ", 0), 0u) << content;
}

TEST(BufferedChatBridgeUnreachableTest, ConnectionFailureBecomesAnswerText) {
    ModelNormalizer normalizer;
    OllamaClient client(endpointFor(kClosedPort));
    BufferedChatBridge bridge(client, normalizer);

    auto content = bridge.handle(userSays("Hi")).content;
    EXPECT_EQ(content.rfind("Error contacting Ollama API: ", 0), 0u) << content;
    EXPECT_GT(content.size(), std::string("Error contacting Ollama API: ").size());
}
