#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "core/content_extractor.h"

using namespace chatgw;
using json = nlohmann::json;

TEST(ContentExtractorTest, FindsTopLevelContent) {
    auto found = extract_content(json::parse(R"({"content":"x"})"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "x");
}

TEST(ContentExtractorTest, FindsOllamaMessageContent) {
    auto doc = json::parse(R"({"model":"llama3:8b","message":{"role":"assistant","content":"hi"},"done":true})");
    auto found = extract_content(doc);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "hi");
}

TEST(ContentExtractorTest, SearchesArraysInOrder) {
    auto found = extract_content(json::parse(R"({"choices":[{"content":"a"},{"content":"b"}]})"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "a");
}

TEST(ContentExtractorTest, TopLevelArrayIsSearched) {
    auto found = extract_content(json::parse(R"([1, "text", {"message":{"content":"deep"}}])"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "deep");
}

TEST(ContentExtractorTest, NonStringContentIsSkipped) {
    auto found = extract_content(json::parse(R"({"content":5,"x":{"content":"y"}})"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "y");
}

TEST(ContentExtractorTest, ContentTakesPrecedenceOverMessage) {
    auto found = extract_content(json::parse(R"({"message":{"content":"inner"},"content":"outer"})"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "outer");
}

TEST(ContentExtractorTest, MessageWithoutStringContentIsSearchedAsChild) {
    auto found = extract_content(json::parse(R"({"message":{"content":null,"parts":[{"content":"p"}]}})"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "p");
}

TEST(ContentExtractorTest, EmptyStringIsAMatch) {
    auto found = extract_content(json::parse(R"({"content":"","other":{"content":"later"}})"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "");
}

TEST(ContentExtractorTest, ReturnsNothingWithoutContent) {
    EXPECT_FALSE(extract_content(json::parse(R"({"a":1})")).has_value());
    EXPECT_FALSE(extract_content(json::parse(R"({"error":"model not found"})")).has_value());
    EXPECT_FALSE(extract_content(json::parse(R"([])")).has_value());
}

TEST(ContentExtractorTest, ScalarsNeverMatch) {
    EXPECT_FALSE(extract_content(json("content")).has_value());
    EXPECT_FALSE(extract_content(json(42)).has_value());
    EXPECT_FALSE(extract_content(json(nullptr)).has_value());
    EXPECT_FALSE(extract_content(json(true)).has_value());
}

TEST(ContentExtractorTest, RecursesIntoArbitraryKeys) {
    auto found = extract_content(json::parse(R"({"foo":{"content":"nested"}})"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "nested");
}

TEST(ContentExtractorTest, BareStringLeafDoesNotMatch) {
    EXPECT_FALSE(extract_content(json::parse(R"({"a":1,"b":"text"})")).has_value());
}

TEST(ContentExtractorTest, SkipsLeadingScalarsInArray) {
    auto found = extract_content(json::parse(R"(["x",{"content":"found"}])"));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, "found");
}
