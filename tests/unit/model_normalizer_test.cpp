#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "core/model_normalizer.h"

using namespace chatgw;

TEST(ModelNormalizerTest, MissingModelUsesDefault) {
    EXPECT_EQ(normalize_model(std::nullopt), "llama3:8b");
}

TEST(ModelNormalizerTest, BuiltinAliasMapsToDefaultModel) {
    EXPECT_EQ(normalize_model(std::string("llama3.1")), "llama3:8b");
}

TEST(ModelNormalizerTest, DottedNameBecomesNameTag) {
    EXPECT_EQ(normalize_model(std::string("mistral.7b")), "mistral:7b");
}

TEST(ModelNormalizerTest, GenericNamesFollowTheRules) {
    EXPECT_EQ(normalize_model(std::string("foo.bar")), "foo:bar");
    EXPECT_EQ(normalize_model(std::string("foo:bar")), "foo:bar");
    EXPECT_EQ(normalize_model(std::string("plainname")), "plainname");
}

TEST(ModelNormalizerTest, EveryDotIsReplaced) {
    EXPECT_EQ(normalize_model(std::string("qwen2.5.coder")), "qwen2:5:coder");
}

TEST(ModelNormalizerTest, NamesWithColonAreUnchanged) {
    EXPECT_EQ(normalize_model(std::string("qwen2:7b")), "qwen2:7b");
    EXPECT_EQ(normalize_model(std::string("llama3.2:1b")), "llama3.2:1b");
}

TEST(ModelNormalizerTest, PlainNamesAreUnchanged) {
    EXPECT_EQ(normalize_model(std::string("phi3")), "phi3");
}

TEST(ModelNormalizerTest, EmptyStringIsNotTreatedAsMissing) {
    EXPECT_EQ(normalize_model(std::string("")), "");
}

TEST(ModelNormalizerTest, AliasIsMatchedExactly) {
    EXPECT_EQ(normalize_model(std::string("LLAMA3.1")), "LLAMA3:1");
    EXPECT_EQ(normalize_model(std::string("llama3.1 ")), "llama3:1 ");
}

TEST(ModelNormalizerTest, NormalizingTwiceGivesSameResult) {
    const std::vector<std::string> inputs = {
        "llama3.1", "mistral.7b", "qwen2:7b", "phi3", "a.b.c", "x:y.z", ""};
    for (const auto& input : inputs) {
        const auto once = normalize_model(input);
        EXPECT_EQ(normalize_model(once), once) << "input: " << input;
    }
    const auto from_default = normalize_model(std::nullopt);
    EXPECT_EQ(normalize_model(from_default), from_default);
}

TEST(ModelNormalizerTest, ConfiguredTableOverridesBuiltins) {
    ModelNormalizer normalizer("qwen2:7b", {{"fast", "phi3:mini"}});

    EXPECT_EQ(normalizer.defaultModel(), "qwen2:7b");
    EXPECT_EQ(normalizer.normalize(std::nullopt), "qwen2:7b");
    EXPECT_EQ(normalizer.normalize(std::string("fast")), "phi3:mini");
    // builtin alias is not part of this table; the dot rule applies instead
    EXPECT_EQ(normalizer.normalize(std::string("llama3.1")), "llama3:1");
}

TEST(ModelNormalizerTest, EmptyDefaultFallsBackToBuiltinDefault) {
    ModelNormalizer normalizer("", {});
    EXPECT_EQ(normalizer.normalize(std::nullopt), kDefaultModel);
}
