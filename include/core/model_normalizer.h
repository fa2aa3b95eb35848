#pragma once

#include <map>
#include <optional>
#include <string>

namespace chatgw {

constexpr const char* kDefaultModel = "llama3:8b";

/// Maps caller supplied model tokens onto the "name:tag" identifiers the
/// inference server expects.
///
/// Rules, in order:
///   - no model            -> default model
///   - exact alias match   -> alias target
///   - contains '.' and no ':' -> every '.' replaced by ':'
///   - otherwise           -> unchanged
class ModelNormalizer {
public:
    /// Built-in table: default "llama3:8b", alias "llama3.1" -> "llama3:8b"
    ModelNormalizer();
    ModelNormalizer(std::string default_model, std::map<std::string, std::string> aliases);

    std::string normalize(const std::optional<std::string>& model) const;

    const std::string& defaultModel() const { return default_model_; }

    static std::map<std::string, std::string> builtinAliases();

private:
    std::string default_model_;
    std::map<std::string, std::string> aliases_;
};

// Normalization with the built-in table.
std::string normalize_model(const std::optional<std::string>& model);

}  // namespace chatgw
