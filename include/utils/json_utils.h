// json_utils.h - JSON parsing helpers shared by request handling
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace chatgw {

// Parse without throwing. On failure the parser message goes to *error.
std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error = nullptr);

// True if every key is present; *missing_key receives the first one that is not.
bool has_required_keys(const nlohmann::json& j,
                       const std::vector<std::string>& keys,
                       std::string* missing_key = nullptr);

// An optional field counts as unset when it is missing or JSON null.
bool is_unset(const nlohmann::json& j, const std::string& key);

}  // namespace chatgw
