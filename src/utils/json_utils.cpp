#include "utils/json_utils.h"

namespace chatgw {

std::optional<nlohmann::json> parse_json(const std::string& body, std::string* error) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& ex) {
        if (error) *error = ex.what();
        return std::nullopt;
    }
}

bool has_required_keys(const nlohmann::json& j,
                       const std::vector<std::string>& keys,
                       std::string* missing_key) {
    for (const auto& k : keys) {
        if (!j.contains(k)) {
            if (missing_key) *missing_key = k;
            return false;
        }
    }
    return true;
}

bool is_unset(const nlohmann::json& j, const std::string& key) {
    auto it = j.find(key);
    return it == j.end() || it->is_null();
}

}  // namespace chatgw
