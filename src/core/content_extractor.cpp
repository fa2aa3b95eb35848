#include "core/content_extractor.h"

namespace chatgw {

std::optional<std::string> extract_content(const nlohmann::json& value) {
    if (value.is_object()) {
        auto content = value.find("content");
        if (content != value.end() && content->is_string()) {
            return content->get<std::string>();
        }
        auto message = value.find("message");
        if (message != value.end() && message->is_object()) {
            auto inner = message->find("content");
            if (inner != message->end() && inner->is_string()) {
                return inner->get<std::string>();
            }
        }
        for (const auto& child : value) {
            if (auto found = extract_content(child)) {
                return found;
            }
        }
        return std::nullopt;
    }

    if (value.is_array()) {
        for (const auto& element : value) {
            if (auto found = extract_content(element)) {
                return found;
            }
        }
    }
    return std::nullopt;
}

}  // namespace chatgw
