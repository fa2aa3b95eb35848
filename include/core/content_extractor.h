#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace chatgw {

/// Depth-first search for the answer text in an upstream document of unknown
/// shape. At each object the precedence is `content` (string), then
/// `message.content` (string), then the children in iteration order; arrays
/// are searched element by element. The first match wins. Bare strings and
/// scalars never match on their own.
std::optional<std::string> extract_content(const nlohmann::json& value);

}  // namespace chatgw
