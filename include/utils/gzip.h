#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace chatgw {

// True if an Accept-Encoding header value lists gzip (case-insensitive).
bool accepts_gzip(std::string_view accept_encoding);

// Compresses input into a single gzip member. Returns std::nullopt if zlib
// reports an error.
std::optional<std::string> gzip_compress(std::string_view input);

}  // namespace chatgw
