#pragma once

#include <string>
#include <string_view>

namespace chatgw {

// Returns true if input is well-formed UTF-8 (no overlongs, surrogates or
// code points above U+10FFFF).
bool is_valid_utf8(std::string_view input);

// Decodes one upstream chunk as text. A chunk that is not valid UTF-8 on its
// own decodes to an empty string.
std::string decode_chunk_text(std::string_view chunk);

// Decodes a whole body as text, replacing each ill-formed sequence with
// U+FFFD. Valid input is returned unchanged.
std::string decode_lossy(std::string_view input);

}  // namespace chatgw
