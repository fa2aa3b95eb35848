#include "utils/utf8.h"

namespace chatgw {

namespace {

constexpr const char* kReplacementChar = "\xEF\xBF\xBD";  // U+FFFD

inline bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Bounds for the byte after a lead byte; they exclude overlongs, surrogates
// and code points above U+10FFFF.
inline bool second_byte_ok(unsigned char c0, unsigned char c1) {
    if (c0 == 0xE0) return c1 >= 0xA0 && c1 <= 0xBF;
    if (c0 == 0xED) return c1 >= 0x80 && c1 <= 0x9F;
    if (c0 == 0xF0) return c1 >= 0x90 && c1 <= 0xBF;
    if (c0 == 0xF4) return c1 >= 0x80 && c1 <= 0x8F;
    return is_continuation(c1);
}

// Scans the sequence starting at bytes[i]. Returns its length when it is
// well formed, otherwise 0 with `consumed` set to the length of the invalid
// prefix (at least one byte).
size_t scan_sequence(const unsigned char* bytes, size_t size, size_t i, size_t& consumed) {
    const unsigned char c0 = bytes[i];
    consumed = 1;
    if (c0 <= 0x7F) {
        return 1;
    }

    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) {
        len = 2;
    } else if (c0 >= 0xE0 && c0 <= 0xEF) {
        len = 3;
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
        len = 4;
    } else {
        return 0;
    }

    for (size_t k = 1; k < len; ++k) {
        if (i + k >= size) {
            return 0;
        }
        const unsigned char c = bytes[i + k];
        const bool ok = k == 1 ? second_byte_ok(c0, c) : is_continuation(c);
        if (!ok) {
            return 0;
        }
        consumed = k + 1;
    }
    return len;
}

}  // namespace

bool is_valid_utf8(std::string_view input) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(input.data());
    size_t i = 0;
    while (i < input.size()) {
        size_t consumed = 0;
        const size_t len = scan_sequence(bytes, input.size(), i, consumed);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

std::string decode_chunk_text(std::string_view chunk) {
    if (!is_valid_utf8(chunk)) {
        return {};
    }
    return std::string(chunk);
}

std::string decode_lossy(std::string_view input) {
    if (is_valid_utf8(input)) {
        return std::string(input);
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(input.data());
    std::string out;
    out.reserve(input.size() + 8);
    size_t i = 0;
    while (i < input.size()) {
        size_t consumed = 0;
        const size_t len = scan_sequence(bytes, input.size(), i, consumed);
        if (len == 0) {
            out += kReplacementChar;
            i += consumed;
        } else {
            out.append(input.data() + i, len);
            i += len;
        }
    }
    return out;
}

}  // namespace chatgw
