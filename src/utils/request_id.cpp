#include "utils/request_id.h"

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace chatgw {

namespace {
uint64_t next_random() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng();
}

std::string to_hex(uint64_t v) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << v;
    return oss.str();
}
}  // namespace

std::string generate_request_id() {
    return to_hex(next_random());
}

std::string generate_trace_id() {
    return to_hex(next_random()) + to_hex(next_random());
}

std::string generate_span_id() {
    return to_hex(next_random());
}

std::optional<std::string> parse_trace_id(const std::string& traceparent) {
    // 2 + 1 + 32 + 1 + 16 + 1 + 2
    if (traceparent.size() != 55 || traceparent.compare(0, 3, "00-") != 0) {
        return std::nullopt;
    }
    if (traceparent[35] != '-' || traceparent[52] != '-') {
        return std::nullopt;
    }
    auto is_lower_hex = [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    };
    for (size_t i = 3; i < traceparent.size(); ++i) {
        if (i == 35 || i == 52) continue;
        if (!is_lower_hex(traceparent[i])) return std::nullopt;
    }
    std::string trace_id = traceparent.substr(3, 32);
    if (trace_id.find_first_not_of('0') == std::string::npos) {
        return std::nullopt;
    }
    return trace_id;
}

}  // namespace chatgw
