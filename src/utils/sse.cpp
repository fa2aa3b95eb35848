#include "utils/sse.h"

#include <sstream>

namespace chatgw {

std::string format_sse_event(const std::string& payload) {
    std::string out;
    out.reserve(payload.size() + 16);
    size_t start = 0;
    while (true) {
        size_t nl = payload.find('\n', start);
        out += "data: ";
        if (nl == std::string::npos) {
            out.append(payload, start, std::string::npos);
            out += '\n';
            break;
        }
        out.append(payload, start, nl - start);
        out += '\n';
        start = nl + 1;
    }
    out += '\n';
    return out;
}

std::vector<std::string> parse_sse_events(const std::string& stream) {
    std::vector<std::string> events;
    std::istringstream in(stream);
    std::string line;
    std::string data;
    bool has_data = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            if (has_data) {
                events.push_back(data);
            }
            data.clear();
            has_data = false;
            continue;
        }
        if (line.rfind("data:", 0) != 0) {
            continue;  // comments, event names, ids
        }
        std::string value = line.substr(5);
        if (!value.empty() && value.front() == ' ') value.erase(0, 1);
        if (has_data) data += '\n';
        data += value;
        has_data = true;
    }
    if (has_data) {
        events.push_back(data);
    }
    return events;
}

}  // namespace chatgw
