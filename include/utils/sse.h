#pragma once

#include <string>
#include <vector>

namespace chatgw {

// Serializes one server-sent event. Every line of the payload becomes its own
// `data:` field so that a conforming reader rebuilds the payload exactly.
std::string format_sse_event(const std::string& payload);

// Splits an event-stream body back into event payloads (data fields only).
std::vector<std::string> parse_sse_events(const std::string& stream);

}  // namespace chatgw
