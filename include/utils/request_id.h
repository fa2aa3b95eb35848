// request_id.h - ids attached to every gateway response
#pragma once

#include <optional>
#include <string>

namespace chatgw {

// 16 lowercase hex characters.
std::string generate_request_id();

// W3C trace context ids: 32 hex (trace) and 16 hex (span).
std::string generate_trace_id();
std::string generate_span_id();

// Trace id of a version-00 traceparent header
// ("00-<32 hex>-<16 hex>-<2 hex>"), or std::nullopt if the header is
// malformed or carries the all-zero trace id.
std::optional<std::string> parse_trace_id(const std::string& traceparent);

}  // namespace chatgw
