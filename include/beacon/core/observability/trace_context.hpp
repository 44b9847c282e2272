#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "beacon/core/observability/span.hpp"

namespace beacon::core::observability {

// 32 lowercase hex characters (128 random bits), never all zero.
std::string generate_trace_id();

// 16 lowercase hex characters, unique within the process.
std::string generate_span_id();

/**
 * @brief Parses a W3C traceparent header ("00-<trace-id>-<span-id>-<flags>").
 * @return std::nullopt for malformed values or all-zero identifiers.
 */
std::optional<SpanContext> parse_traceparent(std::string_view header);

std::string format_traceparent(const SpanContext& context);

}  // namespace beacon::core::observability
