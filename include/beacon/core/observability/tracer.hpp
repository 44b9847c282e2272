#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "beacon/core/observability/span.hpp"

namespace beacon::core::observability {

struct SpanOptions {
    // Explicit parent; wins over remote_parent and the active span.
    SpanPtr parent;
    // Parent received from another process, e.g. via a traceparent header.
    std::optional<SpanContext> remote_parent;
    SpanKind kind{SpanKind::Internal};
    Attributes attributes = Attributes::object();
};

/**
 * @brief One persisted span row.
 */
struct SpanRecord {
    std::string id;
    std::string trace_id;
    std::optional<std::string> parent_span_id;
    std::string name;
    std::string kind{"INTERNAL"};
    std::string start_time;
    std::optional<std::string> end_time;
    std::int64_t duration_ms{0};
    std::string status_code{"UNSET"};
    std::optional<std::string> status_message;
    Attributes attributes = Attributes::object();
    Attributes events = Attributes::array();
    std::optional<std::string> agent_id;
    std::optional<std::string> project_id;
    std::string classification{"CUI"};
    std::optional<std::string> created_at;

    [[nodiscard]] nlohmann::ordered_json to_json() const;
};

/**
 * @brief Filters for Tracer::query_spans(). Set predicates are AND-combined.
 */
struct SpanQuery {
    std::optional<std::string> trace_id;
    std::optional<std::string> project_id;
    std::optional<std::string> name;
    std::size_t limit{100};
};

/**
 * @brief Span factory shared by every backend.
 *
 * start_span() never fails. The new span becomes the active span of the
 * calling thread until it ends; its parent is, in priority order, the
 * explicit parent, the remote parent, then the active span. Without any of
 * them a new trace is started.
 */
class Tracer {
public:
    virtual ~Tracer() = default;

    virtual SpanPtr start_span(const std::string& name, const SpanOptions& options = {}) = 0;
    [[nodiscard]] virtual SpanPtr get_active_span() const = 0;

    // Persists buffered spans. Never throws; failed batches are dropped.
    virtual void flush() = 0;

    // Newest first. Empty when the backend keeps no store.
    [[nodiscard]] virtual std::vector<SpanRecord> query_spans(const SpanQuery& query) const;

    // Static string naming the backend ("null", "sqlite", ...).
    [[nodiscard]] virtual std::string_view backend_name() const noexcept = 0;
};

using TracerPtr = std::shared_ptr<Tracer>;

// ISO-8601 UTC with microseconds, e.g. "2025-01-31T12:00:00.123456Z".
std::string format_timestamp(std::chrono::system_clock::time_point time);

}  // namespace beacon::core::observability
