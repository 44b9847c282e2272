#pragma once

#include <optional>
#include <string>

#include "beacon/core/observability/tracer.hpp"

namespace beacon::core::observability {

/**
 * @brief Span that only carries identifiers; every mutator is a no-op.
 */
class NullSpan : public Span {
public:
    NullSpan();
    NullSpan(std::string name, std::string trace_id, std::string span_id,
             std::optional<std::string> parent_span_id = std::nullopt,
             SpanKind kind = SpanKind::Internal);

    const std::string& span_id() const noexcept override { return span_id_; }
    const std::string& trace_id() const noexcept override { return trace_id_; }
    const std::optional<std::string>& parent_span_id() const noexcept override { return parent_span_id_; }
    const std::string& name() const noexcept override { return name_; }
    SpanKind kind() const noexcept override { return kind_; }

    void set_attribute(const std::string& /*key*/, AttributeValue /*value*/) override {}
    void add_event(const std::string& /*name*/, Attributes /*attributes*/ = Attributes::object()) override {}
    void set_status(StatusCode /*code*/, const std::string& /*message*/ = "") override {}
    void end() override {}

    bool is_ended() const noexcept override { return false; }
    StatusCode status_code() const noexcept override { return StatusCode::Unset; }

private:
    std::string name_;
    std::string trace_id_;
    std::string span_id_;
    std::optional<std::string> parent_span_id_;
    SpanKind kind_{SpanKind::Internal};
};

/**
 * @brief Default backend: hands out NullSpans, stores nothing, tracks nothing.
 */
class NullTracer : public Tracer {
public:
    SpanPtr start_span(const std::string& name, const SpanOptions& options = {}) override;
    SpanPtr get_active_span() const override { return nullptr; }
    void flush() override {}
    std::string_view backend_name() const noexcept override { return "null"; }
};

}  // namespace beacon::core::observability
