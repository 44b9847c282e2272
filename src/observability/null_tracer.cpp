#include "beacon/core/observability/null_tracer.hpp"

#include "beacon/core/observability/trace_context.hpp"

namespace beacon::core::observability {

NullSpan::NullSpan()
    : trace_id_(generate_trace_id()), span_id_(generate_span_id()) {
}

NullSpan::NullSpan(std::string name, std::string trace_id, std::string span_id,
                   std::optional<std::string> parent_span_id, SpanKind kind)
    : name_(std::move(name)),
      trace_id_(std::move(trace_id)),
      span_id_(std::move(span_id)),
      parent_span_id_(std::move(parent_span_id)),
      kind_(kind) {
}

SpanPtr NullTracer::start_span(const std::string& name, const SpanOptions& options) {
    if (options.parent) {
        return std::make_shared<NullSpan>(name, options.parent->trace_id(), generate_span_id(),
                                          options.parent->span_id(), options.kind);
    }
    if (options.remote_parent && options.remote_parent->valid()) {
        return std::make_shared<NullSpan>(name, options.remote_parent->trace_id, generate_span_id(),
                                          options.remote_parent->span_id, options.kind);
    }
    return std::make_shared<NullSpan>(name, generate_trace_id(), generate_span_id(), std::nullopt, options.kind);
}

}  // namespace beacon::core::observability
