#include "beacon/core/observability/proxy_tracer.hpp"

#include <utility>

#include "beacon/core/observability/null_tracer.hpp"

namespace beacon::core::observability {

ProxyTracer::ProxyTracer()
    : tracer_(std::make_shared<NullTracer>()) {
}

ProxyTracer::ProxyTracer(TracerPtr tracer)
    : tracer_(tracer ? std::move(tracer) : std::make_shared<NullTracer>()) {
}

void ProxyTracer::set_tracer(TracerPtr tracer) {
    if (!tracer) {
        tracer = std::make_shared<NullTracer>();
    }
    TracerPtr previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::exchange(tracer_, std::move(tracer));
    }
    // previous is released outside the lock; its destructor may flush.
}

TracerPtr ProxyTracer::tracer() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracer_;
}

SpanPtr ProxyTracer::start_span(const std::string& name, const SpanOptions& options) {
    return tracer()->start_span(name, options);
}

SpanPtr ProxyTracer::get_active_span() const {
    return tracer()->get_active_span();
}

void ProxyTracer::flush() {
    tracer()->flush();
}

std::vector<SpanRecord> ProxyTracer::query_spans(const SpanQuery& query) const {
    return tracer()->query_spans(query);
}

std::string_view ProxyTracer::backend_name() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracer_->backend_name();
}

}  // namespace beacon::core::observability
