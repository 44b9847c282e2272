#pragma once

#include <mutex>

#include "beacon/core/observability/tracer.hpp"

namespace beacon::core::observability {

/**
 * @brief Stable tracer handle whose backend can be swapped at runtime.
 *
 * Starts with a NullTracer. Every call delegates to the backend installed at
 * the time of the call; spans already handed out stay with the backend that
 * created them.
 */
class ProxyTracer : public Tracer {
public:
    ProxyTracer();
    explicit ProxyTracer(TracerPtr tracer);

    // nullptr installs a NullTracer.
    void set_tracer(TracerPtr tracer);
    [[nodiscard]] TracerPtr tracer() const;

    SpanPtr start_span(const std::string& name, const SpanOptions& options = {}) override;
    SpanPtr get_active_span() const override;
    void flush() override;
    std::vector<SpanRecord> query_spans(const SpanQuery& query) const override;

    // Name of the current backend, not "proxy".
    std::string_view backend_name() const noexcept override;

private:
    mutable std::mutex mutex_;
    TracerPtr tracer_;
};

using ProxyTracerPtr = std::shared_ptr<ProxyTracer>;

}  // namespace beacon::core::observability
