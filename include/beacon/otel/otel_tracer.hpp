#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#include <opentelemetry/trace/tracer_provider.h>

#include "beacon/core/logging/logger.hpp"
#include "beacon/core/observability/tracer.hpp"

namespace beacon::otel {

namespace obs = core::observability;
namespace otel_trace = opentelemetry::trace;

/**
 * @brief Span forwarding every call to an OpenTelemetry SDK span.
 */
class OtelSpan : public obs::Span {
public:
    OtelSpan(opentelemetry::nostd::shared_ptr<otel_trace::Span> span, std::string name, obs::SpanKind kind,
             std::optional<std::string> parent_span_id, std::uint64_t owner);

    const std::string& span_id() const noexcept override { return span_id_; }
    const std::string& trace_id() const noexcept override { return trace_id_; }
    const std::optional<std::string>& parent_span_id() const noexcept override { return parent_span_id_; }
    const std::string& name() const noexcept override { return name_; }
    obs::SpanKind kind() const noexcept override { return kind_; }

    void set_attribute(const std::string& key, obs::AttributeValue value) override;
    void add_event(const std::string& name, obs::Attributes attributes = obs::Attributes::object()) override;
    void set_status(obs::StatusCode code, const std::string& message = "") override;
    void end() override;

    bool is_ended() const noexcept override { return ended_.load(); }
    obs::StatusCode status_code() const noexcept override { return status_.load(); }

    [[nodiscard]] otel_trace::SpanContext otel_context() const noexcept { return span_->GetContext(); }

private:
    opentelemetry::nostd::shared_ptr<otel_trace::Span> span_;
    std::string name_;
    std::string trace_id_;
    std::string span_id_;
    std::optional<std::string> parent_span_id_;
    obs::SpanKind kind_;
    std::uint64_t owner_;

    std::mutex mutex_;
    std::atomic<bool> ended_{false};
    std::atomic<obs::StatusCode> status_{obs::StatusCode::Unset};
};

/**
 * @brief Backend forwarding to an OpenTelemetry TracerProvider.
 *
 * SDK failures while starting a span are logged and answered with a
 * NullSpan, so callers never see them.
 */
class OtelTracer : public obs::Tracer {
public:
    OtelTracer(std::shared_ptr<otel_trace::TracerProvider> provider, const std::string& service_name,
               core::logging::LoggerPtr logger = nullptr);
    ~OtelTracer() override;

    obs::SpanPtr start_span(const std::string& name, const obs::SpanOptions& options = {}) override;
    obs::SpanPtr get_active_span() const override;
    void flush() override;
    std::string_view backend_name() const noexcept override { return "otel"; }

private:
    std::shared_ptr<otel_trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<otel_trace::Tracer> tracer_;
    core::logging::LoggerPtr logger_;
    std::uint64_t owner_;
};

/**
 * @brief Builds an SDK provider exporting over OTLP/HTTP to @p endpoint and
 * installs it as the global OpenTelemetry provider.
 */
std::shared_ptr<otel_trace::TracerProvider> install_otlp_provider(const std::string& endpoint,
                                                                  const std::string& service_name);

// Adds the "otel" backend to Telemetry's factory registry.
void register_otel_backend();

}  // namespace beacon::otel
