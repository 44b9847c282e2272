#include "beacon/otel/otel_tracer.hpp"

#include <array>
#include <deque>
#include <map>
#include <vector>

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>

#include "beacon/core/observability/active_span.hpp"
#include "beacon/core/observability/null_tracer.hpp"
#include "beacon/core/observability/telemetry.hpp"
#include "beacon/core/observability/trace_context.hpp"

namespace beacon::otel {

namespace {

namespace common = opentelemetry::common;
namespace nostd = opentelemetry::nostd;

otel_trace::SpanKind to_otel(obs::SpanKind kind) {
    switch (kind) {
        case obs::SpanKind::Internal: return otel_trace::SpanKind::kInternal;
        case obs::SpanKind::Client:   return otel_trace::SpanKind::kClient;
        case obs::SpanKind::Server:   return otel_trace::SpanKind::kServer;
        case obs::SpanKind::Producer: return otel_trace::SpanKind::kProducer;
        case obs::SpanKind::Consumer: return otel_trace::SpanKind::kConsumer;
    }
    return otel_trace::SpanKind::kInternal;
}

otel_trace::StatusCode to_otel(obs::StatusCode code) {
    switch (code) {
        case obs::StatusCode::Unset: return otel_trace::StatusCode::kUnset;
        case obs::StatusCode::Ok:    return otel_trace::StatusCode::kOk;
        case obs::StatusCode::Error: return otel_trace::StatusCode::kError;
    }
    return otel_trace::StatusCode::kUnset;
}

std::string trace_id_hex(const otel_trace::TraceId& id) {
    char buf[2 * otel_trace::TraceId::kSize];
    id.ToLowerBase16(nostd::span<char, 2 * otel_trace::TraceId::kSize>(buf, sizeof(buf)));
    return std::string(buf, sizeof(buf));
}

std::string span_id_hex(const otel_trace::SpanId& id) {
    char buf[2 * otel_trace::SpanId::kSize];
    id.ToLowerBase16(nostd::span<char, 2 * otel_trace::SpanId::kSize>(buf, sizeof(buf)));
    return std::string(buf, sizeof(buf));
}

std::uint8_t hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return static_cast<std::uint8_t>(c - '0');
    }
    return static_cast<std::uint8_t>(c - 'a' + 10);
}

template <std::size_t N>
std::array<std::uint8_t, N> hex_to_bytes(const std::string& hex) {
    std::array<std::uint8_t, N> bytes{};
    for (std::size_t i = 0; i < N; ++i) {
        bytes[i] = static_cast<std::uint8_t>((hex_value(hex[2 * i]) << 4) | hex_value(hex[2 * i + 1]));
    }
    return bytes;
}

// Context of a parent that may come from any backend; only valid contexts are accepted.
std::optional<otel_trace::SpanContext> parent_context(const obs::SpanContext& context, bool remote) {
    if (!context.valid()) {
        return std::nullopt;
    }
    const auto trace_bytes = hex_to_bytes<otel_trace::TraceId::kSize>(context.trace_id);
    const auto span_bytes = hex_to_bytes<otel_trace::SpanId::kSize>(context.span_id);
    return otel_trace::SpanContext(
        otel_trace::TraceId(nostd::span<const std::uint8_t, otel_trace::TraceId::kSize>(trace_bytes.data(),
                                                                                         trace_bytes.size())),
        otel_trace::SpanId(nostd::span<const std::uint8_t, otel_trace::SpanId::kSize>(span_bytes.data(),
                                                                                      span_bytes.size())),
        otel_trace::TraceFlags(context.sampled ? otel_trace::TraceFlags::kIsSampled : 0), remote);
}

// Scalars map 1:1; arrays and objects are stored as their JSON text. The
// buffer owns the strings the returned views point into.
class AttributeBuffer {
public:
    common::AttributeValue convert(const obs::AttributeValue& value) {
        if (value.is_boolean()) {
            return value.get<bool>();
        }
        if (value.is_number_unsigned()) {
            return value.get<std::uint64_t>();
        }
        if (value.is_number_integer()) {
            return value.get<std::int64_t>();
        }
        if (value.is_number_float()) {
            return value.get<double>();
        }
        strings_.push_back(value.is_string() ? value.get<std::string>()
                                              : value.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace));
        return nostd::string_view(strings_.back());
    }

private:
    std::deque<std::string> strings_;
};

}  // namespace

// OtelSpan

OtelSpan::OtelSpan(nostd::shared_ptr<otel_trace::Span> span, std::string name, obs::SpanKind kind,
                   std::optional<std::string> parent_span_id, std::uint64_t owner)
    : span_(std::move(span)),
      name_(std::move(name)),
      parent_span_id_(std::move(parent_span_id)),
      kind_(kind),
      owner_(owner) {
    const auto context = span_->GetContext();
    trace_id_ = trace_id_hex(context.trace_id());
    span_id_ = span_id_hex(context.span_id());
}

void OtelSpan::set_attribute(const std::string& key, obs::AttributeValue value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_.load()) {
        return;
    }
    AttributeBuffer buffer;
    span_->SetAttribute(key, buffer.convert(value));
}

void OtelSpan::add_event(const std::string& name, obs::Attributes attributes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_.load()) {
        return;
    }
    AttributeBuffer buffer;
    std::map<std::string, common::AttributeValue> converted;
    if (attributes.is_object()) {
        for (const auto& [key, value] : attributes.items()) {
            converted.emplace(key, buffer.convert(value));
        }
    }
    span_->AddEvent(name, converted);
}

void OtelSpan::set_status(obs::StatusCode code, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ended_.load()) {
        return;
    }
    status_.store(code);
    span_->SetStatus(to_otel(code), message);
}

void OtelSpan::end() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ended_.exchange(true)) {
            return;
        }
        span_->End();
    }
    obs::ActiveSpanStack::remove(owner_, this);
}

// OtelTracer

OtelTracer::OtelTracer(std::shared_ptr<otel_trace::TracerProvider> provider, const std::string& service_name,
                       core::logging::LoggerPtr logger)
    : provider_(std::move(provider)),
      logger_(std::move(logger)),
      owner_(obs::ActiveSpanStack::next_owner_id()) {
    if (!logger_) {
        logger_ = core::logging::create_logger("beacon.tracing");
    }
    if (!provider_) {
        provider_ = std::make_shared<otel_trace::NoopTracerProvider>();
    }
    tracer_ = provider_->GetTracer(service_name);
}

OtelTracer::~OtelTracer() {
    flush();
    obs::ActiveSpanStack::clear(owner_);
}

obs::SpanPtr OtelTracer::start_span(const std::string& name, const obs::SpanOptions& options) {
    std::optional<std::string> parent_span_id;
    otel_trace::StartSpanOptions start;
    start.kind = to_otel(options.kind);

    std::optional<otel_trace::SpanContext> parent;
    if (options.parent) {
        parent = parent_context(options.parent->context(), false);
    } else if (options.remote_parent) {
        parent = parent_context(*options.remote_parent, true);
    } else if (auto active = obs::ActiveSpanStack::top(owner_)) {
        parent = parent_context(active->context(), false);
    }
    if (parent) {
        start.parent = *parent;
        parent_span_id = span_id_hex(parent->span_id());
    } else {
        // Without this the SDK would adopt its own implicit context.
        start.parent = otel_trace::SpanContext::GetInvalid();
    }

    try {
        auto span = std::make_shared<OtelSpan>(tracer_->StartSpan(name, start), name, options.kind,
                                               std::move(parent_span_id), owner_);
        if (options.attributes.is_object()) {
            for (const auto& [key, value] : options.attributes.items()) {
                span->set_attribute(key, value);
            }
        }
        obs::ActiveSpanStack::push(owner_, span);
        return span;
    } catch (const std::exception& e) {
        logger_->warn("OpenTelemetry span start failed:", e.what());
        return obs::NullTracer().start_span(name, options);
    }
}

obs::SpanPtr OtelTracer::get_active_span() const {
    return obs::ActiveSpanStack::top(owner_);
}

void OtelTracer::flush() {
    auto sdk_provider = std::dynamic_pointer_cast<opentelemetry::sdk::trace::TracerProvider>(provider_);
    if (sdk_provider && !sdk_provider->ForceFlush()) {
        logger_->warn("OpenTelemetry flush did not complete");
    }
}

std::shared_ptr<otel_trace::TracerProvider> install_otlp_provider(const std::string& endpoint,
                                                                  const std::string& service_name) {
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions exporter_options;
    if (!endpoint.empty()) {
        exporter_options.url = endpoint;
    }
    auto exporter = opentelemetry::exporter::otlp::OtlpHttpExporterFactory::Create(exporter_options);

    opentelemetry::sdk::trace::BatchSpanProcessorOptions processor_options;
    auto processor =
        opentelemetry::sdk::trace::BatchSpanProcessorFactory::Create(std::move(exporter), processor_options);

    auto resource = opentelemetry::sdk::resource::Resource::Create({{"service.name", service_name}});
    std::shared_ptr<otel_trace::TracerProvider> provider =
        opentelemetry::sdk::trace::TracerProviderFactory::Create(std::move(processor), resource);

    otel_trace::Provider::SetTracerProvider(nostd::shared_ptr<otel_trace::TracerProvider>(provider));
    return provider;
}

void register_otel_backend() {
    obs::Telemetry::register_backend(
        "otel", [](const obs::TracingOptions& options, const core::logging::LoggerPtr& logger) -> obs::TracerPtr {
            auto provider = install_otlp_provider(options.otel_endpoint, options.service_name);
            return std::make_shared<OtelTracer>(std::move(provider), options.service_name, logger);
        });
}

}  // namespace beacon::otel
