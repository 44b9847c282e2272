#include "beacon/core/observability/instrumentation.hpp"

#include "beacon/core/observability/null_tracer.hpp"
#include "beacon/core/observability/telemetry.hpp"
#include "beacon/core/security/digest.hpp"

namespace beacon::core::observability {

namespace {

constexpr std::size_t kFingerprintLength = 16;
constexpr const char* kHashSuffix = "_hash";

}  // namespace

void set_content_tag(Span& span, const std::string& key, std::string_view value) {
    set_content_tag(span, key, value, Telemetry::content_tracing_enabled());
}

void set_content_tag(Span& span, const std::string& key, std::string_view value, bool include_plaintext) {
    try {
        span.set_attribute(key + kHashSuffix, security::sha256_hex(value));
        if (include_plaintext) {
            span.set_attribute(key, std::string{value});
        }
    } catch (const std::exception& e) {
        detail::log_instrumentation_failure("content tag", e);
    }
}

namespace detail {

TracerPtr resolve_tracer(const TracedOptions& options) {
    if (options.tracer) {
        return options.tracer;
    }
    return Telemetry::get_tracer();
}

std::string span_name(const TracedOptions& options) {
    if (!options.name.empty()) {
        return options.name;
    }
    if (options.module.empty()) {
        return options.function.empty() ? "traced" : options.function;
    }
    if (options.function.empty()) {
        return options.module;
    }
    return options.module + "." + options.function;
}

SpanPtr open_span(const TracedOptions& options) {
    SpanOptions span_options;
    span_options.kind = options.kind;
    span_options.attributes = options.attributes.is_object() ? options.attributes : Attributes::object();

    SpanPtr span;
    try {
        span = resolve_tracer(options)->start_span(span_name(options), span_options);
    } catch (const std::exception& e) {
        log_instrumentation_failure("span start", e);
    }
    if (!span) {
        return std::make_shared<NullSpan>();
    }
    if (!options.function.empty()) {
        tag(*span, kFunctionAttribute, options.function);
    }
    if (!options.module.empty()) {
        tag(*span, kModuleAttribute, options.module);
    }
    return span;
}

SpanPtr start_span(Tracer& tracer, const std::string& name, const SpanOptions& options) {
    SpanPtr span;
    try {
        span = tracer.start_span(name, options);
    } catch (const std::exception& e) {
        log_instrumentation_failure("span start", e);
    }
    return span ? span : std::make_shared<NullSpan>();
}

void tag(Span& span, const std::string& key, AttributeValue value) {
    try {
        span.set_attribute(key, std::move(value));
    } catch (const std::exception& e) {
        log_instrumentation_failure("span attribute", e);
    }
}

std::string module_from_path(std::string_view file) {
    const auto slash = file.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        file.remove_prefix(slash + 1);
    }
    const auto dot = file.find('.');
    if (dot != std::string_view::npos) {
        file = file.substr(0, dot);
    }
    return std::string{file};
}

TracedOptions options_for(std::string_view function, std::string_view file, TracedOptions base) {
    // Qualified identifiers keep only the last component, as in "jobs::run" -> "run".
    const auto scope = function.rfind("::");
    if (scope != std::string_view::npos) {
        function.remove_prefix(scope + 2);
    }
    if (base.function.empty()) {
        base.function = std::string{function};
    }
    if (base.module.empty()) {
        base.module = module_from_path(file);
    }
    return base;
}

std::optional<std::string> fingerprint(const nlohmann::ordered_json& rendering) noexcept {
    try {
        const auto text = rendering.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
        return security::sha256_prefix(text, kFingerprintLength);
    } catch (const std::exception& e) {
        log_instrumentation_failure("fingerprint", e);
        return std::nullopt;
    }
}

void log_instrumentation_failure(std::string_view what, const std::exception& e) noexcept {
    try {
        Telemetry::logger()->warn("Instrumentation", std::string{what}, "failed:", e.what());
    } catch (const std::exception&) {
        // Logger unavailable.
        return;
    }
}

void end(Span& span) {
    try {
        span.end();
    } catch (const std::exception& e) {
        log_instrumentation_failure("span end", e);
    }
}

void finish_ok(Span& span) {
    try {
        if (span.status_code() == StatusCode::Unset) {
            span.set_status(StatusCode::Ok);
        }
    } catch (const std::exception& e) {
        log_instrumentation_failure("span status", e);
    }
    end(span);
}

void finish_error(Span& span, const std::exception& e) {
    try {
        record_exception(span, e);
    } catch (const std::exception& failure) {
        log_instrumentation_failure("exception recording", failure);
    }
    end(span);
}

void finish_unknown_error(Span& span) {
    try {
        record_unknown_exception(span);
    } catch (const std::exception& failure) {
        log_instrumentation_failure("exception recording", failure);
    }
    end(span);
}

void finish_generator(Span& span, std::size_t item_count) {
    tag(span, kItemCountAttribute, item_count);
    finish_ok(span);
}

}  // namespace detail

}  // namespace beacon::core::observability
