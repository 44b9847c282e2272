#include "beacon/core/observability/span.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <typeinfo>

#include "beacon/core/observability/instrumentation.hpp"

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace beacon::core::observability {

namespace {

constexpr const char* kExceptionEvent = "exception";
constexpr const char* kUnwoundMessage = "scope exited by exception";

std::string demangle(const char* mangled) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled{
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free};
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return mangled;
}

bool is_lower_hex(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

}  // namespace

const char* to_string(SpanKind kind) noexcept {
    switch (kind) {
        case SpanKind::Internal: return "INTERNAL";
        case SpanKind::Client:   return "CLIENT";
        case SpanKind::Server:   return "SERVER";
        case SpanKind::Producer: return "PRODUCER";
        case SpanKind::Consumer: return "CONSUMER";
    }
    return "INTERNAL";
}

const char* to_string(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Unset: return "UNSET";
        case StatusCode::Ok:    return "OK";
        case StatusCode::Error: return "ERROR";
    }
    return "UNSET";
}

std::optional<SpanKind> span_kind_from_string(std::string_view text) noexcept {
    if (text == "INTERNAL") return SpanKind::Internal;
    if (text == "CLIENT") return SpanKind::Client;
    if (text == "SERVER") return SpanKind::Server;
    if (text == "PRODUCER") return SpanKind::Producer;
    if (text == "CONSUMER") return SpanKind::Consumer;
    return std::nullopt;
}

std::optional<StatusCode> status_code_from_string(std::string_view text) noexcept {
    if (text == "UNSET") return StatusCode::Unset;
    if (text == "OK") return StatusCode::Ok;
    if (text == "ERROR") return StatusCode::Error;
    return std::nullopt;
}

bool SpanContext::valid() const noexcept {
    return trace_id.size() == 32 && span_id.size() == 16 &&
           is_lower_hex(trace_id) && is_lower_hex(span_id) &&
           trace_id != std::string(32, '0') && span_id != std::string(16, '0');
}

std::string demangled_name(const std::type_info& type) {
    return demangle(type.name());
}

std::string exception_type_name(const std::exception& e) {
    return demangle(typeid(e).name());
}

void record_exception(Span& span, const std::exception& e) {
    span.set_status(StatusCode::Error, e.what());
    span.add_event(kExceptionEvent, Attributes{
        {"exception.type", exception_type_name(e)},
        {"exception.message", e.what()},
    });
}

void record_unknown_exception(Span& span) {
    span.set_status(StatusCode::Error, "unknown exception");
    span.add_event(kExceptionEvent, Attributes{
        {"exception.type", "unknown"},
        {"exception.message", "unknown exception"},
    });
}

ScopedSpan::ScopedSpan(SpanPtr span)
    : span_(std::move(span)), uncaught_on_entry_(std::uncaught_exceptions()) {
}

ScopedSpan::~ScopedSpan() {
    if (!span_) {
        return;
    }
    if (std::uncaught_exceptions() > uncaught_on_entry_) {
        try {
            if (span_->status_code() == StatusCode::Unset) {
                span_->set_status(StatusCode::Error, kUnwoundMessage);
            }
        } catch (const std::exception& e) {
            detail::log_instrumentation_failure("span status", e);
        }
        detail::end(*span_);
        return;
    }
    detail::finish_ok(*span_);
}

void ScopedSpan::record_exception(const std::exception& e) {
    if (!span_) {
        return;
    }
    try {
        observability::record_exception(*span_, e);
    } catch (const std::exception& failure) {
        detail::log_instrumentation_failure("exception recording", failure);
    }
}

}  // namespace beacon::core::observability
