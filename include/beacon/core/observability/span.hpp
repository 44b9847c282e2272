#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>

#include <nlohmann/json.hpp>

namespace beacon::core::observability {

// Attribute values are JSON scalars (string, number, boolean) or nested
// arrays/objects of the same. Objects keep insertion order.
using AttributeValue = nlohmann::ordered_json;
using Attributes = nlohmann::ordered_json;

enum class SpanKind {
    Internal,
    Client,
    Server,
    Producer,
    Consumer
};

enum class StatusCode {
    Unset,
    Ok,
    Error
};

[[nodiscard]] const char* to_string(SpanKind kind) noexcept;
[[nodiscard]] const char* to_string(StatusCode code) noexcept;
[[nodiscard]] std::optional<SpanKind> span_kind_from_string(std::string_view text) noexcept;
[[nodiscard]] std::optional<StatusCode> status_code_from_string(std::string_view text) noexcept;

/**
 * @brief Identity of a span as seen by other processes (W3C trace context).
 */
struct SpanContext {
    std::string trace_id;
    std::string span_id;
    bool sampled{true};

    [[nodiscard]] bool valid() const noexcept;
};

/**
 * @brief One traced operation.
 *
 * Once end() has been called a span is immutable: set_attribute, add_event and
 * set_status become no-ops and a second end() changes nothing. Mutators never
 * throw tracing errors into the caller.
 */
class Span {
public:
    virtual ~Span() = default;

    [[nodiscard]] virtual const std::string& span_id() const noexcept = 0;
    [[nodiscard]] virtual const std::string& trace_id() const noexcept = 0;
    [[nodiscard]] virtual const std::optional<std::string>& parent_span_id() const noexcept = 0;
    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
    [[nodiscard]] virtual SpanKind kind() const noexcept = 0;

    virtual void set_attribute(const std::string& key, AttributeValue value) = 0;
    virtual void add_event(const std::string& name, Attributes attributes = Attributes::object()) = 0;
    virtual void set_status(StatusCode code, const std::string& message = "") = 0;
    virtual void end() = 0;

    [[nodiscard]] virtual bool is_ended() const noexcept = 0;
    [[nodiscard]] virtual StatusCode status_code() const noexcept = 0;

    [[nodiscard]] SpanContext context() const { return {trace_id(), span_id(), true}; }
};

using SpanPtr = std::shared_ptr<Span>;

// Readable name of @p type, e.g. "std::vector<int, std::allocator<int> >".
std::string demangled_name(const std::type_info& type);

/**
 * @brief Demangled dynamic type name of an exception, e.g. "std::invalid_argument".
 */
std::string exception_type_name(const std::exception& e);

/**
 * @brief Marks @p span as failed by @p e: ERROR status with the exception
 * message plus an "exception" event carrying exception.type/exception.message.
 */
void record_exception(Span& span, const std::exception& e);

/**
 * @brief Like record_exception() for exceptions that are not std::exception.
 */
void record_unknown_exception(Span& span);

/**
 * @brief RAII owner of a span (scoped resource).
 *
 * On scope exit the span is ended. A still-UNSET status becomes OK on normal
 * exit and ERROR when the scope is left by an exception.
 *
 * The destructor cannot see the in-flight exception, so an unwound scope gets
 * the fixed message "scope exited by exception". Call record_exception() from
 * a catch block, or run the body through in_span(), to keep the real message.
 * Backend failures while ending the span are logged, never thrown.
 */
class ScopedSpan {
public:
    explicit ScopedSpan(SpanPtr span);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    Span* operator->() const noexcept { return span_.get(); }
    [[nodiscard]] SpanPtr get() const { return span_; }

    // Records the exception now so the ERROR status carries its message.
    void record_exception(const std::exception& e);

private:
    SpanPtr span_;
    int uncaught_on_entry_;
};

}  // namespace beacon::core::observability
