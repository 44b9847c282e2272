#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "beacon/core/observability/span.hpp"
#include "beacon/core/observability/tracer.hpp"

namespace beacon::core::observability {

/**
 * @brief How traced() and traced_generator() describe the span they open.
 */
struct TracedOptions {
    // Span name. Empty means "<module>.<function>".
    std::string name;
    std::string function;
    std::string module;
    SpanKind kind{SpanKind::Internal};
    Attributes attributes = Attributes::object();
    // Store a SHA-256 prefix of the arguments / non-null result, never the values.
    bool record_args{false};
    bool record_result{false};
    // Empty means Telemetry::get_tracer(), resolved at call time.
    TracerPtr tracer;
};

constexpr const char* kFunctionAttribute = "code.function";
constexpr const char* kModuleAttribute = "code.module";
constexpr const char* kArgsHashAttribute = "code.args_hash";
constexpr const char* kResultHashAttribute = "code.result_hash";
constexpr const char* kItemCountAttribute = "code.generator.item_count";

/**
 * @brief Always stores sha256(value) under "<key>_hash"; stores the plaintext
 * under @p key only when content tracing is enabled. Never throws.
 */
void set_content_tag(Span& span, const std::string& key, std::string_view value);
void set_content_tag(Span& span, const std::string& key, std::string_view value, bool include_plaintext);

namespace detail {

TracerPtr resolve_tracer(const TracedOptions& options);
std::string span_name(const TracedOptions& options);

// The helpers below run backend code on behalf of a wrapped callable. A
// std::exception thrown by the backend is logged and goes no further.

// Falls back to a NullSpan when the backend cannot start one.
SpanPtr open_span(const TracedOptions& options);
SpanPtr start_span(Tracer& tracer, const std::string& name, const SpanOptions& options);
void tag(Span& span, const std::string& key, AttributeValue value);

// "src/jobs/report.cpp" -> "report"
std::string module_from_path(std::string_view file);
TracedOptions options_for(std::string_view function, std::string_view file, TracedOptions base = {});

// 16 hex chars of SHA-256 over the compact JSON rendering, or nullopt on failure.
std::optional<std::string> fingerprint(const nlohmann::ordered_json& rendering) noexcept;
void log_instrumentation_failure(std::string_view what, const std::exception& e) noexcept;

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template <typename T>
nlohmann::ordered_json describe(const T& value) {
    if constexpr (std::is_constructible_v<nlohmann::ordered_json, const T&>) {
        return nlohmann::ordered_json(value);
    } else if constexpr (is_streamable<T>::value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return demangled_name(typeid(T));
    }
}

template <typename T>
bool is_null(const T& /*value*/) {
    return false;
}

template <typename T>
bool is_null(T* value) {
    return value == nullptr;
}

template <typename T>
bool is_null(const std::shared_ptr<T>& value) {
    return !value;
}

template <typename T, typename D>
bool is_null(const std::unique_ptr<T, D>& value) {
    return !value;
}

template <typename T>
bool is_null(const std::optional<T>& value) {
    return !value.has_value();
}

inline bool is_null(std::nullptr_t) {
    return true;
}

inline bool is_null(const nlohmann::json& value) {
    return value.is_null();
}

inline bool is_null(const nlohmann::ordered_json& value) {
    return value.is_null();
}

template <typename... Args>
std::optional<std::string> args_fingerprint(const Args&... args) noexcept {
    try {
        nlohmann::ordered_json rendering = nlohmann::ordered_json::array();
        (rendering.push_back(describe(args)), ...);
        return fingerprint(rendering);
    } catch (const std::exception& e) {
        log_instrumentation_failure("argument fingerprint", e);
        return std::nullopt;
    }
}

template <typename T>
std::optional<std::string> result_fingerprint(const T& result) noexcept {
    try {
        if (is_null(result)) {
            return std::nullopt;
        }
        return fingerprint(describe(result));
    } catch (const std::exception& e) {
        log_instrumentation_failure("result fingerprint", e);
        return std::nullopt;
    }
}

void end(Span& span);
// OK unless a status was already set, then end().
void finish_ok(Span& span);
// record_exception() then end(). The caller rethrows the original exception.
void finish_error(Span& span, const std::exception& e);
void finish_unknown_error(Span& span);
// Stamps code.generator.item_count, then finish_ok().
void finish_generator(Span& span, std::size_t item_count);

}  // namespace detail

/**
 * @brief Callable wrapper that runs @p F inside a span.
 *
 * The wrapped callable's result and exceptions pass through unchanged. An
 * exception marks the span ERROR, adds one "exception" event and is rethrown.
 */
template <typename F>
class Traced {
public:
    Traced(TracedOptions options, F fn)
        : options_(std::move(options)), fn_(std::move(fn)) {}

    template <typename... Args>
    std::invoke_result_t<const F&, Args&&...> operator()(Args&&... args) const {
        using Result = std::invoke_result_t<const F&, Args&&...>;

        auto span = detail::open_span(options_);
        if (options_.record_args) {
            if (auto hash = detail::args_fingerprint(args...)) {
                detail::tag(*span, kArgsHashAttribute, *hash);
            }
        }

        // Only the wrapped callable runs inside the try: tracing failures
        // after it returns must not turn its result into an exception.
        auto call = [&]() -> Result {
            try {
                return std::invoke(fn_, std::forward<Args>(args)...);
            } catch (const std::exception& e) {
                detail::finish_error(*span, e);
                throw;
            } catch (...) {
                detail::finish_unknown_error(*span);
                throw;
            }
        };

        if constexpr (std::is_void_v<Result>) {
            call();
            detail::finish_ok(*span);
        } else {
            Result result = call();
            if (options_.record_result) {
                if (auto hash = detail::result_fingerprint(result)) {
                    detail::tag(*span, kResultHashAttribute, *hash);
                }
            }
            detail::finish_ok(*span);
            return std::forward<Result>(result);
        }
    }

    [[nodiscard]] const TracedOptions& options() const noexcept { return options_; }

private:
    TracedOptions options_;
    F fn_;
};

template <typename F>
Traced<std::decay_t<F>> traced(TracedOptions options, F&& fn) {
    return Traced<std::decay_t<F>>(std::move(options), std::forward<F>(fn));
}

/**
 * @brief Input range over a pull source, traced by one span for the whole iteration.
 *
 * The span opens on the first pull. Exhaustion sets OK, an exception sets
 * ERROR and is rethrown, and destroying an unfinished generator ends the span
 * with its status left as is. code.generator.item_count is set in every case.
 */
template <typename T>
class TracedGenerator {
public:
    using Source = std::function<std::optional<T>()>;
    using SourceFactory = std::function<Source()>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;
        explicit iterator(TracedGenerator* generator) : generator_(generator) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }
        void operator++(int) { advance(); }

        friend bool operator==(const iterator& a, const iterator& b) { return a.generator_ == b.generator_; }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

    private:
        void advance() {
            current_ = generator_->next();
            if (!current_) {
                generator_ = nullptr;
            }
        }

        TracedGenerator* generator_{nullptr};
        std::optional<T> current_;
    };

    TracedGenerator(TracedOptions options, SourceFactory factory)
        : options_(std::move(options)), factory_(std::move(factory)) {}

    ~TracedGenerator() {
        if (span_ && !done_) {
            detail::tag(*span_, kItemCountAttribute, item_count_);
            detail::end(*span_);
        }
    }

    TracedGenerator(const TracedGenerator&) = delete;
    TracedGenerator& operator=(const TracedGenerator&) = delete;
    TracedGenerator(TracedGenerator&&) = default;
    TracedGenerator& operator=(TracedGenerator&&) = delete;

    std::optional<T> next() {
        if (done_) {
            return std::nullopt;
        }
        if (!span_) {
            span_ = detail::open_span(options_);
        }

        auto item = pull();
        if (!item) {
            done_ = true;
            detail::finish_generator(*span_, item_count_);
            return std::nullopt;
        }
        ++item_count_;
        return item;
    }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    [[nodiscard]] std::size_t item_count() const noexcept { return item_count_; }
    [[nodiscard]] bool finished() const noexcept { return done_; }
    [[nodiscard]] SpanPtr span() const { return span_; }

private:
    std::optional<T> pull() {
        try {
            if (!source_) {
                source_ = factory_();
            }
            return source_();
        } catch (const std::exception& e) {
            done_ = true;
            detail::tag(*span_, kItemCountAttribute, item_count_);
            detail::finish_error(*span_, e);
            throw;
        } catch (...) {
            done_ = true;
            detail::tag(*span_, kItemCountAttribute, item_count_);
            detail::finish_unknown_error(*span_);
            throw;
        }
    }

    TracedOptions options_;
    SourceFactory factory_;
    Source source_;
    SpanPtr span_;
    std::size_t item_count_{0};
    bool done_{false};
};

/**
 * @brief Wraps a function returning a pull source (a callable yielding
 * std::optional<T>, nullopt at the end). Calling the wrapper captures the
 * arguments and returns a TracedGenerator; @p F runs on the first pull.
 */
template <typename F>
class TracedGeneratorFunction {
public:
    TracedGeneratorFunction(TracedOptions options, F fn)
        : options_(std::move(options)), fn_(std::move(fn)) {}

    template <typename... Args>
    auto operator()(Args&&... args) const {
        using SourceType = std::invoke_result_t<F&, std::decay_t<Args>&...>;
        using Item = typename std::invoke_result_t<SourceType&>::value_type;
        using Generator = TracedGenerator<Item>;

        auto options = options_;
        if (options.record_args) {
            if (auto hash = detail::args_fingerprint(args...)) {
                options.attributes[kArgsHashAttribute] = *hash;
            }
        }

        typename Generator::SourceFactory factory =
            [fn = fn_, captured = std::make_tuple(std::decay_t<Args>(std::forward<Args>(args))...)]() mutable {
                return typename Generator::Source(std::apply(fn, captured));
            };
        return Generator(std::move(options), std::move(factory));
    }

private:
    TracedOptions options_;
    F fn_;
};

template <typename F>
TracedGeneratorFunction<std::decay_t<F>> traced_generator(TracedOptions options, F&& fn) {
    return TracedGeneratorFunction<std::decay_t<F>>(std::move(options), std::forward<F>(fn));
}

/**
 * @brief Runs fn(span) inside a ScopedSpan started on @p tracer. An exception
 * is recorded with its message and rethrown.
 */
template <typename F>
std::invoke_result_t<F&, Span&> in_span(Tracer& tracer, const std::string& name, F&& fn,
                                        const SpanOptions& options = {}) {
    ScopedSpan scope(detail::start_span(tracer, name, options));
    try {
        return std::invoke(fn, *scope.get());
    } catch (const std::exception& e) {
        scope.record_exception(e);
        throw;
    }
}

}  // namespace beacon::core::observability

#define BEACON_TRACED(fn) \
    ::beacon::core::observability::traced(::beacon::core::observability::detail::options_for(#fn, __FILE__), fn)

#define BEACON_TRACED_WITH(fn, options)                                                                  \
    ::beacon::core::observability::traced(                                                               \
        ::beacon::core::observability::detail::options_for(#fn, __FILE__, options), fn)
