#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "beacon/core/observability/buffered_tracer.hpp"
#include "beacon/core/observability/instrumentation.hpp"
#include "beacon/core/observability/null_tracer.hpp"
#include "beacon/core/observability/telemetry.hpp"
#include "beacon/core/security/digest.hpp"
#include "memory_store.hpp"

using namespace beacon::core::observability;
using beacon::core::security::sha256_hex;
using beacon::core::security::sha256_prefix;
using beacon::test::MemorySpanStore;

namespace {

struct Fixture {
    Fixture() {
        BufferedTracerOptions buffered;
        buffered.buffer_size = 1;
        tracer = std::make_shared<BufferedTracer>(store, buffered);
    }

    TracedOptions options(const std::string& function) const {
        TracedOptions result;
        result.function = function;
        result.module = "jobs";
        result.tracer = tracer;
        return result;
    }

    SpanRecord only_record() const {
        const auto records = store->records();
        REQUIRE(records.size() == 1);
        return records[0];
    }

    std::shared_ptr<MemorySpanStore> store = std::make_shared<MemorySpanStore>();
    std::shared_ptr<BufferedTracer> tracer;
};

int add_numbers(int a, int b) {
    return a + b;
}

struct Opaque {
    int value;
};

// Yields 1..n, optionally failing once `fail_after` items were produced.
std::function<std::optional<int>()> count_to(int n, int fail_after = -1) {
    return [i = 0, n, fail_after]() mutable -> std::optional<int> {
        if (i == fail_after) {
            throw std::runtime_error("source broke");
        }
        if (i >= n) {
            return std::nullopt;
        }
        return ++i;
    };
}

// Backend whose spans throw from every mutator, standing in for an exporter
// that went away mid-request.
class FailingSpan : public NullSpan {
public:
    void set_attribute(const std::string& /*key*/, AttributeValue /*value*/) override { fail(); }
    void add_event(const std::string& /*name*/, Attributes /*attributes*/) override { fail(); }
    void set_status(StatusCode /*code*/, const std::string& /*message*/) override { fail(); }
    void end() override {
        ++end_calls;
        fail();
    }

    int end_calls{0};

private:
    static void fail() { throw std::runtime_error("exporter down"); }
};

class FailingTracer : public NullTracer {
public:
    SpanPtr start_span(const std::string& /*name*/, const SpanOptions& /*options*/ = {}) override {
        if (fail_start) {
            throw std::runtime_error("tracer offline");
        }
        last_span = std::make_shared<FailingSpan>();
        return last_span;
    }

    bool fail_start{false};
    std::shared_ptr<FailingSpan> last_span;
};

}  // namespace

TEST_CASE("traced() wraps a successful call", "[observability][instrumentation]") {
    Fixture fx;
    auto add = traced(fx.options("add"), [](int a, int b) { return a + b; });

    REQUIRE(add(2, 3) == 5);

    const auto record = fx.only_record();
    REQUIRE(record.name == "jobs.add");
    REQUIRE(record.status_code == "OK");
    REQUIRE(record.attributes[kFunctionAttribute] == "add");
    REQUIRE(record.attributes[kModuleAttribute] == "jobs");
    REQUIRE_FALSE(record.attributes.contains(kArgsHashAttribute));
    REQUIRE_FALSE(record.attributes.contains(kResultHashAttribute));
    REQUIRE(record.events.empty());
}

TEST_CASE("traced() records exceptions and rethrows them", "[observability][instrumentation]") {
    Fixture fx;
    auto fail = traced(fx.options("fail"), []() -> int { throw std::invalid_argument("boom"); });

    REQUIRE_THROWS_AS(fail(), std::invalid_argument);

    const auto record = fx.only_record();
    REQUIRE(record.status_code == "ERROR");
    REQUIRE(record.status_message == std::optional<std::string>{"boom"});
    REQUIRE(record.events.size() == 1);
    const auto& event = record.events[0];
    REQUIRE(event["name"] == "exception");
    REQUIRE(event["attributes"]["exception.type"] == "std::invalid_argument");
    REQUIRE(event["attributes"]["exception.message"] == "boom");
}

TEST_CASE("traced() keeps an explicit status set inside the call", "[observability][instrumentation]") {
    Fixture fx;
    auto tracer = fx.tracer;
    auto degrade = traced(fx.options("degrade"), [tracer] {
        tracer->get_active_span()->set_status(StatusCode::Error, "partial result");
    });

    degrade();
    const auto record = fx.only_record();
    REQUIRE(record.status_code == "ERROR");
    REQUIRE(record.status_message == std::optional<std::string>{"partial result"});
}

TEST_CASE("traced() fingerprints arguments and results", "[observability][instrumentation]") {
    Fixture fx;
    auto options = fx.options("concat");
    options.record_args = true;
    options.record_result = true;

    SECTION("JSON-representable values") {
        auto concat = traced(options, [](const std::string& a, int b) { return a + std::to_string(b); });
        REQUIRE(concat(std::string{"id-"}, 7) == "id-7");

        const auto record = fx.only_record();
        REQUIRE(record.attributes[kArgsHashAttribute] == sha256_prefix(R"(["id-",7])", 16));
        REQUIRE(record.attributes[kResultHashAttribute] == sha256_prefix(R"("id-7")", 16));
        REQUIRE(record.attributes.dump().find("id-7") == std::string::npos);
    }

    SECTION("Null results are not fingerprinted") {
        auto lookup = traced(options, [](int) { return std::optional<int>{}; });
        REQUIRE_FALSE(lookup(1).has_value());

        const auto record = fx.only_record();
        REQUIRE(record.attributes.contains(kArgsHashAttribute));
        REQUIRE_FALSE(record.attributes.contains(kResultHashAttribute));
    }

    SECTION("Null pointers are not fingerprinted") {
        auto make = traced(options, [] { return std::shared_ptr<int>{}; });
        REQUIRE(make() == nullptr);
        REQUIRE_FALSE(fx.only_record().attributes.contains(kResultHashAttribute));
    }

    SECTION("Values without a JSON form fall back to their type name") {
        auto unwrap = traced(options, [](Opaque o) { return o.value; });
        REQUIRE(unwrap(Opaque{4}) == 4);

        const auto hash = fx.only_record().attributes[kArgsHashAttribute].get<std::string>();
        REQUIRE(hash.size() == 16);
    }
}

TEST_CASE("traced() nests under the active span", "[observability][instrumentation]") {
    Fixture fx;
    auto inner = traced(fx.options("inner"), [] { return 1; });
    auto outer = traced(fx.options("outer"), [&inner] { return inner() + 1; });

    REQUIRE(outer() == 2);

    const auto records = fx.store->records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].name == "jobs.inner");
    REQUIRE(records[1].name == "jobs.outer");
    REQUIRE(records[0].trace_id == records[1].trace_id);
    REQUIRE(records[0].parent_span_id == std::optional<std::string>{records[1].id});
}

TEST_CASE("Span names", "[observability][instrumentation]") {
    TracedOptions options;
    REQUIRE(detail::span_name(options) == "traced");
    options.function = "run";
    REQUIRE(detail::span_name(options) == "run");
    options.module = "jobs";
    REQUIRE(detail::span_name(options) == "jobs.run");
    options.name = "custom";
    REQUIRE(detail::span_name(options) == "custom");

    REQUIRE(detail::module_from_path("src/jobs/report.cpp") == "report");
    REQUIRE(detail::module_from_path("C:\\work\\sync.cc") == "sync");

    const auto derived = detail::options_for("jobs::run", "src/jobs/runner.cpp");
    REQUIRE(derived.function == "run");
    REQUIRE(derived.module == "runner");
}

TEST_CASE("BEACON_TRACED names spans after the function and file", "[observability][instrumentation]") {
    Fixture fx;
    Telemetry::configure_tracer(fx.tracer);

    auto add = BEACON_TRACED(add_numbers);
    REQUIRE(add(20, 22) == 42);

    TracedOptions extra;
    extra.kind = SpanKind::Client;
    auto add_client = BEACON_TRACED_WITH(add_numbers, extra);
    REQUIRE(add_client(1, 1) == 2);

    Telemetry::shutdown();

    const auto records = fx.store->records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].name == "instrumentation_test.add_numbers");
    REQUIRE(records[0].kind == "INTERNAL");
    REQUIRE(records[1].name == "instrumentation_test.add_numbers");
    REQUIRE(records[1].kind == "CLIENT");
}

TEST_CASE("traced_generator() spans the whole iteration", "[observability][instrumentation]") {
    Fixture fx;

    SECTION("Exhaustion sets OK and the item count") {
        auto numbers = traced_generator(fx.options("numbers"), [](int n) { return count_to(n); });
        auto generator = numbers(3);
        REQUIRE(fx.store->records().empty());
        REQUIRE(generator.span() == nullptr);

        std::vector<int> items;
        for (int item : generator) {
            items.push_back(item);
        }
        REQUIRE(items == std::vector<int>{1, 2, 3});
        REQUIRE(generator.finished());
        REQUIRE(generator.item_count() == 3);

        const auto record = fx.only_record();
        REQUIRE(record.name == "jobs.numbers");
        REQUIRE(record.status_code == "OK");
        REQUIRE(record.attributes[kItemCountAttribute] == 3);
    }

    SECTION("Empty sources still produce a span") {
        auto none = traced_generator(fx.options("none"), [] { return count_to(0); });
        auto generator = none();
        REQUIRE_FALSE(generator.next().has_value());
        REQUIRE(fx.only_record().attributes[kItemCountAttribute] == 0);
    }

    SECTION("A failing source sets ERROR and rethrows") {
        auto flaky = traced_generator(fx.options("flaky"), [](int n) { return count_to(n, 2); });
        auto generator = flaky(5);

        std::vector<int> items;
        REQUIRE_THROWS_AS(
            [&] {
                for (int item : generator) {
                    items.push_back(item);
                }
            }(),
            std::runtime_error);
        REQUIRE(items == std::vector<int>{1, 2});

        const auto record = fx.only_record();
        REQUIRE(record.status_code == "ERROR");
        REQUIRE(record.attributes[kItemCountAttribute] == 2);
        REQUIRE(record.events.size() == 1);
        REQUIRE(record.events[0]["attributes"]["exception.message"] == "source broke");
    }

    SECTION("Abandoning the iteration ends the span") {
        {
            auto numbers = traced_generator(fx.options("partial"), [](int n) { return count_to(n); });
            auto generator = numbers(10);
            REQUIRE(generator.next() == std::optional<int>{1});
            REQUIRE(fx.store->records().empty());
        }
        const auto record = fx.only_record();
        REQUIRE(record.status_code == "UNSET");
        REQUIRE(record.attributes[kItemCountAttribute] == 1);
    }

    SECTION("Arguments are fingerprinted when requested") {
        auto options = fx.options("numbers");
        options.record_args = true;
        auto numbers = traced_generator(options, [](int n) { return count_to(n); });
        auto generator = numbers(2);
        while (generator.next()) {
        }
        REQUIRE(fx.only_record().attributes[kArgsHashAttribute] == sha256_prefix("[2]", 16));
    }
}

TEST_CASE("Content tags", "[observability][instrumentation]") {
    Fixture fx;
    auto span = fx.tracer->start_span("prompt");
    auto buffered = std::dynamic_pointer_cast<BufferedSpan>(span);

    SECTION("Hash only by default") {
        set_content_tag(*span, "llm.prompt", "hello", false);
        REQUIRE(buffered->attributes()["llm.prompt_hash"] == sha256_hex("hello"));
        REQUIRE_FALSE(buffered->attributes().contains("llm.prompt"));
    }

    SECTION("Plaintext when opted in") {
        set_content_tag(*span, "llm.prompt", "hello", true);
        REQUIRE(buffered->attributes()["llm.prompt_hash"] == sha256_hex("hello"));
        REQUIRE(buffered->attributes()["llm.prompt"] == "hello");
    }

    SECTION("Global flag") {
        Telemetry::set_content_tracing_enabled(true);
        set_content_tag(*span, "llm.response", "world");
        Telemetry::set_content_tracing_enabled(false);
        set_content_tag(*span, "llm.other", "hidden");

        REQUIRE(buffered->attributes()["llm.response"] == "world");
        REQUIRE(buffered->attributes().contains("llm.other_hash"));
        REQUIRE_FALSE(buffered->attributes().contains("llm.other"));
    }

    span->end();
}

TEST_CASE("in_span() runs a block inside a scoped span", "[observability][instrumentation]") {
    Fixture fx;

    SECTION("Result passes through") {
        const int value = in_span(*fx.tracer, "block", [](Span& span) {
            span.set_attribute("step", 1);
            return 9;
        });
        REQUIRE(value == 9);
        const auto record = fx.only_record();
        REQUIRE(record.name == "block");
        REQUIRE(record.status_code == "OK");
        REQUIRE(record.attributes["step"] == 1);
    }

    SECTION("Exceptions are recorded") {
        REQUIRE_THROWS_AS(in_span(*fx.tracer, "failing", [](Span&) { throw std::out_of_range("index 4"); }),
                          std::out_of_range);
        const auto record = fx.only_record();
        REQUIRE(record.status_code == "ERROR");
        REQUIRE(record.status_message == std::optional<std::string>{"index 4"});
        REQUIRE(record.events[0]["attributes"]["exception.type"] == "std::out_of_range");
    }
}

TEST_CASE("Tracing failures never reach the wrapped call's caller", "[observability][instrumentation]") {
    auto tracer = std::make_shared<FailingTracer>();
    TracedOptions options;
    options.function = "double_it";
    options.record_args = true;
    options.record_result = true;
    options.tracer = tracer;

    SECTION("Result passes through when ending the span fails") {
        int calls = 0;
        auto wrapped = traced(options, [&calls](int x) {
            ++calls;
            return x * 2;
        });
        int result = 0;
        REQUIRE_NOTHROW(result = wrapped(21));
        REQUIRE(result == 42);
        REQUIRE(calls == 1);
        REQUIRE(tracer->last_span->end_calls == 1);
    }

    SECTION("Void calls complete when ending the span fails") {
        bool ran = false;
        REQUIRE_NOTHROW(traced(options, [&ran] { ran = true; })());
        REQUIRE(ran);
    }

    SECTION("The call's own exception is rethrown, not the backend's") {
        auto wrapped = traced(options, [](int) -> int { throw std::invalid_argument("bad input"); });
        REQUIRE_THROWS_AS(wrapped(1), std::invalid_argument);
        REQUIRE(tracer->last_span->end_calls == 1);
    }

    SECTION("A tracer that cannot start spans still runs the call") {
        tracer->fail_start = true;
        auto wrapped = traced(options, [](int x) { return x + 1; });
        int result = 0;
        REQUIRE_NOTHROW(result = wrapped(1));
        REQUIRE(result == 2);
    }

    SECTION("Generators yield every item") {
        auto numbers = traced_generator(options, [](int n) { return count_to(n); });
        auto generator = numbers(3);
        std::vector<int> seen;
        REQUIRE_NOTHROW([&] {
            for (int value : generator) {
                seen.push_back(value);
            }
        }());
        REQUIRE(seen == std::vector<int>{1, 2, 3});
        REQUIRE(generator.finished());
        REQUIRE(generator.item_count() == 3);
    }

    SECTION("in_span returns the block's value") {
        int result = 0;
        REQUIRE_NOTHROW(result = in_span(*tracer, "block", [](Span&) { return 7; }));
        REQUIRE(result == 7);
    }

    SECTION("ScopedSpan keeps the body's exception and never throws from its destructor") {
        REQUIRE_THROWS_AS([&] {
            ScopedSpan scope(tracer->start_span("scoped"));
            throw std::logic_error("body failed");
        }(), std::logic_error);
        REQUIRE_NOTHROW([&] { ScopedSpan scope(tracer->start_span("scoped")); }());
    }
}
