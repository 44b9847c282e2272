#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include "beacon/core/config/configuration.hpp"
#include "beacon/core/observability/buffered_tracer.hpp"
#include "beacon/core/observability/null_tracer.hpp"
#include "beacon/core/observability/telemetry.hpp"
#include "beacon/core/registry.hpp"
#include "beacon/modules/tracing.hpp"
#include "memory_store.hpp"

using namespace beacon::core::observability;
using beacon::core::config::Configuration;
using beacon::test::MemorySpanStore;
using beacon::test::TempDbPath;

namespace {

// Sets or clears BEACON_CONTENT_TRACING_ENABLED for one test.
class ContentTracingEnv {
public:
    explicit ContentTracingEnv(const char* value) {
        if (value) {
            ::setenv(kContentTracingEnv, value, 1);
        } else {
            ::unsetenv(kContentTracingEnv);
        }
    }
    ~ContentTracingEnv() { ::unsetenv(kContentTracingEnv); }
};

// Leaves the process-wide tracer on the null backend.
struct TelemetryReset {
    ~TelemetryReset() {
        Telemetry::shutdown();
        Telemetry::set_content_tracing_enabled(false);
    }
};

}  // namespace

TEST_CASE("TracingOptions defaults and validation", "[observability][telemetry]") {
    TracingOptions options;
    REQUIRE(options.backend == "null");
    REQUIRE(options.db_path == "data/beacon.db");
    REQUIRE(options.buffer_size == 10);
    REQUIRE(options.classification == "CUI");
    REQUIRE_FALSE(options.content_tracing_enabled);
    REQUIRE(options.validate());

    SECTION("Zero buffer") {
        options.buffer_size = 0;
        REQUIRE_FALSE(options.validate());
    }

    SECTION("SQLite needs a path") {
        options.backend = "sqlite";
        options.db_path.clear();
        REQUIRE_FALSE(options.validate());
    }

    SECTION("Empty classification") {
        options.classification.clear();
        REQUIRE_FALSE(options.validate());
    }

    SECTION("Buffered options carry identity") {
        options.agent_id = "agent";
        options.buffer_size = 3;
        const auto buffered = options.buffered_options();
        REQUIRE(buffered.buffer_size == 3);
        REQUIRE(buffered.agent_id == std::optional<std::string>{"agent"});
        REQUIRE_FALSE(buffered.project_id.has_value());
        REQUIRE(buffered.classification == "CUI");
    }
}

TEST_CASE("TracingOptions from configuration", "[observability][telemetry]") {
    ContentTracingEnv env(nullptr);

    Configuration config;
    config.set("tracing.backend", "SQLite");
    config.set("tracing.db_path", "/tmp/spans.db");
    config.set("tracing.buffer_size", "25");
    config.set("tracing.classification", "PUBLIC");
    config.set("tracing.agent_id", "agent-1");
    config.set("tracing.project_id", "");
    config.set("tracing.content_tracing_enabled", "true");

    auto options = TracingOptions::from_config(config);
    REQUIRE(options.backend == "sqlite");
    REQUIRE(options.db_path == "/tmp/spans.db");
    REQUIRE(options.buffer_size == 25);
    REQUIRE(options.classification == "PUBLIC");
    REQUIRE(options.agent_id == std::optional<std::string>{"agent-1"});
    REQUIRE_FALSE(options.project_id.has_value());
    REQUIRE(options.content_tracing_enabled);

    SECTION("Negative buffer size is invalid") {
        config.set("tracing.buffer_size", "-4");
        REQUIRE_FALSE(TracingOptions::from_config(config).validate());
    }

    SECTION("Environment overrides the content flag") {
        ContentTracingEnv off("off");
        REQUIRE_FALSE(TracingOptions::from_config(config).content_tracing_enabled);
    }

    SECTION("Empty configuration yields defaults") {
        const auto defaults = TracingOptions::from_config(Configuration{});
        REQUIRE(defaults.backend == "null");
        REQUIRE(defaults.buffer_size == 10);
    }
}

TEST_CASE("Content tracing environment values", "[observability][telemetry]") {
    {
        ContentTracingEnv env(nullptr);
        REQUIRE_FALSE(content_tracing_from_env().has_value());
    }
    {
        ContentTracingEnv env(" Yes ");
        REQUIRE(content_tracing_from_env() == std::optional<bool>{true});
    }
    {
        ContentTracingEnv env("0");
        REQUIRE(content_tracing_from_env() == std::optional<bool>{false});
    }
    {
        ContentTracingEnv env("maybe");
        REQUIRE_FALSE(content_tracing_from_env().has_value());
    }
}

TEST_CASE("Backend registry", "[observability][telemetry]") {
    const auto names = Telemetry::backends();
    for (const char* builtin : {"null", "sqlite", "buffered", "log"}) {
        REQUIRE(std::find(names.begin(), names.end(), builtin) != names.end());
    }

    SECTION("Unknown backends fall back to null") {
        TracingOptions options;
        options.backend = "carrier-pigeon";
        auto tracer = Telemetry::create_tracer(options);
        REQUIRE(tracer != nullptr);
        REQUIRE(tracer->backend_name() == "null");
    }

    SECTION("Invalid options fall back to null") {
        TracingOptions options;
        options.backend = "log";
        options.buffer_size = 0;
        REQUIRE(Telemetry::create_tracer(options)->backend_name() == "null");
    }

    SECTION("Custom backends") {
        auto store = std::make_shared<MemorySpanStore>();
        Telemetry::register_backend("memory", [store](const TracingOptions& options, const auto& logger) {
            return std::make_shared<BufferedTracer>(store, options.buffered_options(), logger);
        });
        REQUIRE(Telemetry::has_backend("memory"));

        TracingOptions options;
        options.backend = "memory";
        options.buffer_size = 1;
        auto tracer = Telemetry::create_tracer(options);
        tracer->start_span("custom")->end();
        REQUIRE(store->records().size() == 1);

        Telemetry::register_backend("memory", nullptr);
        REQUIRE_FALSE(Telemetry::has_backend("memory"));
    }

    SECTION("Throwing factories fall back to null") {
        Telemetry::register_backend("broken", [](const TracingOptions&, const auto&) -> TracerPtr {
            throw std::runtime_error("no backend today");
        });
        TracingOptions options;
        options.backend = "broken";
        REQUIRE(Telemetry::create_tracer(options)->backend_name() == "null");
        Telemetry::register_backend("broken", nullptr);
    }

    SECTION("SQLite backend") {
        TempDbPath db("telemetry");
        TracingOptions options;
        options.backend = "sqlite";
        options.db_path = db.path;
        options.buffer_size = 1;
        auto tracer = Telemetry::create_tracer(options);
        REQUIRE(tracer->backend_name() == "buffered");
        REQUIRE(std::filesystem::exists(db.path));

        auto span = tracer->start_span("persisted");
        span->end();
        SpanQuery query;
        query.trace_id = span->trace_id();
        REQUIRE(tracer->query_spans(query).size() == 1);
    }
}

TEST_CASE("Global tracer lifecycle", "[observability][telemetry]") {
    TelemetryReset reset;
    ContentTracingEnv env(nullptr);

    auto proxy = Telemetry::get_tracer();
    REQUIRE(proxy == Telemetry::get_tracer());
    REQUIRE(proxy->backend_name() == "null");

    auto store = std::make_shared<MemorySpanStore>();
    BufferedTracerOptions buffered;
    buffered.buffer_size = 100;
    Telemetry::configure_tracer(std::make_shared<BufferedTracer>(store, buffered));
    REQUIRE(proxy->backend_name() == "buffered");

    proxy->start_span("pending")->end();
    REQUIRE(store->records().empty());

    Telemetry::shutdown();
    REQUIRE(store->records().size() == 1);
    REQUIRE(proxy->backend_name() == "null");

    SECTION("enable_tracing installs the named backend") {
        TracingOptions options;
        options.content_tracing_enabled = true;
        auto tracer = Telemetry::enable_tracing("log", options);
        REQUIRE(proxy->tracer() == tracer);
        REQUIRE(Telemetry::content_tracing_enabled());
    }

    SECTION("enable_tracing with an unknown backend installs null") {
        auto tracer = Telemetry::enable_tracing("nope");
        REQUIRE(tracer->backend_name() == "null");
        REQUIRE(proxy->backend_name() == "null");
    }
}

TEST_CASE("Tracing logger is replaceable", "[observability][telemetry]") {
    auto previous = Telemetry::logger();
    REQUIRE(previous != nullptr);

    auto custom = beacon::core::logging::create_logger("beacon.tracing.test");
    Telemetry::set_logger(custom);
    REQUIRE(Telemetry::logger() == custom);

    Telemetry::set_logger(previous);
    REQUIRE(Telemetry::logger() == previous);
}

TEST_CASE("Tracing module drives the proxy", "[observability][telemetry][registry]") {
    ContentTracingEnv env(nullptr);
    TempDbPath db("module");

    auto proxy = std::make_shared<ProxyTracer>();
    beacon::core::ModuleRegistry registry;
    auto& module = registry.emplace_module<beacon::modules::TracingModule>(nullptr, proxy);
    REQUIRE(module.name() == "tracing");

    Configuration config;
    config.set("tracing.backend", "sqlite");
    config.set("tracing.db_path", db.path.string());
    config.set("tracing.buffer_size", "50");
    config.set("tracing.project_id", "proj-module");
    registry.configure_all(config);
    REQUIRE(module.options().backend == "sqlite");
    REQUIRE(module.options().buffer_size == 50);

    registry.start_all();
    REQUIRE(module.active());
    REQUIRE(proxy->backend_name() == "buffered");

    auto span = proxy->start_span("module-span");
    span->end();

    registry.stop_all();
    REQUIRE_FALSE(module.active());
    REQUIRE(proxy->backend_name() == "null");

    beacon::core::observability::SqliteSpanStore store(db.path);
    SpanQuery query;
    query.project_id = "proj-module";
    const auto rows = store.query(query);
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].name == "module-span");

    Telemetry::set_content_tracing_enabled(false);
}
