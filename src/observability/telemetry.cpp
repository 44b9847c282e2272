#include "beacon/core/observability/telemetry.hpp"

#include <atomic>
#include <map>
#include <mutex>

#include "beacon/core/observability/buffered_tracer.hpp"
#include "beacon/core/observability/null_tracer.hpp"
#include "beacon/core/observability/span_store.hpp"

namespace beacon::core::observability {

namespace {

std::mutex g_mutex;
logging::LoggerPtr g_logger;

std::map<std::string, TracerFactory>& factories() {
    static std::map<std::string, TracerFactory> registry = [] {
        std::map<std::string, TracerFactory> builtins;
        builtins["null"] = [](const TracingOptions&, const logging::LoggerPtr&) -> TracerPtr {
            return std::make_shared<NullTracer>();
        };
        builtins["sqlite"] = [](const TracingOptions& options, const logging::LoggerPtr& logger) -> TracerPtr {
            auto store = std::make_shared<SqliteSpanStore>(options.db_path);
            try {
                store->ensure_schema();
            } catch (const std::exception& e) {
                // Spans are still created; batches are dropped until the store is writable.
                logger->warn("Span store", options.db_path.string(), "not writable yet:", e.what());
            }
            return std::make_shared<BufferedTracer>(std::move(store), options.buffered_options(), logger);
        };
        builtins["buffered"] = builtins["sqlite"];
        builtins["log"] = [](const TracingOptions& options, const logging::LoggerPtr& logger) -> TracerPtr {
            auto store = std::make_shared<LogSpanStore>(logging::create_logger("beacon.spans"));
            return std::make_shared<BufferedTracer>(std::move(store), options.buffered_options(), logger);
        };
        return builtins;
    }();
    return registry;
}

std::atomic<bool>& content_flag() {
    static std::atomic<bool> flag{content_tracing_from_env().value_or(false)};
    return flag;
}

logging::LoggerPtr current_logger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = logging::create_logger("beacon.tracing");
    }
    return g_logger;
}

}  // namespace

ProxyTracerPtr Telemetry::get_tracer() {
    static const ProxyTracerPtr proxy = std::make_shared<ProxyTracer>();
    return proxy;
}

void Telemetry::configure_tracer(TracerPtr tracer) {
    get_tracer()->set_tracer(std::move(tracer));
    current_logger()->info("Tracing backend set to", std::string{get_tracer()->backend_name()});
}

TracerPtr Telemetry::create_tracer(const TracingOptions& options, const logging::LoggerPtr& logger) {
    auto log = logger ? logger : current_logger();

    TracerFactory factory;
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        auto& registry = factories();
        auto it = registry.find(options.backend);
        if (it != registry.end()) {
            factory = it->second;
        }
    }

    if (!factory) {
        log->warn("Unknown tracing backend", options.backend, "- using null backend");
        return std::make_shared<NullTracer>();
    }
    if (!options.validate()) {
        log->warn("Invalid tracing options for backend", options.backend, "- using null backend");
        return std::make_shared<NullTracer>();
    }

    try {
        auto tracer = factory(options, log);
        if (tracer) {
            return tracer;
        }
        log->warn("Tracing backend", options.backend, "produced no tracer - using null backend");
    } catch (const std::exception& e) {
        log->warn("Tracing backend", options.backend, "failed to start:", e.what(), "- using null backend");
    }
    return std::make_shared<NullTracer>();
}

TracerPtr Telemetry::enable_tracing(const std::string& backend, const TracingOptions& options) {
    auto resolved = options;
    resolved.backend = backend;
    return enable_tracing(resolved);
}

TracerPtr Telemetry::enable_tracing(const TracingOptions& options) {
    auto tracer = create_tracer(options);
    set_content_tracing_enabled(content_tracing_from_env().value_or(options.content_tracing_enabled));
    configure_tracer(tracer);
    return tracer;
}

void Telemetry::register_backend(const std::string& name, TracerFactory factory) {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!factory) {
        factories().erase(name);
        return;
    }
    factories()[name] = std::move(factory);
}

bool Telemetry::has_backend(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mutex);
    return factories().count(name) > 0;
}

std::vector<std::string> Telemetry::backends() {
    std::lock_guard<std::mutex> lock(g_mutex);
    std::vector<std::string> names;
    for (const auto& entry : factories()) {
        names.push_back(entry.first);
    }
    return names;
}

void Telemetry::shutdown() {
    auto proxy = get_tracer();
    proxy->flush();
    proxy->set_tracer(nullptr);
    current_logger()->debug("Tracing shut down");
}

void Telemetry::set_content_tracing_enabled(bool enabled) noexcept {
    content_flag().store(enabled);
}

bool Telemetry::content_tracing_enabled() noexcept {
    return content_flag().load();
}

void Telemetry::set_logger(logging::LoggerPtr logger) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = std::move(logger);
}

logging::LoggerPtr Telemetry::logger() {
    return current_logger();
}

}  // namespace beacon::core::observability
