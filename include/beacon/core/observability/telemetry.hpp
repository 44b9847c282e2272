#pragma once

#include <functional>
#include <string>
#include <vector>

#include "beacon/core/logging/logger.hpp"
#include "beacon/core/observability/proxy_tracer.hpp"
#include "beacon/core/observability/tracing_options.hpp"

namespace beacon::core::observability {

using TracerFactory = std::function<TracerPtr(const TracingOptions& options, const logging::LoggerPtr& logger)>;

/**
 * @brief Process-wide tracing entry point.
 *
 * Holds the global ProxyTracer and the backend factory registry. Built-in
 * backends: "null", "sqlite" (alias "buffered") and "log".
 */
class Telemetry {
public:
    static ProxyTracerPtr get_tracer();

    // nullptr installs the Null backend.
    static void configure_tracer(TracerPtr tracer);

    // Builds @p backend and installs it. Unknown names and construction
    // failures log a warning and install the Null backend. Returns the
    // installed backend.
    static TracerPtr enable_tracing(const std::string& backend, const TracingOptions& options = {});
    static TracerPtr enable_tracing(const TracingOptions& options);

    // Same as enable_tracing() without installing; never returns nullptr.
    static TracerPtr create_tracer(const TracingOptions& options, const logging::LoggerPtr& logger = nullptr);

    static void register_backend(const std::string& name, TracerFactory factory);
    [[nodiscard]] static bool has_backend(const std::string& name);
    [[nodiscard]] static std::vector<std::string> backends();

    // Flushes the current backend and reinstalls the Null backend.
    static void shutdown();

    // Plaintext opt-in for set_content_tag(). Initialised from
    // BEACON_CONTENT_TRACING_ENABLED.
    static void set_content_tracing_enabled(bool enabled) noexcept;
    [[nodiscard]] static bool content_tracing_enabled() noexcept;

    static void set_logger(logging::LoggerPtr logger);
    [[nodiscard]] static logging::LoggerPtr logger();
};

}  // namespace beacon::core::observability
