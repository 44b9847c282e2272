#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "beacon/core/observability/buffered_tracer.hpp"

namespace beacon::core {

namespace config {
class Configuration;
}

namespace observability {

/**
 * @brief Resolved tracing settings (the [tracing] section).
 */
struct TracingOptions {
    std::string backend{"null"};
    std::filesystem::path db_path{"data/beacon.db"};
    std::size_t buffer_size{10};
    std::string classification{"CUI"};
    std::optional<std::string> agent_id;
    std::optional<std::string> project_id;
    bool content_tracing_enabled{false};
    std::string otel_endpoint{"http://localhost:4318/v1/traces"};
    std::string service_name{"beacon"};

    static TracingOptions from_config(const config::Configuration& config);

    [[nodiscard]] bool validate() const;
    [[nodiscard]] BufferedTracerOptions buffered_options() const;
};

constexpr const char* kContentTracingEnv = "BEACON_CONTENT_TRACING_ENABLED";

// Value of BEACON_CONTENT_TRACING_ENABLED, or nullopt when unset or not a boolean.
[[nodiscard]] std::optional<bool> content_tracing_from_env();

}  // namespace observability
}  // namespace beacon::core
