#include "beacon/core/observability/tracing_options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "beacon/core/config/configuration.hpp"

namespace beacon::core::observability {

namespace {

std::optional<std::string> optional_string(const config::Configuration& config, std::string_view key) {
    if (!config.contains(key)) {
        return std::nullopt;
    }
    auto value = config.get_string(key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

TracingOptions TracingOptions::from_config(const config::Configuration& config) {
    TracingOptions options;
    options.backend = lowercase(config.get_string("tracing.backend", options.backend));
    options.db_path = config.get_string("tracing.db_path", options.db_path.string());

    const int buffer_size = config.get_int("tracing.buffer_size", static_cast<int>(options.buffer_size));
    options.buffer_size = buffer_size > 0 ? static_cast<std::size_t>(buffer_size) : 0;

    options.classification = config.get_string("tracing.classification", options.classification);
    options.agent_id = optional_string(config, "tracing.agent_id");
    options.project_id = optional_string(config, "tracing.project_id");
    options.content_tracing_enabled = config.get_bool("tracing.content_tracing_enabled", false);
    if (auto env = content_tracing_from_env()) {
        options.content_tracing_enabled = *env;
    }
    options.otel_endpoint = config.get_string("tracing.otel_endpoint", options.otel_endpoint);
    options.service_name = config.get_string("tracing.service_name", options.service_name);
    return options;
}

bool TracingOptions::validate() const {
    if (backend.empty() || buffer_size == 0) {
        return false;
    }
    if ((backend == "sqlite" || backend == "buffered") && db_path.empty()) {
        return false;
    }
    if (backend == "otel" && service_name.empty()) {
        return false;
    }
    return !classification.empty();
}

BufferedTracerOptions TracingOptions::buffered_options() const {
    BufferedTracerOptions options;
    options.buffer_size = buffer_size;
    options.agent_id = agent_id;
    options.project_id = project_id;
    options.classification = classification;
    return options;
}

std::optional<bool> content_tracing_from_env() {
    const char* raw = std::getenv(kContentTracingEnv);
    if (raw == nullptr) {
        return std::nullopt;
    }
    const auto value = lowercase(config::trim(raw));
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off" || value.empty()) {
        return false;
    }
    return std::nullopt;
}

}  // namespace beacon::core::observability
