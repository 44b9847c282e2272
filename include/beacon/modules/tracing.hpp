#pragma once

#include <memory>
#include <string_view>

#include "beacon/core/logging/logger.hpp"
#include "beacon/core/module.hpp"
#include "beacon/core/observability/proxy_tracer.hpp"
#include "beacon/core/observability/tracing_options.hpp"

namespace beacon::modules {

/**
 * @brief Installs the configured tracing backend into a ProxyTracer on
 * start() and flushes/reverts to the Null backend on stop().
 */
class TracingModule : public core::Module {
public:
    TracingModule(std::shared_ptr<core::logging::Logger> logger,
                  core::observability::ProxyTracerPtr tracer);

    std::string_view name() const noexcept override { return "tracing"; }
    void configure(const core::config::Configuration& configuration) override;
    void start() override;
    void stop() override;

    [[nodiscard]] const core::observability::TracingOptions& options() const noexcept { return options_; }
    [[nodiscard]] bool active() const noexcept { return active_; }

private:
    std::shared_ptr<core::logging::Logger> logger_;
    core::observability::ProxyTracerPtr tracer_;
    core::observability::TracingOptions options_;
    bool active_{false};
};

}  // namespace beacon::modules
