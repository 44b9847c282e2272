#include "beacon/modules/tracing.hpp"

#include "beacon/core/observability/telemetry.hpp"

namespace beacon::modules {

using core::observability::Telemetry;
using core::observability::TracingOptions;

TracingModule::TracingModule(std::shared_ptr<core::logging::Logger> logger,
                             core::observability::ProxyTracerPtr tracer)
    : logger_(std::move(logger)), tracer_(std::move(tracer)) {
    if (!logger_) {
        logger_ = core::logging::create_logger("beacon.tracing");
    }
    if (!tracer_) {
        tracer_ = Telemetry::get_tracer();
    }
}

void TracingModule::configure(const core::config::Configuration& configuration) {
    options_ = TracingOptions::from_config(configuration);
    logger_->debug("[tracing] backend", options_.backend, "buffer_size", options_.buffer_size);
}

void TracingModule::start() {
    if (active_) {
        return;
    }
    Telemetry::set_content_tracing_enabled(options_.content_tracing_enabled);
    tracer_->set_tracer(Telemetry::create_tracer(options_, logger_));
    active_ = true;
    logger_->info("[tracing] backend active:", std::string{tracer_->backend_name()});
}

void TracingModule::stop() {
    if (!active_) {
        return;
    }
    tracer_->flush();
    tracer_->set_tracer(nullptr);
    active_ = false;
    logger_->info("[tracing] stopped");
}

}  // namespace beacon::modules
