#include "beacon/core/registry.hpp"

#include <stdexcept>
#include <string>

namespace beacon::core {

ModuleRegistry::ModuleRegistry(logging::LoggerPtr logger)
    : logger_(logger ? std::move(logger) : logging::create_logger("beacon.modules")) {
}

void ModuleRegistry::register_module(ModulePtr module) {
    if (!module) {
        throw std::invalid_argument("module is null");
    }

    std::lock_guard lock{mutex_};
    if (started_) {
        throw std::runtime_error("Cannot register modules after start");
    }

    modules_.push_back(std::move(module));

    if (configured_ && configuration_) {
        modules_.back()->configure(*configuration_);
    }
}

void ModuleRegistry::configure_all(const config::Configuration& configuration) {
    std::lock_guard lock{mutex_};
    configuration_ = &configuration;
    for (auto& module : modules_) {
        try {
            module->configure(configuration);
        } catch (const std::exception& e) {
            report_failure(*module, "configure", e);
        }
    }
    configured_ = true;
}

void ModuleRegistry::start_all() {
    std::lock_guard lock{mutex_};
    if (started_) {
        return;
    }
    for (auto& module : modules_) {
        try {
            module->start();
        } catch (const std::exception& e) {
            report_failure(*module, "start", e);
        }
    }
    started_ = true;
}

void ModuleRegistry::stop_all() {
    std::lock_guard lock{mutex_};
    if (!started_) {
        return;
    }
    for (auto it = modules_.rbegin(); it != modules_.rend(); ++it) {
        try {
            (*it)->stop();
        } catch (const std::exception& e) {
            report_failure(**it, "stop", e);
        }
    }
    started_ = false;
}

bool ModuleRegistry::empty() const {
    std::lock_guard lock{mutex_};
    return modules_.empty();
}

bool ModuleRegistry::started() const {
    std::lock_guard lock{mutex_};
    return started_;
}

void ModuleRegistry::report_failure(const Module& module, const char* stage, const std::exception& e) const {
    logger_->error("[modules] " + std::string{module.name()} + " failed to " + stage + ": " + e.what());
}

}  // namespace beacon::core
