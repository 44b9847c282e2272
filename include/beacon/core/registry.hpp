#pragma once

#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "beacon/core/logging/logger.hpp"
#include "beacon/core/module.hpp"

namespace beacon::core {

class ModuleRegistry {
public:
    explicit ModuleRegistry(logging::LoggerPtr logger = nullptr);

    void register_module(ModulePtr module);

    template <typename ModuleType, typename... Args>
    ModuleType& emplace_module(Args&&... args) {
        auto module = std::make_shared<ModuleType>(std::forward<Args>(args)...);
        register_module(module);
        return *module;
    }

    void configure_all(const config::Configuration& configuration);
    void start_all();
    // Stops modules in reverse registration order.
    void stop_all();

    [[nodiscard]] bool empty() const;
    [[nodiscard]] bool started() const;

private:
    void report_failure(const Module& module, const char* stage, const std::exception& e) const;

    std::vector<ModulePtr> modules_;
    logging::LoggerPtr logger_;
    const config::Configuration* configuration_{nullptr};
    bool configured_{false};
    bool started_{false};
    mutable std::mutex mutex_;
};

}  // namespace beacon::core
