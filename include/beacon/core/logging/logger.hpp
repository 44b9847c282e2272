#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "beacon/core/logging/config.hpp"

namespace beacon::core {

namespace config {
class Configuration;
}

namespace logging {

class Logger {
public:
    explicit Logger(std::string name);
    Logger(std::string name, const LogConfig* config);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept;

    void log(Level level, const std::string& message);
    void flush();

    [[nodiscard]] static const char* level_to_string(Level level) noexcept;

    template <typename... Args>
    void log(Level level, std::string_view message, Args&&... args) {
        if (level < this->level()) {
            return;
        }

        if constexpr (sizeof...(Args) == 0) {
            log(level, std::string{message});
        } else {
            std::ostringstream oss;
            oss << message;
            ((oss << " " << std::forward<Args>(args)), ...);
            log(level, oss.str());
        }
    }

    template <typename... Args>
    void trace(std::string_view message, Args&&... args) {
        log(Level::trace, message, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view message, Args&&... args) {
        log(Level::debug, message, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view message, Args&&... args) {
        log(Level::info, message, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view message, Args&&... args) {
        log(Level::warn, message, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view message, Args&&... args) {
        log(Level::error, message, std::forward<Args>(args)...);
    }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

using LoggerPtr = std::shared_ptr<Logger>;

LoggerPtr create_logger(const std::string& name);
LoggerPtr create_logger(const std::string& name, const LogConfig& config);

// Installs the process-wide default sinks. Later calls are ignored until shutdown_logging().
void initialize_logging(const LogConfig& config);
void initialize_logging(const config::Configuration& config);

void shutdown_logging();

Level level_from_string(const std::string& str);
std::string level_to_string(Level level);

}  // namespace logging
}  // namespace beacon::core
