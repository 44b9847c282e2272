#include "beacon/core/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "beacon/core/config/configuration.hpp"

namespace beacon::core::logging {
namespace {

constexpr const char* kDefaultPattern = "%Y-%m-%d %H:%M:%S.%e [%n] [%l] %v";
constexpr const char* kJsonPattern =
    R"({"time":"%Y-%m-%dT%H:%M:%S.%e%z","logger":"%n","level":"%l","thread":%t,"message":"%v"})";

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::trace:    return spdlog::level::trace;
        case Level::debug:    return spdlog::level::debug;
        case Level::info:     return spdlog::level::info;
        case Level::warn:     return spdlog::level::warn;
        case Level::error:    return spdlog::level::err;
        case Level::critical: return spdlog::level::critical;
        default:              return spdlog::level::info;
    }
}

Level from_spdlog_level(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace:    return Level::trace;
        case spdlog::level::debug:    return Level::debug;
        case spdlog::level::info:     return Level::info;
        case spdlog::level::warn:     return Level::warn;
        case spdlog::level::err:      return Level::error;
        case spdlog::level::critical: return Level::critical;
        default:                      return Level::info;
    }
}

// "HH:MM" -> {hour, minute}; anything else rotates at midnight.
std::pair<int, int> parse_rotation_time(const std::string& value) {
    auto colon_pos = value.find(':');
    if (colon_pos == std::string::npos) {
        return {0, 0};
    }
    int hour = 0;
    int minute = 0;
    auto h = std::from_chars(value.data(), value.data() + colon_pos, hour);
    auto m = std::from_chars(value.data() + colon_pos + 1, value.data() + value.size(), minute);
    if (h.ec != std::errc{} || m.ec != std::errc{} || hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        return {0, 0};
    }
    return {hour, minute};
}

std::shared_ptr<spdlog::sinks::sink> create_spdlog_sink(const SinkConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }
    std::shared_ptr<spdlog::sinks::sink> sink;
    switch (config.type) {
        case SinkType::Console:
            sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            break;
        case SinkType::File:
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.path.string(), false);
            break;
        case SinkType::RotatingFile:
            sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.path.string(), config.max_size, config.max_files);
            break;
        case SinkType::DailyFile: {
            auto [hour, minute] = parse_rotation_time(config.rotation_time);
            sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(config.path.string(), hour, minute,
                                                                       false, static_cast<uint16_t>(config.max_files));
            break;
        }
        default:
            throw std::runtime_error("Unknown sink type");
    }
    sink->set_level(to_spdlog_level(config.level));
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

std::vector<std::shared_ptr<spdlog::sinks::sink>> create_sinks(const LogConfig& config) {
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
    for (const auto& sink_config : config.sinks) {
        auto sink = create_spdlog_sink(sink_config);
        if (sink) {
            sinks.push_back(std::move(sink));
        }
    }
    return sinks;
}

std::string pattern_for(const LogConfig& config) {
    if (config.format == LogFormat::Json) {
        return kJsonPattern;
    }
    return config.pattern.empty() ? std::string{kDefaultPattern} : config.pattern;
}

std::mutex g_init_mutex;
bool g_logging_initialized = false;
bool g_thread_pool_initialized = false;
std::shared_ptr<spdlog::logger> g_default_logger;

void ensure_thread_pool(std::size_t queue_size) {
    if (!g_thread_pool_initialized) {
        spdlog::init_thread_pool(queue_size, 1);
        g_thread_pool_initialized = true;
    }
}

}  // namespace

class Logger::Impl {
public:
    Impl(const std::string& name, const LogConfig* config)
        : name_(name) {
        if (config) {
            auto sinks = create_sinks(*config);
            if (config->async) {
                {
                    std::lock_guard<std::mutex> lock(g_init_mutex);
                    ensure_thread_pool(config->queue_size);
                }
                spdlog_logger_ = std::make_shared<spdlog::async_logger>(
                    name, sinks.begin(), sinks.end(), spdlog::thread_pool(),
                    spdlog::async_overflow_policy::block);
            } else {
                spdlog_logger_ = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            }
            spdlog_logger_->flush_on(spdlog::level::warn);
            spdlog_logger_->set_pattern(pattern_for(*config));
            spdlog_logger_->set_level(to_spdlog_level(config->level));
            return;
        }

        // Without a config, share the sinks installed by initialize_logging() so
        // component loggers follow the process-wide destinations.
        auto fallback = spdlog::default_logger();
        if (fallback) {
            spdlog_logger_ = fallback->clone(name);
        } else {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern(kDefaultPattern);
            spdlog_logger_ = std::make_shared<spdlog::logger>(name, console_sink);
        }
        spdlog_logger_->set_level(spdlog::level::info);
    }

    void set_level(Level level) {
        spdlog_logger_->set_level(to_spdlog_level(level));
    }

    Level level() const {
        return from_spdlog_level(spdlog_logger_->level());
    }

    const std::string& name() const {
        return name_;
    }

    void log(Level level, const std::string& message) {
        spdlog_logger_->log(to_spdlog_level(level), message);
    }

    void flush() {
        spdlog_logger_->flush();
    }

private:
    std::string name_;
    std::shared_ptr<spdlog::logger> spdlog_logger_;
};

Logger::Logger(std::string name)
    : impl_(std::make_unique<Impl>(name, nullptr)) {
}

Logger::Logger(std::string name, const LogConfig* config)
    : impl_(std::make_unique<Impl>(name, config)) {
}

Logger::~Logger() = default;
Logger::Logger(Logger&&) noexcept = default;
Logger& Logger::operator=(Logger&&) noexcept = default;

void Logger::set_level(Level level) noexcept {
    impl_->set_level(level);
}

Level Logger::level() const noexcept {
    return impl_->level();
}

const std::string& Logger::name() const noexcept {
    return impl_->name();
}

void Logger::log(Level level, const std::string& message) {
    impl_->log(level, message);
}

void Logger::flush() {
    impl_->flush();
}

const char* Logger::level_to_string(Level level) noexcept {
    switch (level) {
        case Level::trace:    return "TRACE";
        case Level::debug:    return "DEBUG";
        case Level::info:     return "INFO";
        case Level::warn:     return "WARN";
        case Level::error:    return "ERROR";
        case Level::critical: return "CRITICAL";
        default:              return "UNKNOWN";
    }
}

LoggerPtr create_logger(const std::string& name) {
    return std::make_shared<Logger>(name);
}

LoggerPtr create_logger(const std::string& name, const LogConfig& config) {
    return std::make_shared<Logger>(name, &config);
}

void initialize_logging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logging_initialized) {
        return;
    }
    if (!config.validate()) {
        throw std::runtime_error("Invalid logging configuration");
    }

    auto sinks = create_sinks(config);
    if (!sinks.empty()) {
        if (config.async) {
            ensure_thread_pool(config.queue_size);
            g_default_logger = std::make_shared<spdlog::async_logger>(
                "beacon", sinks.begin(), sinks.end(), spdlog::thread_pool(),
                spdlog::async_overflow_policy::block);
            spdlog::flush_every(config.flush_interval);
        } else {
            g_default_logger = std::make_shared<spdlog::logger>("beacon", sinks.begin(), sinks.end());
        }
        g_default_logger->set_pattern(pattern_for(config));
        g_default_logger->set_level(to_spdlog_level(config.level));
        g_default_logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(g_default_logger);
    }
    spdlog::set_level(to_spdlog_level(config.level));

    g_logging_initialized = true;
}

void initialize_logging(const config::Configuration& config) {
    initialize_logging(LogConfig::from_toml(config));
}

void shutdown_logging() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    spdlog::shutdown();
    g_logging_initialized = false;
    g_thread_pool_initialized = false;
    g_default_logger = nullptr;
}

Level level_from_string(const std::string& str) {
    std::string lower;
    lower.reserve(str.size());
    std::transform(str.begin(), str.end(), std::back_inserter(lower),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::trace;
    if (lower == "debug") return Level::debug;
    if (lower == "info") return Level::info;
    if (lower == "warn" || lower == "warning") return Level::warn;
    if (lower == "error") return Level::error;
    if (lower == "critical") return Level::critical;
    return Level::info;
}

std::string level_to_string(Level level) {
    return Logger::level_to_string(level);
}

}  // namespace beacon::core::logging
