#include "beacon/core/logging/config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>

#include "beacon/core/config/configuration.hpp"
#include "beacon/core/logging/logger.hpp"

namespace beacon::core::logging {

namespace {

std::string to_lower(const std::string& str) {
    std::string lower;
    lower.reserve(str.size());
    std::transform(str.begin(), str.end(), std::back_inserter(lower),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

LogFormat format_from_string(const std::string& str) {
    auto lower = to_lower(str);
    if (lower == "json") return LogFormat::Json;
    if (lower == "custom") return LogFormat::Custom;
    return LogFormat::Simple;
}

SinkType sink_type_from_string(const std::string& str) {
    auto lower = to_lower(str);
    if (lower == "file") return SinkType::File;
    if (lower == "rotating_file" || lower == "rotating") return SinkType::RotatingFile;
    if (lower == "daily_file" || lower == "daily") return SinkType::DailyFile;
    return SinkType::Console;
}

// Parses sizes such as "10MB", "1024KB" or a plain byte count. Returns 0 on error.
std::size_t parse_size_string(const std::string& str) {
    if (str.empty()) return 0;

    std::size_t value = 0;
    auto result = std::from_chars(str.data(), str.data() + str.size(), value);
    if (result.ec != std::errc{}) {
        return 0;
    }

    auto unit = to_lower(config::trim(std::string_view{result.ptr, static_cast<std::size_t>(str.data() + str.size() - result.ptr)}));
    std::size_t multiplier = 1;
    if (unit == "kb" || unit == "k") multiplier = 1024;
    else if (unit == "mb" || unit == "m") multiplier = 1024 * 1024;
    else if (unit == "gb" || unit == "g") multiplier = 1024 * 1024 * 1024;
    else if (!unit.empty() && unit != "b") return 0;

    return value * multiplier;
}

}  // namespace

LogConfig LogConfig::default_config() {
    LogConfig config;
    config.add_default_sinks();
    return config;
}

LogConfig LogConfig::from_toml(const config::Configuration& config) {
    LogConfig log_config;

    if (config.contains("logging.level")) {
        log_config.level = level_from_string(config.get_string("logging.level"));
    }
    if (config.contains("logging.format")) {
        log_config.format = format_from_string(config.get_string("logging.format"));
    }
    if (config.contains("logging.pattern")) {
        log_config.pattern = config.get_string("logging.pattern");
    }
    if (config.contains("logging.async")) {
        log_config.async = config.get_bool("logging.async", true);
    }
    if (config.contains("logging.queue_size")) {
        log_config.queue_size = static_cast<std::size_t>(config.get_int("logging.queue_size", 8192));
    }
    if (config.contains("logging.flush_interval")) {
        log_config.flush_interval = std::chrono::seconds(config.get_int("logging.flush_interval", 3));
    }

    // Sinks come from [[logging.sinks]] tables, flattened as logging.sinks[i].*
    for (int i = 0;; ++i) {
        std::string prefix = "logging.sinks[" + std::to_string(i) + "]";
        if (!config.contains(prefix + ".type")) {
            break;
        }

        SinkConfig sink;
        sink.type = sink_type_from_string(config.get_string(prefix + ".type"));
        sink.level = log_config.level;

        if (config.contains(prefix + ".enabled")) {
            sink.enabled = config.get_bool(prefix + ".enabled", true);
        }
        if (config.contains(prefix + ".level")) {
            sink.level = level_from_string(config.get_string(prefix + ".level"));
        }
        if (config.contains(prefix + ".path")) {
            sink.path = config.get_string(prefix + ".path");
        }
        if (config.contains(prefix + ".max_size")) {
            sink.max_size = parse_size_string(config.get_string(prefix + ".max_size"));
        }
        if (config.contains(prefix + ".max_files")) {
            sink.max_files = static_cast<std::size_t>(config.get_int(prefix + ".max_files", 5));
        }
        if (config.contains(prefix + ".rotation_time")) {
            sink.rotation_time = config.get_string(prefix + ".rotation_time");
        }
        if (config.contains(prefix + ".pattern")) {
            sink.pattern = config.get_string(prefix + ".pattern");
        }

        log_config.sinks.push_back(sink);
    }

    if (log_config.sinks.empty()) {
        log_config.add_default_sinks();
    }

    return log_config;
}

bool LogConfig::validate() const {
    if (level < Level::trace || level > Level::critical) {
        return false;
    }
    if (async && queue_size == 0) {
        return false;
    }

    for (const auto& sink : sinks) {
        if (!sink.enabled) {
            continue;
        }
        if (sink.level < Level::trace || sink.level > Level::critical) {
            return false;
        }
        if (sink.type != SinkType::Console && sink.path.empty()) {
            return false;
        }
        if (sink.type == SinkType::RotatingFile && sink.max_size == 0) {
            return false;
        }
        if ((sink.type == SinkType::RotatingFile || sink.type == SinkType::DailyFile) &&
            sink.max_files == 0) {
            return false;
        }
    }

    return true;
}

void LogConfig::add_default_sinks() {
    SinkConfig console_sink;
    console_sink.type = SinkType::Console;
    console_sink.enabled = true;
    console_sink.level = level;
    sinks.push_back(console_sink);
}

}  // namespace beacon::core::logging
