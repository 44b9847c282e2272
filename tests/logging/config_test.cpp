#include <catch2/catch_test_macros.hpp>

#include <filesystem>

#include "beacon/core/config/configuration.hpp"
#include "beacon/core/logging/config.hpp"

using namespace beacon::core;
using namespace beacon::core::logging;

TEST_CASE("LogConfig defaults and validation", "[logging][config]") {
    auto config = LogConfig::default_config();
    REQUIRE(config.level == Level::info);
    REQUIRE(config.format == LogFormat::Simple);
    REQUIRE(config.async);
    REQUIRE(config.queue_size == 8192);
    REQUIRE(config.flush_interval == std::chrono::seconds(3));
    REQUIRE_FALSE(config.sinks.empty());
    REQUIRE(config.validate());

    SECTION("Async logging needs a queue") {
        config.queue_size = 0;
        REQUIRE_FALSE(config.validate());
    }

    SECTION("File sinks need a path") {
        SinkConfig sink;
        sink.type = SinkType::File;
        config.sinks.push_back(sink);
        REQUIRE_FALSE(config.validate());
    }

    SECTION("Disabled sinks are not validated") {
        SinkConfig sink;
        sink.type = SinkType::RotatingFile;
        sink.enabled = false;
        sink.max_size = 0;
        config.sinks.push_back(sink);
        REQUIRE(config.validate());
    }
}

TEST_CASE("LogConfig from configuration", "[logging][config]") {
    SECTION("Empty config returns defaults") {
        config::Configuration empty;
        auto log_config = LogConfig::from_toml(empty);
        REQUIRE(log_config.level == Level::info);
        REQUIRE_FALSE(log_config.sinks.empty());
    }

    SECTION("Level, format and async settings") {
        config::Configuration config;
        config.set("logging.level", "debug");
        config.set("logging.format", "json");
        config.set("logging.async", "false");
        config.set("logging.queue_size", "4096");
        config.set("logging.flush_interval", "5");

        auto log_config = LogConfig::from_toml(config);
        REQUIRE(log_config.level == Level::debug);
        REQUIRE(log_config.format == LogFormat::Json);
        REQUIRE_FALSE(log_config.async);
        REQUIRE(log_config.queue_size == 4096);
        REQUIRE(log_config.flush_interval == std::chrono::seconds(5));
    }

    SECTION("Sinks with sizes and rotation") {
        config::Configuration config;
        config.set("logging.sinks[0].type", "console");
        config.set("logging.sinks[0].level", "warn");
        config.set("logging.sinks[1].type", "rotating_file");
        config.set("logging.sinks[1].path", "logs/beacon.log");
        config.set("logging.sinks[1].max_size", "10MB");
        config.set("logging.sinks[1].max_files", "3");
        config.set("logging.sinks[2].type", "daily");
        config.set("logging.sinks[2].path", "logs/daily.log");
        config.set("logging.sinks[2].rotation_time", "02:30");

        auto log_config = LogConfig::from_toml(config);
        REQUIRE(log_config.sinks.size() == 3);
        REQUIRE(log_config.sinks[0].level == Level::warn);
        REQUIRE(log_config.sinks[1].type == SinkType::RotatingFile);
        REQUIRE(log_config.sinks[1].max_size == 10 * 1024 * 1024);
        REQUIRE(log_config.sinks[1].max_files == 3);
        REQUIRE(log_config.sinks[2].type == SinkType::DailyFile);
        REQUIRE(log_config.sinks[2].rotation_time == "02:30");
        REQUIRE(log_config.validate());
    }

    SECTION("Malformed sizes become zero and fail validation") {
        config::Configuration config;
        config.set("logging.sinks[0].type", "rotating");
        config.set("logging.sinks[0].path", "x.log");
        config.set("logging.sinks[0].max_size", "ten");

        auto log_config = LogConfig::from_toml(config);
        REQUIRE(log_config.sinks[0].max_size == 0);
        REQUIRE_FALSE(log_config.validate());
    }
}

TEST_CASE("Sample configuration parses", "[logging][config]") {
    const auto sample = std::filesystem::path(BEACON_SOURCE_DIR) / "config" / "beacon.sample.toml";
    auto config = config::Configuration::load_from_file(sample);

    REQUIRE(config.contains("logging.level"));
    REQUIRE(config.contains("logging.sinks[0].type"));
    REQUIRE(config.contains("logging.sinks[1].type"));

    auto log_config = LogConfig::from_toml(config);
    REQUIRE(log_config.sinks.size() == 2);
    REQUIRE(log_config.validate());
}
