#include <catch2/catch_test_macros.hpp>

#include <filesystem>

#include "faastel/core/config/configuration.hpp"
#include "faastel/core/logging/config.hpp"

TEST_CASE("LogConfig from configuration", "[logging][config]") {
    using namespace faastel::core;
    using namespace faastel::core::logging;

    SECTION("Empty configuration gives synchronous console logging") {
        config::Configuration empty_config;
        auto log_config = LogConfig::from_configuration(empty_config);

        REQUIRE(log_config.level == Level::info);
        REQUIRE(log_config.format == LogFormat::Simple);
        REQUIRE(log_config.async == false);
        REQUIRE(log_config.sinks.size() == 1);
        REQUIRE(log_config.sinks[0].type == SinkType::Console);
        REQUIRE(log_config.validate());
    }

    SECTION("Log level") {
        config::Configuration config;
        config.set("logging.level", "debug");
        REQUIRE(LogConfig::from_configuration(config).level == Level::debug);

        config.set("logging.level", "\"warning\"");
        REQUIRE(LogConfig::from_configuration(config).level == Level::warn);

        config.set("logging.level", "bogus");
        REQUIRE(LogConfig::from_configuration(config).level == Level::info);
    }

    SECTION("Default sink follows the global level") {
        config::Configuration config;
        config.set("logging.level", "error");
        auto log_config = LogConfig::from_configuration(config);
        REQUIRE(log_config.sinks.at(0).level == Level::error);
    }

    SECTION("Format selects the pattern") {
        config::Configuration config;
        config.set("logging.format", "json");
        auto log_config = LogConfig::from_configuration(config);
        REQUIRE(log_config.format == LogFormat::Json);
        REQUIRE(log_config.effective_pattern() == LogConfig::kJsonPattern);

        config.set("logging.format", "custom");
        config.set("logging.pattern", "[%H:%M:%S] %v");
        log_config = LogConfig::from_configuration(config);
        REQUIRE(log_config.format == LogFormat::Custom);
        REQUIRE(log_config.effective_pattern() == "[%H:%M:%S] %v");
    }

    SECTION("Async settings") {
        config::Configuration config;
        config.set("logging.async", "true");
        config.set("logging.queue_size", "4096");
        config.set("logging.flush_interval", "5");

        auto log_config = LogConfig::from_configuration(config);
        REQUIRE(log_config.async == true);
        REQUIRE(log_config.queue_size == 4096);
        REQUIRE(log_config.flush_interval == std::chrono::seconds(5));
    }
}

TEST_CASE("LogConfig validation", "[logging][config]") {
    using namespace faastel::core::logging;

    auto config = LogConfig::default_config();
    REQUIRE(config.validate());

    SECTION("Async needs a queue") {
        config.async = true;
        config.queue_size = 0;
        REQUIRE_FALSE(config.validate());
        config.queue_size = 1024;
        REQUIRE(config.validate());
    }

    SECTION("Custom format needs a pattern") {
        config.format = LogFormat::Custom;
        config.pattern.clear();
        REQUIRE_FALSE(config.validate());
    }

    SECTION("File sinks need a path") {
        SinkConfig file_sink;
        file_sink.type = SinkType::File;
        config.sinks.push_back(file_sink);
        REQUIRE_FALSE(config.validate());

        config.sinks.back().enabled = false;
        REQUIRE(config.validate());
    }
}

TEST_CASE("Sink parsing", "[logging][config]") {
    using namespace faastel::core;
    using namespace faastel::core::logging;

    SECTION("Rotating file sink with size units") {
        config::Configuration config;
        config.set("logging.sinks[0].type", "rotating_file");
        config.set("logging.sinks[0].path", "\"/tmp/faastel.log\"");
        config.set("logging.sinks[0].max_size", "10MB");
        config.set("logging.sinks[0].max_files", "3");

        auto log_config = LogConfig::from_configuration(config);
        REQUIRE(log_config.sinks.size() == 1);
        const auto& sink = log_config.sinks[0];
        REQUIRE(sink.type == SinkType::RotatingFile);
        REQUIRE(sink.path == "/tmp/faastel.log");
        REQUIRE(sink.max_size == 10 * 1024 * 1024);
        REQUIRE(sink.max_files == 3);
    }

    SECTION("Multiple sinks keep their own levels") {
        config::Configuration config;
        config.set("logging.level", "warn");
        config.set("logging.sinks[0].type", "console");
        config.set("logging.sinks[1].type", "daily_file");
        config.set("logging.sinks[1].path", "app.log");
        config.set("logging.sinks[1].level", "debug");
        config.set("logging.sinks[1].rotation_time", "02:30");

        auto log_config = LogConfig::from_configuration(config);
        REQUIRE(log_config.sinks.size() == 2);
        REQUIRE(log_config.sinks[0].level == Level::warn);
        REQUIRE(log_config.sinks[1].type == SinkType::DailyFile);
        REQUIRE(log_config.sinks[1].level == Level::debug);
        REQUIRE(log_config.sinks[1].rotation_time == "02:30");
    }

    SECTION("Disabled sink is parsed but marked") {
        config::Configuration config;
        config.set("logging.sinks[0].type", "console");
        config.set("logging.sinks[0].enabled", "false");

        auto log_config = LogConfig::from_configuration(config);
        REQUIRE(log_config.sinks.size() == 1);
        REQUIRE_FALSE(log_config.sinks[0].enabled);
    }
}

TEST_CASE("Sample configuration file", "[logging][config]") {
    using namespace faastel::core;

    auto sample_path = std::filesystem::path(FAASTEL_SOURCE_DIR) / "config" / "faastel.sample.toml";
    REQUIRE(std::filesystem::exists(sample_path));

    auto config = config::Configuration::load_from_file(sample_path);
    REQUIRE(config.contains("logging.level"));
    REQUIRE(config.contains("logging.sinks[0].type"));

    auto log_config = logging::LogConfig::from_configuration(config);
    REQUIRE(log_config.validate());
    REQUIRE(log_config.sinks.size() == 1);
    REQUIRE(log_config.sinks[0].type == logging::SinkType::Console);
}
