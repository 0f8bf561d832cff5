#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace faastel::core {
namespace config {
class Configuration;
}
}

namespace faastel::core::logging {

// Log levels
enum class Level {
    trace = 0,
    debug,
    info,
    warn,
    error,
    critical
};

// Log format types
enum class LogFormat {
    Simple,  // Simple text format
    Json,    // One JSON object per line
    Custom   // Custom pattern
};

// Sink types
enum class SinkType {
    Console,
    File,
    RotatingFile,
    DailyFile
};

// Sink configuration
struct SinkConfig {
    SinkType type{SinkType::Console};
    bool enabled{true};
    Level level{Level::info};

    // File-specific options
    std::filesystem::path path;
    std::size_t max_size{10 * 1024 * 1024};  // 10MB
    std::size_t max_files{5};
    std::string rotation_time{"00:00"};       // "HH:MM" for daily files

    // Pattern for custom format
    std::string pattern;
};

// Main logging configuration
struct LogConfig {
    static constexpr const char* kSimplePattern = "%Y-%m-%dT%H:%M:%S.%eZ [%n] [%l] %v";
    static constexpr const char* kJsonPattern =
        R"({"time":"%Y-%m-%dT%H:%M:%S.%eZ","logger":"%n","level":"%l","message":"%v"})";

    // Global settings
    Level level{Level::info};
    LogFormat format{LogFormat::Simple};
    std::string pattern{kSimplePattern};

    // The runtime may freeze the process right after the handler returns,
    // so logging is synchronous unless asked otherwise.
    bool async{false};
    std::size_t queue_size{8192};
    std::chrono::seconds flush_interval{3};

    // Sinks
    std::vector<SinkConfig> sinks;

    // Factory methods
    static LogConfig default_config();
    static LogConfig from_configuration(const config::Configuration& config);

    // Pattern actually handed to spdlog for the selected format
    [[nodiscard]] std::string effective_pattern() const;

    // Validation
    bool validate() const;

private:
    void add_default_sinks();
};

}  // namespace faastel::core::logging
