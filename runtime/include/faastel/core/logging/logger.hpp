#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "faastel/core/logging/config.hpp"

namespace faastel::core::logging {

/**
 * @brief Named logger backed by spdlog.
 *
 * Without a LogConfig it writes to stderr at info level with the simple
 * pattern; with one it gets the configured sinks, level and pattern.
 */
class Logger {
public:
    explicit Logger(std::string name);
    explicit Logger(std::string name, const LogConfig* config);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    [[nodiscard]] const std::string& name() const noexcept;

    // False when a record at this level would be filtered out
    [[nodiscard]] bool should_log(Level level) const noexcept;

    void log(Level level, std::string_view message);
    void flush();

    void trace(std::string_view message) { log(Level::trace, message); }
    void debug(std::string_view message) { log(Level::debug, message); }
    void info(std::string_view message) { log(Level::info, message); }
    void warn(std::string_view message) { log(Level::warn, message); }
    void error(std::string_view message) { log(Level::error, message); }

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

std::shared_ptr<Logger> create_logger(const std::string& name);
std::shared_ptr<Logger> create_logger(const std::string& name, const LogConfig& config);

// Process-wide default logger (idempotent)
void initialize_logging(const LogConfig& config);

// Flushes all loggers; call before the handler returns control to the runtime
void flush_all();

// Shutdown logging system (flushes all logs)
void shutdown_logging();

// Unknown names map to info
Level level_from_string(const std::string& str);

}  // namespace faastel::core::logging
