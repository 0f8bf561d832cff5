#include "faastel/core/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
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

namespace faastel::core::logging {
namespace {

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

// "HH:MM" -> (hour, minute); midnight when the value does not parse.
std::pair<int, int> parse_rotation_time(const std::string& text) {
    auto colon_pos = text.find(':');
    if (colon_pos == std::string::npos) {
        return {0, 0};
    }
    try {
        int hour = std::stoi(text.substr(0, colon_pos));
        int minute = std::stoi(text.substr(colon_pos + 1));
        if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
            return {0, 0};
        }
        return {hour, minute};
    } catch (const std::logic_error&) {
        return {0, 0};
    }
}

std::shared_ptr<spdlog::sinks::sink> create_spdlog_sink(const SinkConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }
    std::shared_ptr<spdlog::sinks::sink> sink;
    switch (config.type) {
        case SinkType::Console:
            sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
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
            sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                config.path.string(), hour, minute, false, static_cast<uint16_t>(config.max_files));
            break;
        }
        default:
            throw std::runtime_error("Unknown sink type");
    }
    sink->set_level(to_spdlog_level(config.level));
    if (!config.pattern.empty()) {
        sink->set_formatter(std::make_unique<spdlog::pattern_formatter>(
            config.pattern, spdlog::pattern_time_type::utc));
    }
    return sink;
}

std::vector<std::shared_ptr<spdlog::sinks::sink>> create_sinks(const LogConfig& config) {
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
    for (const auto& sink_config : config.sinks) {
        if (auto sink = create_spdlog_sink(sink_config)) {
            sinks.push_back(std::move(sink));
        }
    }
    return sinks;
}

std::mutex g_init_mutex;
bool g_logging_initialized = false;
bool g_thread_pool_initialized = false;
std::shared_ptr<spdlog::logger> g_default_logger = nullptr;

std::shared_ptr<spdlog::logger> make_spdlog_logger(const std::string& name, const LogConfig& config) {
    auto sinks = create_sinks(config);
    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        if (!g_thread_pool_initialized) {
            spdlog::init_thread_pool(config.queue_size, 1);
            g_thread_pool_initialized = true;
        }
        logger = std::make_shared<spdlog::async_logger>(
            name, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::block);
        spdlog::flush_every(config.flush_interval);
    } else {
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    }
    logger->set_pattern(config.effective_pattern(), spdlog::pattern_time_type::utc);
    logger->set_level(to_spdlog_level(config.level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

class Logger::Impl {
public:
    Impl(const std::string& name, const LogConfig* config)
        : name_(name) {
        if (config) {
            std::lock_guard<std::mutex> lock(g_init_mutex);
            spdlog_logger_ = make_spdlog_logger(name, *config);
        } else {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            spdlog_logger_ = std::make_shared<spdlog::logger>(name, console_sink);
            spdlog_logger_->set_pattern(LogConfig::kSimplePattern, spdlog::pattern_time_type::utc);
            spdlog_logger_->set_level(spdlog::level::info);
        }
    }

    bool should_log(Level level) const {
        return spdlog_logger_->should_log(to_spdlog_level(level));
    }

    const std::string& name() const {
        return name_;
    }

    void log(Level level, std::string_view message) {
        spdlog_logger_->log(to_spdlog_level(level), spdlog::string_view_t(message.data(), message.size()));
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

const std::string& Logger::name() const noexcept {
    return impl_->name();
}

bool Logger::should_log(Level level) const noexcept {
    return impl_->should_log(level);
}

void Logger::log(Level level, std::string_view message) {
    impl_->log(level, message);
}

void Logger::flush() {
    impl_->flush();
}

std::shared_ptr<Logger> create_logger(const std::string& name) {
    return std::make_shared<Logger>(name);
}

std::shared_ptr<Logger> create_logger(const std::string& name, const LogConfig& config) {
    return std::make_shared<Logger>(name, &config);
}

void initialize_logging(const LogConfig& config) {
    if (!config.validate()) {
        throw std::runtime_error("Invalid logging configuration");
    }

    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_logging_initialized) {
        return;
    }

    spdlog::set_level(to_spdlog_level(config.level));
    g_default_logger = make_spdlog_logger("faastel", config);
    spdlog::set_default_logger(g_default_logger);
    g_logging_initialized = true;
}

void flush_all() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
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
    return Level::info;  // default
}

}  // namespace faastel::core::logging
