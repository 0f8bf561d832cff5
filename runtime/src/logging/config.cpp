#include "faastel/core/logging/config.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "faastel/core/config/configuration.hpp"
#include "faastel/core/logging/logger.hpp"

namespace faastel::core::logging {

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
    return LogFormat::Simple;  // default
}

SinkType sink_type_from_string(const std::string& str) {
    auto lower = to_lower(str);
    if (lower == "file") return SinkType::File;
    if (lower == "rotating_file" || lower == "rotating") return SinkType::RotatingFile;
    if (lower == "daily_file" || lower == "daily") return SinkType::DailyFile;
    return SinkType::Console;  // default
}

// Parses size strings such as "10MB", "1024KB" or a plain byte count.
std::size_t parse_size_string(const std::string& str) {
    std::string num_str;
    std::string unit_str;

    auto it = str.begin();
    while (it != str.end() && std::isdigit(static_cast<unsigned char>(*it))) {
        num_str.push_back(*it);
        ++it;
    }
    while (it != str.end()) {
        unit_str.push_back(*it);
        ++it;
    }
    if (num_str.empty()) {
        return 0;
    }

    std::size_t multiplier = 1;
    auto unit_lower = to_lower(unit_str);
    if (unit_lower.find("kb") != std::string::npos) multiplier = 1024;
    else if (unit_lower.find("mb") != std::string::npos) multiplier = 1024 * 1024;
    else if (unit_lower.find("gb") != std::string::npos) multiplier = 1024 * 1024 * 1024;

    try {
        return static_cast<std::size_t>(std::stoull(num_str)) * multiplier;
    } catch (const std::out_of_range&) {
        return 0;
    }
}

}  // namespace

LogConfig LogConfig::default_config() {
    LogConfig config;
    config.add_default_sinks();
    return config;
}

LogConfig LogConfig::from_configuration(const config::Configuration& config) {
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
        log_config.async = config.get_bool("logging.async", false);
    }

    if (config.contains("logging.queue_size")) {
        log_config.queue_size = static_cast<std::size_t>(std::max(0, config.get_int("logging.queue_size", 8192)));
    }

    if (config.contains("logging.flush_interval")) {
        log_config.flush_interval = std::chrono::seconds(config.get_int("logging.flush_interval", 3));
    }

    // [[logging.sinks]] tables are flattened to logging.sinks[N].*
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
            sink.max_files = static_cast<std::size_t>(std::max(0, config.get_int(prefix + ".max_files", 5)));
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

std::string LogConfig::effective_pattern() const {
    switch (format) {
        case LogFormat::Json:
            return kJsonPattern;
        case LogFormat::Custom:
            return pattern;
        case LogFormat::Simple:
        default:
            return pattern.empty() ? std::string{kSimplePattern} : pattern;
    }
}

bool LogConfig::validate() const {
    if (level < Level::trace || level > Level::critical) {
        return false;
    }

    if (async && queue_size == 0) {
        return false;
    }

    if (format == LogFormat::Custom && pattern.empty()) {
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

}  // namespace faastel::core::logging
