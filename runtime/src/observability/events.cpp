#include "faastel/core/observability/events.hpp"

#include <cstdio>
#include <ctime>

namespace faastel::core::observability {

std::string format_timestamp(Timestamp timestamp) {
    auto since_epoch = timestamp.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds).count();
    if (millis < 0) {
        seconds -= std::chrono::seconds(1);
        millis += 1000;
    }

    std::time_t time = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&time, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
    return buffer;
}

const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::info:  return "info";
        case LogLevel::warn:  return "warn";
        case LogLevel::error: return "error";
    }
    return "info";
}

const char* to_string(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::unset: return "unset";
        case StatusCode::ok:    return "ok";
        case StatusCode::error: return "error";
    }
    return "unset";
}

const char* to_string(MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::counter:   return "counter";
        case MetricKind::histogram: return "histogram";
    }
    return "counter";
}

nlohmann::json attribute_to_json(const AttributeValue& value) {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

}  // namespace faastel::core::observability
