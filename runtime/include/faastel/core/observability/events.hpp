#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace faastel::core::observability {

using Timestamp = std::chrono::system_clock::time_point;

// RFC3339, UTC, millisecond precision: 2024-05-01T12:00:00.123Z
std::string format_timestamp(Timestamp timestamp);

enum class LogLevel {
    info,
    warn,
    error
};

const char* to_string(LogLevel level) noexcept;

/**
 * @brief Structured log record bound for the sink
 */
struct LogRecord {
    LogLevel level{LogLevel::info};
    std::string message;
    std::string correlation_id;
    nlohmann::json metadata = nlohmann::json::object();
    Timestamp timestamp{};
};

enum class StatusCode {
    unset,
    ok,
    error
};

const char* to_string(StatusCode code) noexcept;

struct SpanStatus {
    StatusCode code{StatusCode::unset};
    std::string message;
};

using AttributeValue = std::variant<std::string, int64_t, double, bool>;
using Attributes = std::map<std::string, AttributeValue>;

nlohmann::json attribute_to_json(const AttributeValue& value);

struct ExceptionRecord {
    std::string type;
    std::string message;
    std::string stacktrace;
    Timestamp timestamp{};
};

/**
 * @brief Immutable snapshot of an ended span
 */
struct SpanData {
    std::string name;
    std::string correlation_id;
    std::string span_id;
    std::string parent_span_id;  // empty for the root
    Timestamp start_time{};
    Timestamp end_time{};
    SpanStatus status;
    Attributes attributes;
    std::vector<ExceptionRecord> exceptions;

    [[nodiscard]] std::chrono::milliseconds duration() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

using Labels = std::map<std::string, std::string>;

enum class MetricKind {
    counter,
    histogram
};

const char* to_string(MetricKind kind) noexcept;

/**
 * @brief Aggregated value of one (name, labels) series at snapshot time
 */
struct MetricData {
    std::string name;
    MetricKind kind{MetricKind::counter};
    Labels labels;
    std::string correlation_id;
    Timestamp timestamp{};

    // counter
    double value{0.0};

    // histogram
    uint64_t count{0};
    double sum{0.0};
    double min{0.0};
    double max{0.0};
    std::vector<double> bucket_bounds;
    std::vector<uint64_t> bucket_counts;
};

using TelemetryEvent = std::variant<LogRecord, SpanData, MetricData>;

}  // namespace faastel::core::observability
