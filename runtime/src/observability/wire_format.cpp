#include "faastel/core/observability/wire_format.hpp"

#include <variant>

namespace faastel::core::observability {
namespace {

using nlohmann::json;

json base_record(Timestamp timestamp, const char* level, const std::string& message,
                 const std::string& correlation_id, const RecordEnvelope& envelope) {
    return json{
        {"timestamp", format_timestamp(timestamp)},
        {"level", level},
        {"message", message},
        {"service", envelope.service},
        {"function_name", envelope.function_name},
        {"request_id", correlation_id},
    };
}

json render(const LogRecord& record, const RecordEnvelope& envelope) {
    json out = base_record(record.timestamp, to_string(record.level), record.message,
                           record.correlation_id, envelope);
    if (record.metadata.is_object()) {
        for (auto it = record.metadata.begin(); it != record.metadata.end(); ++it) {
            out[it.key()] = it.value();
        }
    } else if (!record.metadata.is_null()) {
        out["metadata"] = record.metadata;
    }
    return out;
}

json render(const SpanData& span, const RecordEnvelope& envelope) {
    const bool failed = span.status.code == StatusCode::error;
    json out = base_record(span.end_time, failed ? "error" : "info", span.name, span.correlation_id, envelope);
    out["type"] = "span";
    out["span_id"] = span.span_id;
    if (!span.parent_span_id.empty()) {
        out["parent_span_id"] = span.parent_span_id;
    }
    out["start_time"] = format_timestamp(span.start_time);
    out["end_time"] = format_timestamp(span.end_time);
    out["duration_ms"] = span.duration().count();
    out["status"] = to_string(span.status.code);
    if (!span.status.message.empty()) {
        out["status_message"] = span.status.message;
    }

    json attributes = json::object();
    for (const auto& [key, value] : span.attributes) {
        attributes[key] = attribute_to_json(value);
    }
    out["attributes"] = std::move(attributes);

    json exceptions = json::array();
    for (const auto& ex : span.exceptions) {
        exceptions.push_back({{"type", ex.type}, {"message", ex.message}, {"stacktrace", ex.stacktrace}});
    }
    out["exceptions"] = std::move(exceptions);
    return out;
}

json render(const MetricData& metric, const RecordEnvelope& envelope) {
    json out = base_record(metric.timestamp, "info", metric.name, metric.correlation_id, envelope);
    out["type"] = "metric";
    out["metric_name"] = metric.name;
    out["metric_kind"] = to_string(metric.kind);
    out["labels"] = metric.labels.empty() ? json::object() : json(metric.labels);

    if (metric.kind == MetricKind::counter) {
        out["value"] = metric.value;
    } else {
        out["count"] = metric.count;
        out["sum"] = metric.sum;
        out["min"] = metric.min;
        out["max"] = metric.max;
        out["bucket_bounds"] = metric.bucket_bounds;
        out["bucket_counts"] = metric.bucket_counts;
    }
    return out;
}

}  // namespace

nlohmann::json to_wire_record(const TelemetryEvent& event, const RecordEnvelope& envelope) {
    return std::visit([&envelope](const auto& e) { return render(e, envelope); }, event);
}

std::string to_wire_batch(const std::vector<TelemetryEvent>& batch, const RecordEnvelope& envelope) {
    json body = json::array();
    for (const auto& event : batch) {
        body.push_back(to_wire_record(event, envelope));
    }
    // Invalid UTF-8 from user metadata must not fail the whole batch
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace faastel::core::observability
