#include "faastel/core/observability/telemetry.hpp"

namespace faastel::core::observability {
namespace {

logging::Level local_level(LogLevel level) {
    switch (level) {
        case LogLevel::info:  return logging::Level::info;
        case LogLevel::warn:  return logging::Level::warn;
        case LogLevel::error: return logging::Level::error;
    }
    return logging::Level::info;
}

}  // namespace

Telemetry::Telemetry(std::shared_ptr<Exporter> exporter,
                     std::shared_ptr<logging::Logger> logger,
                     BudgetSource remaining_time)
    : exporter_(std::move(exporter)),
      logger_(std::move(logger)),
      remaining_time_(std::move(remaining_time)),
      buffer_(std::make_shared<EventBuffer>()),
      context_(buffer_, logger_),
      metrics_(logger_) {
    if (exporter_ && exporter_->config().flush_on_span_end) {
        context_.on_span_ended([this](const SpanData&) { flush(FlushScope::events); });
    }
}

SpanHandle Telemetry::begin_invocation(const std::string& correlation_id, const std::string& root_name) {
    auto root = context_.begin_invocation(correlation_id, root_name);
    metrics_.set_correlation_id(correlation_id);
    return root;
}

SpanHandle Telemetry::start_span(const SpanHandle& parent, const std::string& name) {
    return context_.start_span(parent, name);
}

void Telemetry::end_span(const SpanHandle& span, StatusCode status, const std::string& error) {
    context_.end_span(span, status, error);
}

ScopedSpan Telemetry::scoped_span(const SpanHandle& parent, const std::string& name) {
    return ScopedSpan(context_, context_.start_span(parent, name));
}

void Telemetry::log(LogLevel level, const std::string& message, nlohmann::json metadata) {
    if (logger_ && logger_->should_log(local_level(level))) {
        std::string line = message;
        if (metadata.is_object() && !metadata.empty()) {
            line += " " + metadata.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        logger_->log(local_level(level), line);
    }
    buffer_->log(level, message, std::move(metadata));
}

void Telemetry::info(const std::string& message, nlohmann::json metadata) {
    log(LogLevel::info, message, std::move(metadata));
}

void Telemetry::warn(const std::string& message, nlohmann::json metadata) {
    log(LogLevel::warn, message, std::move(metadata));
}

void Telemetry::error(const std::string& message, nlohmann::json metadata) {
    log(LogLevel::error, message, std::move(metadata));
}

std::chrono::milliseconds Telemetry::remaining_time() const {
    if (!remaining_time_) {
        return std::chrono::milliseconds::max();
    }
    return remaining_time_();
}

FlushResult Telemetry::flush(FlushScope scope) {
    return flush(remaining_time(), scope);
}

FlushResult Telemetry::flush(std::chrono::milliseconds budget, FlushScope scope) {
    std::vector<TelemetryEvent> batch = buffer_->drain();
    if (scope == FlushScope::events_and_metrics) {
        for (auto& point : metrics_.snapshot()) {
            batch.emplace_back(std::move(point));
        }
    }

    if (!exporter_) {
        return FlushResult::skipped(batch.size());
    }

    auto result = exporter_->flush(batch, budget);
    if (logger_) {
        logger_->debug("[telemetry] flush of " + std::to_string(result.record_count) + " records: " +
                       to_string(result.status));
    }
    return result;
}

}  // namespace faastel::core::observability
