#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "faastel/core/logging/logger.hpp"
#include "faastel/core/observability/correlation.hpp"
#include "faastel/core/observability/event_buffer.hpp"
#include "faastel/core/observability/exporter.hpp"
#include "faastel/core/observability/metrics.hpp"

namespace faastel::core::observability {

enum class FlushScope {
    events,
    events_and_metrics
};

/**
 * @brief Telemetry of one invocation: correlation context, event buffer and
 * metrics aggregator sharing one correlation id, flushed through one exporter.
 *
 * Built when the invocation starts and discarded when it ends; nothing here is
 * process-global. Flushing never throws.
 */
class Telemetry {
public:
    using BudgetSource = std::function<std::chrono::milliseconds()>;

    Telemetry(std::shared_ptr<Exporter> exporter,
              std::shared_ptr<logging::Logger> logger,
              BudgetSource remaining_time = {});

    Telemetry(const Telemetry&) = delete;
    Telemetry& operator=(const Telemetry&) = delete;

    SpanHandle begin_invocation(const std::string& correlation_id, const std::string& root_name);

    SpanHandle start_span(const SpanHandle& parent, const std::string& name);
    void end_span(const SpanHandle& span, StatusCode status = StatusCode::ok, const std::string& error = {});
    [[nodiscard]] ScopedSpan scoped_span(const SpanHandle& parent, const std::string& name);

    // Buffers a record for export and mirrors it to the local log
    void log(LogLevel level, const std::string& message, nlohmann::json metadata = nlohmann::json::object());
    void info(const std::string& message, nlohmann::json metadata = nlohmann::json::object());
    void warn(const std::string& message, nlohmann::json metadata = nlohmann::json::object());
    void error(const std::string& message, nlohmann::json metadata = nlohmann::json::object());

    /**
     * @brief Drains the buffer (plus a metrics snapshot for events_and_metrics)
     * and ships it as a single batch.
     */
    FlushResult flush(FlushScope scope = FlushScope::events);
    FlushResult flush(std::chrono::milliseconds budget, FlushScope scope);

    [[nodiscard]] std::string correlation_id() const { return context_.correlation_id(); }
    [[nodiscard]] SpanHandle root() const { return context_.root(); }
    [[nodiscard]] CorrelationContext& context() noexcept { return context_; }
    [[nodiscard]] EventBuffer& buffer() noexcept { return *buffer_; }
    [[nodiscard]] MetricsAggregator& metrics() noexcept { return metrics_; }
    [[nodiscard]] const std::shared_ptr<logging::Logger>& logger() const noexcept { return logger_; }
    [[nodiscard]] std::chrono::milliseconds remaining_time() const;

private:
    std::shared_ptr<Exporter> exporter_;
    std::shared_ptr<logging::Logger> logger_;
    BudgetSource remaining_time_;
    std::shared_ptr<EventBuffer> buffer_;
    CorrelationContext context_;
    MetricsAggregator metrics_;
};

}  // namespace faastel::core::observability
