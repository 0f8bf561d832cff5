#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "faastel/core/observability/events.hpp"

namespace faastel::core::observability {

/**
 * @brief Per-invocation queue of log records and finalized spans awaiting export.
 *
 * Appends never drop and never block beyond the internal lock. drain() hands
 * over everything buffered so far in append order; a failed delivery does not
 * put the events back.
 */
class EventBuffer {
public:
    EventBuffer() = default;
    explicit EventBuffer(std::string correlation_id);

    EventBuffer(const EventBuffer&) = delete;
    EventBuffer& operator=(const EventBuffer&) = delete;

    void set_correlation_id(std::string correlation_id);
    [[nodiscard]] std::string correlation_id() const;

    void append(TelemetryEvent event);

    // Builds a LogRecord stamped with the buffer's correlation id and the current time
    void log(LogLevel level, std::string message, nlohmann::json metadata = nlohmann::json::object());

    [[nodiscard]] std::vector<TelemetryEvent> drain();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

private:
    mutable std::mutex mutex_;
    std::string correlation_id_;
    std::vector<TelemetryEvent> events_;
};

}  // namespace faastel::core::observability
