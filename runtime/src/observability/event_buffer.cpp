#include "faastel/core/observability/event_buffer.hpp"

#include <stdexcept>

namespace faastel::core::observability {

EventBuffer::EventBuffer(std::string correlation_id) : correlation_id_(std::move(correlation_id)) {
}

void EventBuffer::set_correlation_id(std::string correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = std::move(correlation_id);
}

std::string EventBuffer::correlation_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return correlation_id_;
}

void EventBuffer::append(TelemetryEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
}

void EventBuffer::log(LogLevel level, std::string message, nlohmann::json metadata) {
    LogRecord record;
    record.level = level;
    record.message = std::move(message);
    record.metadata = metadata.is_null() ? nlohmann::json::object() : std::move(metadata);
    record.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    if (correlation_id_.empty()) {
        throw std::logic_error("log record emitted before the invocation started");
    }
    record.correlation_id = correlation_id_;
    events_.push_back(std::move(record));
}

std::vector<TelemetryEvent> EventBuffer::drain() {
    std::vector<TelemetryEvent> drained;
    std::lock_guard<std::mutex> lock(mutex_);
    drained.swap(events_);
    return drained;
}

std::size_t EventBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

bool EventBuffer::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
}

}  // namespace faastel::core::observability
