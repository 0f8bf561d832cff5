#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "faastel/core/logging/logger.hpp"
#include "faastel/core/observability/event_buffer.hpp"
#include "faastel/core/observability/span.hpp"

namespace faastel::core::observability {

/**
 * @brief Raised when a span is opened out of order: before the invocation
 * began, as a second root, or under a parent owned by another context.
 */
class InvalidSpanNesting : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @brief Owns the correlation identity and the live span tree of one invocation.
 *
 * Parents are passed explicitly; there is no ambient "current span". Ended
 * spans leave the live set and their snapshot goes to the event buffer.
 */
class CorrelationContext {
public:
    using SpanEndedCallback = std::function<void(const SpanData&)>;

    CorrelationContext(std::shared_ptr<EventBuffer> buffer, std::shared_ptr<logging::Logger> logger);

    CorrelationContext(const CorrelationContext&) = delete;
    CorrelationContext& operator=(const CorrelationContext&) = delete;

    /**
     * @brief Starts the invocation and opens its root span.
     * @throws std::invalid_argument if correlation_id is empty
     * @throws InvalidSpanNesting if the invocation has already begun
     */
    SpanHandle begin_invocation(const std::string& correlation_id, const std::string& root_name = "invocation");

    /**
     * @brief Opens a child of parent, or a root when parent is null and no root exists yet.
     * @throws InvalidSpanNesting
     */
    SpanHandle start_span(const SpanHandle& parent, const std::string& name);

    // Ending an already-ended span only logs a warning
    void end_span(const SpanHandle& span, StatusCode status = StatusCode::ok, const std::string& error = {});

    // The callback runs outside the lock and must not throw
    void on_span_ended(SpanEndedCallback callback);

    [[nodiscard]] std::string correlation_id() const;
    [[nodiscard]] SpanHandle root() const;
    [[nodiscard]] std::size_t live_span_count() const;
    [[nodiscard]] const std::shared_ptr<EventBuffer>& buffer() const noexcept { return buffer_; }

private:
    SpanHandle open_span(const std::string& name, const std::string& parent_id);

    std::shared_ptr<EventBuffer> buffer_;
    std::shared_ptr<logging::Logger> logger_;

    mutable std::mutex mutex_;
    std::string correlation_id_;
    SpanHandle root_;
    std::unordered_map<std::string, SpanHandle> live_;
    SpanEndedCallback span_ended_;
};

/**
 * @brief RAII guard that ends its span on scope exit.
 *
 * The span ends with the status chosen through set_status()/fail(), else ok;
 * when the guard is destroyed by an exception in flight and no status was
 * chosen, the span ends as error.
 */
class ScopedSpan {
public:
    ScopedSpan(CorrelationContext& context, SpanHandle span);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;
    ScopedSpan(ScopedSpan&& other) noexcept;
    ScopedSpan& operator=(ScopedSpan&&) = delete;

    void set_status(StatusCode status, std::string message = {});

    // Records the exception and marks the span as error
    void fail(const std::exception& ex);

    Span* operator->() const { return span_.get(); }
    [[nodiscard]] const SpanHandle& get() const noexcept { return span_; }

private:
    CorrelationContext* context_;
    SpanHandle span_;
    int uncaught_on_entry_;
    StatusCode status_{StatusCode::unset};
    std::string message_;
};

}  // namespace faastel::core::observability
