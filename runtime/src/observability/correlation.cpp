#include "faastel/core/observability/correlation.hpp"

#include <exception>

namespace faastel::core::observability {

CorrelationContext::CorrelationContext(std::shared_ptr<EventBuffer> buffer, std::shared_ptr<logging::Logger> logger)
    : buffer_(std::move(buffer)), logger_(std::move(logger)) {
    if (!buffer_) {
        throw std::invalid_argument("CorrelationContext requires an event buffer");
    }
}

SpanHandle CorrelationContext::begin_invocation(const std::string& correlation_id, const std::string& root_name) {
    if (correlation_id.empty()) {
        throw std::invalid_argument("correlation id must not be empty");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!correlation_id_.empty()) {
            throw InvalidSpanNesting("invocation " + correlation_id_ + " already begun");
        }
        correlation_id_ = correlation_id;
    }
    buffer_->set_correlation_id(correlation_id);

    if (logger_) logger_->debug("[trace] invocation " + correlation_id + " started");
    return start_span(nullptr, root_name);
}

SpanHandle CorrelationContext::start_span(const SpanHandle& parent, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (correlation_id_.empty()) {
        throw InvalidSpanNesting("span '" + name + "' started before the invocation began");
    }

    if (!parent) {
        if (root_) {
            throw InvalidSpanNesting("span '" + name + "' has no parent but the root already exists");
        }
        root_ = open_span(name, {});
        return root_;
    }

    if (parent->correlation_id() != correlation_id_) {
        throw InvalidSpanNesting("parent of span '" + name + "' belongs to invocation " + parent->correlation_id());
    }
    return open_span(name, parent->span_id());
}

SpanHandle CorrelationContext::open_span(const std::string& name, const std::string& parent_id) {
    auto span = std::make_shared<Span>(name, correlation_id_, Span::generate_id(), parent_id);
    live_.emplace(span->span_id(), span);
    return span;
}

void CorrelationContext::end_span(const SpanHandle& span, StatusCode status, const std::string& error) {
    if (!span) {
        return;
    }

    if (!span->end(status, error)) {
        if (logger_) logger_->warn("[trace] span '" + span->name() + "' (" + span->span_id() + ") already ended");
        return;
    }

    SpanEndedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        live_.erase(span->span_id());
        callback = span_ended_;
    }

    SpanData data = span->snapshot();
    buffer_->append(data);

    if (callback) {
        callback(data);
    }
}

void CorrelationContext::on_span_ended(SpanEndedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    span_ended_ = std::move(callback);
}

std::string CorrelationContext::correlation_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return correlation_id_;
}

SpanHandle CorrelationContext::root() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return root_;
}

std::size_t CorrelationContext::live_span_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

ScopedSpan::ScopedSpan(CorrelationContext& context, SpanHandle span)
    : context_(&context), span_(std::move(span)), uncaught_on_entry_(std::uncaught_exceptions()) {
}

ScopedSpan::ScopedSpan(ScopedSpan&& other) noexcept
    : context_(other.context_),
      span_(std::move(other.span_)),
      uncaught_on_entry_(other.uncaught_on_entry_),
      status_(other.status_),
      message_(std::move(other.message_)) {
    other.span_.reset();
}

ScopedSpan::~ScopedSpan() {
    if (!span_ || !context_) {
        return;
    }

    StatusCode status = status_;
    std::string message = message_;
    if (status == StatusCode::unset && std::uncaught_exceptions() > uncaught_on_entry_) {
        status = StatusCode::error;
        message = "scope exited by exception";
    }

    context_->end_span(span_, status, message);
}

void ScopedSpan::set_status(StatusCode status, std::string message) {
    status_ = status;
    message_ = std::move(message);
}

void ScopedSpan::fail(const std::exception& ex) {
    if (span_) {
        span_->record_exception(ex);
    }
    set_status(StatusCode::error, ex.what());
}

}  // namespace faastel::core::observability
