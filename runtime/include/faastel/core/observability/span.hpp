#pragma once

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "faastel/core/observability/events.hpp"

namespace faastel::core::observability {

/**
 * @brief One traced operation.
 *
 * OPEN -> ENDED(ok | error). Attributes and exceptions are accepted only while
 * the span is open; the status becomes terminal exactly once, in end().
 */
class Span {
public:
    Span(std::string name, std::string correlation_id, std::string span_id, std::string parent_span_id = {});

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& correlation_id() const noexcept { return correlation_id_; }
    [[nodiscard]] const std::string& span_id() const noexcept { return span_id_; }
    [[nodiscard]] const std::string& parent_span_id() const noexcept { return parent_span_id_; }
    [[nodiscard]] bool is_root() const noexcept { return parent_span_id_.empty(); }

    [[nodiscard]] bool is_open() const;
    [[nodiscard]] SpanStatus status() const;
    [[nodiscard]] Timestamp start_time() const noexcept { return start_time_; }
    [[nodiscard]] std::optional<Timestamp> end_time() const;
    [[nodiscard]] Attributes attributes() const;
    [[nodiscard]] std::vector<ExceptionRecord> exceptions() const;

    // Return false (and change nothing) once the span has ended.
    bool set_attribute(const std::string& key, std::string_view value);
    bool set_attribute(const std::string& key, const char* value);
    bool set_attribute(const std::string& key, int64_t value);
    bool set_attribute(const std::string& key, int value);
    bool set_attribute(const std::string& key, double value);
    bool set_attribute(const std::string& key, bool value);

    bool record_exception(std::string type, std::string message, std::string stacktrace = {});
    bool record_exception(const std::exception& ex);

    /**
     * @brief Finalizes the span. An unset status ends as ok.
     * @return false if the span had already ended (nothing changes)
     */
    bool end(StatusCode code = StatusCode::ok, std::string message = {});

    [[nodiscard]] SpanData snapshot() const;

    static std::string generate_id();

private:
    bool set(const std::string& key, AttributeValue value);

    const std::string name_;
    const std::string correlation_id_;
    const std::string span_id_;
    const std::string parent_span_id_;
    const Timestamp start_time_;
    const std::chrono::steady_clock::time_point start_steady_;

    mutable std::mutex mutex_;
    bool ended_{false};
    Timestamp end_time_{};
    SpanStatus status_;
    Attributes attributes_;
    std::vector<ExceptionRecord> exceptions_;
};

using SpanHandle = std::shared_ptr<Span>;

// Demangled dynamic type of an exception, e.g. "std::runtime_error"
std::string exception_type_name(const std::exception& ex);

}  // namespace faastel::core::observability
